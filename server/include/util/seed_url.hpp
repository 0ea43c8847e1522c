//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_UTIL_SEED_URL_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_UTIL_SEED_URL_HPP

#include <boost/url/url.hpp>

#include <string_view>

#include "error.hpp"

namespace handoff {

// The only host we send bot cookies to
inline constexpr std::string_view steam_community_host = "steamcommunity.com";

// Parses and validates a login seed URL (or a form action found in a Steam page).
// It must be an absolute https URL pointing to steam_community_host, without
// user information and on the default port. Returns errc::invalid_seed_url otherwise.
result<boost::urls::url> parse_seed_url(std::string_view input);

}  // namespace handoff

#endif
