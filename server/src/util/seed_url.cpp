//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/seed_url.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/scheme.hpp>
#include <boost/url/url.hpp>

#include <string_view>

#include "error.hpp"

using namespace handoff;

result<boost::urls::url> handoff::parse_seed_url(std::string_view input)
{
    auto parsed = boost::urls::parse_absolute_uri(input);
    if (parsed.has_error())
        HANDOFF_RETURN_ERROR(errc::invalid_seed_url)
    const auto& u = *parsed;

    // Scheme: https only. Bot cookies must never travel in plaintext
    if (u.scheme_id() != boost::urls::scheme::https)
        HANDOFF_RETURN_ERROR(errc::invalid_seed_url)

    // Host: Steam Community only
    if (!boost::beast::iequals(u.host(), steam_community_host))
        HANDOFF_RETURN_ERROR(errc::invalid_seed_url)

    // No credentials or custom ports
    if (u.has_userinfo())
        HANDOFF_RETURN_ERROR(errc::invalid_seed_url)
    if (u.has_port() && u.port_number() != 443u)
        HANDOFF_RETURN_ERROR(errc::invalid_seed_url)

    return boost::urls::url(u);
}
