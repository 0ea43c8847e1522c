//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_BUSINESS_TYPES_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_BUSINESS_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// This file contains business object definitions

namespace handoff {

// A Steam Community cookie (name, value) pair
using web_cookie = std::pair<std::string, std::string>;

// A managed bot account. Bots are owned by the bot registry
// and never mutated after it has been loaded.
struct bot
{
    // Unique bot name, as used in API requests
    std::string name;

    // 64-bit SteamID of the account. Zero if unknown
    std::uint64_t steam_id{};

    // Steam Community session cookies (steamLoginSecure, sessionid...).
    // These authenticate the bot when performing a login handoff.
    std::vector<web_cookie> web_cookies;
};

// The two login handoff protocols we support
enum class login_protocol
{
    oauth,
    openid,
};

// The name of the seed URL field for the given protocol, as it appears
// in the API (OAuthUrl or OpenIdUrl)
constexpr std::string_view seed_url_field_name(login_protocol p) noexcept
{
    return p == login_protocol::oauth ? "OAuthUrl" : "OpenIdUrl";
}

// The outcome of a login handoff. success is true iff login_url starts with "https".
// login_url is always populated with whatever the resolver returned.
struct login_response
{
    bool success{};
    std::string login_url;
};

inline bool operator==(const login_response& lhs, const login_response& rhs) noexcept
{
    return lhs.success == rhs.success && lhs.login_url == rhs.login_url;
}
inline bool operator!=(const login_response& lhs, const login_response& rhs) noexcept
{
    return !(lhs == rhs);
}

}  // namespace handoff

#endif
