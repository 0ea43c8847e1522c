//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_SERVICES_LOGIN_URL_RESOLVER_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_SERVICES_LOGIN_URL_RESOLVER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "services/steam_transport.hpp"

// Performs the actual Steam login handoff on behalf of a bot: given a seed URL
// provided by a third-party website, obtains the URL the website should
// redirect its user to.
//
// Results are plain strings: an URL starting with "https" on success,
// and a human-readable description of the problem otherwise.

namespace handoff {

// Using an interface to reduce build times and improve testability
class login_url_resolver
{
public:
    virtual ~login_url_resolver() {}

    // Authorizes a Steam OAuth request (https://steamcommunity.com/oauth/login?...)
    virtual boost::asio::awaitable<std::string> login_via_steam_oauth(const bot& b, std::string_view oauth_url) = 0;

    // Authorizes a Steam OpenID request (https://steamcommunity.com/openid/login?...)
    virtual boost::asio::awaitable<std::string> login_via_steam_openid(const bot& b, std::string_view openid_url) = 0;
};

// Creates a resolver that talks to Steam Community over HTTPS
std::unique_ptr<login_url_resolver> create_steam_login_resolver(boost::asio::any_io_executor ex);

// Creates a resolver that sends its requests through transport
std::unique_ptr<login_url_resolver> create_steam_login_resolver(std::unique_ptr<steam_transport> transport);

}  // namespace handoff

#endif
