//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_SERVICES_STEAM_TRANSPORT_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_SERVICES_STEAM_TRANSPORT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/url_view.hpp>

#include <memory>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// Sends single HTTP requests to Steam Community on behalf of a bot.
// Redirects are never followed: they are returned to the caller.

namespace handoff {

using steam_response = boost::beast::http::response<boost::beast::http::string_body>;

// Using an interface to improve testability
class steam_transport
{
public:
    virtual ~steam_transport() {}

    // Sends a request to url, authenticated with the bot's web cookies.
    // referer is omitted if empty. body is only sent for POST requests,
    // as application/x-www-form-urlencoded.
    virtual boost::asio::awaitable<result<steam_response>> exchange(
        boost::beast::http::verb method,
        boost::urls::url_view url,
        const bot& b,
        std::string_view referer,
        std::string body
    ) = 0;
};

// Creates a transport using a fresh TLS connection per request
std::unique_ptr<steam_transport> create_https_transport(boost::asio::any_io_executor ex);

}  // namespace handoff

#endif
