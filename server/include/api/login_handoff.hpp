//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_API_LOGIN_HANDOFF_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_API_LOGIN_HANDOFF_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// API handler functions for the login handoff endpoints.
// Body handlers read {BotName, OAuthUrl|OpenIdUrl} from a JSON body.
// Route handlers read them from the two route parameters captured by the router.
// Both delegate to the same login_dispatcher operation.

namespace handoff {

class shared_state;

// POST /Api/OAuth
boost::asio::awaitable<response_builder::response_type> handle_oauth_body(request_context& ctx, shared_state& st);

// GET|POST /Api/OAuth/{botName}/{oAuthUrl}
boost::asio::awaitable<response_builder::response_type> handle_oauth_route(request_context& ctx, shared_state& st);

// POST /Api/OpenId
boost::asio::awaitable<response_builder::response_type> handle_openid_body(request_context& ctx, shared_state& st);

// GET|POST /Api/OpenId/{botName}/{OpenIdUrl}
boost::asio::awaitable<response_builder::response_type> handle_openid_route(
    request_context& ctx,
    shared_state& st
);

}  // namespace handoff

#endif
