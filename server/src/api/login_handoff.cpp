//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/login_handoff.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <cassert>
#include <string_view>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/login_dispatcher.hpp"
#include "shared_state.hpp"

using namespace handoff;
namespace asio = boost::asio;

// Runs the dispatcher and converts its result into a HTTP response
static asio::awaitable<response_builder::response_type> dispatch(
    request_context& ctx,
    shared_state& st,
    login_protocol protocol,
    std::string_view bot_name,
    std::string_view seed_url
)
{
    auto res = co_await st.dispatcher().resolve(protocol, bot_name, seed_url);

    // Validation failures are reported as bad requests
    if (const auto* failure = boost::variant2::get_if<dispatch_failure>(&res))
        co_return ctx.response().bad_request_json(failure->message);

    // Handoff failures are not HTTP errors. The client should inspect Data.Success
    const auto& handoff_result = boost::variant2::get<login_response>(res);
    co_return ctx.response().json_response(login_handoff_response{handoff_result});
}

static asio::awaitable<response_builder::response_type> handle_body(
    request_context& ctx,
    shared_state& st,
    login_protocol protocol
)
{
    // Parse params
    auto parse_result = ctx.parse_json_body<login_request>(protocol);
    if (parse_result.has_error())
    {
        auto ec = parse_result.error();
        if (ec == errc::missing_body)
            co_return ctx.response().bad_request_json("Request body can not be null");
        else if (ec == errc::invalid_content_type)
            co_return ctx.response().bad_request_json("Content-Type must be application/json");
        else
            co_return ctx.response().bad_request_json("Invalid body provided");
    }
    const auto& req_params = parse_result.value();

    co_return co_await dispatch(ctx, st, protocol, req_params.bot_name, req_params.seed_url);
}

static asio::awaitable<response_builder::response_type> handle_route(
    request_context& ctx,
    shared_state& st,
    login_protocol protocol
)
{
    // The router guarantees that we got exactly {botName}/{seedUrl}
    auto params = ctx.route_params();
    assert(params.size() == 2u);

    co_return co_await dispatch(ctx, st, protocol, params[0], params[1]);
}

asio::awaitable<response_builder::response_type> handoff::handle_oauth_body(request_context& ctx, shared_state& st)
{
    co_return co_await handle_body(ctx, st, login_protocol::oauth);
}

asio::awaitable<response_builder::response_type> handoff::handle_oauth_route(request_context& ctx, shared_state& st)
{
    co_return co_await handle_route(ctx, st, login_protocol::oauth);
}

asio::awaitable<response_builder::response_type> handoff::handle_openid_body(request_context& ctx, shared_state& st)
{
    co_return co_await handle_body(ctx, st, login_protocol::openid);
}

asio::awaitable<response_builder::response_type> handoff::handle_openid_route(
    request_context& ctx,
    shared_state& st
)
{
    co_return co_await handle_route(ctx, st, login_protocol::openid);
}
