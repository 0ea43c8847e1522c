//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>

#include <chrono>
#include <exception>
#include <openssl/crypto.h>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/login_handoff.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "shared_state.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using namespace handoff;

namespace {

// The function signature of endpoint handlers
using handler_fn = asio::awaitable<http::message_generator> (*)(request_context&, shared_state&);

// Identifies a single endpoint that the client can call
struct api_endpoint
{
    // The first path segment after /Api. Matched case-insensitively.
    std::string_view name;

    // The number of path segments following name, captured as route parameters.
    std::size_t num_params;

    // The request method. If several methods are allowed for the same path,
    // create several api_endpoint objects with the same path but different methods.
    http::verb method;

    // The function to invoke when a client requests this endpoint.
    handler_fn handler;
};

// All the endpoints that our application supports.
// Actual paths are prefixed by /Api, which is removed before looking up in this table.
constexpr api_endpoint endpoints[] = {
    {"OAuth",  0u, http::verb::post, handle_oauth_body  },
    {"OAuth",  2u, http::verb::get,  handle_oauth_route },
    {"OAuth",  2u, http::verb::post, handle_oauth_route },
    {"OpenId", 0u, http::verb::post, handle_openid_body },
    {"OpenId", 2u, http::verb::get,  handle_openid_route},
    {"OpenId", 2u, http::verb::post, handle_openid_route},
};

constexpr std::string_view api_prefix = "Api";

// Compares secrets in constant time
bool secure_equals(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() && CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

// If an IPC password is configured, clients must send it either in the
// Authentication header or in the password query parameter
bool is_authorized(const request_context& ctx, const shared_state& st)
{
    const auto& password = st.ipc_password();
    if (password.empty())
        return true;

    auto header_value = ctx.header("Authentication");
    if (!header_value.empty())
        return secure_equals(header_value, password);

    auto query_value = ctx.query_param("password");
    return query_value.has_value() && secure_equals(*query_value, password);
}

asio::awaitable<http::message_generator> handle_http_request_impl(request_context& ctx, shared_state& st)
{
    using namespace std::chrono_literals;

    // Attempt to parse the request target
    auto ec = ctx.parse_request_target();
    if (ec)
        co_return ctx.response().bad_request_text("Invalid request target");
    const auto& target = ctx.request_target();

    // Split the path into percent-decoded segments. Route parameters
    // (like the seed URL) are usually percent-encoded by clients.
    auto segs_view = target.segments();
    std::vector<std::string> segs(segs_view.begin(), segs_view.end());

    // Everything we serve is under /Api/<endpoint>
    if (segs.size() < 2u || !beast::iequals(segs[0], api_prefix))
        co_return ctx.response().not_found_text();
    std::string_view endpoint_name = segs[1];
    const std::size_t num_params = segs.size() - 2u;

    // Attempt to match one of the endpoints we have defined.
    // Since there aren't too many, linear search works better here.
    bool path_matched = false;
    handler_fn handler = nullptr;
    for (const auto& e : endpoints)
    {
        if (!beast::iequals(e.name, endpoint_name) || e.num_params != num_params)
            continue;
        path_matched = true;
        if (e.method == ctx.request_method())
        {
            handler = e.handler;
            break;
        }
    }

    // If the path didn't match, return a 404
    if (!path_matched)
        co_return ctx.response().not_found_text();

    // If we didn't find any endpoint here, it means that the method that
    // the client requested doesn't have a matching handler
    if (handler == nullptr)
        co_return ctx.response().method_not_allowed();

    // Check credentials
    if (!is_authorized(ctx, st))
        co_return ctx.response().unauthorized_json("Invalid or missing IPC password");

    // Expose route parameters to the handler
    ctx.set_route_params(std::vector<std::string>(segs.begin() + 2, segs.end()));

    // Invoke the endpoint, applying a timeout to the overall operation,
    // which includes the Steam login handoff.
    // asio::cancel_after will issue a cancellation signal after the specified
    // deadline, making the operation fail if the deadline is exceeded.
    // co_spawn doesn't support returning arguments that are not default-constructible,
    // like http::message_generator, so we use an optional.
    std::optional<http::message_generator> gen;
    co_await asio::co_spawn(
        // Use the same executor as the current coroutine
        co_await asio::this_coro::executor,

        // The actual coroutine to run
        [handler, &gen, &ctx, &st]() -> asio::awaitable<void> { gen = co_await handler(ctx, st); },

        // Set a timeout to the overall operation. Return an object that can be
        // co_awaited. Equivalent to asio::cancel_after(30s, asio::deferred).
        asio::cancel_after(30s)
    );

    // If we got here, the handler finished successfully, and the optional
    // has been populated with the response.
    co_return std::move(gen).value();
}

}  // namespace

asio::awaitable<http::message_generator> handoff::handle_http_request(
    http::request<http::string_body>&& req,
    shared_state& st
)
{
    // Build a request context
    request_context ctx(std::move(req));

    // We don't communicate regular failures using exceptions, but
    // unhandled exceptions shouldn't crash the server.
    try
    {
        co_return co_await handle_http_request_impl(ctx, st);
    }
    catch (const std::exception& err)
    {
        co_return ctx.response().internal_server_error(errc::uncaught_exception, err.what());
    }
}

asio::awaitable<void> handoff::run_http_session(asio::ip::tcp::socket socket, std::shared_ptr<shared_state> state)
{
    error_code ec;

    // A buffer to read incoming client requests
    beast::flat_buffer buff;

    // A stream allows us to set quality-of-service parameters for the connection,
    // like timeouts.
    beast::tcp_stream stream(std::move(socket));

    while (true)
    {
        // Construct a new parser for each message
        http::request_parser<http::string_body> parser;

        // Apply a reasonable limit to the allowed size
        // of the body in bytes to prevent abuse.
        parser.body_limit(10000);

        // Set the timeout.
        stream.expires_after(std::chrono::seconds(30));

        // Read a request
        co_await http::async_read(stream, buff, parser, asio::redirect_error(ec));

        if (ec == http::error::end_of_stream)
        {
            // This means they closed the connection
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
        else if (ec)
        {
            // An unknown error happened
            co_return log_error(ec, "read");
        }

        // The handler may take a while (it talks to Steam). Don't let the
        // read timeout fire in the meantime
        stream.expires_never();

        // Attempt to serve the request and generate a response
        http::message_generator msg = co_await handle_http_request(parser.release(), *state);

        // Determine if we should close the connection
        bool keep_alive = msg.keep_alive();

        // Send the response
        stream.expires_after(std::chrono::seconds(30));
        co_await beast::async_write(stream, std::move(msg), asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "write");
            co_return;
        }

        // This means we should close the connection, usually because
        // the response indicated the "Connection: close" semantic.
        if (!keep_alive)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
    }
}
