//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "server.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/this_coro.hpp>

#include <exception>
#include <memory>
#include <utility>

#include "error.hpp"
#include "http_session.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace handoff;

namespace {

// Completion handler for sessions. Exceptions escaping a session are logged,
// and the rest of the server keeps running
struct session_completion
{
    void operator()(std::exception_ptr exc) const
    {
        if (!exc)
            return;
        try
        {
            std::rethrow_exception(exc);
        }
        catch (const std::exception& err)
        {
            log_error(errc::uncaught_exception, "Uncaught exception in IPC session", err.what());
        }
    }
};

// Opens an acceptor bound to ep, allowing address reuse so the server
// can be restarted right away
asio::ip::tcp::acceptor make_acceptor(asio::any_io_executor ex, const asio::ip::tcp::endpoint& ep)
{
    asio::ip::tcp::acceptor acceptor(std::move(ex));
    acceptor.open(ep.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(ep);
    acceptor.listen(asio::socket_base::max_listen_connections);
    return acceptor;
}

}  // namespace

asio::awaitable<void> handoff::run_server(
    asio::ip::tcp::endpoint listening_endpoint,
    std::shared_ptr<shared_state> st
)
{
    auto ex = co_await asio::this_coro::executor;
    auto acceptor = make_acceptor(ex, listening_endpoint);

    // Runs until the io_context is stopped. Accept errors are fatal, so they throw
    for (;;)
    {
        auto sock = co_await acceptor.async_accept();
        asio::co_spawn(ex, run_http_session(std::move(sock), st), session_completion{});
    }
}
