//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_SERVER_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_SERVER_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

namespace handoff {

// Forward declaration
class shared_state;

// Runs the IPC HTTP server, accepting connections until the underlying
// I/O context is stopped. Throws if the acceptor can't be set up
// (e.g. the port is already in use).
boost::asio::awaitable<void> run_server(
    boost::asio::ip::tcp::endpoint listening_endpoint,
    std::shared_ptr<shared_state> state
);

}  // namespace handoff

#endif
