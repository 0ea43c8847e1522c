//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_HTTP_SESSION_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_HTTP_SESSION_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/string_body.hpp>

#include <memory>

namespace handoff {

// Forward declaration
class shared_state;

// Routes a single HTTP request to the matching API endpoint and generates a response.
// Never throws: unexpected errors are reported as 500 responses.
boost::asio::awaitable<boost::beast::http::message_generator> handle_http_request(
    boost::beast::http::request<boost::beast::http::string_body>&& req,
    shared_state& st
);

// Runs a HTTP session until the connection is closed or an error is encountered.
boost::asio::awaitable<void> run_http_session(
    boost::asio::ip::tcp::socket socket,
    std::shared_ptr<shared_state> state
);

}  // namespace handoff

#endif
