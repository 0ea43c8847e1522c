//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/url/url_view.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"
#include "services/steam_transport.hpp"

using namespace handoff;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {

// Applies to each individual network operation (connect, handshake, write, read)
constexpr auto operation_timeout = std::chrono::seconds(30);

// Steam login pages are a few hundred KB at most
constexpr std::uint64_t max_response_body_size = 4u * 1024u * 1024u;

// Browser-like user agent
constexpr std::string_view user_agent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";

// Builds the Cookie header for a bot
std::string cookie_header(const bot& b)
{
    std::string res;
    for (const auto& [name, value] : b.web_cookies)
    {
        if (!res.empty())
            res += "; ";
        res += name;
        res += '=';
        res += value;
    }
    return res;
}

class https_transport final : public steam_transport
{
    asio::any_io_executor ex_;
    asio::ssl::context ssl_ctx_{asio::ssl::context::tls_client};

public:
    https_transport(asio::any_io_executor ex) : ex_(std::move(ex))
    {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
    }

    asio::awaitable<result<steam_response>> exchange(
        http::verb method,
        boost::urls::url_view url,
        const bot& b,
        std::string_view referer,
        std::string body
    ) final override
    {
        error_code ec;
        const std::string host = url.host();

        // Compose the request
        auto encoded_target = url.encoded_target();
        std::string target(encoded_target.data(), encoded_target.size());
        if (target.empty() || target.front() != '/')
            target.insert(target.begin(), '/');
        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, user_agent);
        req.set(http::field::accept, "text/html,application/xhtml+xml");
        auto cookies = cookie_header(b);
        if (!cookies.empty())
            req.set(http::field::cookie, cookies);
        if (!referer.empty())
            req.set(http::field::referer, referer);
        if (method == http::verb::post)
        {
            req.set(http::field::content_type, "application/x-www-form-urlencoded");
            req.body() = std::move(body);
        }
        req.prepare_payload();

        // Resolve the host name
        asio::ip::tcp::resolver resolver(ex_);
        auto endpoints = co_await resolver.async_resolve(host, "https", asio::redirect_error(ec));
        if (ec)
            co_return ec;

        // Set up the TLS stream. Steam requires SNI
        beast::ssl_stream<beast::tcp_stream> stream(ex_, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
        {
            co_return error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        }
        stream.set_verify_callback(asio::ssl::host_name_verification(host));

        // Connect
        beast::get_lowest_layer(stream).expires_after(operation_timeout);
        co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::redirect_error(ec));
        if (ec)
            co_return ec;

        // TLS handshake
        beast::get_lowest_layer(stream).expires_after(operation_timeout);
        co_await stream.async_handshake(asio::ssl::stream_base::client, asio::redirect_error(ec));
        if (ec)
            co_return ec;

        // Send the request
        beast::get_lowest_layer(stream).expires_after(operation_timeout);
        co_await http::async_write(stream, req, asio::redirect_error(ec));
        if (ec)
            co_return ec;

        // Read the response
        beast::flat_buffer buff;
        http::response_parser<http::string_body> parser;
        parser.body_limit(max_response_body_size);
        beast::get_lowest_layer(stream).expires_after(operation_timeout);
        co_await http::async_read(stream, buff, parser, asio::redirect_error(ec));
        if (ec)
            co_return ec;

        // Close the connection. Steam frequently skips close_notify, which results
        // in stream_truncated. The response is complete at this point anyway
        error_code shutdown_ec;
        beast::get_lowest_layer(stream).expires_after(operation_timeout);
        co_await stream.async_shutdown(asio::redirect_error(shutdown_ec));
        if (shutdown_ec && shutdown_ec != asio::ssl::error::stream_truncated)
            log_error(shutdown_ec, "Shutting down Steam Community connection", host);

        co_return parser.release();
    }
};

}  // namespace

std::unique_ptr<steam_transport> handoff::create_https_transport(asio::any_io_executor ex)
{
    return std::unique_ptr<steam_transport>{new https_transport(std::move(ex))};
}
