//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "request_context.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/url/parse.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "api/api_types.hpp"
#include "error.hpp"

using namespace handoff;
namespace http = boost::beast::http;
namespace beast = boost::beast;

// Intentionally don't provide exact version
static constexpr std::string_view server_header = "beast";

response_builder::response_builder(unsigned version, bool keep_alive) : keep_alive_(keep_alive)
{
    header_.version(version);
    header_.set(http::field::server, server_header);
}

response_builder::response_type response_builder::json_response_impl(std::string serialized_json)
{
    set_content_type("application/json");
    auto res = build_response<http::string_body>(std::move(serialized_json));
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::plaintext_response(
    boost::beast::http::status status,
    std::string content
)
{
    header_.result(status);
    set_content_type("text/plain");
    auto res = build_response<http::string_body>(std::move(content));
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::json_error(
    boost::beast::http::status status,
    std::string_view error_message
)
{
    header_.result(status);
    return json_response(api_error{error_message});
}

response_builder::response_type response_builder::internal_server_error(error_code ec, std::string_view what)
{
    // Log the error
    log_error(ec, "Returning internal server error", what);

    // Intentionally don't expose any error information
    return plaintext_response(
        boost::beast::http::status::internal_server_error,
        "An unexpected server error occurred"
    );
}

error_code request_context::parse_request_target()
{
    auto url_result = boost::urls::parse_origin_form(request_.target());
    if (url_result.has_error())
        return url_result.error();
    target_ = url_result.value();
    return error_code();
}

std::string_view request_context::header(std::string_view name) const
{
    auto it = request_.find(name);
    return it == request_.end() ? std::string_view() : std::string_view(it->value());
}

std::optional<std::string> request_context::query_param(std::string_view name) const
{
    const auto params = request_target().params();
    auto it = params.find(name);
    if (it == params.end())
        return std::nullopt;
    return std::string((*it).value);
}

bool request_context::is_json_content_type() const
{
    // Validate content-type. Parameters like charset are allowed
    auto it = request_.find(boost::beast::http::field::content_type);
    if (it == request_.end())
        return false;
    std::string_view value = it->value();
    auto media_type = value.substr(0, value.find(';'));
    while (!media_type.empty() && (media_type.back() == ' ' || media_type.back() == '\t'))
        media_type.remove_suffix(1);
    return beast::iequals(media_type, "application/json");
}
