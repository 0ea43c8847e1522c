//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "request_context.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/test/unit_test.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"

using namespace handoff;
namespace http = boost::beast::http;

namespace {

http::request<http::string_body> make_request(
    std::string_view target,
    std::string body = "",
    std::string_view content_type = ""
)
{
    http::request<http::string_body> req{http::verb::post, target, 11};
    if (!content_type.empty())
        req.set(http::field::content_type, content_type);
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(request_context_)

BOOST_AUTO_TEST_CASE(parse_request_target)
{
    request_context ctx(make_request("/Api/OAuth?password=abc"));
    BOOST_TEST(ctx.parse_request_target() == error_code());
    BOOST_TEST(ctx.request_target().path() == "/Api/OAuth");
}

BOOST_AUTO_TEST_CASE(parse_request_target_error)
{
    request_context ctx(make_request("http://host/Api/OAuth"));
    BOOST_TEST(ctx.parse_request_target() != error_code());
}

BOOST_AUTO_TEST_CASE(query_param)
{
    request_context ctx(make_request("/Api/OAuth?password=p%40ss%20word&other=1&empty="));
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());

    // Values are percent-decoded
    BOOST_TEST(ctx.query_param("password").value_or("<none>") == "p@ss word");
    BOOST_TEST(ctx.query_param("other").value_or("<none>") == "1");
    BOOST_TEST(ctx.query_param("empty").value_or("<none>") == "");
    BOOST_TEST(!ctx.query_param("missing").has_value());
    BOOST_TEST(!ctx.query_param("Password").has_value());
}

BOOST_AUTO_TEST_CASE(header)
{
    auto req = make_request("/Api/OAuth");
    req.set("Authentication", "secret");
    request_context ctx(std::move(req));

    // Header names are case-insensitive
    BOOST_TEST(ctx.header("Authentication") == "secret");
    BOOST_TEST(ctx.header("authentication") == "secret");
    BOOST_TEST(ctx.header("Authorization") == "");
}

BOOST_AUTO_TEST_CASE(route_params)
{
    request_context ctx(make_request("/Api/OAuth/Bot1/url"));
    BOOST_TEST(ctx.route_params().size() == 0u);

    ctx.set_route_params({"Bot1", "https://steamcommunity.com/oauth/login"});
    BOOST_TEST_REQUIRE(ctx.route_params().size() == 2u);
    BOOST_TEST(ctx.route_params()[0] == "Bot1");
    BOOST_TEST(ctx.route_params()[1] == "https://steamcommunity.com/oauth/login");
}

BOOST_AUTO_TEST_CASE(parse_json_body_success)
{
    constexpr std::string_view content_types[] = {
        "application/json",
        "Application/JSON",
        "application/json; charset=utf-8",
        "application/json ;charset=utf-8",
    };

    for (auto content_type : content_types)
    {
        BOOST_TEST_CONTEXT(content_type)
        {
            request_context ctx(make_request("/Api/OAuth", R"({"BotName": "b", "OAuthUrl": "u"})", content_type));
            auto res = ctx.parse_json_body<login_request>(login_protocol::oauth);
            BOOST_TEST_REQUIRE(res.error() == error_code());
            BOOST_TEST(res->bot_name == "b");
            BOOST_TEST(res->seed_url == "u");
        }
    }
}

BOOST_AUTO_TEST_CASE(parse_json_body_missing)
{
    // An empty body is reported as missing, regardless of the content type
    request_context ctx(make_request("/Api/OAuth", "", "text/plain"));
    auto res = ctx.parse_json_body<login_request>(login_protocol::oauth);
    BOOST_TEST(res.error() == error_code(errc::missing_body));
}

BOOST_AUTO_TEST_CASE(parse_json_body_content_type)
{
    constexpr std::string_view content_types[] = {
        "",
        "text/plain",
        "application/jsonx",
        "application/x-www-form-urlencoded",
    };

    for (auto content_type : content_types)
    {
        BOOST_TEST_CONTEXT(content_type)
        {
            request_context ctx(make_request("/Api/OAuth", R"({"BotName": "b"})", content_type));
            auto res = ctx.parse_json_body<login_request>(login_protocol::oauth);
            BOOST_TEST(res.error() == error_code(errc::invalid_content_type));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
