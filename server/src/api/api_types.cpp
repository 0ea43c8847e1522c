//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"

using namespace handoff;

namespace {

//
// BOOST_DESCRIBE_STRUCT is used to add reflection capabilities to structs.
// It's used by boost::json::value_from to automatically generate JSON
// serialization code. Member names match the wire format exactly.
//

// Login handoff result wire format
struct wire_login_response
{
    bool Success;
    std::string_view LoginUrl;
};
BOOST_DESCRIBE_STRUCT(wire_login_response, (), (Success, LoginUrl))

// Successful envelope wire format
struct wire_login_handoff_response
{
    bool Success;
    std::string_view Message;
    wire_login_response Data;
};
BOOST_DESCRIBE_STRUCT(wire_login_handoff_response, (), (Success, Message, Data))

// Error envelope wire format
struct wire_api_error
{
    bool Success;
    std::string_view Message;
    std::nullptr_t Data;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (Success, Message, Data))

// The message attached to successful responses
constexpr std::string_view ok_message = "OK";

// Reads a string field from a request. Absent and null fields are
// returned as empty strings.
result<std::string> get_nullable_string(const boost::json::object& obj, std::string_view key)
{
    const auto* val = obj.if_contains(key);
    if (!val || val->is_null())
        return std::string();
    const auto* str = val->if_string();
    if (!str)
        HANDOFF_RETURN_ERROR(errc::invalid_body)
    return std::string(*str);
}

}  // namespace

//
// Incoming types
//

result<login_request> login_request::from_json(std::string_view from, login_protocol protocol)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        HANDOFF_RETURN_ERROR(ec)

    // A literal null is equivalent to not sending a body at all
    if (msg.is_null())
        HANDOFF_RETURN_ERROR(errc::missing_body)
    const auto* obj = msg.if_object();
    if (!obj)
        HANDOFF_RETURN_ERROR(errc::invalid_body)

    // Extract the fields
    auto bot_name = get_nullable_string(*obj, "BotName");
    if (bot_name.has_error())
        return bot_name.error();
    auto seed_url = get_nullable_string(*obj, seed_url_field_name(protocol));
    if (seed_url.has_error())
        return seed_url.error();

    return login_request{std::move(*bot_name), std::move(*seed_url)};
}

//
// Outgoing types
//

std::string login_handoff_response::to_json() const
{
    wire_login_handoff_response res{
        true,
        ok_message,
        wire_login_response{data.success, data.login_url},
    };
    return boost::json::serialize(boost::json::value_from(res));
}

std::string api_error::to_json() const
{
    wire_api_error err{false, message, nullptr};
    return boost::json::serialize(boost::json::value_from(err));
}
