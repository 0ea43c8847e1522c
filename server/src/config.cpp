//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <boost/beast/core/file.hpp>
#include <boost/beast/core/file_base.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

using namespace handoff;
namespace json = boost::json;

// Gets an optional string member. Absent and null members yield an empty string
static result<std::string> get_optional_string(const json::object& obj, std::string_view key)
{
    const auto* val = obj.if_contains(key);
    if (!val || val->is_null())
        return std::string();
    const auto* str = val->if_string();
    if (!str)
        HANDOFF_RETURN_ERROR(errc::invalid_config)
    return std::string(*str);
}

static result<bot> parse_bot(const json::value& input)
{
    const auto* obj = input.if_object();
    if (!obj)
        HANDOFF_RETURN_ERROR(errc::invalid_config)

    bot res;

    // Name. Required and non-empty
    auto name = get_optional_string(*obj, "Name");
    if (name.has_error())
        return name.error();
    if (name->empty())
        HANDOFF_RETURN_ERROR(errc::invalid_config)
    res.name = std::move(*name);

    // SteamID. Optional
    if (const auto* steam_id = obj->if_contains("SteamID"); steam_id && !steam_id->is_null())
    {
        error_code ec;
        res.steam_id = steam_id->to_number<std::uint64_t>(ec);
        if (ec)
            HANDOFF_RETURN_ERROR(ec)
    }

    // WebCookies. Optional, an object mapping cookie names to values
    if (const auto* cookies_val = obj->if_contains("WebCookies"); cookies_val && !cookies_val->is_null())
    {
        const auto* cookies = cookies_val->if_object();
        if (!cookies)
            HANDOFF_RETURN_ERROR(errc::invalid_config)
        res.web_cookies.reserve(cookies->size());
        for (const auto& kv : *cookies)
        {
            const auto* value = kv.value().if_string();
            if (!value)
                HANDOFF_RETURN_ERROR(errc::invalid_config)
            res.web_cookies.emplace_back(std::string(kv.key()), std::string(*value));
        }
    }

    return res;
}

result<app_config> app_config::from_json(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto input = json::parse(from, ec);
    if (ec)
        HANDOFF_RETURN_ERROR(ec)

    const auto* obj = input.if_object();
    if (!obj)
        HANDOFF_RETURN_ERROR(errc::invalid_config)

    app_config res;

    // Culture
    auto culture = get_optional_string(*obj, "CurrentCulture");
    if (culture.has_error())
        return culture.error();
    if (!culture->empty())
        res.culture = std::move(*culture);

    // IPC password
    auto ipc_password = get_optional_string(*obj, "IPCPassword");
    if (ipc_password.has_error())
        return ipc_password.error();
    res.ipc_password = std::move(*ipc_password);

    // Bots
    const auto* bots_val = obj->if_contains("Bots");
    if (bots_val && !bots_val->is_null())
    {
        const auto* bots = bots_val->if_array();
        if (!bots)
            HANDOFF_RETURN_ERROR(errc::invalid_config)
        res.bots.reserve(bots->size());
        for (const auto& elm : *bots)
        {
            auto b = parse_bot(elm);
            if (b.has_error())
                return b.error();
            res.bots.push_back(std::move(*b));
        }
    }

    return res;
}

result<app_config> handoff::load_config(const char* path)
{
    namespace beast = boost::beast;

    // Open the file
    error_code ec;
    beast::file f;
    f.open(path, beast::file_mode::scan, ec);
    if (ec)
        HANDOFF_RETURN_ERROR(ec)

    // Read it entirely
    auto size = f.size(ec);
    if (ec)
        HANDOFF_RETURN_ERROR(ec)
    std::string contents(static_cast<std::size_t>(size), '\0');
    std::size_t bytes_read = 0;
    while (bytes_read < contents.size())
    {
        auto n = f.read(contents.data() + bytes_read, contents.size() - bytes_read, ec);
        if (ec)
            HANDOFF_RETURN_ERROR(ec)
        if (n == 0u)
            break;
        bytes_read += n;
    }
    contents.resize(bytes_read);

    return app_config::from_json(contents);
}
