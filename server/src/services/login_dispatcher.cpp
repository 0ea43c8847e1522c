//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/login_dispatcher.hpp"

#include <boost/asio/awaitable.hpp>

#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "localization.hpp"
#include "services/bot_registry.hpp"
#include "services/login_url_resolver.hpp"

using namespace handoff;
namespace asio = boost::asio;

static constexpr std::string_view success_prefix = "https";

static dispatch_failure null_field_failure(std::string_view prefix, login_protocol protocol)
{
    std::string msg(prefix);
    msg += seed_url_field_name(protocol);
    msg += " can not be null";
    return dispatch_failure{std::move(msg)};
}

login_response handoff::classify_login_result(std::string result)
{
    bool success = std::string_view(result).starts_with(success_prefix);
    return login_response{success, std::move(result)};
}

asio::awaitable<dispatch_result> login_dispatcher::resolve(
    login_protocol protocol,
    std::string_view bot_name,
    std::string_view seed_url
)
{
    // Validate params
    if (bot_name.empty())
        co_return null_field_failure("BotName or ", protocol);

    const bot* b = bots_->get_bot(bot_name);
    if (b == nullptr)
        co_return dispatch_failure{bot_not_found_message(culture_, bot_name)};

    if (seed_url.empty())
        co_return null_field_failure("", protocol);

    // Run the handoff. This performs network I/O and may take a while
    std::string result;
    if (protocol == login_protocol::oauth)
        result = co_await resolver_->login_via_steam_oauth(*b, seed_url);
    else
        result = co_await resolver_->login_via_steam_openid(*b, seed_url);

    co_return classify_login_result(std::move(result));
}
