//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_SERVICES_LOGIN_DISPATCHER_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_SERVICES_LOGIN_DISPATCHER_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"

// Validates login handoff requests, resolves the target bot and delegates
// to a login_url_resolver. Both HTTP bindings (JSON body and route parameters)
// end up here once they have extracted the bot name and the seed URL.

namespace handoff {

// Forward declarations
class bot_registry;
class login_url_resolver;

// A request that was rejected before reaching the resolver.
// message is meant to be sent to the client.
struct dispatch_failure
{
    std::string message;
};

// Either the handoff outcome, or the reason why the request was rejected
using dispatch_result = boost::variant2::variant<login_response, dispatch_failure>;

// Classifies a resolver result. Resolvers return an URL starting with "https"
// on success and anything else on failure. The raw result is always surfaced.
login_response classify_login_result(std::string result);

class login_dispatcher
{
    const bot_registry* bots_;
    login_url_resolver* resolver_;
    std::string culture_;

public:
    // culture is used to localize the bot-not-found message.
    // bots and resolver must outlive this object.
    login_dispatcher(const bot_registry& bots, login_url_resolver& resolver, std::string culture)
        : bots_(&bots), resolver_(&resolver), culture_(std::move(culture))
    {
    }

    // Validates the request and runs the handoff. Checks are applied in order,
    // the first failing one wins:
    //   - bot_name empty => failure, "BotName or <field> can not be null"
    //   - bot_name unknown => failure, localized bot-not-found message
    //   - seed_url empty => failure, "<field> can not be null"
    // where <field> is OAuthUrl or OpenIdUrl, depending on protocol.
    // The resolver is only invoked if all checks pass.
    boost::asio::awaitable<dispatch_result> resolve(
        login_protocol protocol,
        std::string_view bot_name,
        std::string_view seed_url
    );
};

}  // namespace handoff

#endif
