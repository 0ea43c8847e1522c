//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_SERVICES_BOT_REGISTRY_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_SERVICES_BOT_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Read-only lookup of the bots managed by this server

namespace handoff {

// Using an interface to improve testability
class bot_registry
{
public:
    virtual ~bot_registry() {}

    // Looks up a bot by its exact name. Returns nullptr if it doesn't exist.
    // The returned pointer is valid as long as the registry is alive.
    virtual const bot* get_bot(std::string_view name) const = 0;

    // The number of bots in the registry
    virtual std::size_t size() const noexcept = 0;
};

// Creates a registry holding the passed bots. Fails with errc::duplicate_bot
// if two bots share a name, or with errc::invalid_config if a bot has no name.
result<std::unique_ptr<bot_registry>> create_bot_registry(std::vector<bot> bots);

}  // namespace handoff

#endif
