//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/bot_registry.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"

using namespace handoff;

namespace {

class bot_registry_impl final : public bot_registry
{
    // std::less<> enables lookup by string_view without copies
    std::map<std::string, bot, std::less<>> bots_;

public:
    bot_registry_impl(std::map<std::string, bot, std::less<>> bots) noexcept : bots_(std::move(bots)) {}

    const bot* get_bot(std::string_view name) const final override
    {
        auto it = bots_.find(name);
        return it == bots_.end() ? nullptr : &it->second;
    }

    std::size_t size() const noexcept final override { return bots_.size(); }
};

}  // namespace

result<std::unique_ptr<bot_registry>> handoff::create_bot_registry(std::vector<bot> bots)
{
    std::map<std::string, bot, std::less<>> bots_by_name;
    for (auto& b : bots)
    {
        if (b.name.empty())
            HANDOFF_RETURN_ERROR(errc::invalid_config)
        auto key = b.name;
        bool inserted = bots_by_name.emplace(std::move(key), std::move(b)).second;
        if (!inserted)
            HANDOFF_RETURN_ERROR(errc::duplicate_bot)
    }
    return std::unique_ptr<bot_registry>(new bot_registry_impl(std::move(bots_by_name)));
}
