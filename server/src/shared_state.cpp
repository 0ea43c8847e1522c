//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <memory>
#include <string>
#include <utility>

#include "services/bot_registry.hpp"
#include "services/login_dispatcher.hpp"
#include "services/login_url_resolver.hpp"

using namespace handoff;

shared_state::shared_state(
    std::string culture,
    std::string ipc_password,
    std::unique_ptr<bot_registry> bots,
    std::unique_ptr<login_url_resolver> resolver
)
    : impl_{
          std::move(ipc_password),
          std::move(bots),
          std::move(resolver),
          nullptr,
      }
{
    // The dispatcher references objects owned by impl_. They live in the heap,
    // so moving the shared_state keeps these references valid
    impl_.dispatcher_ = std::make_unique<login_dispatcher>(*impl_.bots_, *impl_.resolver_, std::move(culture));
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}
