//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_SHARED_STATE_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_SHARED_STATE_HPP

#include <memory>
#include <string>

namespace handoff {

// Forward declaration
class bot_registry;
class login_url_resolver;
class login_dispatcher;

// Contains singleton objects shared by all sessions in the server.
// None of them hold per-request state.
class shared_state
{
    struct
    {
        std::string ipc_password_;
        std::unique_ptr<bot_registry> bots_;
        std::unique_ptr<login_url_resolver> resolver_;
        std::unique_ptr<login_dispatcher> dispatcher_;
    } impl_;

public:
    // culture localizes user-facing messages. If ipc_password is not empty,
    // API requests must provide it.
    shared_state(
        std::string culture,
        std::string ipc_password,
        std::unique_ptr<bot_registry> bots,
        std::unique_ptr<login_url_resolver> resolver
    );
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    const std::string& ipc_password() const noexcept { return impl_.ipc_password_; }
    const bot_registry& bots() const noexcept { return *impl_.bots_; }
    login_dispatcher& dispatcher() noexcept { return *impl_.dispatcher_; }
};

}  // namespace handoff

#endif
