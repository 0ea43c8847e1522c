//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_CONFIG_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Application configuration, loaded once at startup from a JSON file.
// Schema:
//   {
//     "CurrentCulture": "en-US",      // optional, defaults to "en-US"
//     "IPCPassword": "secret",        // optional, empty disables API authentication
//     "Bots": [{
//       "Name": "Bot1",
//       "SteamID": 76561198000000000, // optional
//       "WebCookies": { "steamLoginSecure": "...", "sessionid": "..." }
//     }]
//   }

namespace handoff {

struct app_config
{
    // Culture used to localize user-facing messages
    std::string culture{"en-US"};

    // If not empty, API requests must provide this password
    std::string ipc_password;

    // The managed bots
    std::vector<bot> bots;

    // Parses the configuration from a JSON string
    static result<app_config> from_json(std::string_view from);
};

// Reads and parses the configuration file at path
result<app_config> load_config(const char* path);

}  // namespace handoff

#endif
