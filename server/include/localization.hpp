//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_LOCALIZATION_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_LOCALIZATION_HPP

#include <string>
#include <string_view>

// Localized user-facing messages. Cultures are identified by their
// IETF tag (e.g. "en-US", "zh-CN"). A culture is looked up by its full name,
// then by its language part, and falls back to English.

namespace handoff {

// Returns the message template for the given culture. Templates contain a single
// "{0}" placeholder for the bot name.
std::string_view bot_not_found_template(std::string_view culture) noexcept;

// "Couldn't find any bot named <bot_name>!", localized
std::string bot_not_found_message(std::string_view culture, std::string_view bot_name);

}  // namespace handoff

#endif
