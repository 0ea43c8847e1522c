//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "localization.hpp"

#include <boost/beast/core/string.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>

using namespace handoff;

namespace {

struct localized_string
{
    std::string_view culture;
    std::string_view value;
};

// The first entry is the fallback
constexpr localized_string bot_not_found_strings[] = {
    {"en",    "Couldn't find any bot named {0}!"              },
    {"de",    "Konnte keinen Bot mit dem Namen {0} finden!"   },
    {"es",    "¡No se ha encontrado ningún bot llamado {0}!"  },
    {"zh-CN", "找不到任何名为 {0} 的机器人！"                 },
    {"zh",    "找不到任何名为 {0} 的机器人！"                 },
};

constexpr std::string_view placeholder = "{0}";

std::string_view find_exact(std::string_view culture) noexcept
{
    auto it = std::find_if(
        std::begin(bot_not_found_strings),
        std::end(bot_not_found_strings),
        [culture](const localized_string& s) { return boost::beast::iequals(s.culture, culture); }
    );
    return it == std::end(bot_not_found_strings) ? std::string_view() : it->value;
}

}  // namespace

std::string_view handoff::bot_not_found_template(std::string_view culture) noexcept
{
    // Full culture name (e.g. zh-CN)
    auto res = find_exact(culture);
    if (!res.empty())
        return res;

    // Language only (e.g. de-AT => de)
    auto pos = culture.find_first_of("-_");
    if (pos != std::string_view::npos)
    {
        res = find_exact(culture.substr(0, pos));
        if (!res.empty())
            return res;
    }

    // Fallback
    return bot_not_found_strings[0].value;
}

std::string handoff::bot_not_found_message(std::string_view culture, std::string_view bot_name)
{
    auto tmpl = bot_not_found_template(culture);
    auto pos = tmpl.find(placeholder);

    std::string res;
    res.reserve(tmpl.size() + bot_name.size());
    res.append(tmpl.substr(0, pos));
    res.append(bot_name);
    res.append(tmpl.substr(pos + placeholder.size()));
    return res;
}
