//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "localization.hpp"

#include <boost/test/unit_test.hpp>

#include <string_view>

using namespace handoff;

BOOST_AUTO_TEST_SUITE(localization)

BOOST_AUTO_TEST_CASE(bot_not_found_message_)
{
    struct
    {
        std::string_view culture;
        std::string_view expected;
    } test_cases[] = {
        {"en-US", "Couldn't find any bot named Bot1!"            },
        {"en",    "Couldn't find any bot named Bot1!"            },
        {"de-DE", "Konnte keinen Bot mit dem Namen Bot1 finden!" },
        {"de-AT", "Konnte keinen Bot mit dem Namen Bot1 finden!" },
        {"DE",    "Konnte keinen Bot mit dem Namen Bot1 finden!" },
        {"es_ES", "¡No se ha encontrado ningún bot llamado Bot1!"},
        {"zh-CN", "找不到任何名为 Bot1 的机器人！"               },
        {"zh-TW", "找不到任何名为 Bot1 的机器人！"               },
        {"fr-FR", "Couldn't find any bot named Bot1!"            },
        {"",      "Couldn't find any bot named Bot1!"            },
        {"-",     "Couldn't find any bot named Bot1!"            },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.culture)
        {
            BOOST_TEST(bot_not_found_message(tc.culture, "Bot1") == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(bot_name_inserted_verbatim)
{
    BOOST_TEST(bot_not_found_message("en-US", "") == "Couldn't find any bot named !");
    BOOST_TEST(bot_not_found_message("en-US", "{0}") == "Couldn't find any bot named {0}!");
    BOOST_TEST(bot_not_found_message("en-US", "a b/c") == "Couldn't find any bot named a b/c!");
}

BOOST_AUTO_TEST_CASE(templates_have_placeholder)
{
    for (std::string_view culture : {"en", "de", "es", "zh-CN", "xx"})
    {
        BOOST_TEST_CONTEXT(culture)
        {
            BOOST_TEST(bot_not_found_template(culture).find("{0}") != std::string_view::npos);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
