//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <boost/test/unit_test.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace handoff;

BOOST_AUTO_TEST_SUITE(config)

BOOST_AUTO_TEST_CASE(from_json_full)
{
    const char* from = R"%({
        "CurrentCulture": "de-DE",
        "IPCPassword": "secret",
        "Bots": [
            {
                "Name": "MainBot",
                "SteamID": 76561198000000001,
                "WebCookies": { "steamLoginSecure": "token", "sessionid": "abc" }
            },
            { "Name": "Alt" }
        ]
    })%";

    auto cfg = app_config::from_json(from);

    BOOST_TEST_REQUIRE(cfg.error() == error_code());
    BOOST_TEST(cfg->culture == "de-DE");
    BOOST_TEST(cfg->ipc_password == "secret");
    BOOST_TEST_REQUIRE(cfg->bots.size() == 2u);

    const auto& b1 = cfg->bots[0];
    BOOST_TEST(b1.name == "MainBot");
    BOOST_TEST(b1.steam_id == 76561198000000001u);
    BOOST_TEST_REQUIRE(b1.web_cookies.size() == 2u);
    BOOST_TEST(b1.web_cookies[0].first == "steamLoginSecure");
    BOOST_TEST(b1.web_cookies[0].second == "token");
    BOOST_TEST(b1.web_cookies[1].first == "sessionid");
    BOOST_TEST(b1.web_cookies[1].second == "abc");

    const auto& b2 = cfg->bots[1];
    BOOST_TEST(b2.name == "Alt");
    BOOST_TEST(b2.steam_id == 0u);
    BOOST_TEST(b2.web_cookies.empty());
}

BOOST_AUTO_TEST_CASE(from_json_defaults)
{
    struct
    {
        std::string_view name;
        std::string_view input;
    } test_cases[] = {
        {"empty_object", "{}"                                                         },
        {"nulls",        R"({"CurrentCulture": null, "IPCPassword": null, "Bots": null})"},
        {"empty_strings", R"({"CurrentCulture": "", "IPCPassword": "", "Bots": []})"  },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            auto cfg = app_config::from_json(tc.input);
            BOOST_TEST_REQUIRE(cfg.error() == error_code());
            BOOST_TEST(cfg->culture == "en-US");
            BOOST_TEST(cfg->ipc_password == "");
            BOOST_TEST(cfg->bots.empty());
        }
    }
}

BOOST_AUTO_TEST_CASE(from_json_error)
{
    struct
    {
        std::string_view name;
        std::string_view input;
    } test_cases[] = {
        {"array",              "[]"                                                  },
        {"culture_number",     R"({"CurrentCulture": 1})"                            },
        {"password_bool",      R"({"IPCPassword": true})"                            },
        {"bots_object",        R"({"Bots": {}})"                                     },
        {"bot_string",         R"({"Bots": ["MainBot"]})"                            },
        {"bot_missing_name",   R"({"Bots": [{"SteamID": 1}]})"                       },
        {"bot_empty_name",     R"({"Bots": [{"Name": ""}]})"                         },
        {"cookies_array",      R"({"Bots": [{"Name": "b", "WebCookies": []}]})"      },
        {"cookie_number",      R"({"Bots": [{"Name": "b", "WebCookies": {"a": 1}}]})"},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            auto cfg = app_config::from_json(tc.input);
            BOOST_TEST(cfg.error() == error_code(errc::invalid_config));
        }
    }
}

BOOST_AUTO_TEST_CASE(from_json_invalid)
{
    // Syntax errors and numbers that don't fit a SteamID
    BOOST_TEST(app_config::from_json("{").has_error());
    BOOST_TEST(app_config::from_json(R"({"Bots": [{"Name": "b", "SteamID": -1}]})").has_error());
    BOOST_TEST(app_config::from_json(R"({"Bots": [{"Name": "b", "SteamID": "1"}]})").has_error());
}

BOOST_AUTO_TEST_CASE(load_config_)
{
    // Write a config file
    auto path = std::filesystem::temp_directory_path() / "steam_handoff_test_config.json";
    {
        std::ofstream os(path);
        os << R"({"IPCPassword": "pwd", "Bots": [{"Name": "MainBot"}]})";
    }

    auto cfg = load_config(path.string().c_str());
    std::filesystem::remove(path);

    BOOST_TEST_REQUIRE(cfg.error() == error_code());
    BOOST_TEST(cfg->ipc_password == "pwd");
    BOOST_TEST_REQUIRE(cfg->bots.size() == 1u);
    BOOST_TEST(cfg->bots[0].name == "MainBot");
}

BOOST_AUTO_TEST_CASE(load_config_file_not_found)
{
    auto cfg = load_config("/this/file/does/not/exist.json");
    BOOST_TEST(cfg.has_error());
}

BOOST_AUTO_TEST_SUITE_END()
