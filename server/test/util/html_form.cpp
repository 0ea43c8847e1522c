//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/html_form.hpp"

#include <boost/test/unit_test.hpp>

#include <string_view>
#include <vector>

using namespace handoff;

namespace {

// Trimmed-down version of the page Steam renders for OpenID logins
constexpr std::string_view openid_page = R"%(
<html>
<body>
<form class="searchbox" action="https://steamcommunity.com/search/" method="GET">
    <input type="text" name="text" value="">
</form>
<div class="OpenID_Main">
<FORM id="openidForm" name="loginForm" action="https://steamcommunity.com/openid/login" method="POST">
    <input type="hidden" name="action" value="steam_openid_login" />
    <input type="hidden" name="openid.mode" value="checkid_setup">
    <input type="hidden" name="openidparams" value="eyJvcGVuaWQ&quot;x&quot;fQ==">
    <input type="hidden" name='nonce' value='6a1b&amp;2c'>
    <input type="text" name="visible" value="ignored">
    <input type="hidden" value="no name">
    <input type="submit" class="btn_green_white_innerfade" id="imageLogin" value="Sign In">
</FORM>
<input type="hidden" name="outside" value="ignored">
</div>
</body>
</html>
)%";

// Trimmed-down version of the page Steam renders for OAuth logins
constexpr std::string_view oauth_page = R"%(
<formula>Not a form</formula>
<form id="logout" action="https://steamcommunity.com/login/logout/" method="post">
    <input type="hidden" name="sessionid" value="abc">
</form>
<form action="https://steamcommunity.com/oauth/auth?client_id=1&amp;response_type=token" method=post>
    <input type=hidden name=sessionid value=abc>
    <input type="hidden" name="state" value="xyz">
</form>
)%";

using field_vector = std::vector<form_field>;

}  // namespace

BOOST_AUTO_TEST_SUITE(html_form_)

BOOST_AUTO_TEST_CASE(find_form_by_id_)
{
    auto form = find_form_by_id(openid_page, "openidForm");
    BOOST_TEST_REQUIRE(form.has_value());
    BOOST_TEST(form->action == "https://steamcommunity.com/openid/login");
    BOOST_TEST(form->method == "post");

    // Only hidden fields with a name that belong to the form are collected,
    // and values are entity-decoded
    field_vector expected{
        {"action",       "steam_openid_login"   },
        {"openid.mode",  "checkid_setup"        },
        {"openidparams", "eyJvcGVuaWQ\"x\"fQ=="},
        {"nonce",        "6a1b&2c"              },
    };
    BOOST_TEST((form->hidden_fields == expected));
}

BOOST_AUTO_TEST_CASE(find_form_by_id_not_found)
{
    BOOST_TEST(!find_form_by_id(openid_page, "otherForm").has_value());
    BOOST_TEST(!find_form_by_id(openid_page, "openidform").has_value());
    BOOST_TEST(!find_form_by_id("", "openidForm").has_value());
    BOOST_TEST(!find_form_by_id("<form id=\"openidForm\"", "openidForm").has_value());
}

BOOST_AUTO_TEST_CASE(find_form_by_action_)
{
    auto form = find_form_by_action(oauth_page, "/oauth/");
    BOOST_TEST_REQUIRE(form.has_value());
    BOOST_TEST(form->action == "https://steamcommunity.com/oauth/auth?client_id=1&response_type=token");
    BOOST_TEST(form->method == "post");

    field_vector expected{
        {"sessionid", "abc"},
        {"state",     "xyz"},
    };
    BOOST_TEST((form->hidden_fields == expected));
}

BOOST_AUTO_TEST_CASE(find_form_by_action_not_found)
{
    BOOST_TEST(!find_form_by_action(oauth_page, "/openid/").has_value());
    BOOST_TEST(!find_form_by_action("<formula action=\"/oauth/\">", "/oauth/").has_value());
}

BOOST_AUTO_TEST_CASE(form_without_method)
{
    auto form = find_form_by_id(R"(<form id="f"><input type="HIDDEN" name="a" value="1"></form>)", "f");
    BOOST_TEST_REQUIRE(form.has_value());
    BOOST_TEST(form->method == "get");
    BOOST_TEST(form->action == "");
    BOOST_TEST((form->hidden_fields == field_vector{{"a", "1"}}));
}

BOOST_AUTO_TEST_CASE(encode_form_body_)
{
    BOOST_TEST(encode_form_body({}) == "");
    BOOST_TEST(encode_form_body({{"a", "1"}}) == "a=1");
    BOOST_TEST(encode_form_body({{"a", "1"}, {"b", ""}}) == "a=1&b=");
    BOOST_TEST(
        encode_form_body({{"openid.mode", "checkid_setup"}, {"params", "a b&c=d/e+f"}}) ==
        "openid.mode=checkid_setup&params=a%20b%26c%3Dd%2Fe%2Bf"
    );
    BOOST_TEST(encode_form_body({{"k~_-", "\xc3\xa9"}}) == "k~_-=%C3%A9");
}

BOOST_AUTO_TEST_CASE(decode_html_entities_)
{
    struct
    {
        std::string_view input;
        std::string_view expected;
    } test_cases[] = {
        {"",                     ""                 },
        {"plain text",           "plain text"       },
        {"a&amp;b",              "a&b"              },
        {"&lt;tag&gt;",          "<tag>"            },
        {"&quot;q&quot;",        "\"q\""            },
        {"it&apos;s &#39;x&#x27;", "it's 'x'"       },
        {"&#233;",               "\xc3\xa9"         },
        {"&#x20AC;",             "\xe2\x82\xac"     },
        {"&#X1F600;",            "\xf0\x9f\x98\x80" },
        {"&nbsp;",               "\xc2\xa0"         },
        {"&unknown;",            "&unknown;"        },
        {"a & b",                "a & b"            },
        {"&amp",                 "&amp"             },
        {"&#;",                  "&#;"              },
        {"&#x;",                 "&#x;"             },
        {"&#0;",                 "&#0;"             },
        {"&#xD800;",             "&#xD800;"         },
        {"&#12ab;",              "&#12ab;"          },
        {"&amp;amp;",            "&amp;"            },
        {"&verylongreference;",  "&verylongreference;"},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.input)
        {
            BOOST_TEST(decode_html_entities(tc.input) == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
