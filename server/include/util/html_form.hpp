//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_UTIL_HTML_FORM_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_UTIL_HTML_FORM_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// A minimal extractor for HTML forms. This is not a general HTML parser:
// it locates <form> tags, and the <input> tags that follow them until
// the matching </form>. This is enough to replay the approval forms
// that Steam Community renders for OAuth and OpenID logins.

namespace handoff {

// A form field (name, value) pair. Values are entity-decoded
using form_field = std::pair<std::string, std::string>;

// A form found in a HTML document
struct html_form
{
    // The action attribute, entity-decoded. May be empty
    std::string action;

    // The method attribute, lowercased. Defaults to "get"
    std::string method{"get"};

    // Hidden input fields, in document order
    std::vector<form_field> hidden_fields;
};

// Finds the first form whose id attribute equals id
std::optional<html_form> find_form_by_id(std::string_view html, std::string_view id);

// Finds the first form whose action attribute contains action_fragment
std::optional<html_form> find_form_by_action(std::string_view html, std::string_view action_fragment);

// Encodes fields as an application/x-www-form-urlencoded body. Everything except
// RFC 3986 unreserved characters is percent-encoded
std::string encode_form_body(const std::vector<form_field>& fields);

// Decodes HTML character references (&amp;, &quot;, &#39;, &#x27;...).
// Unknown named references are left untouched.
std::string decode_html_entities(std::string_view input);

}  // namespace handoff

#endif
