//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/html_form.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/url/encode.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace handoff;
using boost::beast::iequals;

namespace {

constexpr std::size_t npos = std::string_view::npos;

bool is_space(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

// Case-insensitive find, starting at pos
std::size_t ifind(std::string_view haystack, std::string_view needle, std::size_t pos) noexcept
{
    for (std::size_t i = pos; i + needle.size() <= haystack.size(); ++i)
    {
        if (iequals(haystack.substr(i, needle.size()), needle))
            return i;
    }
    return npos;
}

struct tag_attribute
{
    std::string_view name;
    std::string_view value;  // raw, not entity-decoded
};

// A parsed start tag, like <input type="hidden" name="nonce" value="abc">
struct start_tag
{
    std::vector<tag_attribute> attributes;

    // Offset one past the closing '>'
    std::size_t end{};

    // Returns the raw value of an attribute, or an empty view if not present
    std::string_view get(std::string_view name) const noexcept
    {
        for (const auto& attr : attributes)
        {
            if (iequals(attr.name, name))
                return attr.value;
        }
        return {};
    }
};

// Parses the attributes of a start tag. i should point right after the tag name.
// Returns an empty optional if the tag is not terminated.
std::optional<start_tag> parse_attributes(std::string_view html, std::size_t i)
{
    start_tag res;
    const auto size = html.size();

    while (i < size)
    {
        // Whitespace between attributes
        while (i < size && is_space(html[i]))
            ++i;
        if (i >= size)
            break;

        // End of tag
        if (html[i] == '>')
        {
            res.end = i + 1;
            return res;
        }

        // Self-closing marker
        if (html[i] == '/')
        {
            ++i;
            continue;
        }

        // Attribute name
        auto name_start = i;
        while (i < size && !is_space(html[i]) && html[i] != '=' && html[i] != '>' && html[i] != '/')
            ++i;
        auto name = html.substr(name_start, i - name_start);

        // Attribute value, if present
        std::string_view value;
        while (i < size && is_space(html[i]))
            ++i;
        if (i < size && html[i] == '=')
        {
            ++i;
            while (i < size && is_space(html[i]))
                ++i;
            if (i < size && (html[i] == '"' || html[i] == '\''))
            {
                char quote = html[i++];
                auto value_end = html.find(quote, i);
                if (value_end == npos)
                    return std::nullopt;
                value = html.substr(i, value_end - i);
                i = value_end + 1;
            }
            else
            {
                auto value_start = i;
                while (i < size && !is_space(html[i]) && html[i] != '>')
                    ++i;
                value = html.substr(value_start, i - value_start);
            }
        }

        res.attributes.push_back(tag_attribute{name, value});
    }

    return std::nullopt;
}

// Finds the next start tag named tag_name at or after pos
std::optional<start_tag> next_tag(std::string_view html, std::string_view tag_name, std::size_t pos)
{
    std::string needle{"<"};
    needle.append(tag_name);

    while (true)
    {
        auto start = ifind(html, needle, pos);
        if (start == npos)
            return std::nullopt;

        // Make sure we didn't match a prefix of a longer tag name (e.g. <formula>)
        auto after = start + needle.size();
        if (after < html.size() && (is_space(html[after]) || html[after] == '>' || html[after] == '/'))
            return parse_attributes(html, after);

        pos = start + 1;
    }
}

std::string to_lower(std::string_view input)
{
    std::string res(input);
    for (char& c : res)
    {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return res;
}

// Builds a html_form from its start tag, collecting the hidden fields
html_form build_form(std::string_view html, const start_tag& tag)
{
    html_form res;
    res.action = decode_html_entities(tag.get("action"));
    auto method = tag.get("method");
    if (!method.empty())
        res.method = to_lower(method);

    // Only look at inputs belonging to this form
    auto form_end = ifind(html, "</form", tag.end);
    auto form_html = html.substr(0, form_end == npos ? html.size() : form_end);

    auto pos = tag.end;
    while (auto input = next_tag(form_html, "input", pos))
    {
        auto name = input->get("name");
        if (iequals(input->get("type"), "hidden") && !name.empty())
        {
            res.hidden_fields.emplace_back(
                decode_html_entities(name),
                decode_html_entities(input->get("value"))
            );
        }
        pos = input->end;
    }

    return res;
}

template <class Pred>
std::optional<html_form> find_form(std::string_view html, Pred pred)
{
    std::size_t pos = 0;
    while (auto tag = next_tag(html, "form", pos))
    {
        if (pred(*tag))
            return build_form(html, *tag);
        pos = tag->end;
    }
    return std::nullopt;
}

void append_utf8(std::string& to, std::uint32_t cp)
{
    if (cp < 0x80)
    {
        to.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        to.push_back(static_cast<char>(0xc0 | (cp >> 6)));
        to.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
    else if (cp < 0x10000)
    {
        to.push_back(static_cast<char>(0xe0 | (cp >> 12)));
        to.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        to.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
    else
    {
        to.push_back(static_cast<char>(0xf0 | (cp >> 18)));
        to.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
        to.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        to.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
}

// Decodes a single character reference (the part between & and ;).
// Returns false if it's not a reference we understand.
bool decode_reference(std::string_view ref, std::string& to)
{
    struct named_reference
    {
        std::string_view name;
        std::string_view value;
    };
    constexpr named_reference named[] = {
        {"amp",  "&"       },
        {"lt",   "<"       },
        {"gt",   ">"       },
        {"quot", "\""      },
        {"apos", "'"       },
        {"nbsp", "\xc2\xa0"},
    };

    if (ref.size() >= 2u && ref[0] == '#')
    {
        // Numeric reference, decimal or hex
        int base = 10;
        auto digits = ref.substr(1);
        if (digits[0] == 'x' || digits[0] == 'X')
        {
            base = 16;
            digits = digits.substr(1);
        }
        if (digits.empty())
            return false;

        std::uint32_t cp = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
        if (ec != std::errc() || ptr != digits.data() + digits.size())
            return false;
        if (cp == 0 || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
            return false;
        append_utf8(to, cp);
        return true;
    }

    for (const auto& r : named)
    {
        if (r.name == ref)
        {
            to.append(r.value);
            return true;
        }
    }
    return false;
}

}  // namespace

std::optional<html_form> handoff::find_form_by_id(std::string_view html, std::string_view id)
{
    return find_form(html, [id](const start_tag& tag) { return decode_html_entities(tag.get("id")) == id; });
}

std::optional<html_form> handoff::find_form_by_action(std::string_view html, std::string_view action_fragment)
{
    return find_form(html, [action_fragment](const start_tag& tag) {
        return decode_html_entities(tag.get("action")).find(action_fragment) != std::string::npos;
    });
}

std::string handoff::encode_form_body(const std::vector<form_field>& fields)
{
    std::string res;
    for (const auto& field : fields)
    {
        if (!res.empty())
            res.push_back('&');
        res += boost::urls::encode(field.first, boost::urls::unreserved_chars);
        res.push_back('=');
        res += boost::urls::encode(field.second, boost::urls::unreserved_chars);
    }
    return res;
}

std::string handoff::decode_html_entities(std::string_view input)
{
    // Longest reference we care about, excluding & and ;
    constexpr std::size_t max_reference_size = 10u;

    std::string res;
    res.reserve(input.size());

    std::size_t i = 0;
    while (i < input.size())
    {
        if (input[i] != '&')
        {
            res.push_back(input[i++]);
            continue;
        }

        auto semicolon = input.find(';', i);
        if (semicolon != npos && semicolon - i - 1 <= max_reference_size &&
            decode_reference(input.substr(i + 1, semicolon - i - 1), res))
        {
            i = semicolon + 1;
        }
        else
        {
            res.push_back('&');
            ++i;
        }
    }

    return res;
}
