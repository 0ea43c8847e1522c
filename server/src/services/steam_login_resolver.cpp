//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <boost/url/url_base.hpp>
#include <boost/url/url_view.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"
#include "services/login_url_resolver.hpp"
#include "services/steam_transport.hpp"
#include "util/html_form.hpp"
#include "util/seed_url.hpp"

using namespace handoff;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {

bool is_redirect(http::status s) noexcept
{
    switch (s)
    {
    case http::status::moved_permanently:
    case http::status::found:
    case http::status::see_other:
    case http::status::temporary_redirect:
    case http::status::permanent_redirect: return true;
    default: return false;
    }
}

// Steam redirects to its login page when the bot's cookies are no longer valid
bool is_steam_login_page(const boost::urls::url_view& u)
{
    return beast::iequals(u.host(), steam_community_host) && u.path().starts_with("/login");
}

std::string describe_failure(std::string_view what, error_code ec)
{
    std::string res(what);
    res += ": ";
    res += ec.message();
    return res;
}

// Identifies the bot in log messages
std::string bot_diagnostics(const bot& b)
{
    std::string res = "bot ";
    res += b.name;
    if (b.steam_id != 0u)
    {
        res += " (SteamID ";
        res += std::to_string(b.steam_id);
        res += ')';
    }
    return res;
}

// Extracts the Location header of a redirect, resolved against base
result<boost::urls::url> redirect_location(const steam_response& res, const boost::urls::url_view& base)
{
    auto it = res.find(http::field::location);
    if (it == res.end() || it->value().empty())
        HANDOFF_RETURN_ERROR(errc::missing_redirect)

    auto ref = boost::urls::parse_uri_reference(it->value());
    if (ref.has_error())
        HANDOFF_RETURN_ERROR(ref.error())

    boost::urls::url dest;
    auto resolve_result = boost::urls::resolve(base, *ref, dest);
    if (resolve_result.has_error())
        HANDOFF_RETURN_ERROR(resolve_result.error())
    return dest;
}

// Converts the redirect Steam answered with into the handoff result
std::string finish_handoff(const steam_response& res, const boost::urls::url_view& base, const bot& b)
{
    auto location = redirect_location(res, base);
    if (location.has_error())
    {
        log_error(location.error(), "Steam login handoff: reading redirect location", bot_diagnostics(b));
        return "Steam didn't provide a redirect location";
    }
    if (is_steam_login_page(*location))
        return "Bot is not logged in to Steam Community, refresh its web cookies";
    return std::string(location->buffer());
}

class steam_login_resolver final : public login_url_resolver
{
    std::unique_ptr<steam_transport> transport_;

public:
    steam_login_resolver(std::unique_ptr<steam_transport> transport) noexcept : transport_(std::move(transport))
    {
    }

    asio::awaitable<std::string> login_via_steam_oauth(const bot& b, std::string_view oauth_url) final override
    {
        co_return co_await run_handoff(b, oauth_url, login_protocol::oauth);
    }

    asio::awaitable<std::string> login_via_steam_openid(const bot& b, std::string_view openid_url) final override
    {
        co_return co_await run_handoff(b, openid_url, login_protocol::openid);
    }

private:
    asio::awaitable<std::string> run_handoff(const bot& b, std::string_view seed_url, login_protocol protocol)
    {
        const auto field_name = seed_url_field_name(protocol);

        // Validate the seed. We will send the bot's cookies to this URL
        auto seed = parse_seed_url(seed_url);
        if (seed.has_error())
        {
            std::string res("Invalid ");
            res += field_name;
            res += ": must be an https URL on ";
            res += steam_community_host;
            co_return res;
        }

        // Load the approval page
        auto page = co_await transport_->exchange(http::verb::get, *seed, b, {}, {});
        if (page.has_error())
        {
            log_error(page.error(), "Steam login handoff: loading login page", bot_diagnostics(b));
            co_return describe_failure("Failed to load the Steam login page", page.error());
        }

        // Steam may redirect straight to the website if it was already authorized
        if (is_redirect(page->result()))
            co_return finish_handoff(*page, *seed, b);
        if (page->result() != http::status::ok)
        {
            log_error(errc::unexpected_status, "Steam login handoff: loading login page", bot_diagnostics(b));
            co_return "Steam login page returned HTTP " + std::to_string(page->result_int());
        }

        // Locate the approval form
        auto form = protocol == login_protocol::openid ? find_form_by_id(page->body(), "openidForm")
                                                       : find_form_by_action(page->body(), "/oauth/");
        if (!form)
        {
            log_error(errc::login_form_not_found, "Steam login handoff: parsing login page", bot_diagnostics(b));
            co_return "Steam login form not found, is the bot logged in to Steam Community?";
        }

        // The form action may be relative to the page
        boost::urls::url action_url;
        if (form->action.empty())
        {
            action_url = *seed;
        }
        else
        {
            auto ref = boost::urls::parse_uri_reference(form->action);
            if (ref.has_error() || boost::urls::resolve(*seed, *ref, action_url).has_error())
                co_return "Steam login form has an invalid action";
        }

        // Don't follow forms pointing elsewhere
        auto validated_action = parse_seed_url(action_url.buffer());
        if (validated_action.has_error())
            co_return "Steam login form points outside Steam Community";

        // Submit the form
        auto form_body = encode_form_body(form->hidden_fields);
        result<steam_response> submit_result = error_code();
        if (form->method == "get")
        {
            validated_action->set_encoded_query(form_body);
            submit_result = co_await transport_->exchange(http::verb::get, *validated_action, b, seed->buffer(), {});
        }
        else
        {
            submit_result = co_await transport_->exchange(
                http::verb::post,
                *validated_action,
                b,
                seed->buffer(),
                std::move(form_body)
            );
        }
        if (submit_result.has_error())
        {
            log_error(submit_result.error(), "Steam login handoff: submitting login form", bot_diagnostics(b));
            co_return describe_failure("Failed to submit the Steam login form", submit_result.error());
        }

        // The redirect points to the third-party website
        if (!is_redirect(submit_result->result()))
        {
            log_error(errc::missing_redirect, "Steam login handoff: submitting login form", bot_diagnostics(b));
            co_return "Steam login form returned HTTP " + std::to_string(submit_result->result_int());
        }
        co_return finish_handoff(*submit_result, *validated_action, b);
    }
};

}  // namespace

std::unique_ptr<login_url_resolver> handoff::create_steam_login_resolver(std::unique_ptr<steam_transport> transport)
{
    return std::unique_ptr<login_url_resolver>{new steam_login_resolver(std::move(transport))};
}

std::unique_ptr<login_url_resolver> handoff::create_steam_login_resolver(asio::any_io_executor ex)
{
    return create_steam_login_resolver(create_https_transport(std::move(ex)));
}
