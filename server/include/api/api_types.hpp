//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_API_API_TYPES_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_API_API_TYPES_HPP

#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// This file contains type definitions for HTTP API objects.
// Types for incoming requests are owning, since they're used after parsing.
// Types for responses are non-owning and lightweight, since they are only
// used as intermediate types for serialization.
//
// Every response is wrapped in a generic envelope:
//   { "Success": bool, "Message": string|null, "Data": object|null }

namespace handoff {

//
// Incoming messages (HTTP requests)
//

// The request for POST /Api/OAuth and POST /Api/OpenId.
// Wire format: {"BotName": "...", "OAuthUrl": "..."} or {"BotName": "...", "OpenIdUrl": "..."}.
// Missing and null fields are parsed as empty strings, so they can be
// reported by the login_dispatcher like any other empty field.
struct login_request
{
    // Name of the bot that should perform the login
    std::string bot_name;

    // OAuthUrl or OpenIdUrl, depending on the protocol
    std::string seed_url;

    // Parses a request from a JSON string. The seed URL is read from the field
    // that corresponds to protocol. Returns errc::missing_body if the JSON is null,
    // and errc::invalid_body if it's not an object or a field is not a string.
    static result<login_request> from_json(std::string_view from, login_protocol protocol);
};

//
// Outgoing messages (HTTP responses)
//

// A successful login handoff response.
// Wire format: {"Success": true, "Message": "OK", "Data": {"Success": bool, "LoginUrl": "..."}}
struct login_handoff_response
{
    const login_response& data;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// A REST API error. Used within HTTP error responses.
// Wire format: {"Success": false, "Message": "...", "Data": null}
struct api_error
{
    // A human-readable explanation of the error.
    std::string_view message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

}  // namespace handoff

#endif
