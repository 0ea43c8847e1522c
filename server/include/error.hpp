//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STEAMHANDOFF_SERVER_INCLUDE_ERROR_HPP
#define STEAMHANDOFF_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string_view>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio, Beast and URL.

namespace handoff {

using error_code = boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    uncaught_exception = 1,  // an API handler threw an unexpected exception
    invalid_content_type,    // an endpoint received an unsupported Content-Type
    missing_body,            // an endpoint requiring a JSON body received none
    invalid_body,            // the JSON body didn't match the format we expected
    invalid_config,          // the configuration file didn't match the format we expected
    duplicate_bot,           // two bots in the configuration share the same name
    invalid_seed_url,        // a login seed URL is not an https Steam Community URL
    unexpected_status,       // Steam answered with an HTTP status we can't handle
    login_form_not_found,    // the Steam page didn't contain an approval form
    missing_redirect,        // Steam didn't redirect us to the third-party website
};

// The error category for errc
const boost::system::error_category& get_handoff_category() noexcept;

// Allows constructing error_code from errc
inline boost::system::error_code make_error_code(errc v) noexcept
{
    return boost::system::error_code(static_cast<int>(v), get_handoff_category());
}

// Logs ec to stderr
void log_error(boost::system::error_code ec, std::string_view what, std::string_view diagnostics = "");

}  // namespace handoff

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<handoff::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define HANDOFF_RETURN_ERROR(e)                                                   \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

#endif
