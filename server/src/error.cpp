//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <iostream>
#include <string_view>

namespace handoff {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    uncaught_exception,
    invalid_content_type,
    missing_body,
    invalid_body,
    invalid_config,
    duplicate_bot,
    invalid_seed_url,
    unexpected_status,
    login_form_not_found,
    missing_redirect
)

}  // namespace handoff

namespace {

static const char* to_string(handoff::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown handoff error>");
}

// Custom category for handoff::errc. Exposed by get_handoff_category
class handoff_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "handoff"; }
    std::string message(int ev) const final override { return to_string(static_cast<handoff::errc>(ev)); }
};

static handoff_category cat;

}  // namespace

const boost::system::error_category& handoff::get_handoff_category() noexcept { return cat; }

void handoff::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}
