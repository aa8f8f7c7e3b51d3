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
#include <boost/system/system_error.hpp>

#include <iostream>
#include <string_view>

namespace cmdchat {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    invalid_username,
    invalid_room_name,
    invalid_room_type,
    invalid_message_content,
    room_not_found,
    invalid_public_key,
    invalid_content_type,
    requires_auth,
    crypto_failure,
    invalid_token,
    token_expired,
    invalid_base64,
    rate_limited,
    websocket_parse_error,
    connection_failed,
    uncaught_exception
)

}  // namespace cmdchat

namespace {

static const char* to_string(cmdchat::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown cmdchat error>");
}

// Custom category for cmdchat::errc. Exposed by get_cmdchat_category
class cmdchat_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "cmdchat"; }
    std::string message(int ev) const final override { return to_string(static_cast<cmdchat::errc>(ev)); }
};

static cmdchat_category cat;

}  // namespace

const boost::system::error_category& cmdchat::get_cmdchat_category() noexcept { return cat; }

[[noreturn]] void cmdchat::throw_exception_from_error(const error_with_message& e, const boost::source_location&)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void cmdchat::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
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

void cmdchat::log_info(std::string_view what) { std::cerr << what << '\n'; }
