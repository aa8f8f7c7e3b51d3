//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_ERROR_HPP
#define CMDCHAT_COMMON_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio and Beast.

namespace cmdchat {

using error_code = boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    // Validation errors. The offending request is rejected and no state is changed
    invalid_username = 1,     // username is not 2-20 chars of [A-Za-z0-9_-]
    invalid_room_name,        // room name is empty or longer than 30 chars
    invalid_room_type,        // room type is not public, private or direct
    invalid_message_content,  // message content is empty or too long
    room_not_found,           // the requested room doesn't exist
    invalid_public_key,       // the public key is missing or can't be loaded
    invalid_content_type,     // an endpoint received an unsupported Content-Type

    // Authentication errors
    requires_auth,  // the admin password is missing or doesn't match

    // Cryptographic errors. Fatal to the handshake attempt
    crypto_failure,  // an OpenSSL primitive failed
    invalid_token,   // a token failed signature verification or is malformed
    token_expired,   // a token is older than the allowed maximum age
    invalid_base64,  // attempt to decode an invalid base64 string

    // Per-message errors
    rate_limited,           // the user exceeded the allowed message rate
    websocket_parse_error,  // data received through a websocket didn't match the format we expected

    // Transport errors
    connection_failed,  // the reconnection budget was exhausted

    uncaught_exception,  // a handler threw an unexpected exception
};

// The error category for errc
const boost::system::error_category& get_cmdchat_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_cmdchat_category());
}

// An error code with an optional diagnostic message, to provide more context
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// A value or an error_with_message
template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Required by boost::system::result to throw from error_with_message
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location& loc);

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");

inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

// Logs an informational message to stderr
void log_info(std::string_view what);

}  // namespace cmdchat

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<cmdchat::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define CMDCHAT_RETURN_ERROR(e)                                                   \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but for co_return
#define CMDCHAT_CO_RETURN_ERROR(e)                                                   \
    {                                                                                \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                          \
        co_return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Returns an error_with_message with source-code location information on it
#define CMDCHAT_RETURN_ERROR_WITH_MESSAGE(e, msg)                                     \
    {                                                                                 \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                           \
        return ::cmdchat::error_with_message{                                         \
            ::boost::system::error_code(::boost::system::error_code(e), &loc),        \
            msg                                                                       \
        };                                                                            \
    }

// Same, but for co_return
#define CMDCHAT_CO_RETURN_ERROR_WITH_MESSAGE(e, msg)                                  \
    {                                                                                 \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                           \
        co_return ::cmdchat::error_with_message{                                      \
            ::boost::system::error_code(::boost::system::error_code(e), &loc),        \
            msg                                                                       \
        };                                                                            \
    }

#endif
