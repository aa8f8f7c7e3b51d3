//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_BUSINESS_TYPES_HPP
#define CMDCHAT_COMMON_INCLUDE_BUSINESS_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"
#include "timestamp.hpp"

// This file contains business object definitions, together with the
// functions that validate and create them. Objects are never constructed
// with invalid field values: use the make_xxx functions.

namespace cmdchat {

// Limits
inline constexpr std::size_t min_username_size = 2u;
inline constexpr std::size_t max_username_size = 20u;
inline constexpr std::size_t max_room_name_size = 30u;
inline constexpr std::size_t max_message_size = 1000u;
inline constexpr std::size_t default_room_capacity = 50u;

enum class user_status
{
    online,
    away,
    offline,
    busy,
};

enum class room_type
{
    public_room,
    private_room,
    direct_room,
};

enum class message_type
{
    text,
    system,
    emoji,
    file,
    command,
};

// An application user. Identified by the address it connects from plus its display name
struct user
{
    // User ID: "<ip address>:<username>"
    std::string id;

    // Display name
    std::string username;

    user_status status{user_status::online};
    timestamp_t joined_at;
    timestamp_t last_seen;
    std::string ip_address;
    bool is_admin{};
};

// A chat room
struct room
{
    std::string id;

    // User-facing room name
    std::string name;

    room_type type{room_type::public_room};

    // Username of the creator, or "system" for the default rooms
    std::string created_by;

    timestamp_t created_at;
    std::string description;
    bool is_active{true};

    // Maximum number of members
    std::size_t max_members{default_room_capacity};

    // Only meaningful for private rooms. Not enforced.
    std::optional<std::string> password;
};

// A chat message. Immutable once created
struct message
{
    std::string id;
    std::string room_id;

    // ID and display name of the user that sent the message
    std::string user_id;
    std::string username;

    // The actual content of the message. If is_encrypted, this is a Fernet token
    std::string content;

    message_type type{message_type::text};

    // UTC timestamp when the server received the message
    timestamp_t timestamp;

    bool is_encrypted{true};

    // ID of the message being replied to, if any
    std::optional<std::string> reply_to;

    // For file messages
    std::optional<std::string> file_url;
};

// Tracks one logical participant's current subscription
struct connection_info
{
    std::string user_id;
    std::string room_id;
    timestamp_t connected_at;
    timestamp_t last_ping;
    bool is_active{true};
};

// Generates a random identifier (a UUID in its canonical text form)
std::string generate_id();

// Returns the user ID for a username connecting from a certain address
std::string make_user_id(std::string_view ip_address, std::string_view username);

// Validation. Return an empty error_code on success
error_code validate_username(std::string_view username);
error_code validate_room_name(std::string_view trimmed_name);

// Removes leading and trailing whitespace
std::string_view trim(std::string_view input) noexcept;

// Factory functions. These validate their input and fill IDs and timestamps
result<user> make_user(std::string_view ip_address, std::string_view username);
result<room> make_room(
    std::string_view name,
    room_type type,
    std::string created_by,
    std::string description,
    std::string id = generate_id()
);
result<message> make_message(
    std::string room_id,
    const user& sender,
    std::string_view content,
    message_type type = message_type::text,
    bool is_encrypted = true
);

// Conversions from and to the wire representation of the enums
std::string_view to_string(user_status v) noexcept;
std::string_view to_string(room_type v) noexcept;
std::string_view to_string(message_type v) noexcept;
result<room_type> parse_room_type(std::string_view from) noexcept;
result<message_type> parse_message_type(std::string_view from) noexcept;

}  // namespace cmdchat

#endif
