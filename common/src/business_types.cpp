//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "business_types.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <string>
#include <string_view>

#include "error.hpp"
#include "timestamp.hpp"
#include "util/fernet.hpp"

using namespace cmdchat;

// Encrypted messages carry Fernet tokens. Their size limit is the size of a
// token carrying the maximum plaintext size.
static constexpr std::size_t max_encrypted_message_size = fernet_token_size(max_message_size);

static bool is_username_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

static bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string cmdchat::generate_id()
{
    // The generator is expensive to construct and not thread-safe
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string cmdchat::make_user_id(std::string_view ip_address, std::string_view username)
{
    std::string res;
    res.reserve(ip_address.size() + username.size() + 1);
    res.append(ip_address);
    res.push_back(':');
    res.append(username);
    return res;
}

std::string_view cmdchat::trim(std::string_view input) noexcept
{
    while (!input.empty() && is_space(input.front()))
        input.remove_prefix(1);
    while (!input.empty() && is_space(input.back()))
        input.remove_suffix(1);
    return input;
}

error_code cmdchat::validate_username(std::string_view username)
{
    if (username.size() < min_username_size || username.size() > max_username_size)
        CMDCHAT_RETURN_ERROR(errc::invalid_username)
    if (!std::all_of(username.begin(), username.end(), is_username_char))
        CMDCHAT_RETURN_ERROR(errc::invalid_username)
    return error_code();
}

error_code cmdchat::validate_room_name(std::string_view trimmed_name)
{
    if (trimmed_name.empty() || trimmed_name.size() > max_room_name_size)
        CMDCHAT_RETURN_ERROR(errc::invalid_room_name)
    return error_code();
}

result<user> cmdchat::make_user(std::string_view ip_address, std::string_view username)
{
    auto ec = validate_username(username);
    if (ec)
        return ec;

    auto now = current_timestamp();
    return user{
        make_user_id(ip_address, username),
        std::string(username),
        user_status::online,
        now,
        now,
        std::string(ip_address),
        false,
    };
}

result<room> cmdchat::make_room(
    std::string_view name,
    room_type type,
    std::string created_by,
    std::string description,
    std::string id
)
{
    auto trimmed_name = trim(name);
    auto ec = validate_room_name(trimmed_name);
    if (ec)
        return ec;

    room res;
    res.id = std::move(id);
    res.name = std::string(trimmed_name);
    res.type = type;
    res.created_by = std::move(created_by);
    res.created_at = current_timestamp();
    res.description = std::move(description);
    return res;
}

result<message> cmdchat::make_message(
    std::string room_id,
    const user& sender,
    std::string_view content,
    message_type type,
    bool is_encrypted
)
{
    auto trimmed_content = trim(content);
    auto max_size = is_encrypted ? max_encrypted_message_size : max_message_size;
    if (trimmed_content.empty() || trimmed_content.size() > max_size)
        CMDCHAT_RETURN_ERROR(errc::invalid_message_content)

    message res;
    res.id = generate_id();
    res.room_id = std::move(room_id);
    res.user_id = sender.id;
    res.username = sender.username;
    res.content = std::string(trimmed_content);
    res.type = type;
    res.timestamp = current_timestamp();
    res.is_encrypted = is_encrypted;
    return res;
}

std::string_view cmdchat::to_string(user_status v) noexcept
{
    switch (v)
    {
    case user_status::away: return "away";
    case user_status::offline: return "offline";
    case user_status::busy: return "busy";
    case user_status::online:
    default: return "online";
    }
}

std::string_view cmdchat::to_string(room_type v) noexcept
{
    switch (v)
    {
    case room_type::private_room: return "private";
    case room_type::direct_room: return "direct";
    case room_type::public_room:
    default: return "public";
    }
}

std::string_view cmdchat::to_string(message_type v) noexcept
{
    switch (v)
    {
    case message_type::system: return "system";
    case message_type::emoji: return "emoji";
    case message_type::file: return "file";
    case message_type::command: return "command";
    case message_type::text:
    default: return "text";
    }
}

result<room_type> cmdchat::parse_room_type(std::string_view from) noexcept
{
    if (from == "public")
        return room_type::public_room;
    else if (from == "private")
        return room_type::private_room;
    else if (from == "direct")
        return room_type::direct_room;
    else
        CMDCHAT_RETURN_ERROR(errc::invalid_room_type)
}

result<message_type> cmdchat::parse_message_type(std::string_view from) noexcept
{
    if (from == "text")
        return message_type::text;
    else if (from == "system")
        return message_type::system;
    else if (from == "emoji")
        return message_type::emoji;
    else if (from == "file")
        return message_type::file;
    else if (from == "command")
        return message_type::command;
    else
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
}
