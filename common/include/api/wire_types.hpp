//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_API_WIRE_TYPES_HPP
#define CMDCHAT_COMMON_INCLUDE_API_WIRE_TYPES_HPP

#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Websocket frames exchanged between the server and the client.
// These types are owning and match the field names of the JSON frames,
// since the server produces them and the client parses them back.
// Timestamps are serialized as milliseconds since the UNIX epoch.

namespace cmdchat {

// A chat message, as contained in message and room_update events
struct wire_message
{
    std::string id;
    std::string room_id;
    std::string user_id;
    std::string username;
    std::string content;
    std::string message_type;
    std::int64_t timestamp{};
    bool is_encrypted{};
};

// Converts a business message into its wire representation
wire_message to_wire_message(const message& msg);

//
// Talk channel frames (client to server)
//

// A chat message sent by the client. text is a Fernet token
struct chat_frame
{
    std::string text;
    std::string username;
    std::string room_id;
    std::int64_t timestamp{};

    std::string to_json() const;
};

// {"action": "close"}: the client is leaving
struct close_request
{
    std::string to_json() const;
};

// Anything we may receive through the talk channel, or an error_code
// if the frame is not valid JSON or not a JSON object.
// Frames without an action are interpreted as chat frames. Fields that are
// missing or have the wrong type are left empty, and rejected later by validation.
using any_talk_frame = boost::variant2::variant<error_code, close_request, chat_frame>;

any_talk_frame parse_talk_frame(std::string_view from);

//
// Server events (server to client)
//

// Sent through the talk channel once the connection is registered
struct connected_event
{
    std::string room_id;
    std::int64_t user_count{};
    std::int64_t timestamp{};

    std::string to_json() const;
};

// Broadcast to the room when a message is received
struct message_event
{
    wire_message message;

    std::string to_json() const;
};

// Sent periodically through the update channel
struct heartbeat_event
{
    std::int64_t user_count{};
    std::int64_t timestamp{};

    std::string to_json() const;
};

// Room metadata, as contained in room_update events
struct room_summary
{
    std::string id;
    std::string name;
    std::int64_t member_count{};
};

// Sent once when a client subscribes through the update channel
struct room_update_event
{
    room_summary room;
    std::vector<wire_message> recent_messages;
    std::int64_t timestamp{};

    std::string to_json() const;
};

// Sent to the sender of a message, once it's been stored and broadcast.
// Serialized as {"status": "ok", "message_id": "..."}
struct ack_event
{
    std::string message_id;

    std::string to_json() const;
};

// An inline error that doesn't close the channel. Serialized as {"error": "..."}
struct error_event
{
    std::string error;

    std::string to_json() const;
};

// Anything the server may send, or an error_code if the frame can't be parsed
using any_server_event = boost::variant2::variant<
    error_code,
    connected_event,
    message_event,
    heartbeat_event,
    room_update_event,
    ack_event,
    error_event>;

any_server_event parse_server_event(std::string_view from);

}  // namespace cmdchat

#endif
