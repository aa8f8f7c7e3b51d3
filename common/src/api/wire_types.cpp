//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/wire_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace cmdchat;

namespace cmdchat {

//
// Describe metadata is defined in this .cpp file to reduce build times.
// Care must be taken to not redefine this metadata in other files, which is
// an ODR violation.
//
BOOST_DESCRIBE_STRUCT(wire_message, (), (id, room_id, user_id, username, content, message_type, timestamp, is_encrypted))

}  // namespace cmdchat

wire_message cmdchat::to_wire_message(const message& msg)
{
    return wire_message{
        msg.id,
        msg.room_id,
        msg.user_id,
        msg.username,
        msg.content,
        std::string(to_string(msg.type)),
        serialize_timestamp(msg.timestamp),
        msg.is_encrypted,
    };
}

//
// Parsing helpers
//

static result<boost::json::object> parse_object(std::string_view from)
{
    error_code ec;
    auto jv = boost::json::parse(from, ec);
    if (ec)
        CMDCHAT_RETURN_ERROR(ec)
    auto* obj = jv.if_object();
    if (!obj)
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    return std::move(*obj);
}

// Returns the string in obj[key], or an empty view if it's not there or it's not a string
static std::string_view string_or_empty(const boost::json::object& obj, std::string_view key) noexcept
{
    auto it = obj.find(key);
    if (it == obj.end())
        return {};
    const auto* s = it->value().if_string();
    return s ? std::string_view(*s) : std::string_view();
}

static result<std::string> get_string(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    return std::string(it->value().get_string());
}

static result<std::int64_t> get_int(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    error_code ec;
    auto res = it->value().to_number<std::int64_t>(ec);
    if (ec)
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    return res;
}

//
// Talk channel frames
//

std::string chat_frame::to_json() const
{
    return boost::json::serialize(boost::json::object({
        {"text",      text     },
        {"username",  username },
        {"room_id",   room_id  },
        {"timestamp", timestamp},
    }));
}

std::string close_request::to_json() const { return R"({"action":"close"})"; }

any_talk_frame cmdchat::parse_talk_frame(std::string_view from)
{
    auto obj = parse_object(from);
    if (obj.has_error())
        return obj.error();

    // Close requests
    if (string_or_empty(*obj, "action") == "close")
        return close_request{};

    // Anything else is a chat frame. Room and user are determined by the
    // connection, so the values sent here are informative only
    chat_frame res;
    res.text = string_or_empty(*obj, "text");
    res.username = string_or_empty(*obj, "username");
    res.room_id = string_or_empty(*obj, "room_id");
    auto ts = get_int(*obj, "timestamp");
    if (ts.has_value())
        res.timestamp = *ts;
    return res;
}

//
// Server events
//

static std::string serialize_event(std::string_view type, boost::json::object payload)
{
    payload.emplace("type", type);
    return boost::json::serialize(payload);
}

std::string connected_event::to_json() const
{
    return serialize_event(
        "connected",
        boost::json::object({
            {"room_id",    room_id   },
            {"user_count", user_count},
            {"timestamp",  timestamp },
    })
    );
}

std::string message_event::to_json() const
{
    boost::json::object payload;
    payload.emplace("message", boost::json::value_from(message));
    return serialize_event("message", std::move(payload));
}

std::string heartbeat_event::to_json() const
{
    return serialize_event(
        "heartbeat",
        boost::json::object({
            {"user_count", user_count},
            {"timestamp",  timestamp },
    })
    );
}

std::string room_update_event::to_json() const
{
    boost::json::object payload;
    payload.emplace(
        "room",
        boost::json::object({
            {"id",           room.id          },
            {"name",         room.name        },
            {"member_count", room.member_count},
    })
    );
    payload.emplace("recent_messages", boost::json::value_from(recent_messages));
    payload.emplace("timestamp", timestamp);
    return serialize_event("room_update", std::move(payload));
}

std::string ack_event::to_json() const
{
    return boost::json::serialize(boost::json::object({
        {"status",     "ok"      },
        {"message_id", message_id},
    }));
}

std::string error_event::to_json() const
{
    return boost::json::serialize(boost::json::object({
        {"error", error},
    }));
}

static result<wire_message> parse_wire_message(const boost::json::value& from)
{
    auto res = boost::json::try_value_to<wire_message>(from);
    if (res.has_error())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    return std::move(res).value();
}

static any_server_event parse_message_event(const boost::json::object& obj)
{
    auto it = obj.find("message");
    if (it == obj.end())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    auto msg = parse_wire_message(it->value());
    if (msg.has_error())
        return msg.error();
    return message_event{std::move(*msg)};
}

static any_server_event parse_room_update_event(const boost::json::object& obj)
{
    // Room
    auto room_it = obj.find("room");
    if (room_it == obj.end() || !room_it->value().is_object())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    const auto& room_obj = room_it->value().get_object();
    auto id = get_string(room_obj, "id");
    auto name = get_string(room_obj, "name");
    auto member_count = get_int(room_obj, "member_count");
    if (id.has_error() || name.has_error() || member_count.has_error())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)

    // Messages
    auto msgs_it = obj.find("recent_messages");
    if (msgs_it == obj.end() || !msgs_it->value().is_array())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    std::vector<wire_message> msgs;
    msgs.reserve(msgs_it->value().get_array().size());
    for (const auto& elm : msgs_it->value().get_array())
    {
        auto msg = parse_wire_message(elm);
        if (msg.has_error())
            return msg.error();
        msgs.push_back(std::move(*msg));
    }

    auto ts = get_int(obj, "timestamp");
    if (ts.has_error())
        return ts.error();

    return room_update_event{
        room_summary{std::move(*id), std::move(*name), *member_count},
        std::move(msgs),
        *ts,
    };
}

any_server_event cmdchat::parse_server_event(std::string_view from)
{
    auto obj = parse_object(from);
    if (obj.has_error())
        return obj.error();

    // Inline errors and acknowledgments don't have a type
    auto it = obj->find("error");
    if (it != obj->end())
    {
        const auto* err = it->value().if_string();
        if (!err)
            CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
        return error_event{std::string(*err)};
    }
    if (string_or_empty(*obj, "status") == "ok")
    {
        auto id = get_string(*obj, "message_id");
        if (id.has_error())
            return id.error();
        return ack_event{std::move(*id)};
    }

    // Parse the event, depending on its type
    auto type = string_or_empty(*obj, "type");
    if (type == "message")
    {
        return parse_message_event(*obj);
    }
    else if (type == "heartbeat")
    {
        auto user_count = get_int(*obj, "user_count");
        auto ts = get_int(*obj, "timestamp");
        if (user_count.has_error() || ts.has_error())
            CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
        return heartbeat_event{*user_count, *ts};
    }
    else if (type == "room_update")
    {
        return parse_room_update_event(*obj);
    }
    else if (type == "connected")
    {
        auto room_id = get_string(*obj, "room_id");
        auto user_count = get_int(*obj, "user_count");
        auto ts = get_int(*obj, "timestamp");
        if (room_id.has_error() || user_count.has_error() || ts.has_error())
            CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
        return connected_event{std::move(*room_id), *user_count, *ts};
    }
    else
    {
        // Unknown type
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    }
}
