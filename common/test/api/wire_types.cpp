//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/wire_types.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/variant2/variant.hpp>

#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

using namespace cmdchat;
namespace variant2 = boost::variant2;

static wire_message make_wire_message(std::string id, std::string content)
{
    return wire_message{std::move(id), "general", "127.0.0.1:bob", "bob", std::move(content), "text", 1700000000000, true};
}

BOOST_AUTO_TEST_SUITE(wire_types)

//
// Talk channel frames
//
BOOST_AUTO_TEST_CASE(parse_talk_frame_chat)
{
    auto frame = parse_talk_frame(R"({"text": "gAAAAA", "username": "bob", "room_id": "tech", "timestamp": 42})");
    const auto& msg = variant2::get<chat_frame>(frame);
    BOOST_TEST(msg.text == "gAAAAA");
    BOOST_TEST(msg.username == "bob");
    BOOST_TEST(msg.room_id == "tech");
    BOOST_TEST(msg.timestamp == 42);
}

BOOST_AUTO_TEST_CASE(parse_talk_frame_missing_fields)
{
    // Missing or mistyped fields are left empty. Validation rejects them later
    auto frame = parse_talk_frame(R"({"text": 10})");
    const auto& msg = variant2::get<chat_frame>(frame);
    BOOST_TEST(msg.text == "");
    BOOST_TEST(msg.username == "");
    BOOST_TEST(msg.timestamp == 0);
}

BOOST_AUTO_TEST_CASE(parse_talk_frame_close)
{
    auto frame = parse_talk_frame(R"({"action": "close"})");
    BOOST_TEST(frame.index() == 1u);

    // Only the close action is special
    frame = parse_talk_frame(R"({"action": "other", "text": "hi"})");
    BOOST_TEST(variant2::get<chat_frame>(frame).text == "hi");

    // Serialization
    BOOST_TEST(boost::json::parse(close_request{}.to_json()) == boost::json::parse(R"({"action":"close"})"));
}

BOOST_AUTO_TEST_CASE(parse_talk_frame_error)
{
    for (std::string_view input : {"", "{", "not json", "[]", "10", "\"text\"", "{\"text\": \"a\""})
    {
        BOOST_TEST_CONTEXT(input)
        {
            auto frame = parse_talk_frame(input);
            BOOST_TEST(frame.index() == 0u);
        }
    }
}

BOOST_AUTO_TEST_CASE(chat_frame_to_json)
{
    chat_frame frame{"token", "alice", "general", 1234};
    auto expected = boost::json::parse(R"({"text":"token","username":"alice","room_id":"general","timestamp":1234})");
    BOOST_TEST(boost::json::parse(frame.to_json()) == expected);
}

//
// Server events
//
BOOST_AUTO_TEST_CASE(to_wire_message_)
{
    auto sender = make_user("10.0.0.2", "carol").value();
    auto msg = make_message("random", sender, "content", message_type::emoji).value();

    auto res = to_wire_message(msg);

    BOOST_TEST(res.id == msg.id);
    BOOST_TEST(res.room_id == "random");
    BOOST_TEST(res.user_id == "10.0.0.2:carol");
    BOOST_TEST(res.username == "carol");
    BOOST_TEST(res.content == "content");
    BOOST_TEST(res.message_type == "emoji");
    BOOST_TEST(res.timestamp == serialize_timestamp(msg.timestamp));
    BOOST_TEST(res.is_encrypted);
}

BOOST_AUTO_TEST_CASE(message_event_to_json)
{
    message_event evt{make_wire_message("msg1", "hello")};

    // clang-format off
    auto expected = boost::json::parse(R"({
        "type": "message",
        "message": {
            "id": "msg1",
            "room_id": "general",
            "user_id": "127.0.0.1:bob",
            "username": "bob",
            "content": "hello",
            "message_type": "text",
            "timestamp": 1700000000000,
            "is_encrypted": true
        }
    })");
    // clang-format on

    BOOST_TEST(boost::json::parse(evt.to_json()) == expected);
}

BOOST_AUTO_TEST_CASE(room_update_event_to_json)
{
    room_update_event evt{
        room_summary{"general", "general", 3},
        {make_wire_message("m1", "c1"), make_wire_message("m2", "c2")},
        1700000000001,
    };

    auto jv = boost::json::parse(evt.to_json());
    const auto& obj = jv.as_object();
    const auto& room_obj = obj.at("room").as_object();
    const auto& msgs = obj.at("recent_messages").as_array();

    BOOST_TEST(obj.at("type").as_string() == "room_update");
    BOOST_TEST(room_obj.at("member_count").as_int64() == 3);
    BOOST_TEST(room_obj.at("name").as_string() == "general");
    BOOST_TEST(msgs.size() == 2u);
    BOOST_TEST(msgs.at(1).as_object().at("id").as_string() == "m2");
    BOOST_TEST(obj.at("timestamp").as_int64() == 1700000000001);
}

BOOST_AUTO_TEST_CASE(simple_events_to_json)
{
    BOOST_TEST(
        boost::json::parse(heartbeat_event{4, 10}.to_json()) ==
        boost::json::parse(R"({"type":"heartbeat","user_count":4,"timestamp":10})")
    );
    BOOST_TEST(
        boost::json::parse(connected_event{"tech", 2, 11}.to_json()) ==
        boost::json::parse(R"({"type":"connected","room_id":"tech","user_count":2,"timestamp":11})")
    );
    BOOST_TEST(
        boost::json::parse(ack_event{"abc"}.to_json()) ==
        boost::json::parse(R"({"status":"ok","message_id":"abc"})")
    );
    BOOST_TEST(
        boost::json::parse(error_event{"Rate limit exceeded"}.to_json()) ==
        boost::json::parse(R"({"error":"Rate limit exceeded"})")
    );
}

// The client parses what the server serializes
BOOST_AUTO_TEST_CASE(parse_server_event_success)
{
    auto evt = parse_server_event(message_event{make_wire_message("msg1", "hello")}.to_json());
    const auto& msg = variant2::get<message_event>(evt).message;
    BOOST_TEST(msg.id == "msg1");
    BOOST_TEST(msg.username == "bob");
    BOOST_TEST(msg.content == "hello");
    BOOST_TEST(msg.timestamp == 1700000000000);

    evt = parse_server_event(
        room_update_event{room_summary{"r", "n", 1}, {make_wire_message("m1", "c1")}, 5}.to_json()
    );
    const auto& update = variant2::get<room_update_event>(evt);
    BOOST_TEST(update.room.id == "r");
    BOOST_TEST(update.room.name == "n");
    BOOST_TEST(update.room.member_count == 1);
    BOOST_TEST(update.recent_messages.size() == 1u);
    BOOST_TEST(update.timestamp == 5);

    evt = parse_server_event(R"({"type":"heartbeat","user_count":7,"timestamp":100})");
    BOOST_TEST(variant2::get<heartbeat_event>(evt).user_count == 7);

    evt = parse_server_event(R"({"type":"connected","room_id":"tech","user_count":2,"timestamp":100})");
    BOOST_TEST(variant2::get<connected_event>(evt).room_id == "tech");

    evt = parse_server_event(R"({"status":"ok","message_id":"abc"})");
    BOOST_TEST(variant2::get<ack_event>(evt).message_id == "abc");

    evt = parse_server_event(R"({"error":"Invalid JSON"})");
    BOOST_TEST(variant2::get<error_event>(evt).error == "Invalid JSON");
}

BOOST_AUTO_TEST_CASE(parse_server_event_error)
{
    for (std::string_view input : {
             "",
             "[]",
             R"({"type":"unknown"})",
             R"({"type":"heartbeat","user_count":"a","timestamp":1})",
             R"({"type":"heartbeat"})",
             R"({"type":"message"})",
             R"({"type":"message","message":{"id":"a"}})",
             R"({"type":"room_update","room":{"id":"a","name":"b","member_count":1},"timestamp":1})",
             R"({"error":10})",
             R"({"status":"ok"})",
         })
    {
        BOOST_TEST_CONTEXT(input)
        {
            auto evt = parse_server_event(input);
            BOOST_TEST(evt.index() == 0u);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
