//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace cmdchat;

BOOST_AUTO_TEST_SUITE(api_types)

//
// Incoming types
//

BOOST_AUTO_TEST_CASE(create_room_request_from_json)
{
    // Data
    const char* from = R"%({
        "name": "My room",
        "type": "private",
        "description": "Some description"
    })%";

    // Call the function
    auto result = create_room_request::from_json(from);

    // Validate
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->name == "My room");
    BOOST_TEST((result->type == room_type::private_room));
    BOOST_TEST(result->description == "Some description");
}

BOOST_AUTO_TEST_CASE(create_room_request_from_json_defaults)
{
    auto result = create_room_request::from_json(R"({"name": "abc"})");
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->name == "abc");
    BOOST_TEST((result->type == room_type::public_room));
    BOOST_TEST(result->description == "");
}

BOOST_AUTO_TEST_CASE(create_room_request_from_json_missing_name)
{
    // Name validation happens later
    auto result = create_room_request::from_json(R"({"type": "public"})");
    BOOST_TEST_REQUIRE(result.error() == error_code());
    BOOST_TEST(result->name == "");
}

BOOST_AUTO_TEST_CASE(create_room_request_from_json_invalid_type)
{
    auto result = create_room_request::from_json(R"({"name": "abc", "type": "secret"})");
    BOOST_TEST(result.error() == error_code(errc::invalid_room_type));
}

BOOST_AUTO_TEST_CASE(create_room_request_from_json_error)
{
    constexpr std::string_view test_cases[] = {
        "",
        "{",
        "[]",
        "10",
        R"({"name": 10})",
        R"({"name": "abc", "type": null})",
        R"({"name": "abc", "description": []})",
    };
    for (auto tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc) { BOOST_TEST(create_room_request::from_json(tc).has_error()); }
    }
}

//
// Outgoing types
//

static room make_test_room()
{
    room res;
    res.id = "general";
    res.name = "general";
    res.type = room_type::public_room;
    res.created_by = "system";
    res.created_at = parse_timestamp(1700000000000);
    res.description = "General chat room";
    return res;
}

BOOST_AUTO_TEST_CASE(rooms_response_to_json)
{
    // Data
    auto r = make_test_room();
    std::vector<room_listing> rooms{
        {r, 2u}
    };
    rooms_response resp{rooms};

    // Call the function
    auto res = boost::json::parse(resp.to_json());

    // clang-format off
    boost::json::value expected = {
        {"rooms", {
            {
                {"id", "general"},
                {"name", "general"},
                {"type", "public"},
                {"created_by", "system"},
                {"created_at", 1700000000000},
                {"description", "General chat room"},
                {"is_active", true},
                {"member_count", 2},
                {"max_members", 50},
                {"active_users", 2},
            },
        }},
        {"total", 1},
    };
    // clang-format on

    // Validate
    BOOST_TEST(res == expected);
}

BOOST_AUTO_TEST_CASE(rooms_response_to_json_empty)
{
    rooms_response resp{};
    auto res = boost::json::parse(resp.to_json());
    boost::json::value expected = {
        {"rooms", boost::json::array()},
        {"total", 0                   },
    };
    BOOST_TEST(res == expected);
}

BOOST_AUTO_TEST_CASE(create_room_response_to_json)
{
    auto r = make_test_room();
    create_room_response resp{
        room_listing{r, 0u}
    };

    auto res = boost::json::parse(resp.to_json());
    BOOST_TEST_REQUIRE(res.is_object());
    BOOST_TEST(res.as_object().at("success").as_bool());
    const auto& room_json = res.as_object().at("room").as_object();
    BOOST_TEST(room_json.at("id").as_string() == "general");
    BOOST_TEST(room_json.at("member_count").to_number<int>() == 0);
    BOOST_TEST(!room_json.contains("active_users"));
}

BOOST_AUTO_TEST_CASE(health_response_to_json)
{
    health_response resp{1700000000000, 3u, 4u, 5u};
    auto res = boost::json::parse(resp.to_json());
    boost::json::value expected = {
        {"status",             "healthy"    },
        {"timestamp",          1700000000000},
        {"active_rooms",       3            },
        {"total_users",        4            },
        {"active_connections", 5            },
    };
    BOOST_TEST(res == expected);
}

BOOST_AUTO_TEST_SUITE_END()
