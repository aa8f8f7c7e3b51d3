//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_client.hpp"

#include <boost/test/unit_test.hpp>

#include "error.hpp"

using namespace cmdchat;

BOOST_AUTO_TEST_SUITE(parse_rooms_response_)

BOOST_AUTO_TEST_CASE(success)
{
    constexpr std::string_view body = R"({
        "rooms": [
            {"id": "general", "name": "general", "description": "General chat room", "active_users": 2, "is_active": true},
            {"id": "4b1e", "name": "Games", "active_users": 0}
        ],
        "total": 2
    })";

    auto res = parse_rooms_response(body);
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST_REQUIRE(res->size() == 2u);
    BOOST_TEST(res->at(0).id == "general");
    BOOST_TEST(res->at(0).name == "general");
    BOOST_TEST(res->at(0).description == "General chat room");
    BOOST_TEST(res->at(0).active_users == 2);
    BOOST_TEST(res->at(1).id == "4b1e");
    BOOST_TEST(res->at(1).name == "Games");
    BOOST_TEST(res->at(1).description == "");
}

BOOST_AUTO_TEST_CASE(empty)
{
    auto res = parse_rooms_response(R"({"rooms": [], "total": 0})");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->empty());
}

BOOST_AUTO_TEST_CASE(error)
{
    BOOST_TEST(parse_rooms_response("not json").has_error());
    BOOST_TEST(parse_rooms_response("[]").error() == error_code(errc::websocket_parse_error));
    BOOST_TEST(parse_rooms_response(R"({"total": 0})").error() == error_code(errc::websocket_parse_error));
    BOOST_TEST(parse_rooms_response(R"({"rooms": [{"id": 1}]})").error() == error_code(errc::websocket_parse_error));
}

BOOST_AUTO_TEST_SUITE_END()
