//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_history.hpp"

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "business_types.hpp"

using namespace cmdchat;

BOOST_AUTO_TEST_SUITE(room_history_)

static message make_test_message(int i)
{
    message res;
    res.id = std::to_string(i);
    res.room_id = "general";
    res.content = "content " + std::to_string(i);
    return res;
}

static std::vector<std::string> ids(const std::vector<message>& msgs)
{
    std::vector<std::string> res;
    for (const auto& msg : msgs)
        res.push_back(msg.id);
    return res;
}

using string_vector = std::vector<std::string>;

BOOST_AUTO_TEST_CASE(append_below_capacity)
{
    room_history history(5);
    history.append(make_test_message(1));
    history.append(make_test_message(2));

    BOOST_TEST(history.size() == 2u);
    BOOST_TEST(ids(history.recent(0)) == (string_vector{"1", "2"}));
}

BOOST_AUTO_TEST_CASE(eviction)
{
    // Appending cap + k messages leaves the newest cap, in order
    room_history history(3);
    for (int i = 0; i < 5; ++i)
        history.append(make_test_message(i));

    BOOST_TEST(history.size() == 3u);
    BOOST_TEST(ids(history.recent(0)) == (string_vector{"2", "3", "4"}));
}

BOOST_AUTO_TEST_CASE(recent)
{
    room_history history(10);
    for (int i = 0; i < 4; ++i)
        history.append(make_test_message(i));

    BOOST_TEST(ids(history.recent(2)) == (string_vector{"2", "3"}));
    BOOST_TEST(ids(history.recent(4)) == (string_vector{"0", "1", "2", "3"}));

    // Clamped to the available messages
    BOOST_TEST(ids(history.recent(50)) == (string_vector{"0", "1", "2", "3"}));

    // Non-positive values return everything
    BOOST_TEST(ids(history.recent(-1)) == (string_vector{"0", "1", "2", "3"}));
}

BOOST_AUTO_TEST_CASE(empty)
{
    room_history history(10);
    BOOST_TEST(history.size() == 0u);
    BOOST_TEST(history.recent(5).empty());
    BOOST_TEST(history.recent(0).empty());
}

BOOST_AUTO_TEST_SUITE_END()
