//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/rate_limiter.hpp"

#include <boost/test/unit_test.hpp>

#include <chrono>

using namespace cmdchat;
using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(rate_limiter_)

const rate_limiter::clock::time_point t0{std::chrono::hours(1000)};

BOOST_AUTO_TEST_CASE(limit_reached)
{
    rate_limiter limiter(10, 60s);

    // 10 messages within the window are accepted
    for (int i = 0; i < 10; ++i)
        BOOST_TEST(limiter.try_acquire("user", t0 + std::chrono::seconds(i)));

    // The 11th is rejected, and doesn't count
    BOOST_TEST(!limiter.try_acquire("user", t0 + 30s));
    BOOST_TEST(limiter.count("user") == 10u);
}

BOOST_AUTO_TEST_CASE(window_expires)
{
    rate_limiter limiter(10, 60s);
    for (int i = 0; i < 10; ++i)
        BOOST_TEST(limiter.try_acquire("user", t0));
    BOOST_TEST(!limiter.try_acquire("user", t0 + 59s));

    // After the window has elapsed, old entries are dropped
    BOOST_TEST(limiter.try_acquire("user", t0 + 61s));
    BOOST_TEST(limiter.count("user") == 1u);
}

BOOST_AUTO_TEST_CASE(sliding)
{
    rate_limiter limiter(2, 10s);
    BOOST_TEST(limiter.try_acquire("user", t0));
    BOOST_TEST(limiter.try_acquire("user", t0 + 5s));
    BOOST_TEST(!limiter.try_acquire("user", t0 + 9s));

    // Only the first entry has expired
    BOOST_TEST(limiter.try_acquire("user", t0 + 10s));
    BOOST_TEST(!limiter.try_acquire("user", t0 + 11s));
}

BOOST_AUTO_TEST_CASE(users_are_independent)
{
    rate_limiter limiter(1, 60s);
    BOOST_TEST(limiter.try_acquire("1.2.3.4:alice", t0));
    BOOST_TEST(!limiter.try_acquire("1.2.3.4:alice", t0));
    BOOST_TEST(limiter.try_acquire("1.2.3.4:bob", t0));
    BOOST_TEST(limiter.count("unknown") == 0u);
}

BOOST_AUTO_TEST_SUITE_END()
