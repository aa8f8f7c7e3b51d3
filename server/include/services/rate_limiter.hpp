//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_SERVICES_RATE_LIMITER_HPP
#define CMDCHAT_SERVER_INCLUDE_SERVICES_RATE_LIMITER_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cmdchat {

// Per-user sliding window rate limiter. For each user, keeps the times
// of the messages accepted within the last window. State is never reset,
// so reconnecting doesn't restore a user's quota.
class rate_limiter
{
public:
    using clock = std::chrono::steady_clock;

    rate_limiter(std::size_t limit, clock::duration window) : limit_(limit), window_(window) {}

    // If the user has less than limit accepted messages within the window ending
    // at now, records now and returns true. Otherwise, returns false without recording anything.
    bool try_acquire(std::string_view user_id, clock::time_point now = clock::now());

    // Number of messages currently accounted for the user (for testing)
    std::size_t count(std::string_view user_id) const;

private:
    std::size_t limit_;
    clock::duration window_;
    std::unordered_map<std::string, std::deque<clock::time_point>> timestamps_;
};

}  // namespace cmdchat

#endif
