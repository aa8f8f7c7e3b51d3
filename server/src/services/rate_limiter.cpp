//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/rate_limiter.hpp"

#include <string>
#include <string_view>

using namespace cmdchat;

bool rate_limiter::try_acquire(std::string_view user_id, clock::time_point now)
{
    auto& entries = timestamps_[std::string(user_id)];

    // Timestamps are recorded in order, so expired ones are at the front
    while (!entries.empty() && now - entries.front() >= window_)
        entries.pop_front();

    if (entries.size() >= limit_)
        return false;

    entries.push_back(now);
    return true;
}

std::size_t rate_limiter::count(std::string_view user_id) const
{
    auto it = timestamps_.find(std::string(user_id));
    return it == timestamps_.end() ? 0u : it->second.size();
}
