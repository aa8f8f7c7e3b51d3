//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_SERVICES_ROOM_HISTORY_HPP
#define CMDCHAT_SERVER_INCLUDE_SERVICES_ROOM_HISTORY_HPP

#include <cstddef>
#include <deque>
#include <vector>

#include "business_types.hpp"

namespace cmdchat {

// The messages of a room, in arrival order. Holds at most max_size messages:
// once full, appending a message evicts the oldest one.
class room_history
{
    std::deque<message> messages_;
    std::size_t max_size_;

public:
    explicit room_history(std::size_t max_size) : max_size_(max_size) {}

    std::size_t size() const noexcept { return messages_.size(); }
    std::size_t max_size() const noexcept { return max_size_; }

    void append(message msg);

    // Returns the n most recent messages, oldest first. If n is bigger than
    // the number of retained messages or n <= 0, returns all of them.
    std::vector<message> recent(std::ptrdiff_t n) const;
};

}  // namespace cmdchat

#endif
