//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_history.hpp"

#include <cstddef>
#include <utility>
#include <vector>

#include "business_types.hpp"

using namespace cmdchat;

void room_history::append(message msg)
{
    messages_.push_back(std::move(msg));
    while (messages_.size() > max_size_)
        messages_.pop_front();
}

std::vector<message> room_history::recent(std::ptrdiff_t n) const
{
    std::size_t count = messages_.size();
    if (n > 0 && static_cast<std::size_t>(n) < count)
        count = static_cast<std::size_t>(n);
    return std::vector<message>(messages_.end() - static_cast<std::ptrdiff_t>(count), messages_.end());
}
