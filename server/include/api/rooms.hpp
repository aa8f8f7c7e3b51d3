//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_API_ROOMS_HPP
#define CMDCHAT_SERVER_INCLUDE_API_ROOMS_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// API handler functions for room management and server status

namespace cmdchat {

class shared_state;

// GET /rooms
boost::asio::awaitable<response_builder::response_type> handle_list_rooms(request_context& ctx, shared_state& st);

// POST /rooms. Requires the admin password
boost::asio::awaitable<response_builder::response_type> handle_create_room(request_context& ctx, shared_state& st);

// GET /health
boost::asio::awaitable<response_builder::response_type> handle_health(request_context& ctx, shared_state& st);

}  // namespace cmdchat

#endif
