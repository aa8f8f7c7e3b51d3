//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_API_CHAT_WEBSOCKET_HPP
#define CMDCHAT_SERVER_INCLUDE_API_CHAT_WEBSOCKET_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>

#include "error.hpp"
#include "util/websocket.hpp"

// Websocket channels. Both take their parameters from the query string of the
// upgrade request: password, username and room_id (a room ID or name,
// general if not present). The websocket must have been accepted.
// Parameter errors close the websocket with an application close code.

namespace cmdchat {

// Forward declaration
class shared_state;

// Runs a talk channel (/talk) session until the client closes it or an error occurs.
// Receives chat frames from the client, stores and broadcasts them to the room.
boost::asio::awaitable<error_with_message> handle_talk_websocket(
    websocket socket,
    std::shared_ptr<shared_state> state
);

// Runs an update channel (/update) session until the client closes it or an error occurs.
// Sends a room snapshot, broadcast messages and periodic heartbeats.
boost::asio::awaitable<error_with_message> handle_update_websocket(
    websocket socket,
    std::shared_ptr<shared_state> state
);

}  // namespace cmdchat

#endif
