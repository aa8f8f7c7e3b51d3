//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_CLIENT_CONFIG_HPP
#define CMDCHAT_CLIENT_INCLUDE_CLIENT_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>

namespace cmdchat {

// Client tunables. Defaults are used in production; tests override some of them.
struct client_config
{
    // Where the server is listening
    std::string host;
    std::string port;

    // The name other users will see
    std::string username;

    // Shared admin password, if the server requires one
    std::optional<std::string> password;

    // The room we join on startup
    std::string initial_room{"general"};

    // Number of connection attempts before giving up
    unsigned max_retries{5};

    // The n-th failed attempt (starting at zero) is followed by a wait of base_delay * 2^n
    std::chrono::steady_clock::duration base_delay{std::chrono::seconds(1)};

    // TCP connection, websocket handshake and HTTP requests must complete within this time
    std::chrono::steady_clock::duration connect_timeout{std::chrono::seconds(10)};

    // Messages encrypted before this are rejected
    std::chrono::seconds token_max_age{std::chrono::hours(24)};

    // Wait after the send channel is lost, before sending again
    std::chrono::steady_clock::duration reconnect_wait{std::chrono::seconds(2)};
};

}  // namespace cmdchat

#endif
