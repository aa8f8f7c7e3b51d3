//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_SERVER_CONFIG_HPP
#define CMDCHAT_SERVER_INCLUDE_SERVER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace cmdchat {

// Server tunables. Defaults are used in production; tests override some of them.
struct server_config
{
    // Shared admin password. If not set, password checks always pass
    std::optional<std::string> admin_password;

    // Maximum number of messages retained per room
    std::size_t history_size{10000};

    // Number of messages included in room_update snapshots
    std::size_t snapshot_size{50};

    // At most rate_limit messages per user are accepted within rate_window
    std::size_t rate_limit{10};
    std::chrono::steady_clock::duration rate_window{std::chrono::seconds(60)};

    // Interval between heartbeats in the update channel
    std::chrono::steady_clock::duration heartbeat_interval{std::chrono::seconds(30)};

    // Maximum size of HTTP request bodies
    std::size_t body_limit{10000};

    // Reading a request and running an endpoint handler must complete within this time
    std::chrono::steady_clock::duration request_timeout{std::chrono::seconds(30)};
};

}  // namespace cmdchat

#endif
