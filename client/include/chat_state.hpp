//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_CHAT_STATE_HPP
#define CMDCHAT_CLIENT_INCLUDE_CHAT_STATE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "api/wire_types.hpp"
#include "timestamp.hpp"

namespace cmdchat {

class fernet;
class renderer;

// A decrypted message, as kept in the local history
struct history_entry
{
    std::string id;
    std::string room_id;
    std::string username;
    std::string content;
    timestamp_t timestamp;
    bool is_system;
};

// A room we know about, with its last known member count
struct known_room
{
    std::string name;
    std::int64_t member_count{};
};

// Client-local state: who we are, where we are and what we've seen.
// Owned by the client's event loop thread; never accessed concurrently.
class chat_state
{
    std::string username_;
    std::string current_room_;
    std::deque<history_entry> history_;
    std::unordered_set<std::string> seen_ids_;
    std::map<std::string, known_room, std::less<>> rooms_;
    std::optional<timestamp_t> last_heartbeat_;
    std::size_t sent_count_{};
    timestamp_t started_at_;

    void process_message(const wire_message& msg, const fernet& cipher, std::chrono::seconds max_age, renderer& r);
    void add_to_history(history_entry entry);

public:
    // Maximum number of messages kept in the local history
    static constexpr std::size_t max_history_size = 1000;

    chat_state(std::string username, std::string room);

    const std::string& username() const noexcept { return username_; }
    void set_username(std::string value) { username_ = std::move(value); }

    const std::string& current_room() const noexcept { return current_room_; }
    void set_current_room(std::string value) { current_room_ = std::move(value); }

    // Messages, oldest first
    const std::deque<history_entry>& history() const noexcept { return history_; }

    // Senders of the non-system messages in the history for the given room,
    // in order of appearance, without duplicates
    std::vector<std::string> users_in_room(std::string_view room_id) const;

    // Rooms by id. Starts with the default rooms; updated by room listings and snapshots
    const std::map<std::string, known_room, std::less<>>& rooms() const noexcept { return rooms_; }
    void update_room(std::string_view id, std::string_view name, std::int64_t member_count);

    // Looks up a room by id or name. Returns the room id, if found
    std::optional<std::string> find_room(std::string_view id_or_name) const;

    std::optional<timestamp_t> last_heartbeat() const noexcept { return last_heartbeat_; }
    std::size_t sent_count() const noexcept { return sent_count_; }
    void record_sent() noexcept { ++sent_count_; }
    timestamp_t started_at() const noexcept { return started_at_; }

    // Processes a frame received through the update channel. Messages are decrypted,
    // added to the history and rendered. Messages already in the history are skipped.
    // Errors affect only the offending frame and are reported to the renderer.
    void handle_update_frame(
        std::string_view frame,
        const fernet& cipher,
        std::chrono::seconds max_age,
        renderer& r
    );

    // Processes a frame received through the talk channel. Only inline errors are
    // rendered: messages are echoed by the update channel, too.
    void handle_talk_frame(std::string_view frame, renderer& r);
};

}  // namespace cmdchat

#endif
