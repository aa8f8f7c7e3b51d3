//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "chat_state.hpp"

#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/wire_types.hpp"
#include "renderer.hpp"
#include "timestamp.hpp"
#include "util/fernet.hpp"

using namespace cmdchat;

chat_state::chat_state(std::string username, std::string room)
    : username_(std::move(username)), current_room_(std::move(room)), started_at_(std::chrono::system_clock::now())
{
    // The server always has these rooms
    for (std::string_view id : {"general", "random", "tech"})
        rooms_.emplace(std::string(id), known_room{std::string(id), 0});
}

void chat_state::update_room(std::string_view id, std::string_view name, std::int64_t member_count)
{
    auto it = rooms_.find(id);
    if (it == rooms_.end())
        it = rooms_.emplace(std::string(id), known_room{}).first;
    it->second.name = name;
    it->second.member_count = member_count;
}

std::optional<std::string> chat_state::find_room(std::string_view id_or_name) const
{
    auto it = rooms_.find(id_or_name);
    if (it != rooms_.end())
        return it->first;
    for (const auto& r : rooms_)
    {
        if (r.second.name == id_or_name)
            return r.first;
    }
    return std::nullopt;
}

std::vector<std::string> chat_state::users_in_room(std::string_view room_id) const
{
    std::vector<std::string> res;
    for (const auto& entry : history_)
    {
        if (entry.room_id != room_id || entry.is_system)
            continue;
        if (std::find(res.begin(), res.end(), entry.username) == res.end())
            res.push_back(entry.username);
    }
    return res;
}

void chat_state::add_to_history(history_entry entry)
{
    seen_ids_.insert(entry.id);
    history_.push_back(std::move(entry));
    while (history_.size() > max_history_size)
    {
        seen_ids_.erase(history_.front().id);
        history_.pop_front();
    }
}

void chat_state::process_message(
    const wire_message& msg,
    const fernet& cipher,
    std::chrono::seconds max_age,
    renderer& r
)
{
    // Skip duplicates. Snapshots may contain messages we've already received
    if (seen_ids_.count(msg.id))
        return;

    // Decrypt the content
    std::string content;
    if (msg.is_encrypted)
    {
        auto decrypted = cipher.decrypt(msg.content, max_age);
        if (decrypted.has_error())
        {
            r.error("Message processing error: " + decrypted.error().message());
            return;
        }
        content = std::move(*decrypted);
    }
    else
    {
        content = msg.content;
    }

    auto ts = parse_timestamp(msg.timestamp);
    bool is_system = msg.message_type == "system";
    r.render_message(msg.username, content, ts, msg.username == username_, is_system);
    add_to_history(history_entry{msg.id, msg.room_id, msg.username, std::move(content), ts, is_system});
}

void chat_state::handle_update_frame(
    std::string_view frame,
    const fernet& cipher,
    std::chrono::seconds max_age,
    renderer& r
)
{
    auto evt = parse_server_event(frame);
    if (const auto* msg = boost::variant2::get_if<message_event>(&evt))
    {
        process_message(msg->message, cipher, max_age, r);
    }
    else if (const auto* heartbeat = boost::variant2::get_if<heartbeat_event>(&evt))
    {
        last_heartbeat_ = parse_timestamp(heartbeat->timestamp);
        auto it = rooms_.find(current_room_);
        if (it != rooms_.end())
            it->second.member_count = heartbeat->user_count;
    }
    else if (const auto* snapshot = boost::variant2::get_if<room_update_event>(&evt))
    {
        update_room(snapshot->room.id, snapshot->room.name, snapshot->room.member_count);
        for (const auto& msg : snapshot->recent_messages)
            process_message(msg, cipher, max_age, r);
    }
    else if (const auto* err = boost::variant2::get_if<error_event>(&evt))
    {
        r.error(err->error);
    }
    else if (boost::variant2::holds_alternative<error_code>(evt))
    {
        r.warning("Invalid message received");
    }
}

void chat_state::handle_talk_frame(std::string_view frame, renderer& r)
{
    auto evt = parse_server_event(frame);
    if (const auto* err = boost::variant2::get_if<error_event>(&evt))
    {
        r.error(err->error);
    }
    else if (const auto* connected = boost::variant2::get_if<connected_event>(&evt))
    {
        auto it = rooms_.find(connected->room_id);
        std::string name = it == rooms_.end() ? connected->room_id : it->second.name;
        update_room(connected->room_id, name, connected->user_count);
    }
    else if (boost::variant2::holds_alternative<error_code>(evt))
    {
        r.warning("Invalid message received");
    }

    // Acknowledgments and echoed messages don't need any action
}
