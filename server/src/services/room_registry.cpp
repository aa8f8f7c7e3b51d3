//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_registry.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

namespace {

// Rooms created on startup. They use their name as ID, so clients can join
// them without listing rooms first
struct default_room
{
    std::string_view name;
    std::string_view description;
};

constexpr std::array<default_room, 3> default_rooms{{
    {"general", "General chat room"     },
    {"random",  "Random discussions"    },
    {"tech",    "Technology discussions"},
}};

}  // namespace

room_registry::room_registry(asio::any_io_executor ex, const server_config& cfg)
    : ex_(std::move(ex)), history_size_(cfg.history_size), limiter_(cfg.rate_limit, cfg.rate_window)
{
    for (const auto& r : default_rooms)
    {
        auto res = make_room(r.name, room_type::public_room, "system", std::string(r.description), std::string(r.name));
        add_room(std::move(res).value());
    }
}

void room_registry::add_room(room r)
{
    std::string id = r.id;
    room_order_.push_back(id);
    rooms_.emplace(std::move(id), room_entry{std::move(r), room_history(history_size_)});
}

result<room> room_registry::create_room(
    std::string_view name,
    room_type type,
    std::string created_by,
    std::string description
)
{
    auto res = make_room(name, type, std::move(created_by), std::move(description));
    if (res.has_error())
        return res.error();
    add_room(*res);
    return res;
}

const room* room_registry::find_room(std::string_view id_or_name) const
{
    // By ID
    auto it = rooms_.find(id_or_name);
    if (it != rooms_.end())
        return &it->second.data;

    // By name. If several rooms share a name, the oldest one wins
    for (const auto& id : room_order_)
    {
        const auto& entry = rooms_.find(id)->second;
        if (entry.data.name == id_or_name)
            return &entry.data;
    }
    return nullptr;
}

std::vector<room> room_registry::list_rooms() const
{
    std::vector<room> res;
    res.reserve(room_order_.size());
    for (const auto& id : room_order_)
    {
        const auto& r = rooms_.find(id)->second.data;
        if (r.is_active)
            res.push_back(r);
    }
    return res;
}

std::size_t room_registry::member_count(std::string_view room_id) const
{
    return subscriptions_.count(room_id);
}

std::size_t room_registry::active_rooms() const
{
    return std::count_if(rooms_.begin(), rooms_.end(), [](const auto& elm) { return elm.second.data.is_active; });
}

result<user> room_registry::ensure_user(std::string_view ip_address, std::string_view username)
{
    auto u = make_user(ip_address, username);
    if (u.has_error())
        return u.error();

    // Existing users are kept as they are
    auto it = users_.find(u->id);
    if (it != users_.end())
        return it->second;

    std::string id = u->id;
    users_.emplace(std::move(id), *u);
    return u;
}

const user* room_registry::find_user(std::string_view user_id) const
{
    auto it = users_.find(user_id);
    return it == users_.end() ? nullptr : &it->second;
}

void room_registry::set_user_status(std::string_view user_id, user_status status) noexcept
{
    auto it = users_.find(user_id);
    if (it != users_.end())
        it->second.status = status;
}

void room_registry::touch_user(std::string_view user_id)
{
    auto it = users_.find(user_id);
    if (it != users_.end())
        it->second.last_seen = current_timestamp();
}

room_registry::subscription_container::nth_index<1>::type::iterator room_registry::find_subscription(
    std::string_view room_id,
    const message_subscriber& sub
)
{
    auto& idx = subscriptions_.get<1>();
    auto [first, last] = idx.equal_range(&sub);
    auto it = std::find_if(first, last, [room_id](const subscription& s) { return s.room_id == room_id; });
    return it == last ? idx.end() : it;
}

void room_registry::subscribe(std::shared_ptr<message_subscriber> sub, std::string_view room_id)
{
    if (find_subscription(room_id, *sub) == subscriptions_.get<1>().end())
        subscriptions_.insert(subscription{std::string(room_id), std::move(sub)});
}

void room_registry::unsubscribe(std::string_view room_id, message_subscriber& sub) noexcept
{
    auto it = find_subscription(room_id, sub);
    if (it != subscriptions_.get<1>().end())
        subscriptions_.get<1>().erase(it);
}

void room_registry::register_connection(
    const std::string& user_id,
    const std::string& room_id,
    std::shared_ptr<message_subscriber> sub
)
{
    // A reconnection replaces the previous record
    auto now = current_timestamp();
    connections_.insert_or_assign(
        user_id,
        connection_record{connection_info{user_id, room_id, now, now, true}, sub.get()}
    );
    set_user_status(user_id, user_status::online);
    subscribe(std::move(sub), room_id);
}

void room_registry::unregister_connection(
    std::string_view user_id,
    std::string_view room_id,
    message_subscriber& sub
) noexcept
{
    unsubscribe(room_id, sub);

    // Only clear the record if it hasn't been replaced by a newer connection.
    // The user stays online while the newer connection is open
    auto it = connections_.find(user_id);
    if (it != connections_.end() && it->second.owner == &sub)
    {
        connections_.erase(it);
        set_user_status(user_id, user_status::offline);
    }
}

const connection_info* room_registry::find_connection(std::string_view user_id) const
{
    auto it = connections_.find(user_id);
    return it == connections_.end() ? nullptr : &it->second.info;
}

void room_registry::append_message(message msg)
{
    // Never create rooms implicitly
    auto it = rooms_.find(msg.room_id);
    if (it != rooms_.end())
        it->second.history.append(std::move(msg));
}

std::vector<message> room_registry::recent_messages(std::string_view room_id, std::ptrdiff_t n) const
{
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? std::vector<message>() : it->second.history.recent(n);
}

void room_registry::broadcast(std::string_view room_id, std::string payload)
{
    // Place the string into a shared object, to avoid making an individual
    // copy per subscriber
    auto payload_ptr = std::make_shared<const std::string>(std::move(payload));

    // Launch the deliveries in parallel. A slow subscriber doesn't block the others
    auto [first, last] = subscriptions_.equal_range(room_id);
    for (auto it = first; it != last; ++it)
    {
        asio::co_spawn(ex_, deliver(it->subscriber, std::string(room_id), payload_ptr), asio::detached);
    }
}

asio::awaitable<void> room_registry::deliver(
    std::shared_ptr<message_subscriber> sub,
    std::string room_id,
    std::shared_ptr<const std::string> payload
)
{
    auto ec = co_await sub->on_message(*payload);
    if (ec)
    {
        log_error(ec, "Removing subscriber after a failed broadcast", room_id);
        unsubscribe(room_id, *sub);
    }
}
