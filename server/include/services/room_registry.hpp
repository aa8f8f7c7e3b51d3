//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_SERVICES_ROOM_REGISTRY_HPP
#define CMDCHAT_SERVER_INCLUDE_SERVICES_ROOM_REGISTRY_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "server_config.hpp"
#include "services/rate_limiter.hpp"
#include "services/room_history.hpp"

// The in-memory server state: rooms with their message histories, users,
// connection records and the sockets registered to each room.
// The registry is not thread-safe. All functions must be called from the
// executor passed on construction, which must be single-threaded. Functions
// never suspend while the state is partially updated.

namespace cmdchat {

// Anything that can receive broadcast payloads. Implemented by websocket sessions
class message_subscriber
{
public:
    virtual ~message_subscriber() {}

    // Called once per broadcast payload, in its own coroutine. Returning
    // an error removes the subscriber from the room the payload was sent to.
    virtual boost::asio::awaitable<error_code> on_message(std::string_view payload) = 0;
};

class room_registry
{
    struct subscriber_deleter
    {
        room_registry& self;
        std::string room_id;

        void operator()(message_subscriber* sub) const noexcept { self.unsubscribe(room_id, *sub); }
    };

    struct connection_deleter
    {
        room_registry& self;
        std::string user_id;
        std::string room_id;

        void operator()(message_subscriber* sub) const noexcept
        {
            self.unregister_connection(user_id, room_id, *sub);
        }
    };

public:
    room_registry(boost::asio::any_io_executor ex, const server_config& cfg);
    room_registry(const room_registry&) = delete;
    room_registry& operator=(const room_registry&) = delete;

    //
    // Rooms
    //

    // Validates the name and creates a room with a fresh ID and an empty history
    result<room> create_room(
        std::string_view name,
        room_type type,
        std::string created_by,
        std::string description
    );

    // Looks up a room by ID or, if no room has that ID, by name.
    // Returns nullptr if not found.
    const room* find_room(std::string_view id_or_name) const;

    // Active rooms, in creation order
    std::vector<room> list_rooms() const;

    // Number of sockets currently registered to the room
    std::size_t member_count(std::string_view room_id) const;

    //
    // Users
    //

    // Returns the user for the given address and name, creating it if it
    // doesn't exist. Fails if the username is not valid.
    result<user> ensure_user(std::string_view ip_address, std::string_view username);
    const user* find_user(std::string_view user_id) const;
    void set_user_status(std::string_view user_id, user_status status) noexcept;

    // Updates the user's last_seen field to the current time
    void touch_user(std::string_view user_id);

    //
    // Connections and subscriptions
    //

    // Adds sub to the room's active set, records (overwriting any previous
    // record) the user's connection info and marks the user online.
    // Registering the same socket twice is a no-op.
    void register_connection(
        const std::string& user_id,
        const std::string& room_id,
        std::shared_ptr<message_subscriber> sub
    );

    // Removes sub from the room's active set. Clears the user's connection record
    // and marks the user offline, unless the record was overwritten by another socket.
    // Safe to call multiple times
    // and for sockets that were never registered.
    void unregister_connection(std::string_view user_id, std::string_view room_id, message_subscriber& sub) noexcept;

    // RAII-style register_connection. Unregisters when the guard is destroyed
    using connection_guard = std::unique_ptr<message_subscriber, connection_deleter>;
    connection_guard register_connection_guarded(
        const std::string& user_id,
        const std::string& room_id,
        std::shared_ptr<message_subscriber> sub
    )
    {
        auto* ptr = sub.get();
        register_connection(user_id, room_id, std::move(sub));
        return connection_guard(ptr, connection_deleter{*this, user_id, room_id});
    }

    // Adds sub to the room's active set, without any connection record.
    // Used by sockets that only receive updates. Idempotent.
    void subscribe(std::shared_ptr<message_subscriber> sub, std::string_view room_id);

    // Removes sub from the room's active set. No-op if it's not there.
    void unsubscribe(std::string_view room_id, message_subscriber& sub) noexcept;

    using subscriber_guard = std::unique_ptr<message_subscriber, subscriber_deleter>;
    subscriber_guard subscribe_guarded(std::shared_ptr<message_subscriber> sub, std::string_view room_id)
    {
        auto* ptr = sub.get();
        subscribe(std::move(sub), room_id);
        return subscriber_guard(ptr, subscriber_deleter{*this, std::string(room_id)});
    }

    // The connection record for a user, or nullptr if it has no active connection
    const connection_info* find_connection(std::string_view user_id) const;

    //
    // Messages
    //

    // Appends msg to the history of msg.room_id. No-op if the room doesn't exist.
    void append_message(message msg);

    // The n most recent messages in the room. Empty if the room doesn't exist.
    std::vector<message> recent_messages(std::string_view room_id, std::ptrdiff_t n) const;

    // Sends payload to every socket registered to the room. Each delivery
    // runs in its own coroutine, so this function doesn't wait for any of them.
    // Sockets that fail to receive the payload are removed from the room.
    void broadcast(std::string_view room_id, std::string payload);

    // Applies the rate limiter. Returns true if the user may send a message
    bool check_rate_limit(std::string_view user_id, rate_limiter::clock::time_point now = rate_limiter::clock::now())
    {
        return limiter_.try_acquire(user_id, now);
    }

    //
    // Stats
    //
    std::size_t total_users() const noexcept { return users_.size(); }
    std::size_t active_rooms() const;
    std::size_t active_connections() const noexcept { return subscriptions_.size(); }

private:
    struct room_entry
    {
        room data;
        room_history history;
    };

    struct subscription
    {
        std::string room_id;
        std::shared_ptr<message_subscriber> subscriber;

        std::string_view room_id_sv() const noexcept { return room_id; }
        const message_subscriber* subscriber_ptr() const noexcept { return subscriber.get(); }
    };

    struct connection_record
    {
        connection_info info;
        const message_subscriber* owner;
    };

    // Indexed by room ID and by subscriber identity (comparing pointers),
    // so that both fan-out and cleanup run in logarithmic time.
    // clang-format off
    using subscription_container = boost::multi_index::multi_index_container<
        subscription,
        boost::multi_index::indexed_by<
            // Index by room ID
            boost::multi_index::ordered_non_unique<
                boost::multi_index::const_mem_fun<subscription, std::string_view, &subscription::room_id_sv>
            >,
            // Index by subscriber identity
            boost::multi_index::ordered_non_unique<
                boost::multi_index::const_mem_fun<subscription, const message_subscriber*, &subscription::subscriber_ptr>
            >
        >
    >;
    // clang-format on

    boost::asio::any_io_executor ex_;
    std::size_t history_size_;
    std::map<std::string, room_entry, std::less<>> rooms_;
    std::vector<std::string> room_order_;
    std::map<std::string, user, std::less<>> users_;
    std::map<std::string, connection_record, std::less<>> connections_;
    subscription_container subscriptions_;
    rate_limiter limiter_;

    void add_room(room r);
    subscription_container::nth_index<1>::type::iterator find_subscription(
        std::string_view room_id,
        const message_subscriber& sub
    );
    boost::asio::awaitable<void> deliver(
        std::shared_ptr<message_subscriber> sub,
        std::string room_id,
        std::shared_ptr<const std::string> payload
    );
};

}  // namespace cmdchat

#endif
