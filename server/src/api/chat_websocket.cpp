//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/chat_websocket.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/json/error.hpp>
#include <boost/url/parse.hpp>
#include <boost/variant2/variant.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "api/wire_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/room_registry.hpp"
#include "shared_state.hpp"
#include "timestamp.hpp"
#include "util/websocket.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

namespace {

// Inline error messages, sent for per-message errors. These don't close the channel
std::string_view inline_error_message(error_code ec) noexcept
{
    if (ec == errc::websocket_parse_error || ec == boost::json::condition::parse_error)
        return "Invalid JSON";
    else if (ec == errc::rate_limited)
        return "Rate limit exceeded";
    else if (ec == errc::invalid_message_content)
        return "Invalid message";
    else
        return "Message processing failed";
}

// Parameters passed in the query string of the upgrade request
struct connection_params
{
    std::string password;
    std::string username{"unknown"};
    std::string room_id{"general"};
};

connection_params get_connection_params(const websocket& ws)
{
    connection_params res;
    auto target = boost::urls::parse_origin_form(ws.upgrade_request().target());
    if (target.has_error())
        return res;

    if (auto password = find_query_param(*target, "password"))
        res.password = std::move(*password);
    if (auto username = find_query_param(*target, "username"))
        res.username = std::move(*username);
    if (auto room_id = find_query_param(*target, "room_id"))
        res.room_id = std::move(*room_id);
    return res;
}

// Verifies the password and looks up the room. If any of these fail,
// closes the websocket with the relevant code and returns nullptr.
// Authentication is checked first, so unauthenticated clients can't find out which rooms exist.
asio::awaitable<const room*> authorize(websocket& ws, shared_state& st, const connection_params& params)
{
    if (!st.check_password(params.password))
    {
        co_await ws.close(close_code_unauthorized);  // Ignore the result
        co_return nullptr;
    }

    const room* r = st.registry().find_room(params.room_id);
    if (r == nullptr)
    {
        co_await ws.close(close_code_room_not_found);  // Ignore the result
        co_return nullptr;
    }

    co_return r;
}

std::string error_frame(error_code ec) { return error_event{std::string(inline_error_message(ec))}.to_json(); }

//
// Talk channel
//

struct talk_frame_visitor
{
    const user& current_user;
    const std::string& room_id;
    websocket& ws;
    shared_state& st;

    // Parsing error. Not fatal
    asio::awaitable<error_code> operator()(error_code ec) const { co_return co_await ws.write(error_frame(ec)); }

    // Handled by the session before visiting
    asio::awaitable<error_code> operator()(const close_request&) const { co_return error_code(); }

    asio::awaitable<error_code> operator()(chat_frame& frame) const
    {
        auto& registry = st.registry();

        // Rate limit. Rejected messages are dropped
        if (!registry.check_rate_limit(current_user.id))
            co_return co_await ws.write(error_frame(errc::rate_limited));

        // Compose the message. This validates the content
        auto msg = make_message(room_id, current_user, frame.text);
        if (msg.has_error())
            co_return co_await ws.write(error_frame(msg.error()));
        std::string message_id = msg->id;

        // Compose the event before the message is moved into the history
        message_event evt{to_wire_message(*msg)};

        // Store it
        registry.append_message(std::move(*msg));
        registry.touch_user(current_user.id);

        // Broadcast the event to all clients in the room, including this one
        registry.broadcast(room_id, evt.to_json());

        // Acknowledge it
        co_return co_await ws.write(ack_event{std::move(message_id)}.to_json());
    }
};

// Each talk session is a subscriber in the room it sends messages to.
class talk_session final : public message_subscriber, public std::enable_shared_from_this<talk_session>
{
    websocket ws_;
    std::shared_ptr<shared_state> st_;

public:
    talk_session(websocket socket, std::shared_ptr<shared_state> state) noexcept
        : ws_(std::move(socket)), st_(std::move(state))
    {
    }

    // Subscriber callback
    asio::awaitable<error_code> on_message(std::string_view payload) override final
    {
        co_return co_await ws_.write(payload);
    }

    // Runs the session until completion
    asio::awaitable<error_with_message> run()
    {
        auto& registry = st_->registry();
        auto params = get_connection_params(ws_);

        // Check password and room
        const room* r = co_await authorize(ws_, *st_, params);
        if (r == nullptr)
            co_return error_with_message{};
        const std::string room_id = r->id;

        // Get the user
        auto user_result = registry.ensure_user(ws_.remote_address(), params.username);
        if (user_result.has_error())
        {
            co_await ws_.close(close_code_invalid_params);  // Ignore the result
            co_return error_with_message{};
        }
        const user current_user = std::move(user_result).value();

        // Lock writes in the websocket. This ensures that no broadcast is written before the connected event.
        auto write_guard = co_await ws_.lock_writes();
        if (!write_guard)
            co_return error_with_message{};

        // Register the connection. It's unregistered on every exit path
        auto conn_guard = registry.register_connection_guarded(current_user.id, room_id, shared_from_this());

        // Notify the client
        connected_event connected_evt{
            room_id,
            static_cast<std::int64_t>(registry.member_count(room_id)),
            serialize_timestamp(current_timestamp()),
        };
        auto ec = co_await ws_.write_locked(connected_evt.to_json(), write_guard);
        if (ec)
            co_return error_with_message{ec};
        write_guard.reset();

        // Read frames from the websocket and dispatch them
        while (true)
        {
            // Read a frame
            auto raw_frame = co_await ws_.read();
            if (raw_frame.has_error())
                co_return error_with_message{raw_frame.error()};

            // Deserialize it
            auto frame = parse_talk_frame(raw_frame.value());

            // The client is leaving
            if (boost::variant2::holds_alternative<close_request>(frame))
            {
                co_await ws_.close(boost::beast::websocket::close_code::normal);  // Ignore the result
                co_return error_with_message{};
            }

            // Dispatch. Errors processing a frame shouldn't terminate the channel.
            // We can't co_await in a catch block, so the error is reported afterwards
            bool processing_failed = false;
            try
            {
                ec = co_await boost::variant2::visit(talk_frame_visitor{current_user, room_id, ws_, *st_}, frame);
            }
            catch (const std::exception& err)
            {
                log_error(errc::uncaught_exception, "Processing talk frame", err.what());
                processing_failed = true;
            }
            if (processing_failed)
                ec = co_await ws_.write(error_frame(errc::uncaught_exception));

            // Write errors are fatal
            if (ec)
                co_return error_with_message{ec};
        }
    }
};

//
// Update channel
//

class update_session final : public message_subscriber, public std::enable_shared_from_this<update_session>
{
    websocket ws_;
    std::shared_ptr<shared_state> st_;
    std::string room_id_;
    asio::steady_timer heartbeat_timer_;
    bool finished_{};

    // Sends a heartbeat every interval, until the session finishes or a write fails
    static asio::awaitable<void> heartbeat_loop(std::shared_ptr<update_session> self)
    {
        const auto interval = self->st_->config().heartbeat_interval;
        while (!self->finished_)
        {
            self->heartbeat_timer_.expires_after(interval);
            auto [ec] = co_await self->heartbeat_timer_.async_wait(asio::as_tuple);
            if (ec || self->finished_)
                co_return;

            heartbeat_event evt{
                static_cast<std::int64_t>(self->st_->registry().member_count(self->room_id_)),
                serialize_timestamp(current_timestamp()),
            };
            ec = co_await self->ws_.write(evt.to_json());
            if (ec)
            {
                // Closing the socket makes the session's read fail, which performs cleanup
                log_error(ec, "Sending heartbeat");
                self->ws_.shutdown();
                co_return;
            }
        }
    }

public:
    update_session(websocket socket, std::shared_ptr<shared_state> state, asio::any_io_executor ex)
        : ws_(std::move(socket)), st_(std::move(state)), heartbeat_timer_(std::move(ex))
    {
    }

    // Subscriber callback
    asio::awaitable<error_code> on_message(std::string_view payload) override final
    {
        co_return co_await ws_.write(payload);
    }

    // Runs the session until completion
    asio::awaitable<error_with_message> run()
    {
        auto& registry = st_->registry();
        auto params = get_connection_params(ws_);

        // Check password and room
        const room* r = co_await authorize(ws_, *st_, params);
        if (r == nullptr)
            co_return error_with_message{};
        room_id_ = r->id;
        const std::string room_name = r->name;

        // Lock writes in the websocket. This ensures that no broadcast is written before the snapshot.
        auto write_guard = co_await ws_.lock_writes();
        if (!write_guard)
            co_return error_with_message{};

        // Subscribe to the room. The subscription is removed on every exit path
        auto sub_guard = registry.subscribe_guarded(shared_from_this(), room_id_);

        // Compose the snapshot and write it
        auto recent = registry.recent_messages(room_id_, static_cast<std::ptrdiff_t>(st_->config().snapshot_size));
        std::vector<wire_message> recent_wire;
        recent_wire.reserve(recent.size());
        for (const auto& msg : recent)
            recent_wire.push_back(to_wire_message(msg));
        room_update_event snapshot{
            room_summary{room_id_, room_name, static_cast<std::int64_t>(registry.member_count(room_id_))},
            std::move(recent_wire),
            serialize_timestamp(current_timestamp()),
        };
        auto ec = co_await ws_.write_locked(snapshot.to_json(), write_guard);
        if (ec)
            co_return error_with_message{ec};
        write_guard.reset();

        // Launch the heartbeats
        asio::co_spawn(co_await asio::this_coro::executor, heartbeat_loop(shared_from_this()), asio::detached);

        // Read until the client leaves. Clients don't send anything meaningful here
        result<std::string_view> raw_frame;
        do
        {
            raw_frame = co_await ws_.read();
        } while (raw_frame.has_value() &&
                 !boost::variant2::holds_alternative<close_request>(parse_talk_frame(*raw_frame)));

        // Stop the heartbeats
        finished_ = true;
        heartbeat_timer_.cancel();

        if (raw_frame.has_error())
            co_return error_with_message{raw_frame.error()};
        co_await ws_.close(boost::beast::websocket::close_code::normal);  // Ignore the result
        co_return error_with_message{};
    }
};

}  // namespace

asio::awaitable<error_with_message> cmdchat::handle_talk_websocket(
    websocket socket,
    std::shared_ptr<shared_state> state
)
{
    auto sess = std::make_shared<talk_session>(std::move(socket), std::move(state));
    co_return co_await sess->run();
}

asio::awaitable<error_with_message> cmdchat::handle_update_websocket(
    websocket socket,
    std::shared_ptr<shared_state> state
)
{
    auto ex = co_await asio::this_coro::executor;
    auto sess = std::make_shared<update_session>(std::move(socket), std::move(state), std::move(ex));
    co_return co_await sess->run();
}
