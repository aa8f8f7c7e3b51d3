//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "chat_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/variant2/variant.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include "api/wire_types.hpp"
#include "business_types.hpp"
#include "chat_state.hpp"
#include "commands.hpp"
#include "connection_manager.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "key_exchange_client.hpp"
#include "line_reader.hpp"
#include "renderer.hpp"
#include "timestamp.hpp"
#include "util/fernet.hpp"
#include "util/websocket.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

static constexpr unsigned normal_close = boost::beast::websocket::close_code::normal;

// Reports an exception thrown by one of the client's tasks
static void report_exception(renderer& r, std::exception_ptr ptr, std::string_view task)
{
    try
    {
        // Rethrowing is the only way to access the underlying exception object
        std::rethrow_exception(ptr);
    }
    catch (const std::exception& exc)
    {
        r.error("Unexpected error in " + std::string(task) + ": " + exc.what());
    }
}

// Commands are handled here. Returns false if the client should quit
struct chat_client::command_visitor
{
    chat_client& self;

    asio::awaitable<bool> operator()(const quit_command&) const
    {
        self.renderer_.info("Goodbye!");
        co_return false;
    }

    asio::awaitable<bool> operator()(const help_command&) const
    {
        self.renderer_.info(command_help());
        co_return true;
    }

    asio::awaitable<bool> operator()(const clear_command&) const
    {
        self.renderer_.clear();
        co_return true;
    }

    asio::awaitable<bool> operator()(const rooms_command&) const
    {
        co_await self.list_rooms();
        co_return true;
    }

    asio::awaitable<bool> operator()(const join_command& cmd) const
    {
        co_await self.join_room(cmd.room);
        co_return true;
    }

    asio::awaitable<bool> operator()(const users_command&) const
    {
        self.show_users();
        co_return true;
    }

    asio::awaitable<bool> operator()(const me_command& cmd) const
    {
        self.show_action(cmd.action);
        co_return true;
    }

    asio::awaitable<bool> operator()(const nick_command& cmd) const
    {
        co_await self.change_username(cmd.name);
        co_return true;
    }

    asio::awaitable<bool> operator()(const status_command&) const
    {
        self.show_status();
        co_return true;
    }

    asio::awaitable<bool> operator()(const history_command&) const
    {
        self.show_history();
        co_return true;
    }

    asio::awaitable<bool> operator()(const unknown_command& cmd) const
    {
        self.renderer_.warning("Unknown command: /" + cmd.name);
        self.renderer_.info("Type /help for available commands");
        co_return true;
    }
};

chat_client::chat_client(
    asio::any_io_executor ex,
    client_config cfg,
    renderer& r,
    line_reader& reader,
    websocket_connector& connector
)
    : cfg_(std::move(cfg)),
      renderer_(r),
      reader_(reader),
      conn_(ex, connector, r, cfg_),
      state_(cfg_.username, cfg_.initial_room),
      receive_done_(ex, std::chrono::steady_clock::time_point::max())
{
}

void chat_client::fail(error_code ec, std::string_view what)
{
    if (!fatal_error_)
        fatal_error_ = ec;
    if (ec == errc::requires_auth)
        renderer_.error("Authentication failed: wrong or missing password");
    else
        renderer_.error(std::string(what) + ": " + ec.message());
    stop();
}

void chat_client::stop()
{
    if (stopping_)
        return;
    stopping_ = true;
    conn_.stop();
    reader_.cancel();
}

asio::awaitable<error_code> chat_client::connect_talk()
{
    auto ec = co_await conn_.connect_with_retry(channel_kind::talk, [this] { return current_params(); });
    if (ec)
        co_return ec;

    // Inline errors are sent through the talk channel, so we need to read it
    asio::co_spawn(
        co_await asio::this_coro::executor,
        talk_reader(conn_.get(channel_kind::talk)),
        [this](std::exception_ptr exc) {
            if (exc)
                report_exception(renderer_, exc, "talk channel");
        }
    );
    co_return error_code();
}

// Closes the talk channel, if open, and opens it again with the current parameters
asio::awaitable<void> chat_client::reconnect_talk()
{
    if (auto ws = conn_.get(channel_kind::talk))
    {
        conn_.reset(channel_kind::talk);
        co_await ws->close(normal_close);  // Ignore the result
    }

    auto ec = co_await connect_talk();
    if (ec && ec != asio::error::operation_aborted)
        fail(ec, "Failed to connect to the chat server");
}

asio::awaitable<void> chat_client::talk_reader(std::shared_ptr<websocket> ws)
{
    while (true)
    {
        auto frame = co_await ws->read();
        if (frame.has_error())
            break;
        state_.handle_talk_frame(*frame, renderer_);
    }

    // Closed on purpose
    if (stopping_ || conn_.get(channel_kind::talk) != ws)
        co_return;

    // The next message will reconnect
    conn_.reset(channel_kind::talk);
    auto reason = close_code_to_error(ws->peer_close_code());
    if (reason == errc::requires_auth)
        fail(reason, "Connecting to the talk channel");
    else if (reason == errc::invalid_username)
        renderer_.error("The server rejected the username " + state_.username());
    else if (reason != errc::room_not_found)  // reported by the receive loop
        renderer_.warning("Send connection lost. Reconnecting on the next message");
}

asio::awaitable<void> chat_client::receive_loop()
{
    while (!stopping_)
    {
        // The room may change while we're retrying
        std::string room;
        auto ec = co_await conn_.connect_with_retry(channel_kind::update, [this, &room] {
            auto res = current_params();
            room = res.room_id;
            return res;
        });
        if (ec)
        {
            if (!stopping_)
                fail(ec, "Failed to connect to the chat server");
            break;
        }
        auto ws = conn_.get(channel_kind::update);

        // The user switched rooms while the connection was being established
        if (room != state_.current_room())
        {
            conn_.reset(channel_kind::update);
            co_await ws->close(normal_close);  // Ignore the result
            continue;
        }

        // Read until the channel is closed. Errors in individual frames are reported and skipped
        while (true)
        {
            auto frame = co_await ws->read();
            if (frame.has_error())
                break;
            state_.handle_update_frame(*frame, *cipher_, cfg_.token_max_age, renderer_);
        }

        if (conn_.get(channel_kind::update) == ws)
            conn_.reset(channel_kind::update);
        if (stopping_)
            break;

        auto reason = close_code_to_error(ws->peer_close_code());
        if (reason == errc::requires_auth)
        {
            fail(reason, "Connecting to the update channel");
            break;
        }
        else if (reason == errc::room_not_found)
        {
            renderer_.error("Room " + state_.current_room() + " not found");
            if (state_.current_room() == cfg_.initial_room)
            {
                fail(reason, "Joining the initial room");
                break;
            }

            // Go back to the initial room. The talk channel must follow
            state_.set_current_room(cfg_.initial_room);
            renderer_.info("Returning to " + cfg_.initial_room);
            co_await reconnect_talk();
        }
        else if (rejoining_)
        {
            // The user switched rooms
            rejoining_ = false;
        }
        else
        {
            renderer_.warning("Message connection lost. Reconnecting...");
        }
    }
}

asio::awaitable<void> chat_client::send_message(std::string_view text)
{
    if (text.size() > max_message_size)
    {
        renderer_.warning("Message too long (max " + std::to_string(max_message_size) + " characters)");
        co_return;
    }

    // Connect if the channel was lost
    if (!conn_.get(channel_kind::talk))
    {
        auto ec = co_await connect_talk();
        if (ec)
        {
            if (ec != asio::error::operation_aborted)
                fail(ec, "Failed to connect to the chat server");
            co_return;
        }
    }
    auto ws = conn_.get(channel_kind::talk);

    // Encrypt and compose the frame
    auto token = cipher_->encrypt(text);
    if (token.has_error())
    {
        renderer_.error("Encryption failed: " + token.error().message());
        co_return;
    }
    chat_frame frame{
        std::move(*token),
        state_.username(),
        state_.current_room(),
        serialize_timestamp(current_timestamp()),
    };

    // Send it. On failure, discard the channel so the next message reconnects
    auto ec = co_await ws->write(frame.to_json());
    if (ec)
    {
        renderer_.warning("Connection lost. Attempting to reconnect...");
        if (conn_.get(channel_kind::talk) == ws)
            conn_.reset(channel_kind::talk);
        ws->shutdown();
        co_await conn_.wait(channel_kind::talk, cfg_.reconnect_wait);
        co_return;
    }
    state_.record_sent();
}

asio::awaitable<void> chat_client::join_room(std::string_view room)
{
    if (room.empty())
    {
        renderer_.warning("Usage: /join <room>");
        co_return;
    }

    auto room_id = state_.find_room(room);
    if (!room_id.has_value())
    {
        renderer_.warning("Room " + std::string(room) + " not found");
        renderer_.info("Use /rooms to see available rooms");
        co_return;
    }
    if (*room_id == state_.current_room())
    {
        renderer_.info("Already in " + std::string(room));
        co_return;
    }

    std::string old_room = state_.current_room();
    state_.set_current_room(*room_id);
    renderer_.success("Switched from " + old_room + " to " + *room_id);

    // The receive loop reconnects with the new room
    if (auto ws = conn_.get(channel_kind::update))
    {
        rejoining_ = true;
        conn_.reset(channel_kind::update);
        co_await ws->close(normal_close);  // Ignore the result
    }

    co_await reconnect_talk();
}

asio::awaitable<void> chat_client::change_username(std::string_view name)
{
    if (name.empty())
    {
        renderer_.warning("Usage: /nick <name>");
        co_return;
    }
    if (validate_username(name))
    {
        renderer_.warning("Usernames must have between 2 and 20 letters, numbers, underscores or hyphens");
        co_return;
    }

    std::string old_name = state_.username();
    state_.set_username(std::string(name));
    renderer_.success("Changed username from " + old_name + " to " + std::string(name));
    co_await reconnect_talk();
}

asio::awaitable<void> chat_client::list_rooms()
{
    auto rooms = co_await fetch_rooms(co_await asio::this_coro::executor, cfg_.host, cfg_.port, cfg_.connect_timeout);
    if (rooms.has_error())
    {
        renderer_.error("Could not retrieve the room list: " + rooms.error().message());
        co_return;
    }

    renderer_.info("Available rooms:");
    for (const auto& r : *rooms)
    {
        state_.update_room(r.id, r.name, r.active_users);
        std::string line = "  " + r.name;
        if (r.id != r.name)
            line += " (" + r.id + ")";
        line += " - " + std::to_string(r.active_users) + " users";
        if (!r.description.empty())
            line += " - " + r.description;
        if (r.id == state_.current_room())
            line += " [current]";
        renderer_.info(line);
    }
}

void chat_client::show_status()
{
    using namespace std::chrono;
    auto uptime = duration_cast<seconds>(system_clock::now() - state_.started_at()).count();

    renderer_.info("Server: " + cfg_.host + ":" + cfg_.port);
    renderer_.info("Current room: " + state_.current_room());
    renderer_.info("Username: " + state_.username());
    renderer_.info("Connection: " + std::string(to_string(conn_.connection_status())));
    renderer_.info("Messages sent: " + std::to_string(state_.sent_count()));
    renderer_.info("Uptime: " + std::to_string(uptime / 60) + "m " + std::to_string(uptime % 60) + "s");
    renderer_.info("Reconnects: " + std::to_string(conn_.reconnects()));
    if (auto hb = state_.last_heartbeat())
    {
        auto ago = duration_cast<seconds>(system_clock::now() - *hb).count();
        renderer_.info("Last heartbeat: " + std::to_string(ago) + "s ago");
    }
}

void chat_client::show_history()
{
    const auto& history = state_.history();
    if (history.empty())
    {
        renderer_.info("No messages in history");
        return;
    }

    auto first = history.size() > history_display_size
                     ? history.end() - static_cast<std::ptrdiff_t>(history_display_size)
                     : history.begin();
    for (auto it = first; it != history.end(); ++it)
        renderer_.render_message(
            it->username,
            it->content,
            it->timestamp,
            it->username == state_.username(),
            it->is_system
        );
}

void chat_client::show_users()
{
    auto users = state_.users_in_room(state_.current_room());
    if (users.empty())
    {
        renderer_.info("No users in this room yet");
        return;
    }
    renderer_.info("Users in " + state_.current_room() + ":");
    for (const auto& name : users)
        renderer_.info("  " + name + (name == state_.username() ? " (you)" : ""));
}

// Actions are not sent to the server
void chat_client::show_action(std::string_view action)
{
    if (action.empty())
    {
        renderer_.warning("Usage: /me <action>");
        return;
    }
    renderer_.info("* " + state_.username() + " " + std::string(action));
}

asio::awaitable<void> chat_client::send_loop()
{
    renderer_.info("Type /help for commands. Press Ctrl+C to quit.");

    while (!stopping_)
    {
        // Input errors include EOF and cancellation. Both end the loop
        auto line = co_await reader_.read_line();
        if (line.has_error())
            break;

        // Blank lines are ignored
        auto text = trim(*line);
        if (text.empty())
            continue;

        // Commands are handled locally
        auto cmd = parse_command(text);
        if (cmd.has_value())
        {
            if (!co_await boost::variant2::visit(command_visitor{*this}, *cmd))
                break;
            continue;
        }

        co_await send_message(text);
    }
}

asio::awaitable<void> chat_client::shutdown()
{
    stop();
    renderer_.status("Disconnecting");

    // Tell the server we're leaving. This is best-effort
    if (auto ws = conn_.get(channel_kind::talk))
    {
        conn_.reset(channel_kind::talk);
        co_await ws->write(close_request{}.to_json());  // Ignore the result
        co_await ws->close(normal_close);               // Ignore the result
    }
    if (auto ws = conn_.get(channel_kind::update))
    {
        conn_.reset(channel_kind::update);
        co_await ws->close(normal_close);  // Ignore the result
    }

    // Wait for the receive loop to exit
    if (!receive_finished_)
        co_await receive_done_.async_wait(asio::as_tuple);

    // Wipe the key
    cipher_.reset();
    renderer_.status("Disconnected");
}

asio::awaitable<error_code> chat_client::run_session(fernet cipher)
{
    cipher_.emplace(std::move(cipher));
    auto ex = co_await asio::this_coro::executor;

    renderer_.info("Connecting to " + cfg_.host + ":" + cfg_.port);

    // Launch the receive loop. The completion handler runs on every exit path
    asio::co_spawn(ex, receive_loop(), [this](std::exception_ptr exc) {
        receive_finished_ = true;
        receive_done_.cancel();
        if (exc)
        {
            report_exception(renderer_, exc, "receive loop");
            stop();
        }
    });

    // Connect the talk channel and run the send loop
    auto ec = co_await connect_talk();
    if (!ec)
    {
        renderer_.success("Connected to chat server!");
        co_await send_loop();
    }
    else if (ec != asio::error::operation_aborted)
    {
        fail(ec, "Failed to connect to the chat server");
    }

    // Cleanup runs on every exit path
    co_await shutdown();
    co_return fatal_error_;
}

asio::awaitable<error_code> chat_client::run()
{
    renderer_.info("Exchanging keys with " + cfg_.host + ":" + cfg_.port);
    auto cipher = co_await exchange_keys(co_await asio::this_coro::executor, cfg_);
    if (cipher.has_error())
    {
        const auto& err = cipher.error();
        if (err.ec == errc::requires_auth)
            renderer_.error("Authentication failed: wrong or missing password");
        else
            renderer_.error(err.msg + ": " + err.ec.message());
        co_return err.ec;
    }
    renderer_.success("Secure key exchange completed");

    co_return co_await run_session(std::move(cipher).value());
}
