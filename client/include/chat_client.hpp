//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_CHAT_CLIENT_HPP
#define CMDCHAT_CLIENT_INCLUDE_CHAT_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>
#include <optional>
#include <string_view>

#include "chat_state.hpp"
#include "client_config.hpp"
#include "commands.hpp"
#include "connection_manager.hpp"
#include "error.hpp"
#include "util/fernet.hpp"

namespace cmdchat {

class line_reader;
class renderer;

// The chat client. Runs three tasks: the send loop (reads user input and
// sends it through the talk channel), the receive loop (reads the update channel)
// and a reader for the talk channel, which reports inline errors.
// All tasks run in the same thread, which owns all client state.
class chat_client
{
    struct command_visitor;

    client_config cfg_;
    renderer& renderer_;
    line_reader& reader_;
    connection_manager conn_;
    chat_state state_;
    std::optional<fernet> cipher_;

    // Expires when the receive loop exits
    boost::asio::steady_timer receive_done_;
    bool receive_finished_{false};

    bool stopping_{false};
    bool rejoining_{false};  // the update channel was closed to switch rooms
    error_code fatal_error_;

    session_params current_params() const { return {state_.username(), state_.current_room()}; }
    void fail(error_code ec, std::string_view what);

    boost::asio::awaitable<error_code> connect_talk();
    boost::asio::awaitable<void> reconnect_talk();
    boost::asio::awaitable<void> talk_reader(std::shared_ptr<websocket> ws);
    boost::asio::awaitable<void> receive_loop();
    boost::asio::awaitable<void> send_loop();
    boost::asio::awaitable<void> send_message(std::string_view text);
    boost::asio::awaitable<void> shutdown();

    // Command handlers
    boost::asio::awaitable<void> join_room(std::string_view room);
    boost::asio::awaitable<void> change_username(std::string_view name);
    boost::asio::awaitable<void> list_rooms();
    void show_status();
    void show_history();
    void show_users();
    void show_action(std::string_view action);

public:
    // Number of messages shown by /history
    static constexpr std::size_t history_display_size = 10;

    chat_client(
        boost::asio::any_io_executor ex,
        client_config cfg,
        renderer& r,
        line_reader& reader,
        websocket_connector& connector
    );
    chat_client(const chat_client&) = delete;
    chat_client& operator=(const chat_client&) = delete;

    // Runs the key exchange, then the chat session.
    boost::asio::awaitable<error_code> run();

    // Runs the chat session with an established symmetric key, until the user
    // quits, stop() is called or a fatal error happens. Returns the fatal error, if any:
    //   errc::requires_auth       the server rejected our password
    //   errc::connection_failed   the reconnection budget was exhausted
    boost::asio::awaitable<error_code> run_session(fernet cipher);

    // Stops all loops. The session closes both channels and returns.
    // Must be called from the thread running the client.
    void stop();

    const chat_state& state() const noexcept { return state_; }
};

}  // namespace cmdchat

#endif
