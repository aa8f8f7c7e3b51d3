//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_CONNECTION_MANAGER_HPP
#define CMDCHAT_CLIENT_INCLUDE_CONNECTION_MANAGER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "client_config.hpp"
#include "error.hpp"
#include "util/websocket.hpp"

namespace cmdchat {

class renderer;

// The two websocket channels a client keeps open against the server
enum class channel_kind
{
    talk,    // we send messages here
    update,  // we receive room snapshots, messages and heartbeats here
};

// "/talk" or "/update"
std::string_view channel_path(channel_kind kind) noexcept;

// Identifies us to the server. Both channels use the same values
struct session_params
{
    std::string username;
    std::string room_id;
};

// The upgrade request target for a channel, including the query string
std::string make_channel_target(
    channel_kind kind,
    const std::optional<std::string>& password,
    const session_params& params
);

// The wait after the given failed attempt (starting at zero): base_delay * 2^attempt
std::chrono::steady_clock::duration backoff_delay(
    std::chrono::steady_clock::duration base_delay,
    unsigned attempt
) noexcept;

// Maps a close code sent by the server to the error it represents.
// Returns an empty error_code for codes without application meaning.
error_code close_code_to_error(unsigned close_code) noexcept;

// Establishes websocket connections. Abstracts the network for testing
class websocket_connector
{
public:
    virtual ~websocket_connector() {}
    virtual boost::asio::awaitable<result<websocket>> connect(std::string_view target) = 0;
};

// Connects to the server in the configuration
class server_connector final : public websocket_connector
{
    boost::asio::any_io_executor ex_;
    const client_config& cfg_;

public:
    server_connector(boost::asio::any_io_executor ex, const client_config& cfg) noexcept
        : ex_(std::move(ex)), cfg_(cfg)
    {
    }

    boost::asio::awaitable<result<websocket>> connect(std::string_view target) override final;
};

// Owns the talk and update channels and (re)establishes them with exponential backoff.
// Connection failures are reported to the renderer as they happen.
// Not thread-safe: must be used from a single thread.
class connection_manager
{
public:
    enum class status
    {
        disconnected,
        connecting,
        connected,
        failed,
    };

private:
    struct channel
    {
        std::shared_ptr<websocket> ws;
        boost::asio::steady_timer timer;

        explicit channel(boost::asio::any_io_executor ex) : timer(std::move(ex)) {}
    };

    websocket_connector& connector_;
    renderer& renderer_;
    const client_config& cfg_;
    channel talk_;
    channel update_;
    status status_{status::disconnected};
    unsigned reconnects_{0};
    bool stopped_{false};

    channel& get_channel(channel_kind kind) noexcept { return kind == channel_kind::talk ? talk_ : update_; }
    const channel& get_channel(channel_kind kind) const noexcept
    {
        return kind == channel_kind::talk ? talk_ : update_;
    }
    void set_status(status s);
    void report_failure(error_code ec, unsigned attempt);

public:
    connection_manager(
        boost::asio::any_io_executor ex,
        websocket_connector& connector,
        renderer& r,
        const client_config& cfg
    );

    // Returns the parameters to connect with. Invoked once per attempt
    using params_provider = std::function<session_params()>;

    // Connects the given channel, retrying up to cfg.max_retries times.
    // Fails with errc::connection_failed once the budget is exhausted, and
    // with asio::error::operation_aborted if stop() is called meanwhile.
    // Each attempt uses the parameters returned by get_params at that time,
    // so changes made during a backoff wait are honored.
    boost::asio::awaitable<error_code> connect_with_retry(channel_kind kind, params_provider get_params);
    boost::asio::awaitable<error_code> connect_with_retry(channel_kind kind, session_params params)
    {
        return connect_with_retry(kind, [params = std::move(params)] { return params; });
    }

    // The channel's websocket, or nullptr if it's not connected
    std::shared_ptr<websocket> get(channel_kind kind) const noexcept { return get_channel(kind).ws; }

    // Discards the channel's websocket. The websocket is closed when the
    // last reference to it is released.
    void reset(channel_kind kind) noexcept { get_channel(kind).ws.reset(); }

    // Suspends the caller for the given time, or until stop() is called.
    // Returns false if stopped.
    boost::asio::awaitable<bool> wait(channel_kind kind, std::chrono::steady_clock::duration duration);

    // Cancels pending waits and makes further connection attempts fail
    void stop();

    bool stopped() const noexcept { return stopped_; }
    status connection_status() const noexcept { return status_; }
    unsigned reconnects() const noexcept { return reconnects_; }
};

std::string_view to_string(connection_manager::status s) noexcept;

}  // namespace cmdchat

#endif
