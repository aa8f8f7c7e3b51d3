//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "connection_manager.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/url/url.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "client_config.hpp"
#include "error.hpp"
#include "renderer.hpp"
#include "util/websocket.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

std::string_view cmdchat::channel_path(channel_kind kind) noexcept
{
    return kind == channel_kind::talk ? "/talk" : "/update";
}

std::string cmdchat::make_channel_target(
    channel_kind kind,
    const std::optional<std::string>& password,
    const session_params& params
)
{
    boost::urls::url res;
    res.set_path(channel_path(kind));
    auto query = res.params();
    if (password.has_value())
        query.set("password", *password);
    query.set("username", params.username);
    query.set("room_id", params.room_id);
    return std::string(res.buffer());
}

std::chrono::steady_clock::duration cmdchat::backoff_delay(
    std::chrono::steady_clock::duration base_delay,
    unsigned attempt
) noexcept
{
    // Larger exponents would overflow
    constexpr unsigned max_exponent = 30u;
    return base_delay * static_cast<std::chrono::steady_clock::rep>(1ll << std::min(attempt, max_exponent));
}

error_code cmdchat::close_code_to_error(unsigned close_code) noexcept
{
    switch (close_code)
    {
    case close_code_unauthorized: return errc::requires_auth;
    case close_code_invalid_params: return errc::invalid_username;
    case close_code_room_not_found: return errc::room_not_found;
    default: return error_code();
    }
}

asio::awaitable<result<websocket>> server_connector::connect(std::string_view target)
{
    co_return co_await websocket::connect(ex_, cfg_.host, cfg_.port, target, cfg_.connect_timeout);
}

connection_manager::connection_manager(
    asio::any_io_executor ex,
    websocket_connector& connector,
    renderer& r,
    const client_config& cfg
)
    : connector_(connector), renderer_(r), cfg_(cfg), talk_(ex), update_(ex)
{
}

void connection_manager::set_status(status s)
{
    if (s == status_)
        return;
    status_ = s;
    renderer_.status(std::string("Connection: ") + std::string(to_string(s)));
}

void connection_manager::report_failure(error_code ec, unsigned attempt)
{
    std::string msg;
    if (ec == boost::beast::error::timeout)
        msg = "Connection timeout";
    else if (ec == asio::error::connection_refused)
        msg = "Connection refused - is the server running?";
    else
        msg = "Connection error: " + ec.message();
    msg += " (attempt " + std::to_string(attempt + 1u) + "/" + std::to_string(cfg_.max_retries) + ")";
    renderer_.error(msg);
}

asio::awaitable<error_code> connection_manager::connect_with_retry(
    channel_kind kind,
    params_provider get_params
)
{
    auto& chan = get_channel(kind);

    for (unsigned attempt = 0u; attempt < cfg_.max_retries; ++attempt)
    {
        if (stopped_)
            co_return asio::error::operation_aborted;

        set_status(status::connecting);
        const std::string target = make_channel_target(kind, cfg_.password, get_params());
        auto ws = co_await connector_.connect(target);

        // Stopped while connecting. Dropping the websocket closes the connection
        if (stopped_)
            co_return asio::error::operation_aborted;

        if (ws.has_value())
        {
            chan.ws = std::make_shared<websocket>(std::move(ws).value());
            if (attempt > 0u)
                ++reconnects_;
            set_status(status::connected);
            co_return error_code();
        }

        report_failure(ws.error(), attempt);

        // No wait after the last attempt
        if (attempt + 1u < cfg_.max_retries)
        {
            auto delay = backoff_delay(cfg_.base_delay, attempt);
            renderer_.info(
                "Retrying in " +
                std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(delay).count()) + " ms..."
            );
            if (!co_await wait(kind, delay))
                co_return asio::error::operation_aborted;
        }
    }

    set_status(status::failed);
    CMDCHAT_CO_RETURN_ERROR(errc::connection_failed)
}

asio::awaitable<bool> connection_manager::wait(channel_kind kind, std::chrono::steady_clock::duration duration)
{
    if (stopped_)
        co_return false;
    auto& timer = get_channel(kind).timer;
    timer.expires_after(duration);
    auto [ec] = co_await timer.async_wait(asio::as_tuple);
    co_return !ec && !stopped_;
}

void connection_manager::stop()
{
    stopped_ = true;
    talk_.timer.cancel();
    update_.timer.cancel();
}

std::string_view cmdchat::to_string(connection_manager::status s) noexcept
{
    switch (s)
    {
    case connection_manager::status::connecting: return "connecting";
    case connection_manager::status::connected: return "connected";
    case connection_manager::status::failed: return "failed";
    case connection_manager::status::disconnected:
    default: return "disconnected";
    }
}
