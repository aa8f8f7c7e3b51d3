//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/websocket.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"
#include "util/async_mutex.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using namespace cmdchat;

struct websocket::impl
{
    // The actual websocket
    beast::websocket::stream<beast::tcp_stream> ws;

    // The upgrade HTTP request. Only set for server websockets
    websocket::upgrade_request_type upgrade_request;

    // Buffer to read data from the peer
    beast::flat_buffer read_buffer;

    // Mutex to serialize writes
    async_mutex write_mtx;

    // The peer's address, as a string
    std::string remote_address;

    // Make sure that we don't issue two reads concurrently
    bool reading{false};

    // Server websockets
    impl(asio::ip::tcp::socket&& sock, websocket::upgrade_request_type&& upgrade_req, beast::flat_buffer&& buff)
        : ws(std::move(sock)),
          upgrade_request(std::move(upgrade_req)),
          read_buffer(std::move(buff)),
          write_mtx(ws.get_executor()),
          remote_address(compute_remote_address())
    {
    }

    // Client websockets. The remote address is set after connecting
    explicit impl(asio::any_io_executor ex) : ws(ex), write_mtx(ws.get_executor()) {}

    std::string compute_remote_address()
    {
        error_code ec;
        auto ep = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
        return ec ? std::string() : ep.address().to_string();
    }

    // Sets and clears the reading flag using RAII
    struct read_guard_deleter
    {
        void operator()(impl* self) const noexcept { self->reading = false; }
    };
    using read_guard = std::unique_ptr<impl, read_guard_deleter>;
    read_guard lock_reads() noexcept
    {
        reading = true;
        return read_guard(this);
    }
};

static std::string_view buffer_to_sv(asio::const_buffer buff) noexcept
{
    return std::string_view(static_cast<const char*>(buff.data()), buff.size());
}

websocket::websocket(std::unique_ptr<impl> i) noexcept : impl_(std::move(i)) {}

websocket::websocket(asio::ip::tcp::socket sock, upgrade_request_type&& req, beast::flat_buffer buff)
    : impl_(new impl(std::move(sock), std::move(req), std::move(buff)))
{
}

websocket::websocket(websocket&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

websocket& websocket::operator=(websocket&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

websocket::~websocket() {}

asio::awaitable<result<websocket>> websocket::connect(
    asio::any_io_executor ex,
    std::string_view host,
    std::string_view port,
    std::string_view target,
    std::chrono::steady_clock::duration timeout
)
{
    // Resolve the server's name
    asio::ip::tcp::resolver resolver(ex);
    auto [ec, endpoints] = co_await resolver.async_resolve(std::string(host), std::string(port), asio::as_tuple);
    if (ec)
        co_return ec;

    // Connect, applying the timeout
    std::unique_ptr<impl> res{new impl(ex)};
    auto& stream = beast::get_lowest_layer(res->ws);
    stream.expires_after(timeout);
    auto [connect_ec, ep] = co_await stream.async_connect(endpoints, asio::as_tuple);
    if (connect_ec)
        co_return connect_ec;
    res->remote_address = ep.address().to_string();

    // The websocket has its own timeout mechanism, which would conflict with the stream's
    stream.expires_never();
    auto opts = beast::websocket::stream_base::timeout::suggested(beast::role_type::client);
    opts.handshake_timeout = timeout;
    res->ws.set_option(opts);

    // Set a decorator to change the User-Agent of the handshake
    res->ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
        req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " cmdchat-client");
    }));

    // The Host header must contain the port, too
    std::string host_header(host);
    host_header += ':';
    host_header += std::to_string(ep.port());

    // Perform the websocket handshake
    co_await res->ws.async_handshake(host_header, target, asio::redirect_error(ec));
    if (ec)
        co_return ec;

    co_return websocket(std::move(res));
}

const websocket::upgrade_request_type& websocket::upgrade_request() const noexcept
{
    return impl_->upgrade_request;
}

const std::string& websocket::remote_address() const noexcept { return impl_->remote_address; }

asio::awaitable<error_code> websocket::accept()
{
    // Set suggested timeout settings for the websocket
    impl_->ws.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::server));

    // Set a decorator to change the Server of the handshake
    impl_->ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::response_type& res) {
        res.set(beast::http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " cmdchat-server");
    }));

    // Accept the websocket handshake
    auto [ec] = co_await impl_->ws.async_accept(impl_->upgrade_request, asio::as_tuple);
    co_return ec;
}

asio::awaitable<result<std::string_view>> websocket::read()
{
    assert(!impl_->reading);

    error_code ec;

    // Perform the read
    {
        auto guard = impl_->lock_reads();
        impl_->read_buffer.clear();
        co_await impl_->ws.async_read(impl_->read_buffer, asio::redirect_error(ec));
    }

    // Check the result
    if (ec)
        co_return ec;

    // Convert it to a string_view (no copy is performed)
    co_return buffer_to_sv(impl_->read_buffer.data());
}

asio::awaitable<error_code> websocket::write_locked_impl(std::string_view buff)
{
    assert(impl_->write_mtx.locked());

    // Text frames: all our messages are JSON
    impl_->ws.text(true);

    error_code ec;
    co_await impl_->ws.async_write(asio::buffer(buff), asio::redirect_error(ec));
    co_return ec;
}

asio::awaitable<error_code> websocket::write(std::string_view message)
{
    // Wait for the connection to become idle
    auto guard = co_await lock_writes();
    if (!guard)
        co_return asio::error::operation_aborted;

    co_return co_await write_locked(message, guard);
}

asio::awaitable<error_code> websocket::lock_writes_impl() { return impl_->write_mtx.lock(); }

void websocket::unlock_writes_impl() noexcept { impl_->write_mtx.unlock(); }

asio::awaitable<error_code> websocket::close(unsigned close_code)
{
    // Closing writes a frame, so it can't overlap with other writes
    auto guard = co_await lock_writes();
    if (!guard)
        co_return asio::error::operation_aborted;

    error_code ec;
    co_await impl_->ws.async_close(
        beast::websocket::close_reason(static_cast<std::uint16_t>(close_code)),
        asio::redirect_error(ec)
    );
    co_return ec;
}

unsigned websocket::peer_close_code() const noexcept { return impl_->ws.reason().code; }

void websocket::shutdown()
{
    impl_->write_mtx.cancel();

    // Closing the socket makes any outstanding read or write fail
    error_code ignored;
    auto& sock = beast::get_lowest_layer(impl_->ws).socket();
    sock.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    sock.close(ignored);
}
