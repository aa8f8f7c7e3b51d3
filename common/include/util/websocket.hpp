//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_UTIL_WEBSOCKET_HPP
#define CMDCHAT_COMMON_INCLUDE_UTIL_WEBSOCKET_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

namespace cmdchat {

// Application-defined websocket close codes
inline constexpr unsigned close_code_unauthorized = 4001u;
inline constexpr unsigned close_code_invalid_params = 4002u;
inline constexpr unsigned close_code_room_not_found = 4004u;

// A wrapper around beast's websocket stream that handles concurrent writes
// and reduces build times by keeping Beast instantiations in a separate .cpp file.
// Used both by the server (accepted connections) and by the client (connect()).
class websocket
{
    // pimpl idiom, to avoid including heavyweight Beast headers
    struct impl;
    std::unique_ptr<impl> impl_;

    explicit websocket(std::unique_ptr<impl> i) noexcept;

    boost::asio::awaitable<error_code> write_locked_impl(std::string_view buff);
    boost::asio::awaitable<error_code> lock_writes_impl();
    void unlock_writes_impl() noexcept;

    struct write_guard_deleter
    {
        void operator()(websocket* sock) const noexcept { sock->unlock_writes_impl(); }
    };

public:
    using upgrade_request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Server-side constructor, from a socket that sent an upgrade request
    websocket(
        boost::asio::ip::tcp::socket sock,
        upgrade_request_type&& upgrade_request,
        boost::beast::flat_buffer buffer
    );
    websocket(const websocket&) = delete;
    websocket(websocket&&) noexcept;
    websocket& operator=(const websocket&) = delete;
    websocket& operator=(websocket&&) noexcept;
    ~websocket();

    // Client-side: resolves host, connects and performs the websocket handshake
    // against target (e.g. "/talk?username=..."). The TCP connection and the
    // handshake must complete within timeout.
    static boost::asio::awaitable<result<websocket>> connect(
        boost::asio::any_io_executor ex,
        std::string_view host,
        std::string_view port,
        std::string_view target,
        std::chrono::steady_clock::duration timeout
    );

    // Returns the upgrade HTTP request. Empty for client websockets.
    const upgrade_request_type& upgrade_request() const noexcept;

    // The address of the remote peer, as a string. Computed once, on construction
    const std::string& remote_address() const noexcept;

    // Runs the websocket handshake. Must be called before any other operation
    // on server websockets.
    boost::asio::awaitable<error_code> accept();

    // Reads a message from the peer. The returned view is valid until the next
    // read is performed. Only a single read should be outstanding at each time
    // (unlike writes, reads are not serialized).
    boost::asio::awaitable<result<std::string_view>> read();

    // Writes a message to the peer. Writes are serialized: two
    // concurrent writes can be issued safely against the same websocket.
    // A write is roughly equivalent to lock_writes() + write_locked() + releasing the guard
    boost::asio::awaitable<error_code> write(std::string_view buff);

    // Locks writes until the returned guard is destroyed. Other coroutines
    // calling write will be suspended until the guard is released.
    // The guard is empty if the websocket was shut down.
    using write_guard = std::unique_ptr<websocket, write_guard_deleter>;
    boost::asio::awaitable<write_guard> lock_writes()
    {
        auto ec = co_await lock_writes_impl();
        co_return ec ? write_guard() : write_guard(this);
    }

    // Writes bypassing the write lock. lock_writes() must have been called
    // before calling this function.
    boost::asio::awaitable<error_code> write_locked(
        std::string_view buff,
        [[maybe_unused]] write_guard& guard
    )
    {
        assert(guard.get() != nullptr);
        return write_locked_impl(buff);
    }

    // Closes the websocket, sending close_code to the peer.
    boost::asio::awaitable<error_code> close(unsigned close_code);

    // The close code sent by the peer, if the peer closed the connection.
    // Zero if no close frame has been received.
    unsigned peer_close_code() const noexcept;

    // Cancels any outstanding operation and closes the underlying socket
    // without a closing handshake. Writers waiting for the write lock are released.
    void shutdown();
};

}  // namespace cmdchat

#endif
