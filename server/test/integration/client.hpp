//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_TEST_INTEGRATION_CLIENT_HPP
#define CMDCHAT_SERVER_TEST_INTEGRATION_CLIENT_HPP

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "api/wire_types.hpp"
#include "server_config.hpp"
#include "util/fernet.hpp"

namespace cmdchat {

class shared_state;

namespace test {

// A synchronous websocket client
class websocket_client
{
public:
    struct impl;

private:
    std::unique_ptr<impl> impl_;

public:

    websocket_client(impl*) noexcept;
    websocket_client(const websocket_client&) = delete;
    websocket_client(websocket_client&&) noexcept;
    websocket_client& operator=(const websocket_client&) = delete;
    websocket_client& operator=(websocket_client&&) noexcept;
    ~websocket_client();

    // Contents point into an internal buffer, valid until the next read
    std::string_view read();

    // Reads a frame and parses it as a server event
    any_server_event read_event() { return parse_server_event(read()); }

    // Reads until the server closes the connection, and returns the close code.
    // Fails the test if a frame is received instead.
    unsigned read_close_code();

    void write(std::string_view buffer);
};

// Runs a server in a separate thread, listening on a random loopback port.
// Tests interact with it using network clients only.
class server_runner
{
    boost::asio::io_context ctx_{1};
    std::shared_ptr<shared_state> st_;
    unsigned short port_{};
    std::string symmetric_key_;
    std::thread runner_;

public:
    explicit server_runner(server_config cfg = {});
    server_runner(const server_runner&) = delete;
    server_runner(server_runner&&) = delete;
    server_runner& operator=(const server_runner&) = delete;
    server_runner& operator=(server_runner&&) = delete;
    ~server_runner();

    unsigned short port() const noexcept { return port_; }

    // The server's symmetric key, in its base64 form
    const std::string& symmetric_key() const noexcept { return symmetric_key_; }

    // Connects a websocket to target, which includes the query string
    websocket_client connect_websocket(std::string_view target);

    // Issues a HTTP request and returns the response
    boost::beast::http::response<boost::beast::http::string_body> request(
        boost::beast::http::verb method,
        std::string_view target,
        std::string_view body = "",
        std::string_view content_type = ""
    );
};

// A server configuration requiring the given password
server_config config_with_password(std::string password);

// Encrypts a chat message and composes the talk frame
std::string make_chat_frame(const fernet& cipher, std::string_view text, std::string_view username, std::string_view room_id);

}  // namespace test
}  // namespace cmdchat

#endif
