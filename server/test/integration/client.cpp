//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "client.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <boost/system/system_error.hpp>
#include <boost/test/unit_test.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"
#include "server.hpp"
#include "shared_state.hpp"
#include "timestamp.hpp"

using namespace cmdchat;
using namespace cmdchat::test;
namespace asio = boost::asio;
namespace websocket = boost::beast::websocket;
namespace http = boost::beast::http;

// Client sockets perform synchronous operations only, so this context is never run
static asio::io_context& get_context()
{
    static asio::io_context res(1);
    return res;
}

static asio::ip::tcp::endpoint server_endpoint(unsigned short port)
{
    return asio::ip::tcp::endpoint{asio::ip::address_v4::loopback(), port};
}

struct websocket_client::impl
{
    websocket::stream<asio::ip::tcp::socket> ws{get_context().get_executor()};
    boost::beast::flat_buffer read_buffer;
};

websocket_client::websocket_client(impl* i) noexcept : impl_(i) {}

websocket_client::websocket_client(websocket_client&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

websocket_client& websocket_client::operator=(websocket_client&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

websocket_client::~websocket_client()
{
    if (impl_ && impl_->ws.is_open())
    {
        error_code ignored;
        impl_->ws.close(websocket::close_code::normal, ignored);
    }
}

std::string_view websocket_client::read()
{
    impl_->read_buffer.clear();
    impl_->ws.read(impl_->read_buffer);
    return std::string_view(
        static_cast<const char*>(impl_->read_buffer.data().data()),
        impl_->read_buffer.data().size()
    );
}

unsigned websocket_client::read_close_code()
{
    error_code ec;
    impl_->read_buffer.clear();
    impl_->ws.read(impl_->read_buffer, ec);
    BOOST_TEST_REQUIRE(ec == error_code(websocket::error::closed));
    return impl_->ws.reason().code;
}

void websocket_client::write(std::string_view buffer) { impl_->ws.write(asio::buffer(buffer)); }

server_runner::server_runner(server_config cfg)
{
    // Setup the server. Port 0 lets the OS choose a free port
    st_ = std::make_shared<shared_state>(std::move(cfg), ctx_.get_executor());
    symmetric_key_ = st_->symmetric_key();
    auto acceptor = make_acceptor(ctx_.get_executor(), server_endpoint(0));
    port_ = acceptor.local_endpoint().port();

    asio::co_spawn(ctx_, run_server(std::move(acceptor), st_), [](std::exception_ptr exc) {
        if (exc)
            std::rethrow_exception(exc);
    });

    // Start running
    runner_ = std::thread([this] { ctx_.run(); });
}

server_runner::~server_runner()
{
    ctx_.stop();
    if (runner_.joinable())
        runner_.join();
}

websocket_client server_runner::connect_websocket(std::string_view target)
{
    auto impl = std::make_unique<websocket_client::impl>();

    // Connect to the server
    impl->ws.next_layer().connect(server_endpoint(port_));

    // Set a decorator to change the User-Agent of the handshake
    impl->ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " websocket-client-sync");
    }));

    // Perform the websocket handshake
    impl->ws.handshake("127.0.0.1:" + std::to_string(port_), target);

    return websocket_client(impl.release());
}

http::response<http::string_body> server_runner::request(
    http::verb method,
    std::string_view target,
    std::string_view body,
    std::string_view content_type
)
{
    asio::ip::tcp::socket sock(get_context());
    sock.connect(server_endpoint(port_));

    // Compose and send the request
    http::request<http::string_body> req(method, target, 11);
    req.set(http::field::host, "127.0.0.1:" + std::to_string(port_));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!content_type.empty())
        req.set(http::field::content_type, content_type);
    req.body() = body;
    req.keep_alive(false);
    req.prepare_payload();
    http::write(sock, req);

    // Read the response
    boost::beast::flat_buffer buff;
    http::response<http::string_body> res;
    http::read(sock, buff, res);
    return res;
}

server_config cmdchat::test::config_with_password(std::string password)
{
    server_config res;
    res.admin_password = std::move(password);
    return res;
}

std::string cmdchat::test::make_chat_frame(
    const fernet& cipher,
    std::string_view text,
    std::string_view username,
    std::string_view room_id
)
{
    return chat_frame{
        cipher.encrypt(text).value(),
        std::string(username),
        std::string(room_id),
        serialize_timestamp(current_timestamp()),
    }
        .to_json();
}
