//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_SERVER_HPP
#define CMDCHAT_SERVER_INCLUDE_SERVER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

namespace cmdchat {

// Forward declaration
class shared_state;

// Creates an acceptor listening in the requested endpoint, allowing
// address reuse. Throws an exception if the endpoint can't be bound.
// Use port 0 to let the OS choose a port.
boost::asio::ip::tcp::acceptor make_acceptor(
    boost::asio::any_io_executor ex,
    const boost::asio::ip::tcp::endpoint& listening_endpoint
);

// Runs the HTTP server. It will accept connections in a loop until
// the underlying I/O context is stopped.
boost::asio::awaitable<void> run_server(
    boost::asio::ip::tcp::acceptor acceptor,
    std::shared_ptr<shared_state> state
);

}  // namespace cmdchat

#endif
