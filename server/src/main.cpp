//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "error.hpp"
#include "server.hpp"
#include "server_config.hpp"
#include "services/room_registry.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace cmdchat;

// The command line argument takes precedence over the environment
static std::optional<std::string> get_admin_password(int argc, char* argv[])
{
    if (argc == 4)
        return std::string(argv[3]);
    const char* env = std::getenv("CMDCHAT_ADMIN_PASSWORD");
    if (env != nullptr && *env != '\0')
        return std::string(env);
    return std::nullopt;
}

static void main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 3 && argc != 4)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port> [admin_password]\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 0.0.0.0 8080\n"
                  << "The admin password may also be set with the CMDCHAT_ADMIN_PASSWORD environment variable\n";
        exit(EXIT_FAILURE);
    }

    // Application config
    const char* ip = argv[1];                                     // IP where the server will listen
    auto port = static_cast<unsigned short>(std::atoi(argv[2]));  // Port
    server_config config;
    config.admin_password = get_admin_password(argc, argv);

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Singleton objects shared by all connections
    const bool password_protected = config.admin_password.has_value();
    auto st = std::make_shared<shared_state>(std::move(config), ctx.get_executor());

    // The physical endpoint where our server will listen
    asio::ip::tcp::endpoint listening_endpoint(asio::ip::make_address(ip), port);
    auto acceptor = make_acceptor(ctx.get_executor(), listening_endpoint);

    // Startup information
    std::ostringstream oss;
    oss << "Server listening on " << acceptor.local_endpoint();
    log_info(oss.str());
    log_info(password_protected ? "Password protection: enabled" : "Password protection: disabled");
    std::string rooms_msg = "Default rooms:";
    for (const auto& r : st->registry().list_rooms())
        rooms_msg += " " + r.name;
    log_info(rooms_msg);

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Start listening for HTTP connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run_server(std::move(acceptor), st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    signals.async_wait([&ctx](boost::system::error_code, int) {
        log_info("Shutting down");

        // Stop the io_context. This will cause run() to return
        ctx.stop();
    });

    // Run the io_context. This will block until the context is stopped by
    // a signal and all outstanding async tasks are finished.
    ctx.run();

    // (If we get here, it means we got a SIGINT or SIGTERM)
}

int main(int argc, char* argv[])
{
    try
    {
        main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
