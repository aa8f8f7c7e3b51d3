//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "business_types.hpp"
#include "chat_client.hpp"
#include "client_config.hpp"
#include "connection_manager.hpp"
#include "error.hpp"
#include "line_reader.hpp"
#include "renderer.hpp"

namespace asio = boost::asio;
using namespace cmdchat;

// The command line argument takes precedence over the environment
static std::optional<std::string> get_password(int argc, char* argv[])
{
    if (argc == 5)
        return std::string(argv[4]);
    const char* env = std::getenv("CMDCHAT_ADMIN_PASSWORD");
    if (env != nullptr && *env != '\0')
        return std::string(env);
    return std::nullopt;
}

static int main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 4 && argc != 5)
    {
        std::cerr << "Usage: " << argv[0] << " <server> <port> <username> [password]\n"
                  << "Example:\n"
                  << "    " << argv[0] << " localhost 8080 alice\n"
                  << "The password may also be set with the CMDCHAT_ADMIN_PASSWORD environment variable\n";
        return EXIT_FAILURE;
    }

    // Client config
    client_config cfg;
    cfg.host = argv[1];
    cfg.port = argv[2];
    cfg.username = argv[3];
    cfg.password = get_password(argc, argv);
    if (validate_username(cfg.username))
    {
        std::cerr << "Invalid username: use between 2 and 20 letters, numbers, underscores or hyphens\n";
        return EXIT_FAILURE;
    }

    // The client is single-threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Collaborators
    console_renderer renderer(std::cout);
    stdin_line_reader reader(ctx.get_executor());
    server_connector connector(ctx.get_executor(), cfg);
    chat_client client(ctx.get_executor(), cfg, renderer, reader, connector);

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);
    signals.async_wait([&client, &renderer](boost::system::error_code ec, int) {
        if (ec)
            return;
        renderer.info("Received interrupt signal...");
        client.stop();
    });

    // Run the client until completion
    error_code result_ec;
    asio::co_spawn(ctx, client.run(), [&](std::exception_ptr exc, error_code ec) {
        // Stop listening for signals, so run() can return
        signals.cancel();
        if (exc)
            std::rethrow_exception(exc);
        result_ec = ec;
    });

    ctx.run();

    return result_ec ? EXIT_FAILURE : EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try
    {
        return main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
