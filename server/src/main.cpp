//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "services/bot_registry.hpp"
#include "services/login_url_resolver.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace handoff;

static int main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 4)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port> <config_file>\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 127.0.0.1 1242 config.json\n";
        return EXIT_FAILURE;
    }

    // Application config
    const char* ip = argv[1];                                     // IP where the server will listen
    auto port = static_cast<unsigned short>(std::atoi(argv[2]));  // Port
    const char* config_path = argv[3];                            // Bots, culture and IPC password

    // Load the configuration file
    auto cfg = load_config(config_path);
    if (cfg.has_error())
    {
        log_error(cfg.error(), "Loading configuration file", config_path);
        return EXIT_FAILURE;
    }

    // Build the bot registry. Bot names must be unique
    auto bots = create_bot_registry(std::move(cfg->bots));
    if (bots.has_error())
    {
        log_error(bots.error(), "Creating the bot registry");
        return EXIT_FAILURE;
    }

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Singleton objects shared by all connections
    auto st = std::make_shared<shared_state>(
        std::move(cfg->culture),
        std::move(cfg->ipc_password),
        std::move(bots).value(),
        create_steam_login_resolver(ctx.get_executor())
    );

    // The physical endpoint where our server will listen
    asio::ip::tcp::endpoint listening_endpoint(asio::ip::make_address(ip), port);

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Start listening for HTTP connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run_server(listening_endpoint, st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    signals.async_wait([&ctx](boost::system::error_code, int) {
        // Stop the io_context. This will cause run() to return
        ctx.stop();
    });

    std::cout << "Listening on " << listening_endpoint << " with " << st->bots().size() << " bot(s)"
              << std::endl;

    // Run the io_context. This will block until the context is stopped by
    // a signal and all outstanding async tasks are finished.
    ctx.run();

    // (If we get here, it means we got a SIGINT or SIGTERM)
    return EXIT_SUCCESS;
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
