/**
 * piping-server
 *
 * Streaming data transfer over pure HTTP: a sender POSTs or PUTs a body to
 * a path, receivers GET the same path and get the body as it arrives.
 *
 * Usage:
 *   piping-server --http-port 8080
 *   piping-server --enable-https --https-port 8443 --crt-path server.crt --key-path server.key
 */

#include "app/dispatcher.h"
#include "app/options.h"
#include "app/pages.h"
#include "core/logger.h"
#include "http/server.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

using namespace piping;

static std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    core::Logger::instance().configure_from_env();

    app::ServerOptions options;
    std::string error;
    if (!app::parse_options(argc, argv, options, error)) {
        std::fprintf(stderr, "error: %s\n\n%s", error.c_str(), app::usage(argv[0]).c_str());
        return 2;
    }
    if (options.show_help) {
        std::fputs(app::usage(argv[0]).c_str(), stdout);
        return 0;
    }
    if (options.show_version) {
        std::printf("piping-server %s\n", PIPING_VERSION);
        return 0;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    app::Dispatcher dispatcher;
    http::Server server(app::to_server_config(options),
                        [&dispatcher](const std::shared_ptr<http::Exchange>& exchange) {
                            dispatcher.handle(exchange);
                        });

    if (server.listen() < 0) {
        std::fprintf(stderr, "error: %s\n", server.get_error().c_str());
        return 1;
    }

    LOG_INFO("Server", "piping-server %s listening on http://%s:%u", PIPING_VERSION,
             options.host.c_str(), static_cast<unsigned>(server.http_port()));
    if (options.enable_https) {
        LOG_INFO("Server", "HTTPS on https://%s:%u", options.host.c_str(),
                 static_cast<unsigned>(server.https_port()));
    }

    int result = 0;
    std::thread server_thread([&server, &result]() {
        result = server.start();
        g_running = false;
    });

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("Server", "Shutting down...");
    server.stop();
    server_thread.join();

    return result < 0 ? 1 : 0;
}
