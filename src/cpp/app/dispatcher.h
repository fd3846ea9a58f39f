#pragma once

#include "../http/exchange.h"
#include "../relay/rendezvous.h"
#include <memory>

namespace piping {
namespace app {

/**
 * Request router of piping-server.
 *
 * Classification order:
 * 1. OPTIONS on any path: CORS preflight
 * 2. Reserved paths: fixed pages (GET/HEAD), 400 for senders
 * 3. GET/HEAD: receiver, POST/PUT: sender
 * 4. Anything else: 405
 *
 * Called on connection loop threads; all shared state lives in the
 * rendezvous registry.
 */
class Dispatcher {
public:
    static constexpr const char* ALLOWED_METHODS = "GET, HEAD, POST, PUT, OPTIONS";

    Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void handle(const std::shared_ptr<http::Exchange>& exchange);

    relay::Rendezvous& rendezvous() noexcept { return rendezvous_; }

private:
    void handle_preflight(http::Exchange& exchange);
    void handle_reserved(http::Exchange& exchange);
    void handle_unsupported(http::Exchange& exchange);

    relay::Rendezvous rendezvous_;
};

} // namespace app
} // namespace piping
