#include "dispatcher.h"
#include "pages.h"
#include "../core/logger.h"

namespace piping {
namespace app {

using http::HTTP1Method;

Dispatcher::Dispatcher()
    : rendezvous_(reserved_paths())
{
}

void Dispatcher::handle(const std::shared_ptr<http::Exchange>& exchange) {
    const http::Request& request = exchange->request();
    HTTP1Method method = request.method_enum();

    LOG_DEBUG("Server", "%s %s", request.method().c_str(), request.target().c_str());

    if (method == HTTP1Method::OPTIONS) {
        handle_preflight(*exchange);
        return;
    }

    if (is_reserved_path(request.path())) {
        handle_reserved(*exchange);
        return;
    }

    switch (method) {
        case HTTP1Method::GET:
        case HTTP1Method::HEAD:
            rendezvous_.handle_receiver(exchange);
            return;
        case HTTP1Method::POST:
        case HTTP1Method::PUT:
            rendezvous_.handle_sender(exchange);
            return;
        default:
            handle_unsupported(*exchange);
            return;
    }
}

void Dispatcher::handle_preflight(http::Exchange& exchange) {
    exchange.response().respond(200, {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", ALLOWED_METHODS},
        {"Access-Control-Allow-Headers", "Content-Type, Content-Disposition"},
        {"Access-Control-Max-Age", "86400"},
        {"Content-Length", "0"}
    }, "");
}

void Dispatcher::handle_reserved(http::Exchange& exchange) {
    const http::Request& request = exchange.request();
    HTTP1Method method = request.method_enum();

    if (method == HTTP1Method::POST || method == HTTP1Method::PUT) {
        relay::Rendezvous::reject(exchange, relay::messages::RESERVED_SEND);
        return;
    }
    if (method != HTTP1Method::GET && method != HTTP1Method::HEAD) {
        handle_unsupported(exchange);
        return;
    }

    const std::string& path = request.path();
    auto& response = exchange.response();

    if (path == paths::INDEX) {
        response.respond(200, {{"Content-Type", "text/html; charset=utf-8"}}, index_page());
    } else if (path == paths::NOSCRIPT) {
        std::string target = request.query_param("path").value_or("");
        std::string mode = request.query_param("mode").value_or("file");
        response.respond(200, {{"Content-Type", "text/html; charset=utf-8"}},
                         noscript_page(target, mode));
    } else if (path == paths::VERSION) {
        response.respond(200, {{"Content-Type", "text/plain; charset=utf-8"}}, version_text());
    } else if (path == paths::HELP) {
        response.respond(200, {{"Content-Type", "text/plain; charset=utf-8"}},
                         help_text(base_url(request)));
    } else if (path == paths::ROBOTS) {
        response.respond(404, {}, "");
    } else {
        response.respond(204, {}, "");
    }
}

void Dispatcher::handle_unsupported(http::Exchange& exchange) {
    const std::string& method = exchange.request().method();
    LOG_WARN("Server", "Unsupported method %s on %s", method.c_str(),
             exchange.request().path().c_str());

    exchange.response().respond(405, {
        {"Content-Type", "text/plain; charset=utf-8"},
        {"Access-Control-Allow-Origin", "*"},
        {"Allow", ALLOWED_METHODS}
    }, "[ERROR] Unsupported method: " + method + ".\n");
}

} // namespace app
} // namespace piping
