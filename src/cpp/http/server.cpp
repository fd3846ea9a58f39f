#include "server.h"
#include "../core/logger.h"
#include "../net/tls_socket.h"
#include <cerrno>
#include <cstring>
#include <unordered_map>

namespace piping {
namespace http {

namespace {

// Per-worker connection tables. Connections never migrate between threads.
thread_local std::unordered_map<int, std::shared_ptr<Http1Connection>> t_connections;
thread_local std::unordered_map<int, std::unique_ptr<net::TlsSocket>> t_handshakes;

} // anonymous namespace

Server::Server(const ServerConfig& config, Http1Connection::RequestHandler handler)
    : config_(config)
    , handler_(std::move(handler))
{
}

Server::~Server() {
    stop();
    if (https_thread_.joinable()) {
        https_thread_.join();
    }
}

int Server::listen() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (listening_) {
        return 0;
    }

    if (config_.enable_https) {
        net::TlsContextConfig tls_config;
        tls_config.cert_file = config_.cert_file;
        tls_config.key_file = config_.key_file;
        tls_config.cert_data = config_.cert_data;
        tls_config.key_data = config_.key_data;

        std::string tls_error;
        tls_context_ = net::TlsContext::create_server(tls_config, &tls_error);
        if (!tls_context_) {
            error_message_ = "Failed to create TLS context: " + tls_error;
            LOG_ERROR("Server", "%s", error_message_.c_str());
            return -1;
        }

        net::TcpListenerConfig https_config;
        https_config.host = config_.host;
        https_config.port = config_.https_port;
        https_config.num_workers = config_.num_workers;
        https_config.use_reuseport = config_.use_reuseport;
        https_config.name = "https";

        https_listener_ = std::make_unique<net::TcpListener>(
            https_config,
            [this](net::TcpSocket socket, net::EventLoop* loop) {
                on_tls_connection(std::move(socket), loop);
            }
        );
        if (https_listener_->listen() < 0) {
            error_message_ = "Failed to listen on " + config_.host + ":" +
                             std::to_string(config_.https_port) + ": " + std::strerror(errno);
            LOG_ERROR("Server", "%s", error_message_.c_str());
            https_listener_.reset();
            return -1;
        }
        LOG_INFO("Server", "HTTPS listener on %s:%u", config_.host.c_str(),
                 static_cast<unsigned>(https_listener_->port()));
    }

    net::TcpListenerConfig http_config;
    http_config.host = config_.host;
    http_config.port = config_.http_port;
    http_config.num_workers = config_.num_workers;
    http_config.use_reuseport = config_.use_reuseport;
    http_config.name = "http";

    http_listener_ = std::make_unique<net::TcpListener>(
        http_config,
        [this](net::TcpSocket socket, net::EventLoop* loop) {
            on_cleartext_connection(std::move(socket), loop);
        }
    );
    if (http_listener_->listen() < 0) {
        error_message_ = "Failed to listen on " + config_.host + ":" +
                         std::to_string(config_.http_port) + ": " + std::strerror(errno);
        LOG_ERROR("Server", "%s", error_message_.c_str());
        http_listener_.reset();
        https_listener_.reset();
        return -1;
    }
    LOG_INFO("Server", "HTTP listener on %s:%u", config_.host.c_str(),
             static_cast<unsigned>(http_listener_->port()));

    listening_ = true;
    return 0;
}

int Server::start() {
    if (listen() < 0) {
        return -1;
    }
    if (stop_requested_.load(std::memory_order_acquire)) {
        return 0;
    }

    running_.store(true, std::memory_order_release);

    if (https_listener_) {
        https_thread_ = std::thread([this]() {
            LOG_INFO("Server", "Starting HTTPS listener...");
            if (https_listener_->start() < 0) {
                LOG_ERROR("Server", "HTTPS listener failed");
            }
        });
    }

    LOG_INFO("Server", "Starting HTTP listener...");
    int result = http_listener_->start();

    if (https_thread_.joinable()) {
        https_listener_->stop();
        https_thread_.join();
    }

    running_.store(false, std::memory_order_release);
    LOG_INFO("Server", "Server stopped");
    return result;
}

void Server::stop() {
    stop_requested_.store(true, std::memory_order_release);
    if (https_listener_) {
        https_listener_->stop();
    }
    if (http_listener_) {
        http_listener_->stop();
    }
}

uint16_t Server::http_port() const noexcept {
    return http_listener_ ? http_listener_->port() : 0;
}

uint16_t Server::https_port() const noexcept {
    return https_listener_ ? https_listener_->port() : 0;
}

void Server::on_cleartext_connection(net::TcpSocket socket, net::EventLoop* loop) {
    socket.set_nodelay();
    LOG_DEBUG("Server", "Accepted cleartext connection fd=%d", socket.fd());
    start_connection(std::make_unique<net::PlainStream>(std::move(socket)), loop);
}

void Server::on_tls_connection(net::TcpSocket socket, net::EventLoop* loop) {
    socket.set_nodelay();
    int fd = socket.fd();

    auto tls_socket = net::TlsSocket::accept(std::move(socket), tls_context_);
    if (!tls_socket) {
        LOG_ERROR("Server", "Failed to create TLS socket for fd=%d", fd);
        return;
    }
    t_handshakes[fd] = std::move(tls_socket);

    auto handshake_handler = [this](int fd, net::IOEvent events, void* user_data) {
        on_handshake_event(fd, events, static_cast<net::EventLoop*>(user_data));
    };

    if (loop->add_fd(fd, net::IOEvent::READ | net::IOEvent::WRITE | net::IOEvent::EDGE,
                     handshake_handler, loop) < 0) {
        LOG_ERROR("Server", "Failed to register TLS fd=%d: %s", fd, std::strerror(errno));
        t_handshakes.erase(fd);
        return;
    }

    // The ClientHello may already be waiting; edge-triggered mode would not report it.
    on_handshake_event(fd, net::IOEvent::READ, loop);
}

void Server::on_handshake_event(int fd, net::IOEvent events, net::EventLoop* loop) {
    auto it = t_handshakes.find(fd);
    if (it == t_handshakes.end()) {
        return;
    }

    if (events & net::IOEvent::ERROR) {
        LOG_DEBUG("Server", "TLS socket error on fd=%d", fd);
        loop->remove_fd(fd);
        t_handshakes.erase(it);
        return;
    }

    net::TlsSocket* tls_socket = it->second.get();
    int result = tls_socket->handshake();

    if (result == 1) {
        return;
    }

    loop->remove_fd(fd);
    std::unique_ptr<net::TlsSocket> owned = std::move(it->second);
    t_handshakes.erase(it);

    if (result < 0) {
        LOG_WARN("Server", "TLS handshake failed on fd=%d: %s", fd, owned->get_error().c_str());
        return;
    }

    std::string alpn = owned->get_alpn_protocol();
    LOG_DEBUG("Server", "TLS handshake complete on fd=%d, ALPN: %s", fd,
              alpn.empty() ? "(none)" : alpn.c_str());

    start_connection(std::make_unique<net::TlsStream>(std::move(owned)), loop);
}

void Server::start_connection(std::unique_ptr<net::Stream> stream, net::EventLoop* loop) {
    int fd = stream->fd();

    auto connection = std::make_shared<Http1Connection>(
        std::move(stream),
        loop,
        handler_,
        [](int closed_fd) {
            t_connections.erase(closed_fd);
        }
    );

    t_connections[fd] = connection;
    if (!connection->start()) {
        t_connections.erase(fd);
    }
}

} // namespace http
} // namespace piping
