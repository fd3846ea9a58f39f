#pragma once

#include "http1_connection.h"
#include "../net/tcp_listener.h"
#include "../net/tls_context.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace piping {
namespace http {

/**
 * HTTP server configuration
 */
struct ServerConfig {
    // Network
    std::string host = "0.0.0.0";
    uint16_t http_port = 8080;          // 0 = ephemeral
    uint16_t https_port = 8443;         // 0 = ephemeral

    // TLS
    bool enable_https = false;
    std::string cert_file;              // PEM certificate chain
    std::string key_file;               // PEM private key
    std::string cert_data;              // In-memory certificate (alternative to file)
    std::string key_data;               // In-memory key (alternative to file)

    // Performance
    uint16_t num_workers = 0;           // 0 = auto
    bool use_reuseport = true;
};

/**
 * HTTP/1.1 + HTTPS server.
 *
 * Owns a cleartext listener and, when enabled, a TLS listener. Every
 * accepted connection becomes an Http1Connection confined to the worker
 * thread that accepted it; TLS connections are handshaken first.
 *
 * Usage:
 *   ServerConfig config;
 *   config.http_port = 8080;
 *
 *   Server server(config, handler);
 *   if (server.listen() < 0) { ... server.get_error() ... }
 *   server.start();  // Blocks until stop()
 */
class Server {
public:
    Server(const ServerConfig& config, Http1Connection::RequestHandler handler);

    /**
     * Stops and joins everything.
     */
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * Load TLS material and bind all listeners. Ports are known afterwards.
     * @return 0 on success, -1 on error (see get_error())
     */
    int listen();

    /**
     * Serve until stop(). Calls listen() if needed.
     * @return 0 on success, -1 on error
     */
    int start();

    /**
     * Stop all listeners. Thread-safe.
     */
    void stop();

    bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * Bound ports (meaningful after listen()). https_port() is 0 when
     * HTTPS is disabled.
     */
    uint16_t http_port() const noexcept;
    uint16_t https_port() const noexcept;

    const std::string& get_error() const noexcept { return error_message_; }

private:
    void on_cleartext_connection(net::TcpSocket socket, net::EventLoop* loop);
    void on_tls_connection(net::TcpSocket socket, net::EventLoop* loop);
    void on_handshake_event(int fd, net::IOEvent events, net::EventLoop* loop);
    void start_connection(std::unique_ptr<net::Stream> stream, net::EventLoop* loop);

    ServerConfig config_;
    Http1Connection::RequestHandler handler_;
    std::shared_ptr<net::TlsContext> tls_context_;
    std::unique_ptr<net::TcpListener> http_listener_;
    std::unique_ptr<net::TcpListener> https_listener_;
    std::thread https_thread_;          // HTTPS listener runs here when both are enabled
    std::mutex start_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    bool listening_ = false;
    std::string error_message_;
};

} // namespace http
} // namespace piping
