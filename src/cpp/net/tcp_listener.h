/**
 * TCP Listener - Multi-threaded accept loop
 *
 * Features:
 * - One event loop per worker thread
 * - SO_REUSEPORT for kernel-level load balancing (one socket per worker)
 * - Listening sockets bound up front so the real port is known before start()
 */

#pragma once

#include "event_loop.h"
#include "tcp_socket.h"
#include <cstdint>
#include <string>
#include <vector>
#include <thread>
#include <functional>
#include <memory>
#include <atomic>
#include <mutex>

namespace piping {
namespace net {

/**
 * Connection callback
 *
 * Called on the accepting worker's thread when a new connection arrives.
 * @param socket The accepted client socket (already non-blocking)
 * @param event_loop The event loop for this worker thread
 */
using ConnectionCallback = std::function<void(TcpSocket socket, EventLoop* event_loop)>;

struct TcpListenerConfig {
    std::string host = "0.0.0.0";      // Bind address
    uint16_t port = 8080;              // Bind port (0 = ephemeral)
    int backlog = 1024;
    uint16_t num_workers = 0;          // 0 = auto (recommended_worker_count())
    bool use_reuseport = true;         // One SO_REUSEPORT socket per worker
    const char* name = "listener";     // Used in log lines
};

class TcpListener {
public:
    TcpListener(const TcpListenerConfig& config, ConnectionCallback connection_cb);

    /**
     * Stops the workers and closes the listening sockets.
     */
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    TcpListener(TcpListener&&) = delete;
    TcpListener& operator=(TcpListener&&) = delete;

    /**
     * Create, bind and listen on the sockets. Idempotent.
     * @return 0 on success, -1 on error (check errno)
     */
    int listen();

    /**
     * Run the worker threads. Calls listen() if needed.
     * Blocks until stop() is called.
     * @return 0 on success, -1 on error
     */
    int start();

    /**
     * Stop the workers. Thread-safe; may be called before start().
     */
    void stop();

    bool is_running() const;

    /**
     * Port actually bound (meaningful after listen()).
     */
    uint16_t port() const { return bound_port_; }

    uint16_t num_workers() const { return config_.num_workers; }

    const TcpListenerConfig& config() const { return config_; }

private:
    void worker_thread(int worker_id, EventLoop* event_loop, int listen_fd);
    int create_listen_socket(uint16_t port);

    TcpListenerConfig config_;
    ConnectionCallback connection_cb_;
    std::vector<int> listen_fds_;
    std::vector<std::unique_ptr<EventLoop>> event_loops_;  // Outlive the worker threads
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex event_loops_mutex_;
    uint16_t bound_port_ = 0;
};

} // namespace net
} // namespace piping
