#include "tcp_listener.h"
#include "../core/logger.h"
#include <cstring>
#include <errno.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace piping {
namespace net {

TcpListener::TcpListener(const TcpListenerConfig& config, ConnectionCallback connection_cb)
    : config_(config)
    , connection_cb_(std::move(connection_cb))
{
    if (config_.num_workers == 0) {
        config_.num_workers = static_cast<uint16_t>(recommended_worker_count());
    }
}

TcpListener::~TcpListener() {
    stop();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    for (int fd : listen_fds_) {
        ::close(fd);
    }
}

int TcpListener::listen() {
    if (!listen_fds_.empty()) {
        return 0;
    }

    size_t sockets = config_.use_reuseport ? config_.num_workers : 1;
    uint16_t port = config_.port;

    for (size_t i = 0; i < sockets; ++i) {
        int fd = create_listen_socket(port);
        if (fd < 0) {
            int saved = errno;
            for (int open_fd : listen_fds_) {
                ::close(open_fd);
            }
            listen_fds_.clear();
            errno = saved;
            return -1;
        }

        if (i == 0) {
            // Later sockets join the port the kernel picked for the first one.
            struct sockaddr_in addr;
            socklen_t addr_len = sizeof(addr);
            if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) == 0) {
                port = ntohs(addr.sin_port);
            }
            bound_port_ = port;
        }
        listen_fds_.push_back(fd);
    }

    LOG_INFO("Listener", "%s bound to %s:%u (%zu socket(s), %u worker(s))",
             config_.name, config_.host.c_str(), bound_port_, listen_fds_.size(),
             config_.num_workers);
    return 0;
}

int TcpListener::start() {
    if (running_.exchange(true)) {
        return -1;  // Already running
    }

    if (listen() < 0) {
        LOG_ERROR("Listener", "%s failed to listen on %s:%u: %s",
                  config_.name, config_.host.c_str(), config_.port, strerror(errno));
        running_.store(false);
        return -1;
    }

    {
        std::lock_guard<std::mutex> lock(event_loops_mutex_);
        for (uint16_t i = 0; i < config_.num_workers; i++) {
            event_loops_.push_back(create_event_loop());
            if (stop_requested_.load()) {
                event_loops_.back()->stop();
            }
        }
    }

    for (uint16_t i = 0; i < config_.num_workers; i++) {
        EventLoop* loop = event_loops_[i].get();
        int listen_fd = listen_fds_[i % listen_fds_.size()];
        worker_threads_.emplace_back([this, i, loop, listen_fd]() {
            worker_thread(i, loop, listen_fd);
        });
    }

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    running_.store(false);
    return 0;
}

void TcpListener::stop() {
    stop_requested_.store(true);

    std::lock_guard<std::mutex> lock(event_loops_mutex_);
    for (auto& event_loop : event_loops_) {
        event_loop->stop();
    }
}

bool TcpListener::is_running() const {
    return running_.load();
}

void TcpListener::worker_thread(int worker_id, EventLoop* event_loop, int listen_fd) {
    LOG_DEBUG("Listener", "%s worker %d using %s on fd %d",
              config_.name, worker_id, event_loop->platform_name(), listen_fd);

    auto accept_handler = [this, event_loop](int fd, IOEvent events, void*) {
        if (!(events & IOEvent::READ)) {
            return;
        }

        // Accept all pending connections (edge-triggered)
        while (true) {
            int client_fd = ::accept4(fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            TcpSocket socket(client_fd);

            if (!socket.is_valid()) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                if (errno == EINTR || errno == ECONNABORTED) {
                    continue;
                }
                LOG_ERROR("Listener", "accept() failed: %s", strerror(errno));
                break;
            }

            connection_cb_(std::move(socket), event_loop);
        }
    };

    if (event_loop->add_fd(listen_fd, IOEvent::READ | IOEvent::EDGE, accept_handler, nullptr) < 0) {
        LOG_ERROR("Listener", "%s worker %d failed to watch listen socket: %s",
                  config_.name, worker_id, strerror(errno));
        return;
    }

    event_loop->run();

    event_loop->remove_fd(listen_fd);
    LOG_DEBUG("Listener", "%s worker %d stopped", config_.name, worker_id);
}

int TcpListener::create_listen_socket(uint16_t port) {
    TcpSocket socket;

    if (!socket.is_valid()) {
        return -1;
    }

    if (socket.set_reuseaddr() < 0) {
        return -1;
    }

    if (config_.use_reuseport && socket.set_reuseport() < 0) {
        LOG_WARN("Listener", "SO_REUSEPORT unavailable: %s", strerror(errno));
    }

    if (socket.set_nonblocking() < 0) {
        return -1;
    }

    if (socket.bind(config_.host, port) < 0) {
        return -1;
    }

    if (socket.listen(config_.backlog) < 0) {
        return -1;
    }

    return socket.release();
}

} // namespace net
} // namespace piping
