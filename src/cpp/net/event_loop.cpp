/**
 * Event Loop - Common Implementation
 *
 * Factory functions and socket option helpers.
 */

#include "event_loop.h"
#include <thread>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <errno.h>

#if !defined(__linux__)
    #error "Unsupported platform: the piping server requires epoll (Linux)"
#endif

namespace piping {
namespace net {

std::unique_ptr<EventLoop> create_epoll_event_loop();

std::unique_ptr<EventLoop> create_event_loop() {
    return create_epoll_event_loop();
}

uint32_t recommended_worker_count() {
    unsigned int hw_threads = std::thread::hardware_concurrency();

    // Leave 2 cores for OS and other tasks
    if (hw_threads <= 2) {
        return 1;
    }

    return hw_threads - 2;
}

int EventLoop::set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return -1;
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return -1;
    }

    return 0;
}

int EventLoop::set_tcp_nodelay(int fd) {
    int enable = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable)) < 0) {
        return -1;
    }
    return 0;
}

int EventLoop::set_reuseaddr(int fd) {
    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        return -1;
    }
    return 0;
}

int EventLoop::set_reuseport(int fd) {
#if defined(SO_REUSEPORT)
    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable)) < 0) {
        return -1;
    }
    return 0;
#else
    (void)fd;
    errno = ENOTSUP;
    return -1;
#endif
}

} // namespace net
} // namespace piping
