#include "tcp_socket.h"
#include "event_loop.h"
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <cstring>
#include <errno.h>

namespace piping {
namespace net {

namespace {

bool format_address(const struct sockaddr_in& addr, std::string& ip, uint16_t& port) {
    char ip_str[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str)) == nullptr) {
        return false;
    }
    ip = ip_str;
    port = ntohs(addr.sin_port);
    return true;
}

} // namespace

TcpSocket::TcpSocket(int fd)
    : fd_(fd)
{
}

TcpSocket::TcpSocket()
    : fd_(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0))
{
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

int TcpSocket::set_nonblocking() {
    return EventLoop::set_nonblocking(fd_);
}

int TcpSocket::set_nodelay() {
    return EventLoop::set_tcp_nodelay(fd_);
}

int TcpSocket::set_reuseaddr() {
    return EventLoop::set_reuseaddr(fd_);
}

int TcpSocket::set_reuseport() {
    return EventLoop::set_reuseport(fd_);
}

int TcpSocket::connect(const std::string& host, uint16_t port) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    struct addrinfo hints;
    struct addrinfo* resolved = nullptr;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), nullptr, &hints, &resolved) != 0 || !resolved) {
        errno = EINVAL;
        return -1;
    }

    struct sockaddr_in addr;
    std::memcpy(&addr, resolved->ai_addr, sizeof(addr));
    addr.sin_port = htons(port);
    freeaddrinfo(resolved);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            return -1;
        }
    }

    return 0;
}

int TcpSocket::bind(const std::string& host, uint16_t port) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (host == "0.0.0.0" || host.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        errno = EINVAL;
        return -1;
    }

    return ::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
}

int TcpSocket::listen(int backlog) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    return ::listen(fd_, backlog);
}

TcpSocket TcpSocket::accept(struct sockaddr_in* client_addr) {
    if (fd_ < 0) {
        errno = EBADF;
        return TcpSocket(-1);
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);

    int client_fd = ::accept4(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len,
                              SOCK_NONBLOCK | SOCK_CLOEXEC);

    if (client_fd >= 0 && client_addr) {
        *client_addr = addr;
    }

    return TcpSocket(client_fd);
}

ssize_t TcpSocket::send(const void* data, size_t len) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    return ::send(fd_, data, len, MSG_NOSIGNAL);
}

ssize_t TcpSocket::recv(void* buffer, size_t len) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    return ::recv(fd_, buffer, len, 0);
}

bool TcpSocket::get_local_address(std::string& ip, uint16_t& port) const {
    if (fd_ < 0) {
        return false;
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) < 0) {
        return false;
    }
    return format_address(addr, ip, port);
}

bool TcpSocket::get_remote_address(std::string& ip, uint16_t& port) const {
    if (fd_ < 0) {
        return false;
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    if (getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) < 0) {
        return false;
    }
    return format_address(addr, ip, port);
}

int TcpSocket::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

} // namespace net
} // namespace piping
