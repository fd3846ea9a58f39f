/**
 * TCP Socket - RAII wrapper around a stream socket descriptor
 */

#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

namespace piping {
namespace net {

class TcpSocket {
public:
    /**
     * Wrap an existing file descriptor. Takes ownership of the fd.
     */
    explicit TcpSocket(int fd);

    /**
     * Create a new IPv4 TCP socket (close-on-exec).
     */
    TcpSocket();

    ~TcpSocket();

    // Non-copyable, movable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    int fd() const { return fd_; }

    bool is_valid() const { return fd_ >= 0; }

    void close();

    int set_nonblocking();

    /**
     * Disable Nagle's algorithm (set TCP_NODELAY)
     */
    int set_nodelay();

    int set_reuseaddr();

    int set_reuseport();

    /**
     * Connect to a remote address (blocking unless the socket is non-blocking)
     * @param host IPv4 address or hostname
     * @param port Port number
     * @return 0 on success (or EINPROGRESS), -1 on error (check errno)
     */
    int connect(const std::string& host, uint16_t port);

    /**
     * Bind to local address
     * @param host Local IP address ("0.0.0.0" or empty for any)
     * @param port Local port (0 lets the kernel choose)
     * @return 0 on success, -1 on error
     */
    int bind(const std::string& host, uint16_t port);

    int listen(int backlog = 1024);

    /**
     * Accept a pending connection. The returned socket is non-blocking.
     * @return New TcpSocket, invalid (fd -1) on error with errno set
     */
    TcpSocket accept(struct sockaddr_in* client_addr = nullptr);

    /**
     * Send data. SIGPIPE is suppressed; a closed peer yields EPIPE.
     * @return Number of bytes sent, or -1 on error
     */
    ssize_t send(const void* data, size_t len);

    /**
     * @return Number of bytes received, 0 on EOF, -1 on error
     */
    ssize_t recv(void* buffer, size_t len);

    bool get_local_address(std::string& ip, uint16_t& port) const;

    bool get_remote_address(std::string& ip, uint16_t& port) const;

    /**
     * Release ownership of the file descriptor
     */
    int release();

private:
    int fd_;
};

} // namespace net
} // namespace piping
