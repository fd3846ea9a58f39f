/**
 * Stream - byte stream over a plain or TLS connection
 *
 * The HTTP connection code talks to this interface only, so HTTP and
 * HTTPS connections share one implementation.
 */

#pragma once

#include "tcp_socket.h"
#include "tls_socket.h"
#include "../core/result.h"
#include <cstddef>
#include <memory>

namespace piping {
namespace net {

class Stream {
public:
    virtual ~Stream() = default;

    virtual int fd() const = 0;

    /**
     * Read available bytes.
     *
     * @return Bytes read; 0 means the peer finished sending.
     *         error_code::would_block when nothing is available yet.
     */
    virtual core::result<size_t> read(char* buffer, size_t len) = 0;

    /**
     * Write bytes. May accept fewer than len.
     *
     * @return Bytes accepted, or error_code::would_block when the
     *         transport is full
     */
    virtual core::result<size_t> write(const char* data, size_t len) = 0;

    /**
     * Push out anything the transport buffered internally.
     *
     * @return ok when nothing is left, error_code::would_block otherwise
     */
    virtual core::result<void> flush() = 0;

    virtual bool has_pending_output() const = 0;

    virtual bool is_secure() const = 0;

    virtual void close() = 0;
};

/**
 * Plain TCP stream.
 */
class PlainStream : public Stream {
public:
    explicit PlainStream(TcpSocket socket);

    int fd() const override { return socket_.fd(); }
    core::result<size_t> read(char* buffer, size_t len) override;
    core::result<size_t> write(const char* data, size_t len) override;
    core::result<void> flush() override { return core::ok(); }
    bool has_pending_output() const override { return false; }
    bool is_secure() const override { return false; }
    void close() override { socket_.close(); }

private:
    TcpSocket socket_;
};

/**
 * TLS stream over a socket that has completed its handshake.
 */
class TlsStream : public Stream {
public:
    explicit TlsStream(std::unique_ptr<TlsSocket> socket);

    int fd() const override { return socket_->fd(); }
    core::result<size_t> read(char* buffer, size_t len) override;
    core::result<size_t> write(const char* data, size_t len) override;
    core::result<void> flush() override;
    bool has_pending_output() const override { return socket_->has_pending_output(); }
    bool is_secure() const override { return true; }
    void close() override { socket_->close(); }

private:
    std::unique_ptr<TlsSocket> socket_;
};

} // namespace net
} // namespace piping
