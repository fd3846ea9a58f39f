#include "stream.h"
#include "../core/logger.h"
#include <errno.h>
#include <cstring>

namespace piping {
namespace net {

using core::error_code;

PlainStream::PlainStream(TcpSocket socket)
    : socket_(std::move(socket))
{
}

core::result<size_t> PlainStream::read(char* buffer, size_t len) {
    while (true) {
        ssize_t n = socket_.recv(buffer, len);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return core::err<size_t>(error_code::would_block);
        }
        if (errno == ECONNRESET) {
            return core::err<size_t>(error_code::closed);
        }
        return core::err<size_t>(error_code::io_error);
    }
}

core::result<size_t> PlainStream::write(const char* data, size_t len) {
    while (true) {
        ssize_t n = socket_.send(data, len);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return core::err<size_t>(error_code::would_block);
        }
        if (errno == EPIPE || errno == ECONNRESET) {
            return core::err<size_t>(error_code::closed);
        }
        return core::err<size_t>(error_code::io_error);
    }
}

TlsStream::TlsStream(std::unique_ptr<TlsSocket> socket)
    : socket_(std::move(socket))
{
}

core::result<size_t> TlsStream::read(char* buffer, size_t len) {
    ssize_t n = socket_->read(buffer, len);
    if (n >= 0) {
        return static_cast<size_t>(n);
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return core::err<size_t>(error_code::would_block);
    }
    LOG_DEBUG("TLS", "read failed on fd %d: %s", socket_->fd(), socket_->get_error().c_str());
    return core::err<size_t>(error_code::tls_error);
}

core::result<size_t> TlsStream::write(const char* data, size_t len) {
    ssize_t n = socket_->write(data, len);
    if (n >= 0) {
        return static_cast<size_t>(n);
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return core::err<size_t>(error_code::would_block);
    }
    if (errno == EPIPE) {
        return core::err<size_t>(error_code::closed);
    }
    LOG_DEBUG("TLS", "write failed on fd %d: %s", socket_->fd(), socket_->get_error().c_str());
    return core::err<size_t>(error_code::tls_error);
}

core::result<void> TlsStream::flush() {
    int flushed = socket_->flush();
    if (flushed == 0) {
        return core::ok();
    }
    if (flushed > 0) {
        return core::err(error_code::would_block);
    }
    return core::err(error_code::tls_error);
}

} // namespace net
} // namespace piping
