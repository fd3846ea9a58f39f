/**
 * TLS Socket Implementation
 *
 * Non-blocking TLS using OpenSSL memory BIOs
 */

#include "tls_socket.h"
#include <openssl/err.h>
#include <errno.h>
#include <cstring>

namespace piping {
namespace net {

std::unique_ptr<TlsSocket> TlsSocket::accept(
    TcpSocket&& tcp_socket,
    std::shared_ptr<TlsContext> context
) {
    auto socket = std::unique_ptr<TlsSocket>(
        new TlsSocket(std::move(tcp_socket), std::move(context))
    );

    if (!socket->init_ssl()) {
        return nullptr;
    }

    return socket;
}

TlsSocket::TlsSocket(TcpSocket&& tcp_socket, std::shared_ptr<TlsContext> context)
    : tcp_socket_(std::move(tcp_socket))
    , context_(std::move(context))
{
}

TlsSocket::~TlsSocket() {
    if (ssl_) {
        SSL_free(ssl_);  // BIOs are freed by SSL_free
    }
}

bool TlsSocket::init_ssl() {
    ssl_ = SSL_new(context_->get_ssl_ctx());
    if (!ssl_) {
        error_message_ = "Failed to create SSL object";
        state_ = TlsState::ERROR;
        return false;
    }

    rbio_ = BIO_new(BIO_s_mem());
    wbio_ = BIO_new(BIO_s_mem());
    if (!rbio_ || !wbio_) {
        if (rbio_) BIO_free(rbio_);
        if (wbio_) BIO_free(wbio_);
        rbio_ = wbio_ = nullptr;
        error_message_ = "Failed to create BIOs";
        state_ = TlsState::ERROR;
        return false;
    }

    SSL_set_bio(ssl_, rbio_, wbio_);
    SSL_set_mode(ssl_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    SSL_set_accept_state(ssl_);

    return true;
}

int TlsSocket::handshake() {
    if (state_ == TlsState::CONNECTED) {
        return 0;
    }

    if (state_ == TlsState::ERROR || state_ == TlsState::CLOSED) {
        return -1;
    }

    state_ = TlsState::HANDSHAKE_IN_PROGRESS;

    while (true) {
        ERR_clear_error();
        int ret = SSL_do_handshake(ssl_);

        if (ret == 1) {
            if (flush_encrypted_output() < 0) {
                state_ = TlsState::ERROR;
                return -1;
            }
            state_ = TlsState::CONNECTED;
            return 0;
        }

        int ssl_error = SSL_get_error(ssl_, ret);
        if (ssl_error != SSL_ERROR_WANT_READ && ssl_error != SSL_ERROR_WANT_WRITE) {
            error_message_ = get_ssl_error(ssl_, ret);
            state_ = TlsState::ERROR;
            return -1;
        }

        if (flush_encrypted_output() < 0) {
            state_ = TlsState::ERROR;
            return -1;
        }

        if (ssl_error == SSL_ERROR_WANT_WRITE) {
            return 1;
        }

        ssize_t received = read_encrypted_input();
        if (received < 0) {
            state_ = TlsState::ERROR;
            return -1;
        }
        if (received == 0) {
            if (peer_closed_) {
                error_message_ = "Connection closed during handshake";
                state_ = TlsState::CLOSED;
                return -1;
            }
            return 1;
        }
    }
}

ssize_t TlsSocket::read(void* buffer, size_t len) {
    if (state_ == TlsState::CLOSED) {
        return 0;
    }
    if (state_ != TlsState::CONNECTED) {
        errno = EINVAL;
        return -1;
    }

    while (true) {
        ERR_clear_error();
        int ret = SSL_read(ssl_, buffer, static_cast<int>(len));

        if (ret > 0) {
            return ret;
        }

        int ssl_error = SSL_get_error(ssl_, ret);

        if (ssl_error == SSL_ERROR_WANT_READ) {
            // SSL_read may have produced records of its own (key updates).
            if (flush_encrypted_output() < 0) {
                state_ = TlsState::ERROR;
                errno = EIO;
                return -1;
            }

            ssize_t received = read_encrypted_input();
            if (received > 0) {
                continue;
            }
            if (received < 0) {
                state_ = TlsState::ERROR;
                errno = EIO;
                return -1;
            }
            if (peer_closed_) {
                // TCP EOF without close_notify; treat as end of stream.
                state_ = TlsState::CLOSED;
                return 0;
            }
            errno = EAGAIN;
            return -1;
        }

        if (ssl_error == SSL_ERROR_ZERO_RETURN) {
            state_ = TlsState::CLOSED;
            return 0;
        }

        error_message_ = get_ssl_error(ssl_, ret);
        state_ = TlsState::ERROR;
        errno = EIO;
        return -1;
    }
}

ssize_t TlsSocket::write(const void* buffer, size_t len) {
    if (state_ != TlsState::CONNECTED) {
        errno = state_ == TlsState::CLOSED ? EPIPE : EINVAL;
        return -1;
    }

    if (pending_.size() - pending_offset_ > kMaxPendingOutput) {
        int flushed = flush_encrypted_output();
        if (flushed < 0) {
            errno = EIO;
            return -1;
        }
        if (pending_.size() - pending_offset_ > kMaxPendingOutput) {
            errno = EAGAIN;
            return -1;
        }
    }

    if (len == 0) {
        return 0;
    }

    // Memory BIOs never block, so SSL_write consumes everything.
    ERR_clear_error();
    int ret = SSL_write(ssl_, buffer, static_cast<int>(len));
    if (ret <= 0) {
        error_message_ = get_ssl_error(ssl_, ret);
        state_ = TlsState::ERROR;
        errno = EIO;
        return -1;
    }

    if (flush_encrypted_output() < 0) {
        state_ = TlsState::ERROR;
        errno = EIO;
        return -1;
    }

    return ret;
}

int TlsSocket::flush() {
    int result = flush_encrypted_output();
    if (result < 0) {
        state_ = TlsState::ERROR;
    }
    return result;
}

int TlsSocket::flush_encrypted_output() {
    char buffer[16384];

    while (true) {
        int produced = BIO_read(wbio_, buffer, sizeof(buffer));
        if (produced <= 0) {
            break;
        }
        pending_.insert(pending_.end(), buffer, buffer + produced);
    }

    while (pending_offset_ < pending_.size()) {
        ssize_t sent = tcp_socket_.send(pending_.data() + pending_offset_,
                                        pending_.size() - pending_offset_);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return 1;
            }
            error_message_ = "Socket send failed: " + std::string(strerror(errno));
            return -1;
        }
        pending_offset_ += static_cast<size_t>(sent);
    }

    pending_.clear();
    pending_offset_ = 0;
    return 0;
}

ssize_t TlsSocket::read_encrypted_input() {
    char buffer[16384];
    ssize_t total = 0;

    while (true) {
        ssize_t received = tcp_socket_.recv(buffer, sizeof(buffer));

        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return total;
            }
            error_message_ = "Socket recv failed: " + std::string(strerror(errno));
            return -1;
        }

        if (received == 0) {
            peer_closed_ = true;
            return total;
        }

        int written = BIO_write(rbio_, buffer, static_cast<int>(received));
        if (written != received) {
            error_message_ = "BIO_write failed";
            return -1;
        }
        total += received;

        if (static_cast<size_t>(received) < sizeof(buffer)) {
            return total;
        }
    }
}

std::string TlsSocket::get_alpn_protocol() const {
    if (!ssl_ || state_ != TlsState::CONNECTED) {
        return "";
    }

    const unsigned char* alpn_data = nullptr;
    unsigned int alpn_len = 0;

    SSL_get0_alpn_selected(ssl_, &alpn_data, &alpn_len);

    if (alpn_data && alpn_len > 0) {
        return std::string(reinterpret_cast<const char*>(alpn_data), alpn_len);
    }

    return "";
}

bool TlsSocket::has_pending_output() const {
    if (pending_offset_ < pending_.size()) {
        return true;
    }
    return wbio_ && BIO_pending(wbio_) > 0;
}

void TlsSocket::close() {
    if (ssl_ && state_ == TlsState::CONNECTED) {
        // Best effort close_notify; the socket may already be gone.
        SSL_shutdown(ssl_);
        static_cast<void>(flush_encrypted_output());
    }
    state_ = TlsState::CLOSED;
    tcp_socket_.close();
}

std::string TlsSocket::get_ssl_error(SSL* ssl, int ret) {
    int ssl_error = SSL_get_error(ssl, ret);

    switch (ssl_error) {
        case SSL_ERROR_NONE:
            return "No error";
        case SSL_ERROR_ZERO_RETURN:
            return "TLS connection closed";
        case SSL_ERROR_WANT_READ:
            return "Want read";
        case SSL_ERROR_WANT_WRITE:
            return "Want write";
        case SSL_ERROR_SYSCALL: {
            unsigned long err = ERR_get_error();
            if (err == 0) {
                return ret == 0 ? "EOF in violation of protocol"
                                : "I/O error: " + std::string(strerror(errno));
            }
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            return std::string(buf);
        }
        case SSL_ERROR_SSL: {
            unsigned long err = ERR_get_error();
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            return std::string(buf);
        }
        default:
            return "Unknown SSL error: " + std::to_string(ssl_error);
    }
}

} // namespace net
} // namespace piping
