/**
 * TLS Socket with Async Handshake
 *
 * Wraps TcpSocket with OpenSSL TLS layer for the HTTPS listener.
 *
 * Architecture:
 * - Uses memory BIOs for SSL I/O
 * - Application data flows through SSL_read/SSL_write
 * - Network data flows through underlying TcpSocket
 * - Ciphertext the kernel did not accept is kept in a pending buffer and
 *   sent by flush() on the next writable event
 */

#pragma once

#include "tcp_socket.h"
#include "tls_context.h"
#include <openssl/ssl.h>
#include <openssl/bio.h>
#include <string>
#include <vector>
#include <memory>

namespace piping {
namespace net {

/**
 * TLS Socket State
 */
enum class TlsState {
    HANDSHAKE_NEEDED,       // TLS handshake not yet started
    HANDSHAKE_IN_PROGRESS,  // Handshake ongoing
    CONNECTED,              // Handshake complete, ready for data
    ERROR,                  // TLS error occurred
    CLOSED                  // Connection closed
};

/**
 * TLS Socket (wraps TcpSocket with OpenSSL, server side)
 *
 * Usage:
 *   auto tls_socket = TlsSocket::accept(std::move(tcp_socket), tls_context);
 *   // On every readiness event until it returns 0:
 *   int result = tls_socket->handshake();
 */
class TlsSocket {
public:
    /**
     * Ciphertext held back before write() starts reporting EAGAIN.
     */
    static constexpr size_t kMaxPendingOutput = 64 * 1024;

    /**
     * Create TLS socket in server mode
     *
     * @param tcp_socket Accepted TCP connection (moved)
     * @param context TLS context with server certificate
     * @return TLS socket ready for handshake, nullptr if SSL setup failed
     */
    static std::unique_ptr<TlsSocket> accept(
        TcpSocket&& tcp_socket,
        std::shared_ptr<TlsContext> context
    );

    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * Perform TLS handshake (non-blocking)
     *
     * Call on every readiness event until it returns 0 or -1.
     *
     * @return 0 on success (handshake complete)
     *         1 if needs more I/O
     *         -1 on error (see get_error())
     */
    int handshake();

    /**
     * Read decrypted data. Pulls ciphertext from the socket as needed.
     *
     * @return Bytes read, 0 on EOF, -1 on error or would block (errno EAGAIN)
     */
    ssize_t read(void* buffer, size_t len);

    /**
     * Encrypt and send data. Unsent ciphertext is buffered.
     *
     * @return len on success, -1 with errno EAGAIN while the pending
     *         buffer is over kMaxPendingOutput, -1 with EIO on TLS failure
     */
    ssize_t write(const void* buffer, size_t len);

    /**
     * Send buffered ciphertext.
     *
     * @return 0 when everything went out, 1 if the socket would block,
     *         -1 on error
     */
    int flush();

    /**
     * Read whatever ciphertext the socket has into the read BIO.
     *
     * @return Bytes read (> 0), 0 when nothing is available or the peer
     *         closed (see peer_closed()), -1 on error
     */
    ssize_t read_encrypted_input();

    /**
     * ALPN protocol selected during the handshake, empty if none.
     */
    std::string get_alpn_protocol() const;

    TlsState get_state() const { return state_; }

    bool is_handshake_complete() const {
        return state_ == TlsState::CONNECTED;
    }

    bool peer_closed() const { return peer_closed_; }

    int fd() const { return tcp_socket_.fd(); }

    TcpSocket& get_tcp_socket() { return tcp_socket_; }

    const std::string& get_error() const { return error_message_; }

    /**
     * Check if there's encrypted data waiting to be sent
     */
    bool has_pending_output() const;

    void close();

private:
    TlsSocket(TcpSocket&& tcp_socket, std::shared_ptr<TlsContext> context);

    bool init_ssl();

    /**
     * Move everything OpenSSL produced into pending_ and try to send it.
     * @return 0 all sent, 1 would block, -1 error
     */
    int flush_encrypted_output();

    static std::string get_ssl_error(SSL* ssl, int ret);

    TcpSocket tcp_socket_;
    std::shared_ptr<TlsContext> context_;
    SSL* ssl_ = nullptr;
    BIO* rbio_ = nullptr;  // Read BIO (encrypted data from network)
    BIO* wbio_ = nullptr;  // Write BIO (encrypted data to network)
    TlsState state_ = TlsState::HANDSHAKE_NEEDED;
    std::string error_message_;
    bool peer_closed_ = false;

    std::vector<char> pending_;      // Ciphertext the kernel has not taken yet
    size_t pending_offset_ = 0;
};

} // namespace net
} // namespace piping
