/**
 * TLS Context with ALPN Support
 *
 * OpenSSL SSL_CTX wrapper for the HTTPS listener.
 *
 * Features:
 * - File-based and memory-based PEM certificates
 * - ALPN (advertises http/1.1)
 * - TLS 1.2 minimum
 */

#pragma once

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <string>
#include <vector>
#include <memory>

namespace piping {
namespace net {

struct TlsContextConfig {
    std::string cert_file;           // Path to certificate file (PEM)
    std::string key_file;            // Path to private key file (PEM)
    std::string cert_data;           // In-memory certificate (PEM)
    std::string key_data;            // In-memory private key (PEM)

    std::vector<std::string> alpn_protocols = {"http/1.1"};

    std::string cipher_list;         // TLS 1.2 ciphers (empty = OpenSSL defaults)
    std::string cipher_suites;       // TLS 1.3 ciphersuites (empty = OpenSSL defaults)
};

/**
 * TLS Context (wraps SSL_CTX*)
 *
 * Shared by every connection of the HTTPS listener; SSL_CTX is safe to use
 * from multiple threads once configured.
 */
class TlsContext {
public:
    /**
     * Create server TLS context from configuration.
     *
     * @param config TLS configuration
     * @param error Receives the failure reason when nullptr is returned
     * @return Shared pointer to TLS context, or nullptr on error
     */
    static std::shared_ptr<TlsContext> create_server(const TlsContextConfig& config,
                                                     std::string* error = nullptr);

    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* get_ssl_ctx() const noexcept {
        return ctx_;
    }

    const std::vector<std::string>& get_alpn_protocols() const noexcept {
        return alpn_protocols_;
    }

    bool is_valid() const noexcept {
        return ctx_ != nullptr;
    }

    const std::string& get_error() const noexcept {
        return error_message_;
    }

    /**
     * Most recent OpenSSL error queue entry as text.
     */
    static std::string get_openssl_error();

private:
    TlsContext() = default;

    bool configure(const TlsContextConfig& config);
    bool load_cert_mem(const std::string& cert_data);
    bool load_key_mem(const std::string& key_data);
    bool configure_alpn(const std::vector<std::string>& protocols);

    /**
     * ALPN selection callback. Picks the first protocol of ours the client
     * also offers; without a match the handshake proceeds without ALPN.
     */
    static int alpn_select_callback(
        SSL* ssl,
        const unsigned char** out,
        unsigned char* outlen,
        const unsigned char* in,
        unsigned int inlen,
        void* arg
    );

    SSL_CTX* ctx_ = nullptr;
    std::vector<std::string> alpn_protocols_;
    std::string error_message_;

    // ALPN wire format (length-prefixed strings), e.g. "\x08http/1.1"
    std::vector<unsigned char> alpn_wire_format_;
};

} // namespace net
} // namespace piping
