#include "tls_context.h"
#include "../core/logger.h"

namespace piping {
namespace net {

std::string TlsContext::get_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

std::shared_ptr<TlsContext> TlsContext::create_server(const TlsContextConfig& config,
                                                      std::string* error) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    auto ctx = std::shared_ptr<TlsContext>(new TlsContext());
    if (!ctx->configure(config)) {
        LOG_ERROR("TLS", "%s", ctx->error_message_.c_str());
        if (error) {
            *error = ctx->error_message_;
        }
        return nullptr;
    }
    return ctx;
}

bool TlsContext::configure(const TlsContextConfig& config) {
    ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ctx_) {
        error_message_ = "Failed to create SSL_CTX: " + get_openssl_error();
        return false;
    }

    SSL_CTX_set_options(ctx_, SSL_OP_NO_COMPRESSION | SSL_OP_CIPHER_SERVER_PREFERENCE);

    if (!SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION)) {
        error_message_ = "Failed to set min TLS version";
        return false;
    }

    // Certificate (file or memory)
    if (!config.cert_file.empty()) {
        if (SSL_CTX_use_certificate_chain_file(ctx_, config.cert_file.c_str()) != 1) {
            error_message_ = "Failed to load certificate file '" + config.cert_file + "': " +
                             get_openssl_error();
            return false;
        }
    } else if (!config.cert_data.empty()) {
        if (!load_cert_mem(config.cert_data)) {
            return false;
        }
    } else {
        error_message_ = "No certificate provided (cert_file or cert_data)";
        return false;
    }

    // Private key (file or memory)
    if (!config.key_file.empty()) {
        if (SSL_CTX_use_PrivateKey_file(ctx_, config.key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            error_message_ = "Failed to load private key file '" + config.key_file + "': " +
                             get_openssl_error();
            return false;
        }
    } else if (!config.key_data.empty()) {
        if (!load_key_mem(config.key_data)) {
            return false;
        }
    } else {
        error_message_ = "No private key provided (key_file or key_data)";
        return false;
    }

    if (!SSL_CTX_check_private_key(ctx_)) {
        error_message_ = "Private key does not match certificate: " + get_openssl_error();
        return false;
    }

    if (!config.cipher_list.empty() &&
        !SSL_CTX_set_cipher_list(ctx_, config.cipher_list.c_str())) {
        error_message_ = "Failed to set cipher list: " + get_openssl_error();
        return false;
    }

    if (!config.cipher_suites.empty() &&
        !SSL_CTX_set_ciphersuites(ctx_, config.cipher_suites.c_str())) {
        error_message_ = "Failed to set TLS 1.3 ciphersuites: " + get_openssl_error();
        return false;
    }

    if (!config.alpn_protocols.empty()) {
        if (!configure_alpn(config.alpn_protocols)) {
            return false;
        }
        alpn_protocols_ = config.alpn_protocols;
    }

    return true;
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
}

bool TlsContext::load_cert_mem(const std::string& cert_data) {
    BIO* bio = BIO_new_mem_buf(cert_data.data(), static_cast<int>(cert_data.size()));
    if (!bio) {
        error_message_ = "Failed to create BIO for certificate: " + get_openssl_error();
        return false;
    }

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    if (!cert) {
        BIO_free(bio);
        error_message_ = "Failed to parse certificate from memory: " + get_openssl_error();
        return false;
    }

    int result = SSL_CTX_use_certificate(ctx_, cert);
    X509_free(cert);

    // Remaining PEM blocks form the chain.
    while (result == 1) {
        X509* extra = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
        if (!extra) {
            ERR_clear_error();
            break;
        }
        if (SSL_CTX_add_extra_chain_cert(ctx_, extra) != 1) {
            X509_free(extra);
            result = 0;
        }
    }
    BIO_free(bio);

    if (result != 1) {
        error_message_ = "Failed to use certificate: " + get_openssl_error();
        return false;
    }

    return true;
}

bool TlsContext::load_key_mem(const std::string& key_data) {
    BIO* bio = BIO_new_mem_buf(key_data.data(), static_cast<int>(key_data.size()));
    if (!bio) {
        error_message_ = "Failed to create BIO for private key: " + get_openssl_error();
        return false;
    }

    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!key) {
        error_message_ = "Failed to parse private key from memory: " + get_openssl_error();
        return false;
    }

    int result = SSL_CTX_use_PrivateKey(ctx_, key);
    EVP_PKEY_free(key);

    if (result != 1) {
        error_message_ = "Failed to use private key: " + get_openssl_error();
        return false;
    }

    return true;
}

bool TlsContext::configure_alpn(const std::vector<std::string>& protocols) {
    alpn_wire_format_.clear();

    for (const auto& protocol : protocols) {
        if (protocol.empty() || protocol.size() > 255) {
            error_message_ = "Invalid ALPN protocol: '" + protocol + "'";
            return false;
        }

        alpn_wire_format_.push_back(static_cast<unsigned char>(protocol.size()));
        alpn_wire_format_.insert(alpn_wire_format_.end(), protocol.begin(), protocol.end());
    }

    SSL_CTX_set_alpn_select_cb(ctx_, alpn_select_callback, this);
    return true;
}

int TlsContext::alpn_select_callback(
    SSL* /*ssl*/,
    const unsigned char** out,
    unsigned char* outlen,
    const unsigned char* in,
    unsigned int inlen,
    void* arg
) {
    auto* ctx = static_cast<TlsContext*>(arg);

    unsigned char* selected = nullptr;
    int result = SSL_select_next_proto(
        &selected,
        outlen,
        ctx->alpn_wire_format_.data(),
        static_cast<unsigned int>(ctx->alpn_wire_format_.size()),
        in,
        inlen
    );

    if (result == OPENSSL_NPN_NEGOTIATED) {
        *out = selected;
        return SSL_TLSEXT_ERR_OK;
    }

    return SSL_TLSEXT_ERR_NOACK;
}

} // namespace net
} // namespace piping
