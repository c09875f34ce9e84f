// src/tls.cpp
// OpenSSL client context and socket wrapper.

#include "tls.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace tether {

static std::string last_ssl_error() {
    unsigned long code = ::ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ::ERR_error_string_n(code, buf, sizeof(buf));
    ::ERR_clear_error();
    return buf;
}

// --- TlsContext ---

TlsContext::TlsContext(const std::string& ca_pem) {
    ctx_ = ::SSL_CTX_new(::TLS_client_method());
    if (ctx_ == nullptr) {
        throw TetherError::configuration("SSL_CTX_new failed: " + last_ssl_error());
    }
    ::SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    ::SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

    if (ca_pem.empty()) {
        if (::SSL_CTX_set_default_verify_paths(ctx_) != 1) {
            ::SSL_CTX_free(ctx_);
            throw TetherError::configuration("cannot load system trust store: " + last_ssl_error());
        }
        verify_hostname_ = true;
    } else {
        try {
            load_ca_bundle(ca_pem);
        } catch (...) {
            ::SSL_CTX_free(ctx_);
            throw;
        }
        verify_hostname_ = false;
    }
}

TlsContext::~TlsContext() {
    ::SSL_CTX_free(ctx_);
}

void TlsContext::load_ca_bundle(const std::string& ca_pem) {
    BIO* bio = ::BIO_new_mem_buf(ca_pem.data(), static_cast<int>(ca_pem.size()));
    if (bio == nullptr) {
        throw TetherError::configuration("BIO_new_mem_buf failed");
    }

    X509_STORE* store = ::SSL_CTX_get_cert_store(ctx_);
    int loaded = 0;
    while (X509* cert = ::PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) {
        int ok = ::X509_STORE_add_cert(store, cert);
        ::X509_free(cert);
        if (ok != 1) {
            ::BIO_free(bio);
            throw TetherError::configuration("cannot add CA certificate: " + last_ssl_error());
        }
        loaded++;
    }
    ::BIO_free(bio);
    // PEM_read_bio_X509 leaves "no start line" on the queue at end of input.
    ::ERR_clear_error();

    if (loaded == 0) {
        throw TetherError::configuration("CA bundle contains no PEM certificates");
    }
}

std::unique_ptr<Socket> TlsContext::wrap(std::unique_ptr<Socket> socket,
                                         const std::string& server_hostname) {
    return std::make_unique<TlsSocket>(shared_from_this(), std::move(socket), server_hostname);
}

std::shared_ptr<SecurityContext> make_tls_context(const std::string& ca_pem) {
    return std::make_shared<TlsContext>(ca_pem);
}

// --- TlsSocket ---

TlsSocket::TlsSocket(std::shared_ptr<TlsContext> context, std::unique_ptr<Socket> inner,
                     std::string server_hostname)
    : context_(std::move(context)), inner_(std::move(inner)),
      server_hostname_(std::move(server_hostname)) {}

TlsSocket::~TlsSocket() {
    close();
}

void TlsSocket::close() noexcept {
    if (ssl_ != nullptr) {
        // Best effort close_notify; the peer may already be gone.
        ::SSL_shutdown(ssl_);
        ::SSL_free(ssl_);
        ssl_ = nullptr;
        ::ERR_clear_error();
    }
    inner_->close();
}

void TlsSocket::connect(const std::string& host, uint16_t port) {
    inner_->connect(host, port);

    ssl_ = ::SSL_new(context_->native_handle());
    if (ssl_ == nullptr) {
        throw TetherError::network("SSL_new failed: " + last_ssl_error());
    }
    if (::SSL_set_fd(ssl_, inner_->native_handle()) != 1) {
        throw TetherError::network("SSL_set_fd failed: " + last_ssl_error());
    }
    if (::SSL_set_tlsext_host_name(ssl_, server_hostname_.c_str()) != 1) {
        throw TetherError::network("cannot set server name " + server_hostname_ + ": "
                                   + last_ssl_error());
    }
    if (context_->verify_hostname() && ::SSL_set1_host(ssl_, server_hostname_.c_str()) != 1) {
        throw TetherError::network("cannot enable hostname check for " + server_hostname_ + ": "
                                   + last_ssl_error());
    }

    if (::SSL_connect(ssl_) != 1) {
        long verify = ::SSL_get_verify_result(ssl_);
        std::string reason = verify != X509_V_OK
            ? ::X509_verify_cert_error_string(verify)
            : last_ssl_error();
        throw TetherError::network("TLS handshake with " + server_hostname_ + " failed: " + reason);
    }
}

void TlsSocket::set_nonblocking() {
    inner_->set_nonblocking();
}

IoResult TlsSocket::translate(int ret) {
    IoResult result;
    if (ret > 0) {
        result.bytes = static_cast<size_t>(ret);
        return result;
    }
    switch (::SSL_get_error(ssl_, ret)) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            result.status = IoStatus::WouldBlock;
            break;
        case SSL_ERROR_ZERO_RETURN:
            result.status = IoStatus::Closed;
            break;
        case SSL_ERROR_SYSCALL:
            // Unexpected EOF without close_notify.
            result.status = ::ERR_peek_error() == 0 ? IoStatus::Closed : IoStatus::Error;
            result.error = last_ssl_error();
            break;
        default:
            result.status = IoStatus::Error;
            result.error = last_ssl_error();
            break;
    }
    return result;
}

IoResult TlsSocket::send(const uint8_t* data, size_t len) {
    if (ssl_ == nullptr) {
        return IoResult{IoStatus::Error, 0, "TLS session not established"};
    }
    if (len == 0) {
        return IoResult{};
    }
    return translate(::SSL_write(ssl_, data, static_cast<int>(len)));
}

IoResult TlsSocket::recv_into(uint8_t* buf, size_t capacity) {
    if (ssl_ == nullptr) {
        return IoResult{IoStatus::Error, 0, "TLS session not established"};
    }
    return translate(::SSL_read(ssl_, buf, static_cast<int>(capacity)));
}

} // namespace tether
