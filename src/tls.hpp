// src/tls.hpp
// OpenSSL client context and the socket wrapper it produces.

#pragma once

#include "tether/socket.hpp"

#include <openssl/ssl.h>

namespace tether {

class TlsContext final : public SecurityContext,
                         public std::enable_shared_from_this<TlsContext> {
public:
    explicit TlsContext(const std::string& ca_pem);
    ~TlsContext() override;

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    std::unique_ptr<Socket> wrap(std::unique_ptr<Socket> socket,
                                 const std::string& server_hostname) override;

    SSL_CTX* native_handle() const noexcept { return ctx_; }
    bool verify_hostname() const noexcept { return verify_hostname_; }

private:
    void load_ca_bundle(const std::string& ca_pem);

    SSL_CTX* ctx_ = nullptr;
    bool verify_hostname_ = true;
};

class TlsSocket final : public Socket {
public:
    TlsSocket(std::shared_ptr<TlsContext> context, std::unique_ptr<Socket> inner,
              std::string server_hostname);
    ~TlsSocket() override;

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    // TCP connect followed by a blocking TLS handshake.
    void connect(const std::string& host, uint16_t port) override;
    void set_nonblocking() override;

    IoResult send(const uint8_t* data, size_t len) override;
    IoResult recv_into(uint8_t* buf, size_t capacity) override;

    void close() noexcept override;
    int native_handle() const noexcept override { return inner_->native_handle(); }

private:
    IoResult translate(int ret);

    std::shared_ptr<TlsContext> context_;
    std::unique_ptr<Socket> inner_;
    std::string server_hostname_;
    SSL* ssl_ = nullptr;
};

} // namespace tether
