// include/tether/socket.hpp
// Socket capability consumed by the transport: plain TCP or TLS-wrapped.

#pragma once

#include "error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tether {

enum class IoStatus {
    Ok,          // `bytes` were transferred
    WouldBlock,  // nothing more right now
    Closed,      // orderly close by the peer
    Error        // connection is unusable
};

struct IoResult {
    IoStatus status = IoStatus::Ok;
    size_t bytes = 0;
    std::string error;
};

// A stream socket owned by exactly one Connection.
//
// connect() blocks (including any TLS handshake) and throws TetherError on
// failure. After set_nonblocking() send/recv never block: they report
// WouldBlock instead.
class Socket {
public:
    virtual ~Socket() = default;

    virtual void connect(const std::string& host, uint16_t port) = 0;
    virtual void set_nonblocking() = 0;

    virtual IoResult send(const uint8_t* data, size_t len) = 0;
    virtual IoResult recv_into(uint8_t* buf, size_t capacity) = 0;

    virtual void close() noexcept = 0;
    virtual int native_handle() const noexcept = 0;
};

using SocketFactory = std::function<std::unique_ptr<Socket>()>;

// Wraps a not-yet-connected socket in a transport security layer bound to
// the server hostname.
class SecurityContext {
public:
    virtual ~SecurityContext() = default;

    virtual std::unique_ptr<Socket> wrap(std::unique_ptr<Socket> socket,
                                         const std::string& server_hostname) = 0;
};

// POSIX TCP socket. connect() gives up after `connect_timeout`.
std::unique_ptr<Socket> make_tcp_socket(std::chrono::milliseconds connect_timeout);

// OpenSSL client context. With an empty `ca_pem` the system trust store is
// used and the hostname is verified; otherwise only the given CA bundle is
// trusted and hostname checking is off.
// Throws TetherError::configuration on an unusable CA bundle.
std::shared_ptr<SecurityContext> make_tls_context(const std::string& ca_pem = "");

} // namespace tether
