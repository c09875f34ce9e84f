// src/posix_socket.cpp
// POSIX TCP socket.

#include "posix_socket.hpp"

#include <cstring>

// POSIX sockets
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tether {

PosixSocket::PosixSocket(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {}

PosixSocket::~PosixSocket() {
    close();
}

void PosixSocket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void PosixSocket::connect(const std::string& host, uint16_t port) {
    close();

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(port);
    int err = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw TetherError::network("DNS resolution failed for " + host + ": " + ::gai_strerror(err));
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    int fd = -1;
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            ::close(fd);
            fd = -1;
            continue;
        }

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (ret != 0) {
            if (errno != EINPROGRESS) {
                ::close(fd);
                fd = -1;
                continue;
            }

            // Wait for connection with timeout
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int poll_ret = ::poll(&pfd, 1, static_cast<int>(connect_timeout_.count()));
            if (poll_ret <= 0) {
                ::close(fd);
                fd = -1;
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
                ::close(fd);
                fd = -1;
                continue;
            }
        }

        // Connected. Blocking again until set_nonblocking(), so a TLS
        // handshake can run on top.
        ::fcntl(fd, F_SETFL, flags);
        configure_socket(fd);
        fd_ = fd;
        ::freeaddrinfo(res);
        return;
    }

    ::freeaddrinfo(res);
    throw TetherError::network("connect failed to " + host + ":" + port_str);
}

void PosixSocket::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void PosixSocket::set_nonblocking() {
    if (fd_ < 0) {
        throw TetherError::network("socket is not connected");
    }
    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw TetherError::network(std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno));
    }
}

IoResult PosixSocket::send(const uint8_t* data, size_t len) {
    IoResult result;
    for (;;) {
        ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (n >= 0) {
            result.bytes = static_cast<size_t>(n);
            return result;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            result.status = IoStatus::WouldBlock;
        } else {
            result.status = IoStatus::Error;
            result.error = std::strerror(errno);
        }
        return result;
    }
}

IoResult PosixSocket::recv_into(uint8_t* buf, size_t capacity) {
    IoResult result;
    for (;;) {
        ssize_t n = ::recv(fd_, buf, capacity, 0);
        if (n > 0) {
            result.bytes = static_cast<size_t>(n);
            return result;
        }
        if (n == 0) {
            result.status = IoStatus::Closed;
            return result;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            result.status = IoStatus::WouldBlock;
        } else {
            result.status = IoStatus::Error;
            result.error = std::strerror(errno);
        }
        return result;
    }
}

std::unique_ptr<Socket> make_tcp_socket(std::chrono::milliseconds connect_timeout) {
    return std::make_unique<PosixSocket>(connect_timeout);
}

} // namespace tether
