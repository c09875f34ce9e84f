// src/posix_socket.hpp
// POSIX TCP socket: blocking connect with timeout, non-blocking I/O after.

#pragma once

#include "tether/socket.hpp"
#include <chrono>

namespace tether {

class PosixSocket final : public Socket {
public:
    explicit PosixSocket(std::chrono::milliseconds connect_timeout);
    ~PosixSocket() override;

    PosixSocket(const PosixSocket&) = delete;
    PosixSocket& operator=(const PosixSocket&) = delete;

    void connect(const std::string& host, uint16_t port) override;
    void set_nonblocking() override;

    IoResult send(const uint8_t* data, size_t len) override;
    IoResult recv_into(uint8_t* buf, size_t capacity) override;

    void close() noexcept override;
    int native_handle() const noexcept override { return fd_; }

private:
    void configure_socket(int fd);

    std::chrono::milliseconds connect_timeout_;
    int fd_ = -1;
};

} // namespace tether
