// src/transport.cpp
// Reconnecting stream connection.

#include "transport.hpp"

#include <spdlog/spdlog.h>

namespace tether {

Connection::Connection(SocketFactory socket_factory, MonotonicClock clock,
                       std::chrono::milliseconds reconnect_interval, size_t receive_buffer_size)
    : socket_factory_(std::move(socket_factory)),
      clock_(std::move(clock)),
      reconnect_interval_(reconnect_interval),
      buffer_(receive_buffer_size) {
    // No attempt made yet.
    last_connect_attempt_ = clock_() - reconnect_interval_;
}

Connection::~Connection() {
    if (socket_) {
        socket_->close();
    }
}

void Connection::configure(std::string host, uint16_t port,
                           std::shared_ptr<SecurityContext> security) {
    host_ = std::move(host);
    port_ = port;
    security_ = std::move(security);
}

ConnectionState Connection::state() const noexcept {
    if (connected_) return ConnectionState::Connected;
    return paused_ ? ConnectionState::DisconnectedPaused : ConnectionState::DisconnectedActive;
}

void Connection::retry() {
    paused_ = false;
    // Timer reset: if this attempt fails the next poll() tries again.
    last_connect_attempt_ = clock_() - reconnect_interval_;
    try_connect();
}

void Connection::pause() {
    paused_ = true;
}

void Connection::reconnect() {
    if (connected_) {
        drop("reconnect requested");
    }
    if (!paused_) {
        retry();
    }
}

void Connection::poll() {
    if (connected_) return;
    auto now = clock_();
    if (now - last_connect_attempt_ > reconnect_interval_) {
        last_connect_attempt_ = now;
        try_connect();
    }
}

void Connection::try_connect() {
    if (connected_ || paused_) return;
    if (host_.empty() || port_ == 0) return;

    stats_.connect_attempts++;

    std::unique_ptr<Socket> sock;
    try {
        sock = socket_factory_();
        if (!sock) {
            throw TetherError::network("socket factory returned no socket");
        }
        if (security_) {
            sock = security_->wrap(std::move(sock), host_);
        }
        spdlog::debug("connecting to {}:{}", host_, port_);
        sock->connect(host_, port_);
        sock->set_nonblocking();
    } catch (const TetherError& e) {
        spdlog::warn("connect to {}:{} failed: {}", host_, port_, e.what());
        if (sock) sock->close();
        return;
    }

    socket_ = std::move(sock);
    connected_ = true;
    stats_.connects++;
    spdlog::info("connected to {}:{}", host_, port_);

    if (connect_hook_) {
        connect_hook_();
    }
}

void Connection::drop(const char* reason) {
    connected_ = false;
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
    stats_.disconnects++;
    spdlog::info("disconnected ({})", reason);

    if (disconnect_hook_) {
        disconnect_hook_();
    }
}

size_t Connection::send_bytes(const uint8_t* data, size_t len) {
    poll();
    if (!connected_) return 0;

    size_t sent = 0;
    while (sent < len) {
        IoResult r = socket_->send(data + sent, len - sent);
        if (r.status != IoStatus::Ok || r.bytes == 0) {
            spdlog::warn("send truncated after {} of {} bytes: {}", sent, len,
                         r.status == IoStatus::WouldBlock ? "send buffer full" : r.error);
            drop("send failure");
            return 0;
        }
        sent += r.bytes;
    }

    stats_.bytes_sent += sent;
    spdlog::trace("send {} bytes", sent);
    return sent;
}

size_t Connection::receive_bytes(const ChunkHandler& on_chunk) {
    poll();
    if (!connected_) return 0;

    size_t total = 0;
    for (;;) {
        IoResult r = socket_->recv_into(buffer_.data(), buffer_.size());
        switch (r.status) {
            case IoStatus::Ok:
                total += r.bytes;
                stats_.bytes_received += r.bytes;
                spdlog::trace("recv {} bytes", r.bytes);
                on_chunk(buffer_.data(), r.bytes);
                break;
            case IoStatus::WouldBlock:
                return total;
            case IoStatus::Closed:
                drop("eof");
                return total;
            case IoStatus::Error:
                drop(r.error.c_str());
                return total;
        }
    }
}

} // namespace tether
