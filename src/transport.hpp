// src/transport.hpp
// Reconnecting stream connection. Single socket, poll-driven, never blocks
// after connect.

#pragma once

#include "tether/error.hpp"
#include "tether/platform.hpp"
#include "tether/socket.hpp"
#include "tether/types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tether {

// State machine:
//
//   DisconnectedPaused --retry()--> DisconnectedActive --connect ok--> Connected
//   Connected --send/recv failure, reconnect()--> DisconnectedActive
//   any --pause()--> DisconnectedPaused
//
// Created paused and unconfigured. poll() makes at most one connect attempt
// per reconnect interval; there is no backoff.
class Connection {
public:
    using Hook = std::function<void()>;
    using ChunkHandler = std::function<void(const uint8_t* data, size_t len)>;

    Connection(SocketFactory socket_factory, MonotonicClock clock,
               std::chrono::milliseconds reconnect_interval, size_t receive_buffer_size);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Set the connection target. Does not connect.
    void configure(std::string host, uint16_t port,
                   std::shared_ptr<SecurityContext> security = nullptr);

    // Clear the pause flag and attempt a connection now.
    void retry();

    // Stop all connection attempts until retry().
    void pause();

    // Drop the current connection (if any) and, unless paused, reconnect now.
    void reconnect();

    // Connect if disconnected, not paused and the reconnect interval elapsed.
    void poll();

    // Write all of `data`. Any failure tears the connection down.
    // Returns the number of bytes sent: `len`, or 0.
    size_t send_bytes(const uint8_t* data, size_t len);

    // Drain the socket until it would block, handing each chunk to `on_chunk`.
    // Chunks point into a reused buffer and are valid only during the call.
    // Returns the number of bytes delivered.
    size_t receive_bytes(const ChunkHandler& on_chunk);

    void set_connect_hook(Hook hook) { connect_hook_ = std::move(hook); }
    void set_disconnect_hook(Hook hook) { disconnect_hook_ = std::move(hook); }

    void set_reconnect_interval(std::chrono::milliseconds interval) { reconnect_interval_ = interval; }

    bool connected() const noexcept { return connected_; }
    bool paused() const noexcept { return paused_; }
    ConnectionState state() const noexcept;
    const ConnectionStats& stats() const noexcept { return stats_; }

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }
    std::chrono::milliseconds reconnect_interval() const noexcept { return reconnect_interval_; }

private:
    void try_connect();
    void drop(const char* reason);

    SocketFactory socket_factory_;
    MonotonicClock clock_;

    // Configuration
    std::string host_;
    uint16_t port_ = 0;
    std::shared_ptr<SecurityContext> security_;
    std::chrono::milliseconds reconnect_interval_;

    // State
    std::unique_ptr<Socket> socket_;
    bool connected_ = false;
    bool paused_ = true;
    std::chrono::steady_clock::time_point last_connect_attempt_;

    // Workspace, reused across reads
    std::vector<uint8_t> buffer_;

    Hook connect_hook_;
    Hook disconnect_hook_;
    ConnectionStats stats_;
};

} // namespace tether
