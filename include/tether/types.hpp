// include/tether/types.hpp
// Core enums and counters shared by the public API and the internals.

#pragma once

#include <cstddef>
#include <cstdint>

namespace tether {

// Width of the big-endian frame length prefix.
enum class LengthWidth : uint8_t {
    One = 1,  // payloads up to 255 bytes
    Two = 2,  // payloads up to 65535 bytes
};

constexpr size_t width_bytes(LengthWidth width) noexcept {
    return static_cast<size_t>(width);
}

constexpr size_t max_payload(LengthWidth width) noexcept {
    return width == LengthWidth::One ? 0xFFu : 0xFFFFu;
}

// Connection lifecycle.
enum class ConnectionState : uint8_t {
    DisconnectedPaused = 0,
    DisconnectedActive = 1,
    Connected          = 2,
};

inline const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::DisconnectedPaused: return "disconnected-paused";
        case ConnectionState::DisconnectedActive: return "disconnected-active";
        case ConnectionState::Connected:          return "connected";
    }
    return "unknown";
}

// Counters kept by the transport connection.
struct ConnectionStats {
    uint64_t connect_attempts = 0;
    uint64_t connects = 0;
    uint64_t disconnects = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
};

// Counters kept by the client message layer.
struct ClientStats {
    uint64_t messages_sent = 0;
    uint64_t send_errors = 0;
    uint64_t messages_received = 0;
    uint64_t connects = 0;
};

} // namespace tether
