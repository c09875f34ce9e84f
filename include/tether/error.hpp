// include/tether/error.hpp
// Single error class with kind enum, thrown by value, caught by const ref.

#pragma once

#include <stdexcept>
#include <string>

namespace tether {

enum class ErrorKind {
    Configuration,     // Invalid config or config file
    Network,           // Socket/TLS failure (connection is torn down and retried)
    Oversize,          // Payload too large for the frame length field
    Protocol,          // Frame stream desync
    MalformedMessage,  // Frame payload is not a JSON object
    Io,                // Local storage failure
    Integrity          // File size or checksum mismatch
};

class TetherError : public std::exception {
public:
    TetherError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    static TetherError configuration(std::string msg) {
        return TetherError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static TetherError network(std::string msg) {
        return TetherError(ErrorKind::Network, "network error: " + msg);
    }

    static TetherError oversize(size_t size, size_t limit) {
        return TetherError(ErrorKind::Oversize,
            "payload of " + std::to_string(size) + " bytes exceeds maximum frame size "
            + std::to_string(limit));
    }

    static TetherError protocol(std::string msg) {
        return TetherError(ErrorKind::Protocol, "protocol error: " + msg);
    }

    static TetherError malformed_message(std::string msg) {
        return TetherError(ErrorKind::MalformedMessage, "malformed message: " + msg);
    }

    static TetherError io(std::string msg) {
        return TetherError(ErrorKind::Io, "io error: " + msg);
    }

    static TetherError integrity(std::string msg) {
        return TetherError(ErrorKind::Integrity, msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace tether
