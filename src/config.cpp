// src/config.cpp
// Configuration builder, validation and JSON config file loading.

#include "tether/config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace tether {

// --- ClientConfig ---

ClientConfigBuilder ClientConfig::builder() {
    return ClientConfigBuilder();
}

ClientConfig ClientConfig::load(const std::string& path) {
    return load(path, ClientConfig::builder().build());
}

ClientConfig ClientConfig::load(const std::string& path, const ClientConfig& base) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw TetherError::configuration(path + " not found");
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw TetherError::configuration(path + " is not valid JSON: " + e.what());
    }
    if (!doc.is_object()) {
        throw TetherError::configuration(path + " must contain a JSON object");
    }

    ClientConfigBuilder b(base);
    try {
        if (doc.contains("clientid")) b.client_id(doc["clientid"].get<std::string>());
        if (doc.contains("password")) b.password(doc["password"].get<std::string>());
        if (doc.contains("host"))     b.host(doc["host"].get<std::string>());
        if (doc.contains("port")) {
            const auto& port = doc["port"];
            b.port(port.is_string() ? std::stoi(port.get<std::string>()) : port.get<int>());
        }

        // Anything but a literal `true` disables TLS.
        bool tls = doc.contains("tls") && doc["tls"].is_boolean() && doc["tls"].get<bool>();
        b.tls(tls);
        b.ca(tls && doc.contains("ca") && doc["ca"].is_string() ? doc["ca"].get<std::string>()
                                                                : std::string());

        if (doc.contains("reconnect_interval")) {
            b.reconnect_interval(std::chrono::milliseconds(
                static_cast<int64_t>(doc["reconnect_interval"].get<double>() * 1000)));
        }
        if (doc.contains("receive_timeout")) {
            b.receive_timeout(std::chrono::milliseconds(
                static_cast<int64_t>(doc["receive_timeout"].get<double>() * 1000)));
        }
    } catch (const nlohmann::json::exception& e) {
        throw TetherError::configuration(path + ": " + e.what());
    } catch (const std::logic_error&) {
        throw TetherError::configuration(path + ": port is not a valid number");
    }

    return b.build();
}

// --- ClientConfigBuilder ---

ClientConfigBuilder::ClientConfigBuilder(ClientConfig base)
    : port_(base.port_), config_(std::move(base)) {}

ClientConfigBuilder& ClientConfigBuilder::host(std::string host) {
    config_.host_ = std::move(host);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::port(int port) {
    port_ = port;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::client_id(std::string client_id) {
    config_.client_id_ = std::move(client_id);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::password(std::string password) {
    config_.password_ = std::move(password);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::tls(bool enabled) {
    config_.tls_ = enabled;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::ca(std::string ca_pem) {
    config_.ca_ = std::move(ca_pem);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::reconnect_interval(std::chrono::milliseconds interval) {
    config_.reconnect_interval_ = interval;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::receive_timeout(std::chrono::milliseconds timeout) {
    config_.receive_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::length_width(LengthWidth width) {
    config_.length_width_ = width;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::max_frame_size(size_t size) {
    config_.max_frame_size_ = size;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::receive_buffer_size(size_t size) {
    config_.receive_buffer_size_ = size;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::root(std::string root) {
    config_.root_ = std::move(root);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::enable_file_management(bool enabled) {
    config_.enable_file_management_ = enabled;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::enable_rtc_update(bool enabled) {
    config_.enable_rtc_update_ = enabled;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::socket_factory(SocketFactory factory) {
    config_.socket_factory_ = std::move(factory);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::clock(MonotonicClock clock) {
    config_.clock_ = std::move(clock);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::platform(std::shared_ptr<Platform> platform) {
    config_.platform_ = std::move(platform);
    return *this;
}

ClientConfig ClientConfigBuilder::build() const {
    if (port_ < 0 || port_ > 65535) {
        throw TetherError::configuration("port must be 0-65535, got: " + std::to_string(port_));
    }
    if (config_.length_width_ != LengthWidth::One && config_.length_width_ != LengthWidth::Two) {
        throw TetherError::configuration("length width must be 1 or 2 bytes");
    }
    size_t width_max = max_payload(config_.length_width_);
    if (config_.max_frame_size_ > width_max) {
        throw TetherError::configuration("max frame size " + std::to_string(config_.max_frame_size_)
            + " exceeds the length field maximum " + std::to_string(width_max));
    }
    if (config_.receive_buffer_size_ == 0) {
        throw TetherError::configuration("receive buffer size must be non-zero");
    }
    if (config_.reconnect_interval_.count() <= 0 || config_.receive_timeout_.count() <= 0
        || config_.connect_timeout_.count() <= 0) {
        throw TetherError::configuration("intervals and timeouts must be positive");
    }

    ClientConfig result = config_;
    result.port_ = static_cast<uint16_t>(port_);
    if (result.max_frame_size_ == 0) {
        result.max_frame_size_ = width_max;
    }
    if (result.root_.empty()) {
        result.root_ = "/";
    } else if (result.root_.back() != '/') {
        result.root_.push_back('/');
    }
    if (!result.socket_factory_) {
        auto timeout = result.connect_timeout_;
        result.socket_factory_ = [timeout] { return make_tcp_socket(timeout); };
    }
    if (!result.clock_) {
        result.clock_ = steady_clock_source();
    }
    if (!result.platform_) {
        result.platform_ = make_host_platform();
    }
    return result;
}

} // namespace tether
