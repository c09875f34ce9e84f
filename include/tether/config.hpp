// include/tether/config.hpp
// Flat configuration struct with builder pattern, loadable from a JSON file.

#pragma once

#include "error.hpp"
#include "platform.hpp"
#include "socket.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tether {

class ClientConfigBuilder;

// Configuration for a tether Client.
class ClientConfig {
public:
    static ClientConfigBuilder builder();

    // Read `clientid`, `password`, `host`, `port`, `tls`, `ca` and the optional
    // `reconnect_interval` / `receive_timeout` (seconds) from a JSON file and
    // apply them on top of `base`. Throws TetherError on a missing or invalid file.
    static ClientConfig load(const std::string& path, const ClientConfig& base);
    static ClientConfig load(const std::string& path);

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }
    bool configured() const noexcept { return !host_.empty() && port_ != 0; }
    const std::string& client_id() const noexcept { return client_id_; }
    const std::string& password() const noexcept { return password_; }
    bool tls() const noexcept { return tls_; }
    const std::string& ca() const noexcept { return ca_; }

    std::chrono::milliseconds reconnect_interval() const noexcept { return reconnect_interval_; }
    std::chrono::milliseconds receive_timeout() const noexcept { return receive_timeout_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }

    LengthWidth length_width() const noexcept { return length_width_; }
    size_t max_frame_size() const noexcept { return max_frame_size_; }
    size_t receive_buffer_size() const noexcept { return receive_buffer_size_; }

    const std::string& root() const noexcept { return root_; }
    bool enable_file_management() const noexcept { return enable_file_management_; }
    bool enable_rtc_update() const noexcept { return enable_rtc_update_; }

    const SocketFactory& socket_factory() const noexcept { return socket_factory_; }
    const MonotonicClock& clock() const noexcept { return clock_; }
    const std::shared_ptr<Platform>& platform() const noexcept { return platform_; }

private:
    friend class ClientConfigBuilder;

    std::string host_;
    uint16_t port_ = 0;
    std::string client_id_;
    std::string password_;
    bool tls_ = false;
    std::string ca_;

    std::chrono::milliseconds reconnect_interval_{10000};
    std::chrono::milliseconds receive_timeout_{65000};
    std::chrono::milliseconds connect_timeout_{10000};

    LengthWidth length_width_ = LengthWidth::Two;
    size_t max_frame_size_ = 0;  // 0 = width maximum
    size_t receive_buffer_size_ = 1500;

    std::string root_ = "/";
    bool enable_file_management_ = true;
    bool enable_rtc_update_ = true;

    SocketFactory socket_factory_;
    MonotonicClock clock_;
    std::shared_ptr<Platform> platform_;
};

// Fluent builder for ClientConfig.
class ClientConfigBuilder {
public:
    ClientConfigBuilder() = default;
    explicit ClientConfigBuilder(ClientConfig base);

    ClientConfigBuilder& host(std::string host);
    ClientConfigBuilder& port(int port);
    ClientConfigBuilder& client_id(std::string client_id);
    ClientConfigBuilder& password(std::string password);
    ClientConfigBuilder& tls(bool enabled);
    ClientConfigBuilder& ca(std::string ca_pem);
    ClientConfigBuilder& reconnect_interval(std::chrono::milliseconds interval);
    ClientConfigBuilder& receive_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& length_width(LengthWidth width);
    ClientConfigBuilder& max_frame_size(size_t size);
    ClientConfigBuilder& receive_buffer_size(size_t size);
    ClientConfigBuilder& root(std::string root);
    ClientConfigBuilder& enable_file_management(bool enabled);
    ClientConfigBuilder& enable_rtc_update(bool enabled);
    ClientConfigBuilder& socket_factory(SocketFactory factory);
    ClientConfigBuilder& clock(MonotonicClock clock);
    ClientConfigBuilder& platform(std::shared_ptr<Platform> platform);

    // Build the config, filling in default collaborators.
    // Throws TetherError on out-of-range values.
    ClientConfig build() const;

private:
    int port_ = 0;
    ClientConfig config_;
};

} // namespace tether
