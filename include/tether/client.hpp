// include/tether/client.hpp
// tether client: reconnecting JSON message transport with file receive.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tether {

// The tether client.
//
// Created via Client::create(config), paused. Call retry() to start
// connecting, then call receive() from the application loop; nothing runs in
// the background. Not thread-safe.
//
// Example:
//   auto client = Client::create(ClientConfig::load("/etc/tether.json"));
//   client->retry();
//   for (;;) {
//       for (auto& msg : client->receive()) handle(msg);
//       sleep_a_little();
//   }
class Client {
public:
    using MessageHandler = std::function<void(nlohmann::json& message)>;
    using Callback = std::function<void()>;

    // Create a client and apply `config`. Throws TetherError on invalid
    // configuration.
    static std::unique_ptr<Client> create(ClientConfig config);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // --- Connection ---

    // Apply endpoint, credentials, TLS, timers, file root and feature flags,
    // then reconnect unless paused. Framing settings, the socket factory and
    // the clock stay as they were at create().
    void configure(const ClientConfig& config);

    // Load a JSON config file over the current settings and configure().
    // On a missing or invalid file the error is logged, nothing changes and
    // false is returned.
    bool reload(const std::string& path);

    // Resume connecting and attempt a connection now.
    void retry();

    // Stop connecting until retry().
    void pause();

    // Drop the connection and, unless paused, connect again now.
    void reconnect();

    ConnectionState state() const noexcept;
    bool connected() const noexcept;

    // --- Messages ---

    // Send one message. Returns true iff the whole frame went out.
    bool send(const nlohmann::json& message);

    // Send a keepalive frame.
    bool send_null();

    // Send {"cmd":"ping","millis":<monotonic ms>}; the pong reply is logged.
    bool ping();

    // One tick: receive, answer protocol commands, then check liveness.
    // Messages without a known `cmd` are returned in arrival order.
    // Never throws for connection or protocol errors.
    std::vector<nlohmann::json> receive();

    // As receive(), handing each application message to `handler`.
    // Exceptions thrown by `handler` propagate.
    void receive(const MessageHandler& handler);

    // --- Observers ---

    // Fired after the hello handshake has been sent.
    void set_connected_callback(Callback callback);

    // Fired after the connection was lost or dropped.
    void set_disconnected_callback(Callback callback);

    ClientStats stats() const noexcept;
    ConnectionStats connection_stats() const noexcept;
    const ClientConfig& config() const noexcept;

    std::chrono::steady_clock::time_point last_send() const noexcept;
    std::chrono::steady_clock::time_point last_receive() const noexcept;

private:
    explicit Client(ClientConfig config);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace tether
