// examples/client.cpp
// Minimal device loop: connect, answer the server, print application messages.
//
//   cmake -B build -DTETHER_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/tether_client tether.json
//
// tether.json:
//
//   {"host": "hub.local", "port": 20000, "clientid": "door-1",
//    "password": "...", "tls": false, "log_level": "debug"}
//
// SIGHUP reloads the file; SIGINT exits.

#include "tether/tether.hpp"

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

static volatile std::sig_atomic_t g_stop = 0;
static volatile std::sig_atomic_t g_reload = 0;

static void on_signal(int sig) {
    if (sig == SIGHUP) {
        g_reload = 1;
    } else {
        g_stop = 1;
    }
}

// The library leaves the log level to the application.
static void apply_log_level(const std::string& path) {
    std::ifstream in(path);
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_object() && doc.contains("log_level") && doc["log_level"].is_string()) {
        spdlog::set_level(spdlog::level::from_str(doc["log_level"].get<std::string>()));
    }
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <config.json>" << std::endl;
        return 2;
    }
    const std::string path = argv[1];

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGHUP, on_signal);
    // A TLS write to a reset peer must fail, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        apply_log_level(path);
        auto client = tether::Client::create(tether::ClientConfig::load(path));

        client->set_connected_callback([] { spdlog::info("session started"); });
        client->set_disconnected_callback([] { spdlog::info("session lost"); });
        client->retry();

        const auto keepalive_every = std::chrono::seconds(30);
        while (!g_stop) {
            if (g_reload) {
                g_reload = 0;
                apply_log_level(path);
                client->reload(path);
            }

            client->receive([](nlohmann::json& message) {
                std::cout << message.dump() << std::endl;
            });

            if (client->connected()
                && std::chrono::steady_clock::now() - client->last_send() > keepalive_every) {
                client->send_null();
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        auto stats = client->stats();
        spdlog::info("sent {} ({} errors), received {}, connects {}",
                     stats.messages_sent, stats.send_errors, stats.messages_received,
                     stats.connects);

    } catch (const tether::TetherError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
