// src/client.cpp
// tether client implementation: handshake, command handlers, liveness.

#include "tether/client.hpp"
#include "channel.hpp"
#include "checksum.hpp"
#include "dispatcher.hpp"
#include "file_transfer.hpp"
#include "transport.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace tether {

using json = nlohmann::json;

static double wall_time() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string filename_of(const json& message) {
    auto it = message.find("filename");
    return it != message.end() && it->is_string() ? it->get<std::string>() : std::string();
}

// Truthy like a loosely typed peer expects: true or a non-zero number.
static bool flag_of(const json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0;
    return false;
}

// Declared sizes must be non-negative integers.
static uint64_t size_of(const json& message) {
    const auto& size = message.at("size");
    if (size.is_number_unsigned()) return size.get<uint64_t>();
    if (size.is_number_integer() && size.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(size.get<int64_t>());
    }
    throw TetherError::malformed_message("size must be a non-negative integer, got " + size.dump());
}

struct Client::Inner {
    ClientConfig config;
    MonotonicClock clock;
    std::shared_ptr<Platform> platform;
    Connection connection;
    MessageChannel channel;
    CommandDispatcher dispatcher;

    std::unique_ptr<FileWriter> file_writer;

    Callback connected_callback;
    Callback disconnected_callback;

    ClientStats stats;
    std::chrono::steady_clock::time_point last_send{};
    std::chrono::steady_clock::time_point last_receive{};

    explicit Inner(ClientConfig cfg)
        : config(std::move(cfg)),
          clock(config.clock()),
          platform(config.platform()),
          connection(config.socket_factory(), config.clock(), config.reconnect_interval(),
                     config.receive_buffer_size()),
          channel(connection, config.length_width(), config.max_frame_size()),
          dispatcher([this](Command command, const json& message, const std::string& error) {
              reply_error(command, message, error);
          }) {
        connection.set_connect_hook([this] { on_connect(); });
        connection.set_disconnect_hook([this] { on_disconnect(); });

        dispatcher.on(Command::Ping, [this](json& m) { handle_ping(m); });
        dispatcher.on(Command::Pong, [this](json& m) { handle_pong(m); });
        dispatcher.on(Command::FileQuery, [this](json& m) { handle_file_query(m); });
        dispatcher.on(Command::FileWrite, [this](json& m) { handle_file_write(m); });
        dispatcher.on(Command::FileData, [this](json& m) { handle_file_data(m); });
        dispatcher.on(Command::Time, [this](json& m) { handle_time(m); });
        dispatcher.on(Command::NetMetricsQuery, [this](json& m) { handle_net_metrics_query(m); });
        dispatcher.on(Command::SystemQuery, [this](json& m) { handle_system_query(m); });
    }

    int64_t millis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            clock().time_since_epoch()).count();
    }

    // --- Connection hooks ---

    void on_connect() {
        stats.connects++;
        last_receive = clock();
        send({{"cmd", "hello"}, {"clientid", config.client_id()}, {"password", config.password()}});
        if (connection.connected() && connected_callback) {
            connected_callback();
        }
    }

    void on_disconnect() {
        channel.reset();
        if (disconnected_callback) {
            disconnected_callback();
        }
    }

    // --- Sending ---

    bool send(const json& message) {
        bool ok = channel.send_message(message);
        last_send = clock();
        if (ok) {
            stats.messages_sent++;
        } else {
            stats.send_errors++;
        }
        return ok;
    }

    void reply_error(Command command, const json&, const std::string& error) {
        send({{"cmd", "error"}, {"request", command_name(command)}, {"error", error}});
    }

    void reply_file_error(const std::string& filename, const std::string& error) {
        spdlog::error("file transfer of {} failed: {}", filename, error);
        send({{"cmd", "file_write_error"}, {"filename", filename}, {"error", error}});
    }

    // --- Receiving ---

    void receive(const MessageHandler& handler) {
        auto on_message = [&](json& message) {
            last_receive = clock();
            stats.messages_received++;
            if (dispatcher.dispatch(message)) return;
            if (handler) handler(message);
        };
        auto on_keepalive = [this] { last_receive = clock(); };

        try {
            channel.receive_messages(on_message, on_keepalive);
        } catch (const TetherError& e) {
            if (e.kind() != ErrorKind::Protocol && e.kind() != ErrorKind::MalformedMessage) {
                throw;
            }
            spdlog::warn("{}, reconnecting", e.what());
            connection.reconnect();
        }

        check_liveness();
    }

    void check_liveness() {
        if (!connection.connected()) return;
        auto silent = clock() - last_receive;
        if (silent > config.receive_timeout()) {
            spdlog::info("nothing received for {}ms, reconnecting",
                std::chrono::duration_cast<std::chrono::milliseconds>(silent).count());
            connection.reconnect();
        }
    }

    // --- Command handlers ---

    void handle_ping(json& message) {
        message["cmd"] = "pong";
        send(message);

        auto it = message.find("timestamp");
        if (it == message.end()) return;
        int64_t sent = 0;
        if (it->is_string()) {
            // Whole seconds only; the fraction is not needed for the log.
            const auto& ts = it->get_ref<const std::string&>();
            try {
                sent = std::stoll(ts.substr(0, ts.find('.')));
            } catch (const std::logic_error&) {
                spdlog::debug("ping timestamp '{}' is not a number", ts);
                return;
            }
        } else if (it->is_number()) {
            sent = static_cast<int64_t>(it->get<double>());
        } else {
            return;
        }
        spdlog::info("ping received with {}s delay", static_cast<int64_t>(wall_time()) - sent);
    }

    void handle_pong(json& message) {
        auto it = message.find("millis");
        if (it == message.end() || !it->is_number()) return;
        spdlog::info("received ping response with rtt {}ms", millis() - it->get<int64_t>());
    }

    void handle_file_query(json& message) {
        if (!config.enable_file_management()) return;
        FileInfo info = query_file(config.root(), message.at("filename").get<std::string>());
        json reply = {{"cmd", "file_info"}, {"filename", info.filename}};
        reply["size"] = info.size ? json(*info.size) : json(nullptr);
        reply["md5"] = info.md5 ? json(*info.md5) : json(nullptr);
        send(reply);
    }

    void handle_file_write(json& message) {
        if (!config.enable_file_management()) return;
        std::string filename = filename_of(message);

        if (file_writer && file_writer->state() == FileWriter::State::Open) {
            spdlog::info("abandoning incomplete transfer of {} at {} bytes",
                         file_writer->filename(), file_writer->bytes_written());
        }
        file_writer.reset();

        try {
            auto writer = std::make_unique<FileWriter>(
                config.root(), message.at("filename").get<std::string>(),
                size_of(message), message.at("md5").get<std::string>());
            writer->begin();
            file_writer = std::move(writer);
        } catch (const TetherError& e) {
            reply_file_error(filename, e.what());
            return;
        } catch (const json::exception& e) {
            reply_file_error(filename, e.what());
            return;
        }

        send({{"cmd", "file_continue"}, {"filename", filename}, {"position", 0}});
    }

    void handle_file_data(json& message) {
        if (!config.enable_file_management()) return;
        std::string filename = filename_of(message);

        std::string error;
        try {
            write_file_data(message, filename);
            return;
        } catch (const TetherError& e) {
            error = e.what();
        } catch (const json::exception& e) {
            error = e.what();
        }

        if (file_writer) {
            file_writer->abort();
            file_writer.reset();
        }
        reply_file_error(filename, error);
    }

    void write_file_data(const json& message, const std::string& filename) {
        if (!file_writer || file_writer->state() != FileWriter::State::Open) {
            throw TetherError::io("no transfer in progress for " + filename);
        }
        if (file_writer->filename() != filename) {
            throw TetherError::io("transfer in progress is for " + file_writer->filename());
        }
        if (message.contains("position")) {
            uint64_t position = message["position"].get<uint64_t>();
            if (position != file_writer->bytes_written()) {
                throw TetherError::io("position " + std::to_string(position) + " does not match "
                    + std::to_string(file_writer->bytes_written()) + " bytes written");
            }
        }

        auto payload = base64_decode(message.at("data").get<std::string>());
        file_writer->write_chunk(payload.data(), payload.size());

        if (flag_of(message, "eof")) {
            file_writer->commit();
            file_writer.reset();
            send({{"cmd", "file_write_ok"}, {"filename", filename}});
        } else {
            send({{"cmd", "file_continue"}, {"filename", filename},
                  {"position", file_writer->bytes_written()}});
        }
    }

    void handle_time(json& message) {
        if (!config.enable_rtc_update()) return;
        const auto& t = message.at("time");
        int64_t unix_seconds = 0;
        if (t.is_string()) {
            try {
                unix_seconds = std::stoll(t.get<std::string>());
            } catch (const std::logic_error&) {
                throw TetherError::malformed_message("time is not a number");
            }
        } else {
            unix_seconds = static_cast<int64_t>(t.get<double>());
        }
        platform->set_time(unix_seconds);
    }

    void handle_net_metrics_query(json&) {
        const auto& cs = connection.stats();
        json reply = {
            {"cmd", "net_metrics_info"},
            {"millis", millis()},
            {"time", wall_time()},
            {"net_tcp_reconns", stats.connects},
            {"net_tcp_connect_attempts", cs.connect_attempts},
            {"net_tcp_disconnects", cs.disconnects},
            {"net_bytes_sent", cs.bytes_sent},
            {"net_bytes_received", cs.bytes_received},
            {"messages_sent", stats.messages_sent},
            {"messages_received", stats.messages_received},
            {"send_errors", stats.send_errors},
        };
        reply.update(platform->metrics());
        send(reply);
    }

    void handle_system_query(json&) {
        json reply = {
            {"cmd", "system_info"},
            {"millis", millis()},
            {"time", wall_time()},
        };
        reply.update(platform->system_info());
        send(reply);
    }

    // --- Configuration ---

    void configure(const ClientConfig& next) {
        std::shared_ptr<SecurityContext> security;
        if (next.tls()) {
            try {
                security = make_tls_context(next.ca());
            } catch (const TetherError& e) {
                spdlog::error("TLS setup failed, keeping previous settings: {}", e.what());
                return;
            }
        }

        // Framing, socket factory and clock are bound at construction.
        ClientConfigBuilder b(config);
        b.host(next.host())
            .port(next.port())
            .client_id(next.client_id())
            .password(next.password())
            .tls(next.tls())
            .ca(next.ca())
            .reconnect_interval(next.reconnect_interval())
            .receive_timeout(next.receive_timeout())
            .root(next.root())
            .enable_file_management(next.enable_file_management())
            .enable_rtc_update(next.enable_rtc_update());
        if (next.platform()) {
            b.platform(next.platform());
        }
        config = b.build();
        platform = config.platform();

        connection.set_reconnect_interval(config.reconnect_interval());
        connection.configure(config.host(), config.port(), std::move(security));
        if (!connection.paused()) {
            connection.reconnect();
        }
    }
};

// --- Client ---

Client::Client(ClientConfig config) : inner_(std::make_unique<Inner>(config)) {
    inner_->configure(config);
}

Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

std::unique_ptr<Client> Client::create(ClientConfig config) {
    return std::unique_ptr<Client>(new Client(std::move(config)));
}

void Client::configure(const ClientConfig& config) {
    inner_->configure(config);
}

bool Client::reload(const std::string& path) {
    ClientConfig next;
    try {
        next = ClientConfig::load(path, inner_->config);
    } catch (const TetherError& e) {
        spdlog::warn("reload failed: {}", e.what());
        return false;
    }
    inner_->configure(next);
    return true;
}

void Client::retry() {
    inner_->connection.retry();
}

void Client::pause() {
    inner_->connection.pause();
}

void Client::reconnect() {
    inner_->connection.reconnect();
}

ConnectionState Client::state() const noexcept {
    return inner_->connection.state();
}

bool Client::connected() const noexcept {
    return inner_->connection.connected();
}

bool Client::send(const nlohmann::json& message) {
    return inner_->send(message);
}

bool Client::send_null() {
    bool ok = inner_->channel.send_null();
    inner_->last_send = inner_->clock();
    return ok;
}

bool Client::ping() {
    return inner_->send({{"cmd", "ping"}, {"millis", inner_->millis()}});
}

std::vector<nlohmann::json> Client::receive() {
    std::vector<nlohmann::json> messages;
    inner_->receive([&messages](nlohmann::json& message) {
        messages.push_back(std::move(message));
    });
    return messages;
}

void Client::receive(const MessageHandler& handler) {
    inner_->receive(handler);
}

void Client::set_connected_callback(Callback callback) {
    inner_->connected_callback = std::move(callback);
}

void Client::set_disconnected_callback(Callback callback) {
    inner_->disconnected_callback = std::move(callback);
}

ClientStats Client::stats() const noexcept {
    return inner_->stats;
}

ConnectionStats Client::connection_stats() const noexcept {
    return inner_->connection.stats();
}

const ClientConfig& Client::config() const noexcept {
    return inner_->config;
}

std::chrono::steady_clock::time_point Client::last_send() const noexcept {
    return inner_->last_send;
}

std::chrono::steady_clock::time_point Client::last_receive() const noexcept {
    return inner_->last_receive;
}

} // namespace tether
