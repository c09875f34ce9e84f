// src/dispatcher.cpp
// Command table and dispatch.

#include "dispatcher.hpp"
#include "tether/error.hpp"

#include <spdlog/spdlog.h>

namespace tether {

namespace {

struct CommandEntry {
    const char* name;
    Command command;
};

constexpr CommandEntry kCommands[kCommandCount] = {
    {"ping", Command::Ping},
    {"pong", Command::Pong},
    {"file_query", Command::FileQuery},
    {"file_write", Command::FileWrite},
    {"file_data", Command::FileData},
    {"time", Command::Time},
    {"net_metrics_query", Command::NetMetricsQuery},
    {"system_query", Command::SystemQuery},
};

} // namespace

std::optional<Command> parse_command(const std::string& tag) {
    for (const auto& entry : kCommands) {
        if (tag == entry.name) return entry.command;
    }
    return std::nullopt;
}

const char* command_name(Command command) noexcept {
    for (const auto& entry : kCommands) {
        if (entry.command == command) return entry.name;
    }
    return "unknown";
}

bool CommandDispatcher::dispatch(nlohmann::json& message) {
    auto it = message.find("cmd");
    if (it == message.end() || !it->is_string()) return false;

    auto command = parse_command(it->get<std::string>());
    if (!command) return false;

    const auto& handler = handlers_[static_cast<size_t>(*command)];
    if (!handler) return false;

    std::string error;
    try {
        handler(message);
        return true;
    } catch (const TetherError& e) {
        error = e.what();
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
    }

    spdlog::error("{} failed: {}", command_name(*command), error);
    if (on_error_) {
        on_error_(*command, message, error);
    }
    return true;
}

} // namespace tether
