// src/dispatcher.hpp
// Routes incoming messages by their `cmd` tag to registered handlers.

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tether {

enum class Command : uint8_t {
    Ping,
    Pong,
    FileQuery,
    FileWrite,
    FileData,
    Time,
    NetMetricsQuery,
    SystemQuery,
};

constexpr size_t kCommandCount = 8;

std::optional<Command> parse_command(const std::string& tag);
const char* command_name(Command command) noexcept;

class CommandDispatcher {
public:
    using Handler = std::function<void(nlohmann::json& message)>;

    // Called when a handler throws, with the command, the message that was
    // being handled and the error text.
    using ErrorReply = std::function<void(Command command, const nlohmann::json& message,
                                          const std::string& error)>;

    CommandDispatcher() = default;
    explicit CommandDispatcher(ErrorReply on_error) : on_error_(std::move(on_error)) {}

    // Register (or replace) the handler for `command`. An empty handler
    // unregisters it.
    void on(Command command, Handler handler) {
        handlers_[static_cast<size_t>(command)] = std::move(handler);
    }

    bool handles(Command command) const noexcept {
        return static_cast<bool>(handlers_[static_cast<size_t>(command)]);
    }

    // Run the handler for `message["cmd"]`. Returns false when the message
    // has no `cmd` string or no handler is registered for it, so the caller
    // keeps the message. Handler failures are passed to the error reply and
    // still count as handled.
    bool dispatch(nlohmann::json& message);

private:
    std::array<Handler, kCommandCount> handlers_;
    ErrorReply on_error_;
};

} // namespace tether
