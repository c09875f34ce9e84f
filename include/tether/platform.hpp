// include/tether/platform.hpp
// Platform collaborators: monotonic clock, RTC and telemetry queries.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <nlohmann/json.hpp>

namespace tether {

// Source of monotonic time. Injected so the reconnect and liveness timers
// can be driven by tests.
using MonotonicClock = std::function<std::chrono::steady_clock::time_point()>;

inline MonotonicClock steady_clock_source() {
    return [] { return std::chrono::steady_clock::now(); };
}

// Handlers for the commands that only read or set platform state.
class Platform {
public:
    virtual ~Platform() = default;

    // Set the wall clock from a `time` command (unix seconds).
    virtual void set_time(int64_t unix_seconds) = 0;

    // Extra fields merged into the `net_metrics_info` reply.
    virtual nlohmann::json metrics() = 0;

    // Fields of the `system_info` reply.
    virtual nlohmann::json system_info() = 0;
};

// Linux implementation: clock_settime, sysinfo and uname.
std::shared_ptr<Platform> make_host_platform();

} // namespace tether
