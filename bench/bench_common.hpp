// bench/bench_common.hpp
// Shared benchmark scenarios: typical message sizes on the wire.

#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace tether_bench {

struct BenchScenario {
    const char* name;
    size_t messages_per_burst;
    size_t payload_size;

    size_t total_bytes() const { return messages_per_burst * payload_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"keepalive_sized", 10, 40},
    {"typical", 20, 200},
    {"file_chunk", 4, 1400},
    {"max_frame", 2, 60000},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// A JSON message of approximately the given serialized size.
inline nlohmann::json generate_message(size_t size) {
    nlohmann::json msg = {{"cmd", "file_data"}, {"filename", "bench.bin"}, {"position", 0}};
    size_t base = msg.dump().size() + 10;  // ,"data":""
    msg["data"] = std::string(size > base ? size - base : 0, 'A');
    return msg;
}

} // namespace tether_bench
