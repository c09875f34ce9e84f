// src/platform.cpp
// Linux platform collaborator: wall clock, memory and identity queries.

#include "tether/platform.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <string>

#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace tether {

namespace {

std::string read_first_line(const char* path) {
    std::ifstream in(path);
    std::string line;
    if (in.is_open()) std::getline(in, line);
    return line;
}

class HostPlatform final : public Platform {
public:
    void set_time(int64_t unix_seconds) override {
        struct timespec ts {};
        ts.tv_sec = static_cast<time_t>(unix_seconds);
        if (::clock_settime(CLOCK_REALTIME, &ts) != 0) {
            spdlog::warn("cannot set clock to {}: {}", unix_seconds, std::strerror(errno));
            return;
        }
        spdlog::info("clock set to {}", unix_seconds);
    }

    nlohmann::json metrics() override {
        nlohmann::json out = nlohmann::json::object();
        struct sysinfo si {};
        if (::sysinfo(&si) == 0) {
            uint64_t unit = si.mem_unit ? si.mem_unit : 1;
            out["mem_total"] = static_cast<uint64_t>(si.totalram) * unit;
            out["mem_free"] = static_cast<uint64_t>(si.freeram) * unit;
            out["mem_shared"] = static_cast<uint64_t>(si.sharedram) * unit;
            out["mem_buffer"] = static_cast<uint64_t>(si.bufferram) * unit;
            out["uptime"] = static_cast<int64_t>(si.uptime);
            out["procs"] = si.procs;
        } else {
            spdlog::debug("sysinfo failed: {}", std::strerror(errno));
        }
        return out;
    }

    nlohmann::json system_info() override {
        nlohmann::json out = nlohmann::json::object();
        struct utsname u {};
        if (::uname(&u) == 0) {
            out["os_uname_machine"] = std::string(u.machine);
            out["os_uname_nodename"] = std::string(u.nodename);
            out["os_uname_release"] = std::string(u.release);
            out["os_uname_sysname"] = std::string(u.sysname);
            out["os_uname_version"] = std::string(u.version);
        }
        std::string machine_id = read_first_line("/etc/machine-id");
        if (!machine_id.empty()) {
            out["machine_id"] = machine_id;
        }
        out["pid"] = static_cast<int64_t>(::getpid());
        return out;
    }
};

} // namespace

std::shared_ptr<Platform> make_host_platform() {
    return std::make_shared<HostPlatform>();
}

} // namespace tether
