// src/common/system_stats.cpp
#include "system_stats.h"
#include <fstream>
#include <sstream>
#include <cmath>
#include <sys/sysinfo.h>

namespace logwarden {
namespace common {

bool ParseLoadAverage(const std::string& loadavg_line, double& load) {
    std::istringstream iss(loadavg_line);
    double value = 0.0;
    if (!(iss >> value) || value < 0.0) {
        return false;
    }
    load = value;
    return true;
}

SystemStats CollectSystemStats() {
    SystemStats stats;

    std::ifstream loadavg("/proc/loadavg");
    std::string line;
    if (loadavg && std::getline(loadavg, line)) {
        ParseLoadAverage(line, stats.cpu_load);
    }

    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        stats.uptime_seconds = info.uptime;

        double total = static_cast<double>(info.totalram) * info.mem_unit;
        double available = static_cast<double>(info.freeram + info.bufferram) * info.mem_unit;
        if (total > 0) {
            stats.memory_used_pct = std::round((1.0 - available / total) * 1000.0) / 10.0;
        }
    }

    return stats;
}

nlohmann::json SystemStatsToJson(const SystemStats& stats) {
    return {
        {"cpuLoad", stats.cpu_load},
        {"memoryUsedPct", stats.memory_used_pct},
        {"uptime", stats.uptime_seconds}
    };
}

} // namespace common
} // namespace logwarden
