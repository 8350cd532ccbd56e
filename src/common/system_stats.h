// src/common/system_stats.h
#ifndef LOGWARDEN_SYSTEM_STATS_H
#define LOGWARDEN_SYSTEM_STATS_H

#include <nlohmann/json.hpp>
#include <string>

namespace logwarden {
namespace common {

struct SystemStats {
    double cpu_load = 0.0;          // 1-minute load average
    double memory_used_pct = 0.0;
    long uptime_seconds = 0;
};

/**
 * Sample load average and memory usage. Fields that cannot be read stay 0.
 */
SystemStats CollectSystemStats();

bool ParseLoadAverage(const std::string& loadavg_line, double& load);

nlohmann::json SystemStatsToJson(const SystemStats& stats);

} // namespace common
} // namespace logwarden

#endif // LOGWARDEN_SYSTEM_STATS_H
