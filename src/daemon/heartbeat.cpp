// src/daemon/heartbeat.cpp
#include "heartbeat.h"
#include <iostream>

namespace logwarden {
namespace daemon {

Heartbeat::Heartbeat(common::HttpTransport& http, response::IpBlocker& blocker)
    : http_(http), blocker_(blocker) {
}

nlohmann::json Heartbeat::BuildPayload(
        const AgentConfig& config,
        const std::vector<std::pair<std::string, BlockedIpEntry>>& blocked,
        const common::SystemStats& stats) {
    nlohmann::json blocked_ips = nlohmann::json::array();
    for (const auto& [ip, entry] : blocked) {
        blocked_ips.push_back({
            {"ip", ip},
            {"reason", entry.reason},
            {"blockedAt", ToEpochMillis(entry.blocked_at)},
            {"expiresAt", ToEpochMillis(entry.expires_at)}
        });
    }

    return {
        {"instanceId", config.instance_id},
        {"version", config.version},
        {"blockedIps", blocked_ips},
        {"system", common::SystemStatsToJson(stats)}
    };
}

bool Heartbeat::Send(const AgentConfig& config) {
    if (config.dashboard_url.empty()) {
        return false;
    }

    nlohmann::json payload = BuildPayload(config, blocker_.Snapshot(),
                                          common::CollectSystemStats());

    std::string url = config.dashboard_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/agent/heartbeat";

    common::HttpResponse response = http_.Post(url, payload.dump(),
                                               {"Content-Type: application/json"});
    if (!response.ok()) {
        std::cerr << "⚠️  Heartbeat failed: "
                  << (response.error.empty() ? "HTTP " + std::to_string(response.status)
                                             : response.error)
                  << std::endl;
        return false;
    }

    last_success_ = ToEpochMillis(std::chrono::system_clock::now());
    if (config.detailed_logging) {
        std::cout << "Heartbeat sent (" << payload["blockedIps"].size() << " blocked)" << std::endl;
    }
    return true;
}

} // namespace daemon
} // namespace logwarden
