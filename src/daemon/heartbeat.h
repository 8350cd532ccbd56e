// src/daemon/heartbeat.h
#ifndef LOGWARDEN_HEARTBEAT_H
#define LOGWARDEN_HEARTBEAT_H

#include "../common/agent_config.h"
#include "../common/http_client.h"
#include "../common/system_stats.h"
#include "../response/ip_blocker.h"
#include <nlohmann/json.hpp>
#include <atomic>

namespace logwarden {
namespace daemon {

/**
 * Periodic liveness report to the controller.
 * Failures are logged and never retried out of band.
 */
class Heartbeat {
public:
    Heartbeat(common::HttpTransport& http, response::IpBlocker& blocker);

    bool Send(const AgentConfig& config);

    // Epoch milliseconds of the last accepted heartbeat, 0 if none
    int64_t LastSuccess() const { return last_success_.load(); }

    static nlohmann::json BuildPayload(
        const AgentConfig& config,
        const std::vector<std::pair<std::string, BlockedIpEntry>>& blocked,
        const common::SystemStats& stats);

private:
    common::HttpTransport& http_;
    response::IpBlocker& blocker_;
    std::atomic<int64_t> last_success_{0};
};

} // namespace daemon
} // namespace logwarden

#endif // LOGWARDEN_HEARTBEAT_H
