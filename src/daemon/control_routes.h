// src/daemon/control_routes.h
#ifndef LOGWARDEN_CONTROL_ROUTES_H
#define LOGWARDEN_CONTROL_ROUTES_H

#include "control_api.h"
#include "../common/agent_config.h"
#include "../common/recent_events.h"
#include "../common/geo_resolver.h"
#include "../response/ip_blocker.h"
#include <functional>

namespace logwarden {
namespace daemon {

/**
 * Everything the control routes act on. Callbacks may be empty.
 */
struct ControlContext {
    ConfigStore& config;
    response::IpBlocker& blocker;
    RecentEvents& events;
    common::GeoResolver* geo = nullptr;
    std::function<void()> restart;                 // subsystem reload
    std::function<void()> terminate;               // process exit
    std::function<nlohmann::json()> status;        // extra fields for /state
};

/**
 * Install /block, /unblock, /config, /state, /tail, /restart, /kill,
 * /ping and /geo on the API. The context must outlive the API.
 */
void RegisterControlRoutes(ControlApi& api, ControlContext& context);

nlohmann::json BlockedTableToJson(
    const std::vector<std::pair<std::string, BlockedIpEntry>>& blocked);

} // namespace daemon
} // namespace logwarden

#endif // LOGWARDEN_CONTROL_ROUTES_H
