// src/daemon/control_routes.cpp
#include "control_routes.h"
#include "../response/firewall_manager.h"
#include <iostream>

namespace logwarden {
namespace daemon {

namespace {

// Parses a JSON object body; an empty body yields an empty object
bool ParseBody(const HttpRequest& request, nlohmann::json& body, HttpReply& error) {
    if (request.body.empty()) {
        body = nlohmann::json::object();
        return true;
    }

    body = nlohmann::json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        error = HttpReply::Error(400, "body must be a JSON object");
        return false;
    }
    return true;
}

bool RequireIp(const nlohmann::json& body, std::string& ip, HttpReply& error) {
    auto it = body.find("ip");
    if (it == body.end() || !it->is_string()) {
        error = HttpReply::Error(400, "ip must be a string");
        return false;
    }

    bool is_v6 = false;
    if (!response::FirewallManager::ParseAddress(it->get<std::string>(), is_v6)) {
        error = HttpReply::Error(400, "invalid ip address");
        return false;
    }

    ip = it->get<std::string>();
    return true;
}

} // namespace

nlohmann::json BlockedTableToJson(
        const std::vector<std::pair<std::string, BlockedIpEntry>>& blocked) {
    nlohmann::json table = nlohmann::json::array();
    for (const auto& [ip, entry] : blocked) {
        table.push_back(nlohmann::json::array({
            ip,
            {
                {"reason", entry.reason},
                {"blockedAt", ToEpochMillis(entry.blocked_at)},
                {"expiresAt", ToEpochMillis(entry.expires_at)}
            }
        }));
    }
    return table;
}

void RegisterControlRoutes(ControlApi& api, ControlContext& context) {
    ControlContext* ctx = &context;

    api.RegisterRoute("POST", "/block", [ctx](const HttpRequest& request) {
        nlohmann::json body;
        HttpReply error;
        std::string ip;
        if (!ParseBody(request, body, error) || !RequireIp(body, ip, error)) {
            return error;
        }

        std::string reason = "remote";
        auto it = body.find("reason");
        if (it != body.end()) {
            if (!it->is_string()) {
                return HttpReply::Error(400, "reason must be a string");
            }
            if (!it->get<std::string>().empty()) {
                reason = it->get<std::string>();
            }
        }

        auto result = ctx->blocker.Block(ip, reason);
        if (result == response::IpBlocker::BlockResult::FIREWALL_ERROR) {
            return HttpReply::Error(502, "firewall update failed");
        }
        return HttpReply::Ok();
    });

    api.RegisterRoute("POST", "/unblock", [ctx](const HttpRequest& request) {
        nlohmann::json body;
        HttpReply error;
        std::string ip;
        if (!ParseBody(request, body, error) || !RequireIp(body, ip, error)) {
            return error;
        }

        ctx->blocker.Unblock(ip);
        return HttpReply::Ok();
    });

    api.RegisterRoute("POST", "/config", [ctx](const HttpRequest& request) {
        nlohmann::json body;
        HttpReply error;
        if (!ParseBody(request, body, error)) {
            return error;
        }

        std::string message;
        AgentConfig merged;
        if (!ctx->config.Merge(body, message, &merged)) {
            return HttpReply::Error(400, message);
        }

        std::cout << "Configuration updated via control API" << std::endl;
        return HttpReply::Ok({{"newConfig", AgentConfigToJson(merged)}});
    });

    api.RegisterRoute("GET", "/state", [ctx](const HttpRequest&) {
        HttpReply reply;
        reply.body = {
            {"blocked", BlockedTableToJson(ctx->blocker.Snapshot())},
            {"settings", AgentConfigToJson(ctx->config.Get())}
        };
        if (ctx->status) {
            reply.body["status"] = ctx->status();
        }
        return reply;
    });

    api.RegisterRoute("POST", "/tail", [ctx](const HttpRequest& request) {
        nlohmann::json body;
        HttpReply error;
        if (!ParseBody(request, body, error)) {
            return error;
        }

        size_t limit = 0;
        auto it = body.find("lines");
        if (it != body.end()) {
            if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
                return HttpReply::Error(400, "lines must be a positive integer");
            }
            limit = static_cast<size_t>(it->get<int64_t>());
        }

        nlohmann::json events = nlohmann::json::array();
        for (const auto& event : ctx->events.Latest(limit)) {
            events.push_back(RecentEvents::ToJson(event));
        }
        return HttpReply::Ok({{"events", events}});
    });

    api.RegisterRoute("POST", "/restart", [ctx](const HttpRequest&) {
        HttpReply reply = HttpReply::Ok();
        reply.after_send = ctx->restart;
        return reply;
    });

    api.RegisterRoute("POST", "/kill", [ctx](const HttpRequest&) {
        std::cout << "Termination requested via control API" << std::endl;
        HttpReply reply = HttpReply::Ok();
        reply.after_send = ctx->terminate;
        return reply;
    });

    api.RegisterRoute("GET", "/ping", [](const HttpRequest&) {
        return HttpReply::Ok();
    });

    api.RegisterRoute("GET", "/geo", [ctx](const HttpRequest& request) {
        auto it = request.query.find("ip");
        bool is_v6 = false;
        if (it == request.query.end() ||
            !response::FirewallManager::ParseAddress(it->second, is_v6)) {
            return HttpReply::Error(400, "invalid ip address");
        }

        GeoInfo info;
        info.ip = it->second;
        if (ctx->geo) {
            info = ctx->geo->Lookup(it->second);
        }

        HttpReply reply;
        reply.body = {{"ip", info.ip}};
        if (info.asn != 0) reply.body["asn"] = info.asn;
        if (!info.org.empty()) reply.body["org"] = info.org;
        if (!info.country.empty()) reply.body["country"] = info.country;
        return reply;
    });
}

} // namespace daemon
} // namespace logwarden
