// src/common/agent_config.h
#ifndef LOGWARDEN_AGENT_CONFIG_H
#define LOGWARDEN_AGENT_CONFIG_H

#include <logwarden/types.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <functional>

namespace logwarden {

/**
 * Process-wide agent configuration
 * Loaded once at start from an INI-style file, shallow-merged at runtime
 * through the control API. Runtime merges are never written back to disk.
 */
struct AgentConfig {
    // Agent identity / controller
    std::string version = "1.0.0";
    std::string dashboard_url = "https://controller.logwarden.local";
    std::string instance_id;
    int heartbeat_interval_seconds = 10;

    // Log tailing
    std::vector<std::string> log_paths;   // Empty = autodiscover
    LogDialect tail_format = LogDialect::APACHE_CLF;
    int poll_interval_ms = 2000;
    size_t recent_event_capacity = 1000;

    // Detection thresholds
    int rate_threshold = 80;              // Requests per window before blocking
    int rate_window_seconds = 10;
    int scan_threshold = 20;              // 404 responses before blocking

    // Response
    int block_minutes = 30;
    int sweep_interval_seconds = 30;

    // Firewall
    std::string firewall_backend = "auto";   // auto | nftables | iptables
    std::string nft_table = "logwarden";
    std::string nft_chain = "input";
    std::string nft_set = "blocklist";
    int monitored_port = 80;

    // Self update
    bool auto_update = true;
    std::string auto_update_url = "https://controller.logwarden.local/download/agent";
    int update_check_interval_seconds = 600;
    std::string binary_path = "/usr/local/bin/logwardend";
    std::string public_key_path = "/etc/logwarden/pubkey.pem";
    std::string service_name = "logwarden";

    // Geo databases
    std::string geo_asn_path = "/var/lib/logwarden/geo/GeoLite2-ASN.mmdb";
    std::string geo_country_path = "/var/lib/logwarden/geo/GeoLite2-Country.mmdb";
    std::string geo_asn_url;
    std::string geo_country_url;
    int geo_refresh_interval_seconds = 86400;

    // Local control API
    std::string control_address = "127.0.0.1";
    int control_port = 9876;
    std::string control_token;

    // Logging
    std::string log_dir = "/var/log/logwarden";
    bool detailed_logging = false;
};

/**
 * Load configuration from file on top of the defaults.
 * A missing file is not an error (defaults are used).
 */
bool LoadAgentConfig(const std::string& config_path, AgentConfig& config);

/**
 * Public view of the configuration (the control token is never included)
 */
nlohmann::json AgentConfigToJson(const AgentConfig& config);

/**
 * Shallow-merge a partial camelCase JSON object into config.
 * The whole patch is validated before any field is applied.
 */
bool MergeAgentConfig(AgentConfig& config, const nlohmann::json& patch, std::string& error);

std::string DialectName(LogDialect dialect);
bool ParseDialect(const std::string& name, LogDialect& dialect);

/**
 * Conventional access log locations used when no paths are configured
 */
std::vector<std::string> DiscoverAccessLogs();

/**
 * Thread-safe owner of the live configuration
 */
class ConfigStore {
public:
    using Listener = std::function<void(const AgentConfig&)>;

    explicit ConfigStore(const AgentConfig& initial);

    AgentConfig Get() const;

    /**
     * Merge a patch; listeners are notified with the new config on success
     */
    bool Merge(const nlohmann::json& patch, std::string& error, AgentConfig* merged = nullptr);

    void OnChange(Listener listener);

private:
    mutable std::mutex mutex_;
    AgentConfig config_;
    std::vector<Listener> listeners_;
};

} // namespace logwarden

#endif // LOGWARDEN_AGENT_CONFIG_H
