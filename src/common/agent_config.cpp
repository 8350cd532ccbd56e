// src/common/agent_config.cpp
#include "agent_config.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cstdlib>
#include <glob.h>
#include <unistd.h>
#include <limits.h>

namespace logwarden {

namespace {

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

int ParsePositive(const std::string& key, const std::string& value) {
    int parsed = std::stoi(value);
    if (parsed <= 0) {
        throw std::invalid_argument(key + " must be positive");
    }
    return parsed;
}

std::string DetectInstanceId() {
    char host[HOST_NAME_MAX + 1] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return "unknown";
    }
    return host;
}

} // namespace

std::string DialectName(LogDialect dialect) {
    switch (dialect) {
        case LogDialect::APACHE_CLF: return "apache-clf";
        case LogDialect::NGINX: return "nginx";
        case LogDialect::NGINX_JSON: return "nginx-json";
    }
    return "apache-clf";
}

bool ParseDialect(const std::string& name, LogDialect& dialect) {
    if (name == "apache-clf") dialect = LogDialect::APACHE_CLF;
    else if (name == "nginx") dialect = LogDialect::NGINX;
    else if (name == "nginx-json") dialect = LogDialect::NGINX_JSON;
    else return false;
    return true;
}

bool LoadAgentConfig(const std::string& config_path, AgentConfig& config) {
    std::cout << "Loading configuration from: " << config_path << std::endl;

    std::ifstream config_file(config_path);
    if (!config_file) {
        std::cout << "Warning: Config file not found, using defaults" << std::endl;
    } else {
        std::string line, current_section;
        int line_no = 0;
        try {
            while (std::getline(config_file, line)) {
                line_no++;
                line = Trim(line);

                // Skip comments and empty lines
                if (line.empty() || line[0] == '#' || line[0] == ';') continue;

                // Section headers
                if (line[0] == '[' && line[line.length()-1] == ']') {
                    current_section = line.substr(1, line.length()-2);
                    continue;
                }

                size_t eq_pos = line.find('=');
                if (eq_pos == std::string::npos) continue;

                std::string key = Trim(line.substr(0, eq_pos));
                std::string value = Trim(line.substr(eq_pos + 1));

                if (current_section == "agent") {
                    if (key == "version") config.version = value;
                    else if (key == "dashboard_url") config.dashboard_url = value;
                    else if (key == "instance_id") config.instance_id = value;
                    else if (key == "heartbeat_interval") config.heartbeat_interval_seconds = ParsePositive(key, value);
                }
                else if (current_section == "logs") {
                    if (key == "paths") config.log_paths = SplitList(value);
                    else if (key == "format") {
                        if (!ParseDialect(value, config.tail_format)) {
                            throw std::invalid_argument("unknown log format '" + value + "'");
                        }
                    }
                    else if (key == "poll_interval_ms") config.poll_interval_ms = ParsePositive(key, value);
                    else if (key == "recent_events") config.recent_event_capacity = ParsePositive(key, value);
                }
                else if (current_section == "detection") {
                    if (key == "rate_threshold") config.rate_threshold = ParsePositive(key, value);
                    else if (key == "rate_window_seconds") config.rate_window_seconds = ParsePositive(key, value);
                    else if (key == "scan_threshold") config.scan_threshold = ParsePositive(key, value);
                }
                else if (current_section == "response") {
                    if (key == "block_minutes") config.block_minutes = ParsePositive(key, value);
                    else if (key == "sweep_interval") config.sweep_interval_seconds = ParsePositive(key, value);
                }
                else if (current_section == "firewall") {
                    if (key == "backend") config.firewall_backend = value;
                    else if (key == "nft_table") config.nft_table = value;
                    else if (key == "nft_chain") config.nft_chain = value;
                    else if (key == "nft_set") config.nft_set = value;
                    else if (key == "monitored_port") config.monitored_port = ParsePositive(key, value);
                }
                else if (current_section == "update") {
                    if (key == "auto_update") config.auto_update = (value == "true");
                    else if (key == "url") config.auto_update_url = value;
                    else if (key == "check_interval") config.update_check_interval_seconds = ParsePositive(key, value);
                    else if (key == "binary_path") config.binary_path = value;
                    else if (key == "public_key") config.public_key_path = value;
                    else if (key == "service_name") config.service_name = value;
                }
                else if (current_section == "geo") {
                    if (key == "asn_db") config.geo_asn_path = value;
                    else if (key == "country_db") config.geo_country_path = value;
                    else if (key == "asn_url") config.geo_asn_url = value;
                    else if (key == "country_url") config.geo_country_url = value;
                    else if (key == "refresh_interval") config.geo_refresh_interval_seconds = ParsePositive(key, value);
                }
                else if (current_section == "control") {
                    if (key == "address") config.control_address = value;
                    else if (key == "port") config.control_port = ParsePositive(key, value);
                    else if (key == "token") config.control_token = value;
                }
                else if (current_section == "logging") {
                    if (key == "log_dir") config.log_dir = value;
                    else if (key == "enable_detailed_logging") config.detailed_logging = (value == "true");
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid configuration at line " << line_no << ": " << e.what() << std::endl;
            return false;
        }
    }

    if (config.monitored_port > 65535 || config.control_port > 65535) {
        std::cerr << "Invalid configuration: port out of range" << std::endl;
        return false;
    }

    if (config.firewall_backend != "auto" && config.firewall_backend != "nftables" &&
        config.firewall_backend != "iptables") {
        std::cerr << "Invalid configuration: unknown firewall backend '"
                  << config.firewall_backend << "'" << std::endl;
        return false;
    }

    // Environment overrides the file for the shared secret
    const char* token = getenv("LOGWARDEN_TOKEN");
    if (!token || !*token) {
        token = getenv("AGENT_TOKEN");
    }
    if (token && *token) {
        config.control_token = token;
    }

    if (config.instance_id.empty()) {
        config.instance_id = DetectInstanceId();
    }

    if (config.log_paths.empty()) {
        config.log_paths = DiscoverAccessLogs();
    }

    std::cout << "✓ Configuration loaded successfully" << std::endl;

    if (config.control_token.empty()) {
        std::cout << "⚠️  WARNING: No control token configured, control API will reject all requests"
                  << std::endl;
    }

    return true;
}

std::vector<std::string> DiscoverAccessLogs() {
    static const char* patterns[] = {
        "/var/log/apache2/*access*.log",   // Debian/Ubuntu
        "/var/log/httpd/*access*",         // RHEL/CentOS
        "/var/log/nginx/*access*.log"
    };

    std::vector<std::string> found;
    for (const char* pattern : patterns) {
        glob_t results;
        if (glob(pattern, 0, nullptr, &results) == 0) {
            for (size_t i = 0; i < results.gl_pathc; i++) {
                std::string path = results.gl_pathv[i];
                if (std::find(found.begin(), found.end(), path) == found.end()) {
                    found.push_back(path);
                }
            }
        }
        globfree(&results);
    }

    if (found.empty()) {
        // Nothing on disk yet, watch the usual locations
        found = {
            "/var/log/apache2/access.log",
            "/var/log/httpd/access_log",
            "/var/log/nginx/access.log"
        };
    }

    return found;
}

nlohmann::json AgentConfigToJson(const AgentConfig& config) {
    return nlohmann::json{
        {"version", config.version},
        {"dashboardUrl", config.dashboard_url},
        {"instanceId", config.instance_id},
        {"logPaths", config.log_paths},
        {"tailFormat", DialectName(config.tail_format)},
        {"heartbeatInterval", config.heartbeat_interval_seconds},
        {"autoUpdate", config.auto_update},
        {"autoUpdateUrl", config.auto_update_url},
        {"blockMinutes", config.block_minutes},
        {"rateThreshold", config.rate_threshold},
        {"rateWindowSeconds", config.rate_window_seconds},
        {"scanThreshold", config.scan_threshold},
        {"monitoredPort", config.monitored_port},
        {"detailedLogging", config.detailed_logging}
    };
}

bool MergeAgentConfig(AgentConfig& config, const nlohmann::json& patch, std::string& error) {
    if (!patch.is_object()) {
        error = "config patch must be a JSON object";
        return false;
    }

    AgentConfig candidate = config;

    auto string_field = [&](const char* key, std::string& target) {
        auto it = patch.find(key);
        if (it == patch.end()) return true;
        if (!it->is_string()) {
            error = std::string(key) + " must be a string";
            return false;
        }
        target = it->get<std::string>();
        return true;
    };

    auto bool_field = [&](const char* key, bool& target) {
        auto it = patch.find(key);
        if (it == patch.end()) return true;
        if (!it->is_boolean()) {
            error = std::string(key) + " must be a boolean";
            return false;
        }
        target = it->get<bool>();
        return true;
    };

    auto int_field = [&](const char* key, int& target, int max_value) {
        auto it = patch.find(key);
        if (it == patch.end()) return true;
        if (!it->is_number_integer()) {
            error = std::string(key) + " must be an integer";
            return false;
        }
        int64_t value = it->get<int64_t>();
        if (value <= 0 || value > max_value) {
            error = std::string(key) + " out of range";
            return false;
        }
        target = static_cast<int>(value);
        return true;
    };

    if (!string_field("version", candidate.version) ||
        !string_field("dashboardUrl", candidate.dashboard_url) ||
        !string_field("instanceId", candidate.instance_id) ||
        !string_field("autoUpdateUrl", candidate.auto_update_url) ||
        !bool_field("autoUpdate", candidate.auto_update) ||
        !bool_field("detailedLogging", candidate.detailed_logging) ||
        !int_field("heartbeatInterval", candidate.heartbeat_interval_seconds, 86400) ||
        !int_field("blockMinutes", candidate.block_minutes, 525600) ||
        !int_field("rateThreshold", candidate.rate_threshold, 1000000) ||
        !int_field("rateWindowSeconds", candidate.rate_window_seconds, 86400) ||
        !int_field("scanThreshold", candidate.scan_threshold, 1000000) ||
        !int_field("monitoredPort", candidate.monitored_port, 65535)) {
        return false;
    }

    auto paths = patch.find("logPaths");
    if (paths != patch.end()) {
        if (!paths->is_array()) {
            error = "logPaths must be an array of strings";
            return false;
        }
        std::vector<std::string> values;
        for (const auto& p : *paths) {
            if (!p.is_string()) {
                error = "logPaths must be an array of strings";
                return false;
            }
            values.push_back(p.get<std::string>());
        }
        candidate.log_paths = values;
    }

    auto format = patch.find("tailFormat");
    if (format != patch.end()) {
        if (!format->is_string() || !ParseDialect(format->get<std::string>(), candidate.tail_format)) {
            error = "tailFormat must be one of apache-clf, nginx, nginx-json";
            return false;
        }
    }

    config = candidate;
    return true;
}

ConfigStore::ConfigStore(const AgentConfig& initial)
    : config_(initial) {
}

AgentConfig ConfigStore::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool ConfigStore::Merge(const nlohmann::json& patch, std::string& error, AgentConfig* merged) {
    AgentConfig snapshot;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!MergeAgentConfig(config_, patch, error)) {
            return false;
        }
        snapshot = config_;
        listeners = listeners_;
    }

    if (merged) {
        *merged = snapshot;
    }

    for (const auto& listener : listeners) {
        listener(snapshot);
    }
    return true;
}

void ConfigStore::OnChange(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

} // namespace logwarden
