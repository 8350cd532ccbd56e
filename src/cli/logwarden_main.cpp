// src/cli/logwarden_main.cpp
// LogWarden operator CLI
// Talks to the local control API of a running agent

#include "../common/agent_config.h"
#include "../common/http_client.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace logwarden;
using namespace logwarden::common;
using json = nlohmann::json;

struct ControlTarget {
    std::string base_url;
    std::string token;
};

void ShowHelp(const char* prog);
int SendRequest(const ControlTarget& target, const std::string& method,
                const std::string& path, const json& body);
bool ParseSetting(const std::string& arg, json& patch);

int main(int argc, char** argv) {
    std::string config_path = "/etc/logwarden/logwarden.conf";

    int first = 1;
    while (first < argc) {
        std::string arg = argv[first];
        if (arg == "-c" && first + 1 < argc) {
            config_path = argv[first + 1];
            first += 2;
        } else {
            break;
        }
    }

    if (first >= argc) {
        ShowHelp(argv[0]);
        return 1;
    }

    std::string command = argv[first];
    std::vector<std::string> args(argv + first + 1, argv + argc);

    if (command == "help" || command == "--help" || command == "-h") {
        ShowHelp(argv[0]);
        return 0;
    }
    else if (command == "version" || command == "--version" || command == "-v") {
        std::cout << "logwarden v" << AgentConfig().version << std::endl;
        return 0;
    }

    AgentConfig config;
    if (!LoadAgentConfig(config_path, config)) {
        std::cerr << "Failed to load configuration: " << config_path << std::endl;
        return 1;
    }

    ControlTarget target;
    std::string host = config.control_address;
    if (host.find(':') != std::string::npos) {
        host = "[" + host + "]";
    }
    target.base_url = "http://" + host + ":" + std::to_string(config.control_port);
    target.token = config.control_token;

    if (target.token.empty()) {
        std::cerr << "No control token configured (set [control] token or LOGWARDEN_TOKEN)" << std::endl;
        return 1;
    }

    if (!CurlHttpClient::GlobalInit()) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return 1;
    }

    int rc = 1;

    if (command == "ping") {
        rc = SendRequest(target, "GET", "/ping", json());
    }
    else if (command == "state" || command == "status") {
        rc = SendRequest(target, "GET", "/state", json());
    }
    else if (command == "block") {
        if (args.empty()) {
            std::cerr << "Usage: " << argv[0] << " block <ip> [reason]" << std::endl;
        } else {
            json body = {{"ip", args[0]}};
            if (args.size() > 1) {
                body["reason"] = args[1];
            }
            rc = SendRequest(target, "POST", "/block", body);
        }
    }
    else if (command == "unblock") {
        if (args.empty()) {
            std::cerr << "Usage: " << argv[0] << " unblock <ip>" << std::endl;
        } else {
            rc = SendRequest(target, "POST", "/unblock", {{"ip", args[0]}});
        }
    }
    else if (command == "tail") {
        int lines = 50;
        if (!args.empty()) {
            try {
                lines = std::stoi(args[0]);
            } catch (const std::exception&) {
                std::cerr << "Invalid line count: " << args[0] << std::endl;
                lines = 0;
            }
        }
        if (lines > 0) {
            rc = SendRequest(target, "POST", "/tail", {{"lines", lines}});
        }
    }
    else if (command == "restart") {
        rc = SendRequest(target, "POST", "/restart", json::object());
    }
    else if (command == "kill") {
        rc = SendRequest(target, "POST", "/kill", json::object());
    }
    else if (command == "config") {
        json patch = json::object();
        bool valid = !args.empty();
        for (const auto& arg : args) {
            if (!ParseSetting(arg, patch)) {
                std::cerr << "Invalid setting (expected key=value): " << arg << std::endl;
                valid = false;
            }
        }
        if (!valid) {
            std::cerr << "Usage: " << argv[0] << " config key=value [key=value...]" << std::endl;
        } else {
            rc = SendRequest(target, "POST", "/config", patch);
        }
    }
    else {
        std::cerr << "Unknown command: " << command << std::endl;
        std::cerr << "Run '" << argv[0] << " help' for usage information" << std::endl;
    }

    CurlHttpClient::GlobalCleanup();
    return rc;
}

void ShowHelp(const char* prog) {
    std::cout << R"(
╔════════════════════════════════════════════════════════════╗
║                      LogWarden CLI                         ║
║            Control a running logwardend agent              ║
╚════════════════════════════════════════════════════════════╝

Usage: )" << prog << R"( [-c <config>] <command> [args]

AGENT COMMANDS:
  ping                          Check the agent is alive
  state                         Show blocked IPs and settings
  block <ip> [reason]           Block an address now
  unblock <ip>                  Remove a block
  tail [n]                      Show the last n request events (default 50)
  config key=value [...]        Change settings at runtime
  restart                       Reload geo databases and restart log tailing
  kill                          Stop the agent

OTHER COMMANDS:
  help                          Show this help message
  version                       Show version information

Examples:
  sudo )" << prog << R"( block 203.0.113.7 manual
  sudo )" << prog << R"( config rateThreshold=120 blockMinutes=60
  sudo )" << prog << R"( config logPaths=/var/log/nginx/access.log,/var/log/nginx/api.log
)";
}

int SendRequest(const ControlTarget& target, const std::string& method,
                const std::string& path, const json& body) {
    CurlHttpClient http(10);
    std::vector<std::string> headers = {
        "x-agent-token: " + target.token,
        "Content-Type: application/json"
    };

    HttpResponse response;
    if (method == "GET") {
        response = http.Get(target.base_url + path, headers);
    } else {
        response = http.Post(target.base_url + path, body.dump(), headers);
    }

    if (!response.error.empty()) {
        std::cerr << "✗ Cannot reach agent at " << target.base_url << ": " << response.error << std::endl;
        return 1;
    }

    json reply = json::parse(response.body, nullptr, false);
    if (reply.is_discarded()) {
        std::cerr << "✗ Unexpected reply (HTTP " << response.status << ")" << std::endl;
        std::cerr << response.body << std::endl;
        return 1;
    }

    if (!response.ok()) {
        std::cerr << "✗ HTTP " << response.status;
        if (reply.contains("error") && reply["error"].is_string()) {
            std::cerr << ": " << reply["error"].get<std::string>();
        }
        std::cerr << std::endl;
        return 1;
    }

    std::cout << reply.dump(2) << std::endl;
    return 0;
}

bool ParseSetting(const std::string& arg, json& patch) {
    size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }

    std::string key = arg.substr(0, eq);
    std::string value = arg.substr(eq + 1);

    if (key == "logPaths") {
        json paths = json::array();
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) {
                paths.push_back(item);
            }
        }
        patch[key] = paths;
        return true;
    }

    // Numbers and booleans keep their JSON type, anything else is a string
    json parsed = json::parse(value, nullptr, false);
    if (!parsed.is_discarded() && (parsed.is_number() || parsed.is_boolean())) {
        patch[key] = parsed;
    } else {
        patch[key] = value;
    }
    return true;
}
