// src/cli/daemon_main.cpp
// LogWarden Agent Entry Point

#include "../daemon/agent_daemon.h"
#include "../common/agent_config.h"
#include "../common/capabilities_manager.h"
#include "../common/http_client.h"
#include <iostream>
#include <cstdio>
#include <signal.h>
#include <unistd.h>

using namespace logwarden;
using namespace logwarden::daemon;

// Global daemon instance for signal handling
static AgentDaemon* g_daemon = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_daemon) {
            g_daemon->RequestStop();
        }
    }
}

void show_usage(const char* prog) {
    std::cout << "LogWarden Web-Log Security Agent (logwardend)\n" << std::endl;
    std::cout << "Usage: " << prog << " [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c <config>         Configuration file (default: /etc/logwarden/logwarden.conf)" << std::endl;
    std::cout << "  -f, --foreground    Run in foreground (don't daemonize)" << std::endl;
    std::cout << "      --caps          Show capability status and exit" << std::endl;
    std::cout << "  -h, --help          Show this help" << std::endl;
    std::cout << "  -v, --version       Show version" << std::endl;
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    std::string config_path = "/etc/logwarden/logwarden.conf";
    bool foreground = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            show_usage(argv[0]);
            return 0;
        }
        else if (arg == "-v" || arg == "--version") {
            std::cout << "logwardend v" << AgentConfig().version << std::endl;
            return 0;
        }
        else if (arg == "--caps") {
            common::CapabilitiesManager caps;
            caps.PrintCapabilityStatus();
            return caps.HasRequiredCapabilities() ? 0 : 1;
        }
        else if (arg == "-c" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "-f" || arg == "--foreground") {
            foreground = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            show_usage(argv[0]);
            return 1;
        }
    }

    // Firewall changes need root or CAP_NET_ADMIN
    if (getuid() != 0) {
        common::CapabilitiesManager caps;
        if (!caps.HasCapability("CAP_NET_ADMIN")) {
            std::cerr << "Error: logwardend must be run as root or with CAP_NET_ADMIN" << std::endl;
            std::cerr << "Run: sudo " << argv[0] << std::endl;
            return 1;
        }
    }

    std::cout << "╔════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║              LogWarden - Web-Log Security Agent            ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    if (!common::CurlHttpClient::GlobalInit()) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return 1;
    }

    {
        // Create daemon instance
        AgentDaemon daemon;
        g_daemon = &daemon;

        // Set up signal handlers
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        signal(SIGPIPE, SIG_IGN);

        // Initialize
        if (!daemon.Initialize(config_path)) {
            std::cerr << "Failed to initialize daemon" << std::endl;
            g_daemon = nullptr;
            common::CurlHttpClient::GlobalCleanup();
            return 1;
        }

        // Daemonize if not in foreground mode
        if (!foreground) {
            AgentConfig config;
            if (!LoadAgentConfig(config_path, config)) {
                std::cerr << "Failed to re-read configuration" << std::endl;
                return 1;
            }
            std::string log_file = config.log_dir + "/agent.log";

            std::cout << "Daemonizing..." << std::endl;

            pid_t pid = fork();
            if (pid < 0) {
                std::cerr << "Fork failed" << std::endl;
                return 1;
            }

            if (pid > 0) {
                // Parent process - exit
                std::cout << "Daemon started with PID " << pid << std::endl;
                std::cout << "Logs: " << log_file << std::endl;
                std::cout << "Stop with: sudo systemctl stop " << config.service_name << std::endl;
                _exit(0);
            }

            // Child process continues
            setsid();  // Create new session

            // Redirect stdout/stderr to log file
            if (!freopen(log_file.c_str(), "a", stdout) ||
                !freopen(log_file.c_str(), "a", stderr)) {
                return 1;
            }
        }

        // Run daemon
        daemon.Run();
        g_daemon = nullptr;
    }

    common::CurlHttpClient::GlobalCleanup();
    return 0;
}
