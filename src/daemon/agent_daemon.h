// src/daemon/agent_daemon.h
#ifndef LOGWARDEN_AGENT_DAEMON_H
#define LOGWARDEN_AGENT_DAEMON_H

#include "scheduler.h"
#include "heartbeat.h"
#include "control_api.h"
#include "control_routes.h"
#include "../common/agent_config.h"
#include "../common/event_queue.h"
#include "../common/recent_events.h"
#include "../common/geo_resolver.h"
#include "../common/http_client.h"
#include "../monitoring/log_tailer.h"
#include "../monitoring/detection_engine.h"
#include "../response/firewall_manager.h"
#include "../response/ip_blocker.h"
#include "../update/updater.h"
#include <memory>
#include <atomic>
#include <thread>
#include <string>
#include <mutex>

namespace logwarden {
namespace daemon {

    /**
        * Main LogWarden agent daemon
        * Wires tailer -> parser -> detection -> blocker and owns the
        * scheduler and the local control API
        */
    class AgentDaemon {
    public:
        AgentDaemon();
        ~AgentDaemon();

        /**
            * Initialize daemon
            * - Load configuration
            * - Set up the firewall and geo databases
            * - Bind the control API
            * No threads are started here, so the process may fork afterwards.
            */
        bool Initialize(const std::string& config_path = "/etc/logwarden/logwarden.conf");

        /**
            * Start all threads and block until a stop is requested
            */
        void Run();

        /**
            * Ask Run() to return. Async-signal-safe.
            */
        void RequestStop() { running_ = false; }

        /**
            * Stop every thread and release resources
            */
        void Stop();

        bool IsRunning() const { return running_.load(); }

        /**
            * Reload geo databases and restart the tailer with the current paths
            */
        void Restart();

    private:
        std::unique_ptr<ConfigStore> config_;

        // Pipeline
        std::unique_ptr<monitoring::LogTailer> tailer_;
        std::unique_ptr<monitoring::DetectionEngine> detector_;
        EventQueue<BlockDecision> decisions_;
        std::unique_ptr<RecentEvents> recent_events_;

        // Response
        std::unique_ptr<response::FirewallManager> firewall_;
        std::unique_ptr<response::IpBlocker> blocker_;

        // Periodic work
        common::CurlHttpClient http_;
        common::GeoResolver geo_;
        std::unique_ptr<update::Updater> updater_;
        std::unique_ptr<Heartbeat> heartbeat_;
        Scheduler scheduler_;

        // Control surface
        ControlApi control_api_;
        std::unique_ptr<ControlContext> control_context_;

        std::mutex restart_mutex_;
        std::mutex block_log_mutex_;

        // Control
        std::atomic<bool> running_;
        std::atomic<bool> initialized_;
        std::atomic<bool> stopped_;
        std::thread decision_thread_;

        std::atomic<uint64_t> lines_received_{0};
        std::atomic<uint64_t> events_parsed_{0};
        std::atomic<LogDialect> tail_format_{LogDialect::APACHE_CLF};
        std::atomic<int64_t> last_update_check_{0};

        // Initialization
        bool LoadConfiguration(const std::string& config_path);
        void RegisterTasks();
        void ApplyConfig(const AgentConfig& config);

        // Pipeline stages
        void HandleLine(const std::string& source, const std::string& line);
        void ProcessDecisions();

        // Scheduled tasks
        void CheckForUpdate();
        void RefreshGeo();
        void ReportStatus();
        nlohmann::json StatusJson();

        void LogBlockAction(const std::string& action, const std::string& ip,
                            const BlockedIpEntry& entry);
        static update::Updater::Options UpdaterOptions(const AgentConfig& config);
        static std::vector<std::string> ResolveLogPaths(const AgentConfig& config);
        static void NotifySystemd(const char* message);
    };

} // namespace daemon
} // namespace logwarden

#endif // LOGWARDEN_AGENT_DAEMON_H
