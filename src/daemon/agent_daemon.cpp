// src/daemon/agent_daemon.cpp
#include "agent_daemon.h"
#include "../monitoring/log_parser.h"
#include "../common/capabilities_manager.h"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <signal.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <cstring>
#include <ctime>

namespace fs = std::filesystem;

namespace logwarden {
namespace daemon {

AgentDaemon::AgentDaemon()
    : running_(false),
      initialized_(false),
      stopped_(false) {
}

AgentDaemon::~AgentDaemon() {
    Stop();
}

bool AgentDaemon::Initialize(const std::string& config_path) {
    if (initialized_.exchange(true)) {
        std::cerr << "Daemon already initialized" << std::endl;
        return false;
    }

    std::cout << "Initializing LogWarden agent..." << std::endl;

    if (!LoadConfiguration(config_path)) {
        std::cerr << "Failed to load configuration" << std::endl;
        initialized_ = false;
        return false;
    }

    AgentConfig config = config_->Get();

    std::error_code ec;
    fs::create_directories(config.log_dir, ec);
    if (ec) {
        std::cerr << "Warning: Cannot create log directory " << config.log_dir
                  << ": " << ec.message() << std::endl;
    }

    common::CapabilitiesManager caps;
    if (!caps.HasRequiredCapabilities()) {
        std::cerr << "Warning: Running without full capabilities, blocking may fail" << std::endl;
    }

    // Firewall: an initialization failure leaves the agent running,
    // every block attempt then reports an error and is retried later
    response::FirewallManager::Options fw_options;
    fw_options.backend = config.firewall_backend;
    fw_options.table = config.nft_table;
    fw_options.chain = config.nft_chain;
    fw_options.set = config.nft_set;
    fw_options.port = config.monitored_port;

    firewall_ = std::make_unique<response::FirewallManager>(fw_options);
    if (!firewall_->Initialize()) {
        std::cerr << "⚠️  Firewall unavailable, blocks will fail until it is fixed" << std::endl;
    } else {
        std::cout << "✓ Firewall ready (" << firewall_->GetFirewallTypeName() << ")" << std::endl;
    }

    blocker_ = std::make_unique<response::IpBlocker>(
        *firewall_, std::chrono::minutes(config.block_minutes));
    blocker_->SetActionListener([this](const std::string& action, const std::string& ip,
                                       const BlockedIpEntry& entry) {
        LogBlockAction(action, ip, entry);
    });
    std::cout << "✓ IP blocker initialized" << std::endl;

    // Detection
    monitoring::DetectionEngine::Thresholds thresholds;
    thresholds.rate_threshold = config.rate_threshold;
    thresholds.rate_window = std::chrono::seconds(config.rate_window_seconds);
    thresholds.scan_threshold = config.scan_threshold;

    detector_ = std::make_unique<monitoring::DetectionEngine>(
        [this](const BlockDecision& decision) {
            if (!decisions_.Push(decision)) {
                std::cerr << "⚠️  Decision queue full, dropped block of " << decision.ip << std::endl;
            }
        },
        thresholds);
    std::cout << "✓ Detection engine initialized" << std::endl;

    recent_events_ = std::make_unique<RecentEvents>(config.recent_event_capacity);
    tail_format_ = config.tail_format;

    tailer_ = std::make_unique<monitoring::LogTailer>(
        ResolveLogPaths(config),
        [this](const std::string& source, const std::string& line) {
            HandleLine(source, line);
        },
        config.poll_interval_ms);

    // Geo databases are optional
    if (!geo_.Load(config.geo_asn_path, config.geo_country_path)) {
        std::cerr << "Warning: No geo databases loaded, lookups return the address only" << std::endl;
    }

    updater_ = std::make_unique<update::Updater>(http_, UpdaterOptions(config));
    heartbeat_ = std::make_unique<Heartbeat>(http_, *blocker_);

    // Control API, a bind failure is fatal
    if (config.control_token.empty()) {
        std::cerr << "Warning: No control token configured, every control request will be rejected" << std::endl;
    }
    control_api_.SetToken(config.control_token);
    if (!control_api_.Initialize(config.control_address, config.control_port)) {
        initialized_ = false;
        return false;
    }

    control_context_.reset(new ControlContext{*config_, *blocker_, *recent_events_, &geo_});
    control_context_->restart = [this]() { Restart(); };
    control_context_->terminate = []() { kill(getpid(), SIGTERM); };
    control_context_->status = [this]() { return StatusJson(); };
    RegisterControlRoutes(control_api_, *control_context_);

    RegisterTasks();

    config_->OnChange([this](const AgentConfig& updated) { ApplyConfig(updated); });

    std::cout << "✓ LogWarden agent initialized successfully" << std::endl;
    return true;
}

bool AgentDaemon::LoadConfiguration(const std::string& config_path) {
    AgentConfig config;
    if (!LoadAgentConfig(config_path, config)) {
        return false;
    }

    config_ = std::make_unique<ConfigStore>(config);

    std::cout << "✓ Configuration loaded (instance " << config.instance_id
              << ", " << config.log_paths.size() << " log files)" << std::endl;
    return true;
}

void AgentDaemon::RegisterTasks() {
    AgentConfig config = config_->Get();

    scheduler_.AddTask("heartbeat", std::chrono::seconds(config.heartbeat_interval_seconds),
                       [this]() { heartbeat_->Send(config_->Get()); });

    scheduler_.AddTask("update-check", std::chrono::seconds(config.update_check_interval_seconds),
                       [this]() { CheckForUpdate(); });

    scheduler_.AddTask("geo-refresh", std::chrono::seconds(config.geo_refresh_interval_seconds),
                       [this]() { RefreshGeo(); });

    scheduler_.AddTask("sweep", std::chrono::seconds(config.sweep_interval_seconds),
                       [this]() { blocker_->Sweep(); });

    scheduler_.AddTask("status", std::chrono::seconds(60),
                       [this]() { ReportStatus(); });
}

void AgentDaemon::ApplyConfig(const AgentConfig& config) {
    monitoring::DetectionEngine::Thresholds thresholds;
    thresholds.rate_threshold = config.rate_threshold;
    thresholds.rate_window = std::chrono::seconds(config.rate_window_seconds);
    thresholds.scan_threshold = config.scan_threshold;
    detector_->UpdateThresholds(thresholds);

    blocker_->SetBlockDuration(std::chrono::minutes(config.block_minutes));
    tail_format_ = config.tail_format;
    updater_->SetOptions(UpdaterOptions(config));
    scheduler_.SetInterval("heartbeat", std::chrono::seconds(config.heartbeat_interval_seconds));

    if (config.detailed_logging) {
        std::cout << "Applied configuration: " << AgentConfigToJson(config).dump() << std::endl;
    }
}

void AgentDaemon::Run() {
    if (!initialized_) {
        std::cerr << "Daemon not initialized" << std::endl;
        return;
    }

    if (running_.exchange(true)) {
        std::cerr << "Daemon already running" << std::endl;
        return;
    }

    std::cout << "Starting LogWarden..." << std::endl;

    decision_thread_ = std::thread(&AgentDaemon::ProcessDecisions, this);
    std::cout << "✓ Decision consumer active" << std::endl;

    if (!tailer_->Start()) {
        std::cerr << "⚠️  Log tailer failed to start" << std::endl;
    }

    scheduler_.Start();

    if (!control_api_.Start()) {
        std::cerr << "⚠️  Control API failed to start" << std::endl;
    }

    std::cout << "✓ LogWarden is now watching "
              << tailer_->GetPaths().size() << " access logs" << std::endl;

    NotifySystemd("READY=1\nSTATUS=Watching access logs\n");

    // Main loop - just wait for shutdown
    while (running_) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        NotifySystemd("WATCHDOG=1\n");
    }

    std::cout << "Stopping LogWarden..." << std::endl;
    Stop();
}

void AgentDaemon::Stop() {
    if (stopped_.exchange(true)) {
        return;  // Already stopped
    }
    running_ = false;

    control_api_.Stop();
    scheduler_.Stop();
    if (tailer_) {
        tailer_->Stop();
    }

    decisions_.Stop();
    if (decision_thread_.joinable()) {
        decision_thread_.join();
    }

    // Firewall rules are left in place; they are flushed on the next start
    std::cout << "✓ LogWarden stopped" << std::endl;
}

void AgentDaemon::Restart() {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    std::cout << "Restarting subsystems..." << std::endl;

    AgentConfig config = config_->Get();

    if (!geo_.Load(config.geo_asn_path, config.geo_country_path)) {
        std::cerr << "Warning: Geo databases not available after reload" << std::endl;
    }

    tailer_->Stop();
    tailer_->SetPaths(ResolveLogPaths(config));
    if (!tailer_->Start()) {
        std::cerr << "⚠️  Log tailer failed to restart" << std::endl;
    }

    std::cout << "✓ Subsystems restarted" << std::endl;
}

void AgentDaemon::HandleLine(const std::string& source, const std::string& line) {
    lines_received_++;

    RequestEvent event;
    if (!monitoring::LogParser::ParseLine(line, event, std::chrono::system_clock::now(),
                                          tail_format_.load())) {
        return;
    }
    event.source = source;
    events_parsed_++;

    recent_events_->Add(event);
    detector_->ProcessEvent(event);
}

void AgentDaemon::ProcessDecisions() {
    std::cout << "Decision consumer thread started" << std::endl;

    // Drain what is queued even after a stop was requested
    BlockDecision decision;
    while (running_ || !decisions_.Empty()) {
        if (!decisions_.Pop(decision, 200)) {
            continue;
        }

        try {
            auto result = blocker_->Block(decision.ip, decision.reason);
            if (result == response::IpBlocker::BlockResult::FIREWALL_ERROR) {
                std::cerr << "Block of " << decision.ip
                          << " failed, will retry on the next offending request" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Block of " << decision.ip << " failed: " << e.what() << std::endl;
        }
    }

    std::cout << "Decision consumer thread stopped" << std::endl;
}

void AgentDaemon::CheckForUpdate() {
    AgentConfig config = config_->Get();
    if (!config.auto_update) {
        return;
    }

    last_update_check_ = ToEpochMillis(std::chrono::system_clock::now());
    auto status = updater_->CheckAndInstall();

    if (status != update::Updater::UpdateStatus::UP_TO_DATE || config.detailed_logging) {
        std::cout << "Update check: " << update::Updater::StatusName(status) << std::endl;
    }
}

void AgentDaemon::RefreshGeo() {
    AgentConfig config = config_->Get();
    if (config.geo_asn_url.empty() && config.geo_country_url.empty()) {
        return;
    }

    if (geo_.Refresh(http_, config.geo_asn_url, config.geo_country_url)) {
        std::cout << "✓ Geo databases refreshed" << std::endl;
    }
}

void AgentDaemon::ReportStatus() {
    std::cout << "\n📊 [Status] Lines: " << lines_received_.load()
              << "  Events: " << events_parsed_.load()
              << "  Decisions: " << detector_->DecisionsEmitted()
              << "  Active blocks: " << blocker_->ActiveCount()
              << "  Queued: " << decisions_.Size()
              << std::endl;
}

nlohmann::json AgentDaemon::StatusJson() {
    return {
        {"linesReceived", lines_received_.load()},
        {"eventsParsed", events_parsed_.load()},
        {"decisions", detector_->DecisionsEmitted()},
        {"totalBlocks", blocker_->TotalBlocks()},
        {"queuedDecisions", decisions_.Size()},
        {"trackedIps", detector_->TrackedIpCount()},
        {"lastHeartbeat", heartbeat_->LastSuccess()},
        {"lastUpdateCheck", last_update_check_.load()},
        {"installedVersion", updater_->InstalledVersion()}
    };
}

void AgentDaemon::LogBlockAction(const std::string& action, const std::string& ip,
                                 const BlockedIpEntry& entry) {
    AgentConfig config = config_->Get();
    GeoInfo geo = geo_.Lookup(ip);

    std::lock_guard<std::mutex> lock(block_log_mutex_);

    std::string log_file = config.log_dir + "/blocks.log";
    std::ofstream log(log_file, std::ios::app);
    if (!log) {
        std::cerr << "Cannot write " << log_file << std::endl;
        return;
    }

    std::time_t now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::time_t expires_c = std::chrono::system_clock::to_time_t(entry.expires_at);
    char time_buf[100];
    char expires_buf[100];
    struct tm tm_buf;
    strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", localtime_r(&now_c, &tm_buf));
    strftime(expires_buf, sizeof(expires_buf), "%Y-%m-%d %H:%M:%S", localtime_r(&expires_c, &tm_buf));

    log << "[" << time_buf << "] ";
    log << "Action=" << action << " ";
    log << "IP=" << ip << " ";
    log << "Reason=" << entry.reason << " ";
    log << "Expires=" << expires_buf;
    if (geo.asn != 0) {
        log << " ASN=AS" << geo.asn;
    }
    if (!geo.org.empty()) {
        log << " Org=\"" << geo.org << "\"";
    }
    if (!geo.country.empty()) {
        log << " Country=" << geo.country;
    }
    log << std::endl;
}

update::Updater::Options AgentDaemon::UpdaterOptions(const AgentConfig& config) {
    update::Updater::Options options;
    options.current_version = config.version;
    options.update_url = config.auto_update_url;
    options.binary_path = config.binary_path;
    options.public_key_path = config.public_key_path;
    options.service_name = config.service_name;
    return options;
}

std::vector<std::string> AgentDaemon::ResolveLogPaths(const AgentConfig& config) {
    if (!config.log_paths.empty()) {
        return config.log_paths;
    }
    return DiscoverAccessLogs();
}

void AgentDaemon::NotifySystemd(const char* message) {
    const char* notify_socket = getenv("NOTIFY_SOCKET");
    if (!notify_socket) {
        return;
    }

    int fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, notify_socket, sizeof(addr.sun_path) - 1);

    // Abstract namespace socket
    if (addr.sun_path[0] == '@') {
        addr.sun_path[0] = '\0';
    }

    if (sendto(fd, message, strlen(message), 0, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "sd_notify failed: " << strerror(errno) << std::endl;
    }
    close(fd);
}

} // namespace daemon
} // namespace logwarden
