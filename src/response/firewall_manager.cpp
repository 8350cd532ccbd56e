// src/response/firewall_manager.cpp
#include "firewall_manager.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <array>
#include <memory>
#include <arpa/inet.h>
#include <sys/wait.h>

namespace logwarden {
namespace response {

namespace {

// Names end up on a shell command line
bool IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    for (char c : name) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

bool IsMissingObject(const std::string& output) {
    return output.find("No such file") != std::string::npos ||
           output.find("does not exist") != std::string::npos;
}

} // namespace

FirewallManager::FirewallManager()
    : FirewallManager(Options()) {
}

FirewallManager::FirewallManager(const Options& options)
    : options_(options), firewall_type_(FirewallType::NONE) {
}

bool FirewallManager::Initialize() {
    if (!IsSafeName(options_.table) || !IsSafeName(options_.chain) ||
        !IsSafeName(options_.set)) {
        std::cerr << "Invalid firewall table/chain/set name in configuration" << std::endl;
        return false;
    }
    if (options_.port <= 0 || options_.port > 65535) {
        std::cerr << "Invalid monitored port: " << options_.port << std::endl;
        return false;
    }

    std::cout << "Detecting firewall system..." << std::endl;

    // Try nftables first
    if (options_.backend != "iptables" && DetectNftables()) {
        firewall_type_ = FirewallType::NFTABLES;
        std::cout << "Using nftables" << std::endl;

        if (!InitializeNftables()) {
            std::cerr << "Failed to initialize nftables, trying iptables..." << std::endl;
            firewall_type_ = FirewallType::NONE;
        } else {
            return true;
        }
    }

    // Fallback to iptables
    if (options_.backend != "nftables" && DetectIptables()) {
        firewall_type_ = FirewallType::IPTABLES;
        std::cout << "Using iptables (fallback)" << std::endl;
        std::cout << "  Consider installing nftables for set-based blocking" << std::endl;
        FlushIptablesRules();
        return true;
    }

    std::cerr << "No firewall system found (nftables or iptables is required)" << std::endl;
    return false;
}

FirewallBackend::AddResult FirewallManager::AddIngressDenyRule(const std::string& ip) {
    bool is_v6 = false;
    if (!ParseAddress(ip, is_v6)) {
        std::cerr << "Refusing to block invalid address: " << ip << std::endl;
        return AddResult::ERROR;
    }

    std::lock_guard<std::mutex> lock(command_mutex_);

    switch (firewall_type_) {
        case FirewallType::NFTABLES: return AddNftablesElement(ip, is_v6);
        case FirewallType::IPTABLES: return AddIptablesRule(ip, is_v6);
        case FirewallType::NONE: break;
    }

    std::cerr << "No firewall system available, unable to block " << ip << std::endl;
    return AddResult::ERROR;
}

FirewallBackend::RemoveResult FirewallManager::RemoveIngressDenyRule(const std::string& ip) {
    bool is_v6 = false;
    if (!ParseAddress(ip, is_v6)) {
        return RemoveResult::NOT_FOUND;
    }

    std::lock_guard<std::mutex> lock(command_mutex_);

    switch (firewall_type_) {
        case FirewallType::NFTABLES: return RemoveNftablesElement(ip, is_v6);
        case FirewallType::IPTABLES: return RemoveIptablesRule(ip, is_v6);
        case FirewallType::NONE: break;
    }

    std::cerr << "No firewall system available, unable to unblock " << ip << std::endl;
    return RemoveResult::ERROR;
}

std::string FirewallManager::GetFirewallTypeName() const {
    switch (firewall_type_) {
        case FirewallType::NFTABLES: return "nftables";
        case FirewallType::IPTABLES: return "iptables";
        case FirewallType::NONE: return "none";
    }
    return "unknown";
}

bool FirewallManager::ParseAddress(const std::string& ip, bool& is_v6) {
    unsigned char buf[sizeof(struct in6_addr)];

    if (inet_pton(AF_INET, ip.c_str(), buf) == 1) {
        is_v6 = false;
        return true;
    }
    if (inet_pton(AF_INET6, ip.c_str(), buf) == 1) {
        is_v6 = true;
        return true;
    }
    return false;
}

bool FirewallManager::DetectNftables() {
    std::string output = GetCommandOutput("nft --version 2>&1");
    return (output.find("nftables") != std::string::npos);
}

bool FirewallManager::DetectIptables() {
    std::string output = GetCommandOutput("iptables --version 2>&1");
    return (output.find("iptables") != std::string::npos);
}

bool FirewallManager::InitializeNftables() {
    const std::string& table = options_.table;
    const std::string& chain = options_.chain;
    const std::string set4 = options_.set + "4";
    const std::string set6 = options_.set + "6";

    std::string check = GetCommandOutput("nft list table inet " + table + " 2>&1");
    if (IsMissingObject(check)) {
        if (!RunCommand("nft add table inet " + table)) {
            return false;
        }
        std::cout << "  Created nftables table '" << table << "'" << std::endl;
    }

    // Sets first, the drop rules reference them
    for (const auto& [set, type] : {std::make_pair(set4, std::string("ipv4_addr")),
                                    std::make_pair(set6, std::string("ipv6_addr"))}) {
        check = GetCommandOutput("nft list set inet " + table + " " + set + " 2>&1");
        if (IsMissingObject(check)) {
            if (!RunCommand("nft add set inet " + table + " " + set +
                            " { type " + type + " \\; }")) {
                return false;
            }
            std::cout << "  Created nftables set '" << set << "'" << std::endl;
        } else if (!RunCommand("nft flush set inet " + table + " " + set)) {
            std::cerr << "  Could not flush stale entries from set '" << set << "'" << std::endl;
        }
    }

    check = GetCommandOutput("nft list chain inet " + table + " " + chain + " 2>&1");
    if (IsMissingObject(check)) {
        // Input chain, priority 0
        if (!RunCommand("nft add chain inet " + table + " " + chain +
                        " { type filter hook input priority 0 \\; }")) {
            return false;
        }
        std::cout << "  Created nftables chain '" << chain << "'" << std::endl;
        check.clear();
    }

    const std::string port = std::to_string(options_.port);
    if (check.find("@" + set4) == std::string::npos &&
        !RunCommand("nft add rule inet " + table + " " + chain +
                    " tcp dport " + port + " ip saddr @" + set4 + " drop")) {
        return false;
    }
    if (check.find("@" + set6) == std::string::npos &&
        !RunCommand("nft add rule inet " + table + " " + chain +
                    " tcp dport " + port + " ip6 saddr @" + set6 + " drop")) {
        return false;
    }

    return true;
}

FirewallManager::CheckResult FirewallManager::NftablesHasElement(const std::string& set,
                                                                 const std::string& ip) {
    return ClassifyCheck(RunCommandStatus(
        "nft get element inet " + options_.table + " " + set + " { " + ip + " }"));
}

FirewallBackend::AddResult FirewallManager::AddNftablesElement(const std::string& ip, bool is_v6) {
    const std::string set = options_.set + (is_v6 ? "6" : "4");

    if (NftablesHasElement(set, ip) == CheckResult::PRESENT) {
        return AddResult::DUPLICATE;
    }

    if (!RunCommand("nft add element inet " + options_.table + " " + set + " { " + ip + " }")) {
        std::cerr << "nft add element failed for " << ip << std::endl;
        return AddResult::ERROR;
    }
    return AddResult::OK;
}

FirewallBackend::RemoveResult FirewallManager::RemoveNftablesElement(const std::string& ip, bool is_v6) {
    const std::string set = options_.set + (is_v6 ? "6" : "4");

    CheckResult check = NftablesHasElement(set, ip);
    if (check == CheckResult::ABSENT) {
        return RemoveResult::NOT_FOUND;
    }
    if (check != CheckResult::PRESENT) {
        return CheckFailed("nft get element", ip, check);
    }

    if (!RunCommand("nft delete element inet " + options_.table + " " + set + " { " + ip + " }")) {
        std::cerr << "nft delete element failed for " << ip << std::endl;
        return RemoveResult::ERROR;
    }
    return RemoveResult::OK;
}

bool FirewallManager::FlushIptablesRules() {
    bool all_success = true;

    for (const std::string tool : {"iptables", "ip6tables"}) {
        std::string output = GetCommandOutput(tool + " -S INPUT 2>/dev/null");

        std::istringstream iss(output);
        std::string line;
        while (std::getline(iss, line)) {
            if (line.find("--comment " + options_.table) == std::string::npos ||
                line.compare(0, 9, "-A INPUT ") != 0) {
                continue;
            }
            // "-A INPUT <spec>" -> "-D INPUT <spec>"
            if (!RunCommand(tool + " -D" + line.substr(2))) {
                all_success = false;
            }
        }
    }

    return all_success;
}

std::string FirewallManager::IptablesRuleSpec(const std::string& ip) const {
    std::ostringstream oss;
    oss << "INPUT -s " << ip << " -p tcp --dport " << options_.port
        << " -m comment --comment " << options_.table << " -j DROP";
    return oss.str();
}

FirewallBackend::AddResult FirewallManager::AddIptablesRule(const std::string& ip, bool is_v6) {
    const std::string tool = is_v6 ? "ip6tables" : "iptables";
    const std::string spec = IptablesRuleSpec(ip);

    if (RunCommand(tool + " -C " + spec)) {
        return AddResult::DUPLICATE;
    }

    if (!RunCommand(tool + " -I " + spec)) {
        std::cerr << tool << " insert failed for " << ip << std::endl;
        return AddResult::ERROR;
    }
    return AddResult::OK;
}

FirewallBackend::RemoveResult FirewallManager::RemoveIptablesRule(const std::string& ip, bool is_v6) {
    const std::string tool = is_v6 ? "ip6tables" : "iptables";
    const std::string spec = IptablesRuleSpec(ip);

    CheckResult check = ClassifyCheck(RunCommandStatus(tool + " -C " + spec));
    if (check == CheckResult::ABSENT) {
        return RemoveResult::NOT_FOUND;
    }
    if (check != CheckResult::PRESENT) {
        return CheckFailed(tool + " -C", ip, check);
    }

    if (!RunCommand(tool + " -D " + spec)) {
        std::cerr << tool << " delete failed for " << ip << std::endl;
        return RemoveResult::ERROR;
    }
    return RemoveResult::OK;
}

std::string FirewallManager::Bounded(const std::string& command) const {
    return "timeout " + std::to_string(COMMAND_TIMEOUT_SECONDS) + " " + command;
}

bool FirewallManager::RunCommand(const std::string& command) {
    return RunCommandStatus(command) == 0;
}

// Exit status of the bounded command, -1 when it did not exit normally
int FirewallManager::RunCommandStatus(const std::string& command) {
    int result = system((Bounded(command) + " >/dev/null 2>&1").c_str());
    if (result == -1 || !WIFEXITED(result)) {
        return -1;
    }
    return WEXITSTATUS(result);
}

FirewallManager::CheckResult FirewallManager::ClassifyCheck(int exit_status) {
    switch (exit_status) {
        case 0:   return CheckResult::PRESENT;
        case 1:   return CheckResult::ABSENT;
        case 124: return CheckResult::TIMED_OUT;
        default:  return CheckResult::FAILED;
    }
}

FirewallBackend::RemoveResult FirewallManager::CheckFailed(const std::string& what,
                                                           const std::string& ip,
                                                           CheckResult check) {
    if (check == CheckResult::TIMED_OUT) {
        std::cerr << "⚠️  " << what << " timed out after " << COMMAND_TIMEOUT_SECONDS
                  << "s for " << ip << ", rule state unknown" << std::endl;
    } else {
        std::cerr << "⚠️  " << what << " failed for " << ip << ", rule state unknown" << std::endl;
    }
    return RemoveResult::ERROR;
}

std::string FirewallManager::GetCommandOutput(const std::string& command) {
    std::array<char, 128> buffer;
    std::string result;

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(Bounded(command).c_str(), "r"), pclose);

    if (!pipe) {
        return "";
    }

    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    return result;
}

} // namespace response
} // namespace logwarden
