// src/response/firewall_manager.h
#ifndef LOGWARDEN_FIREWALL_MANAGER_H
#define LOGWARDEN_FIREWALL_MANAGER_H

#include <string>
#include <vector>
#include <mutex>

namespace logwarden {
namespace response {

/**
 * Ingress deny rules for single source addresses.
 * Implementations must treat "already present" and "already absent"
 * as distinct from failure.
 */
class FirewallBackend {
public:
    enum class AddResult { OK, DUPLICATE, ERROR };
    enum class RemoveResult { OK, NOT_FOUND, ERROR };

    virtual ~FirewallBackend() = default;

    virtual AddResult AddIngressDenyRule(const std::string& ip) = 0;
    virtual RemoveResult RemoveIngressDenyRule(const std::string& ip) = 0;
};

/**
 * Firewall Manager
 * Drops inbound traffic from blocked addresses to the monitored port,
 * using nftables (preferred) with iptables fallback
 */
class FirewallManager : public FirewallBackend {
public:
    enum class FirewallType {
        NFTABLES,
        IPTABLES,
        NONE
    };

    struct Options {
        std::string backend = "auto";   // auto | nftables | iptables
        std::string table = "logwarden";
        std::string chain = "input";
        std::string set = "blocklist";  // suffixed with 4 and 6
        int port = 80;
    };

    FirewallManager();
    explicit FirewallManager(const Options& options);

    /**
     * Detect nftables/iptables and create the table, chain, sets and
     * drop rules. Stale entries from a previous run are flushed.
     */
    bool Initialize();

    AddResult AddIngressDenyRule(const std::string& ip) override;
    RemoveResult RemoveIngressDenyRule(const std::string& ip) override;

    FirewallType GetFirewallType() const { return firewall_type_; }
    std::string GetFirewallTypeName() const;

    /**
     * True for a literal IPv4 or IPv6 address, sets is_v6 accordingly
     */
    static bool ParseAddress(const std::string& ip, bool& is_v6);

    /**
     * Outcome of an existence check ("nft get element", "iptables -C").
     * Exit 1 means absent; any other failure, a timeout (124) included,
     * says nothing about the rule.
     */
    enum class CheckResult {
        PRESENT,
        ABSENT,
        TIMED_OUT,
        FAILED
    };
    static CheckResult ClassifyCheck(int exit_status);

private:
    Options options_;
    FirewallType firewall_type_;
    std::mutex command_mutex_;

    static constexpr int COMMAND_TIMEOUT_SECONDS = 15;

    // Detection
    bool DetectNftables();
    bool DetectIptables();

    // nftables operations
    bool InitializeNftables();
    CheckResult NftablesHasElement(const std::string& set, const std::string& ip);
    AddResult AddNftablesElement(const std::string& ip, bool is_v6);
    RemoveResult RemoveNftablesElement(const std::string& ip, bool is_v6);

    // iptables operations
    bool FlushIptablesRules();
    std::string IptablesRuleSpec(const std::string& ip) const;
    AddResult AddIptablesRule(const std::string& ip, bool is_v6);
    RemoveResult RemoveIptablesRule(const std::string& ip, bool is_v6);

    // Utilities
    bool RunCommand(const std::string& command);
    int RunCommandStatus(const std::string& command);
    static RemoveResult CheckFailed(const std::string& what, const std::string& ip,
                                    CheckResult check);
    std::string GetCommandOutput(const std::string& command);
    std::string Bounded(const std::string& command) const;
};

} // namespace response
} // namespace logwarden

#endif // LOGWARDEN_FIREWALL_MANAGER_H
