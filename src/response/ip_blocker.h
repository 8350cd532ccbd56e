// src/response/ip_blocker.h
#ifndef LOGWARDEN_IP_BLOCKER_H
#define LOGWARDEN_IP_BLOCKER_H

#include "firewall_manager.h"
#include <logwarden/types.h>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>

namespace logwarden {
namespace response {

/**
 * IP Blocker
 * Owns the table of time-bounded blocks and keeps the firewall in step.
 *
 * The table mutex is never held across a firewall call, so state
 * readers never wait on nft/iptables. Block and unblock operations
 * are serialized among themselves.
 */
class IpBlocker {
public:
    enum class BlockResult {
        BLOCKED,
        ALREADY_BLOCKED,
        INVALID_ADDRESS,
        FIREWALL_ERROR
    };

    // action is "block", "unblock" or "expire"
    using ActionListener = std::function<void(const std::string& action,
                                              const std::string& ip,
                                              const BlockedIpEntry& entry)>;

    IpBlocker(FirewallBackend& firewall, std::chrono::minutes block_duration);

    BlockResult Block(const std::string& ip, const std::string& reason);

    /**
     * Remove the firewall rule and the local entry. The local entry is
     * dropped even when the firewall call fails. Returns false only
     * for a malformed address.
     */
    bool Unblock(const std::string& ip);

    /**
     * Remove every entry whose expiry has passed. Returns the number
     * removed; a call made while another sweep runs returns 0 at once.
     */
    size_t Sweep();
    size_t Sweep(std::chrono::system_clock::time_point now);

    std::vector<std::pair<std::string, BlockedIpEntry>> Snapshot() const;
    bool IsBlocked(const std::string& ip) const;
    size_t ActiveCount() const;
    uint64_t TotalBlocks() const { return total_blocks_.load(); }

    void SetBlockDuration(std::chrono::minutes duration);
    std::chrono::minutes GetBlockDuration() const;

    void SetActionListener(ActionListener listener);

    static std::string ResultName(BlockResult result);

private:
    FirewallBackend& firewall_;

    mutable std::mutex table_mutex_;
    std::map<std::string, BlockedIpEntry> blocked_;
    std::chrono::minutes block_duration_;
    ActionListener listener_;

    std::mutex operation_mutex_;
    std::atomic<bool> sweeping_{false};
    std::atomic<uint64_t> total_blocks_{0};

    void RemoveRule(const std::string& ip);
    void Notify(const std::string& action, const std::string& ip, const BlockedIpEntry& entry);
};

} // namespace response
} // namespace logwarden

#endif // LOGWARDEN_IP_BLOCKER_H
