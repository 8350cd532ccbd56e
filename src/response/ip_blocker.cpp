// src/response/ip_blocker.cpp
#include "ip_blocker.h"
#include <iostream>

namespace logwarden {
namespace response {

IpBlocker::IpBlocker(FirewallBackend& firewall, std::chrono::minutes block_duration)
    : firewall_(firewall), block_duration_(block_duration) {
}

IpBlocker::BlockResult IpBlocker::Block(const std::string& ip, const std::string& reason) {
    bool is_v6 = false;
    if (!FirewallManager::ParseAddress(ip, is_v6)) {
        std::cerr << "Ignoring block request for invalid address: " << ip << std::endl;
        return BlockResult::INVALID_ADDRESS;
    }

    std::lock_guard<std::mutex> op_lock(operation_mutex_);

    auto now = std::chrono::system_clock::now();
    std::chrono::minutes duration;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto it = blocked_.find(ip);
        if (it != blocked_.end() && !it->second.is_expired(now)) {
            return BlockResult::ALREADY_BLOCKED;
        }
        duration = block_duration_;
    }

    auto result = firewall_.AddIngressDenyRule(ip);
    if (result == FirewallBackend::AddResult::ERROR) {
        std::cerr << "❌ Failed to block " << ip << " (" << reason << ")" << std::endl;
        return BlockResult::FIREWALL_ERROR;
    }

    BlockedIpEntry entry;
    entry.reason = reason;
    entry.blocked_at = now;
    entry.expires_at = now + duration;

    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        blocked_[ip] = entry;
    }
    total_blocks_++;

    std::cout << "🛑 Blocked " << ip << " for " << duration.count()
              << " min (" << reason << ")" << std::endl;
    Notify("block", ip, entry);
    return BlockResult::BLOCKED;
}

bool IpBlocker::Unblock(const std::string& ip) {
    bool is_v6 = false;
    if (!FirewallManager::ParseAddress(ip, is_v6)) {
        return false;
    }

    std::lock_guard<std::mutex> op_lock(operation_mutex_);

    RemoveRule(ip);

    BlockedIpEntry entry;
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto it = blocked_.find(ip);
        if (it != blocked_.end()) {
            entry = it->second;
            existed = true;
            blocked_.erase(it);
        }
    }

    std::cout << "Unblocked " << ip << std::endl;
    if (existed) {
        Notify("unblock", ip, entry);
    }
    return true;
}

size_t IpBlocker::Sweep() {
    return Sweep(std::chrono::system_clock::now());
}

size_t IpBlocker::Sweep(std::chrono::system_clock::time_point now) {
    bool expected = false;
    if (!sweeping_.compare_exchange_strong(expected, true)) {
        return 0;
    }

    struct SweepGuard {
        std::atomic<bool>& flag;
        ~SweepGuard() { flag = false; }
    } guard{sweeping_};

    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& [ip, entry] : blocked_) {
            if (entry.is_expired(now)) {
                expired.push_back(ip);
            }
        }
    }

    size_t removed = 0;
    for (const auto& ip : expired) {
        std::lock_guard<std::mutex> op_lock(operation_mutex_);

        // Re-check, the entry may have been replaced or removed meanwhile
        BlockedIpEntry entry;
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            auto it = blocked_.find(ip);
            if (it == blocked_.end() || !it->second.is_expired(now)) {
                continue;
            }
            entry = it->second;
        }

        RemoveRule(ip);

        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            blocked_.erase(ip);
        }
        removed++;

        std::cout << "Block expired: " << ip << " (" << entry.reason << ")" << std::endl;
        Notify("expire", ip, entry);
    }

    return removed;
}

void IpBlocker::RemoveRule(const std::string& ip) {
    auto result = firewall_.RemoveIngressDenyRule(ip);
    if (result == FirewallBackend::RemoveResult::ERROR) {
        std::cerr << "⚠️  Firewall removal failed for " << ip
                  << ", dropping local entry anyway" << std::endl;
    }
}

std::vector<std::pair<std::string, BlockedIpEntry>> IpBlocker::Snapshot() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return std::vector<std::pair<std::string, BlockedIpEntry>>(blocked_.begin(), blocked_.end());
}

bool IpBlocker::IsBlocked(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return blocked_.count(ip) > 0;
}

size_t IpBlocker::ActiveCount() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return blocked_.size();
}

void IpBlocker::SetBlockDuration(std::chrono::minutes duration) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    block_duration_ = duration;
}

std::chrono::minutes IpBlocker::GetBlockDuration() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return block_duration_;
}

void IpBlocker::SetActionListener(ActionListener listener) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    listener_ = std::move(listener);
}

void IpBlocker::Notify(const std::string& action, const std::string& ip,
                       const BlockedIpEntry& entry) {
    ActionListener listener;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(action, ip, entry);
    }
}

std::string IpBlocker::ResultName(BlockResult result) {
    switch (result) {
        case BlockResult::BLOCKED: return "blocked";
        case BlockResult::ALREADY_BLOCKED: return "already-blocked";
        case BlockResult::INVALID_ADDRESS: return "invalid-address";
        case BlockResult::FIREWALL_ERROR: return "firewall-error";
    }
    return "unknown";
}

} // namespace response
} // namespace logwarden
