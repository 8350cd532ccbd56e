// src/common/capabilities_manager.cpp
#include "capabilities_manager.h"
#include <sys/capability.h>
#include <iostream>
#include <map>

namespace logwarden {
namespace common {

static const std::map<std::string, std::string> cap_descriptions = {
    {"CAP_NET_ADMIN", "Modify nftables/iptables rules (blocking)"},
    {"CAP_NET_RAW", "Use raw sockets (iptables fallback)"},
    {"CAP_DAC_READ_SEARCH", "Read web server access logs owned by other users"},
    {"CAP_DAC_OVERRIDE", "Replace the agent binary during self-update"}
};

std::vector<std::string> CapabilitiesManager::GetRequiredCapabilities() {
    return {
        "CAP_NET_ADMIN",
        "CAP_NET_RAW",
        "CAP_DAC_READ_SEARCH",
        "CAP_DAC_OVERRIDE"
    };
}

bool CapabilitiesManager::HasRequiredCapabilities() {
    bool all_present = true;

    for (const auto& cap_name : GetRequiredCapabilities()) {
        if (!HasCapability(cap_name)) {
            std::cerr << "Missing required capability: " << cap_name << std::endl;
            std::cerr << "  " << GetCapabilityDescription(cap_name) << std::endl;
            all_present = false;
        }
    }

    return all_present;
}

bool CapabilitiesManager::HasCapability(const std::string& cap_name) {
    int cap = CapabilityFromName(cap_name);
    if (cap < 0) {
        return false;
    }

    return CheckCapability(cap);
}

bool CapabilitiesManager::CheckCapability(int cap) {
    cap_t caps = cap_get_proc();
    if (!caps) {
        return false;
    }

    cap_flag_value_t value;
    int result = cap_get_flag(caps, cap, CAP_EFFECTIVE, &value);

    cap_free(caps);

    return (result == 0 && value == CAP_SET);
}

int CapabilitiesManager::CapabilityFromName(const std::string& name) {
    std::string cap_name = name;
    if (cap_name.find("CAP_") == 0) {
        cap_name = cap_name.substr(4);
    }

    static const std::map<std::string, int> cap_map = {
        {"NET_ADMIN", CAP_NET_ADMIN},
        {"NET_RAW", CAP_NET_RAW},
        {"DAC_READ_SEARCH", CAP_DAC_READ_SEARCH},
        {"DAC_OVERRIDE", CAP_DAC_OVERRIDE}
    };

    auto it = cap_map.find(cap_name);
    if (it != cap_map.end()) {
        return it->second;
    }

    return -1;
}

std::string CapabilitiesManager::GetCapabilityDescription(const std::string& cap_name) {
    auto it = cap_descriptions.find(cap_name);
    if (it != cap_descriptions.end()) {
        return it->second;
    }
    return "Unknown capability";
}

void CapabilitiesManager::PrintCapabilityStatus() {
    std::cout << "\n=== LogWarden Capability Status ===" << std::endl;

    for (const auto& cap_name : GetRequiredCapabilities()) {
        bool has = HasCapability(cap_name);

        std::cout << (has ? "✓" : "✗") << " " << cap_name;
        if (!has) {
            std::cout << " (MISSING)";
        }
        std::cout << std::endl;
        std::cout << "  -> " << GetCapabilityDescription(cap_name) << std::endl;
    }

    std::cout << "===================================" << std::endl;
}

} // namespace common
} // namespace logwarden
