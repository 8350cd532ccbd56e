// src/common/capabilities_manager.h
#ifndef LOGWARDEN_CAPABILITIES_MANAGER_H
#define LOGWARDEN_CAPABILITIES_MANAGER_H

#include <string>
#include <vector>

namespace logwarden {
namespace common {

/**
 * Capabilities Manager
 * Checks the Linux capabilities the agent needs to manage the firewall
 * and read web server logs, so it can run without full root
 */
class CapabilitiesManager {
public:
    /**
     * True when every required capability is effective.
     * Each missing one is reported on stderr.
     */
    bool HasRequiredCapabilities();

    static std::vector<std::string> GetRequiredCapabilities();

    /**
     * Check one capability by name, with or without the CAP_ prefix
     */
    bool HasCapability(const std::string& cap_name);

    static std::string GetCapabilityDescription(const std::string& cap_name);

    void PrintCapabilityStatus();

private:
    bool CheckCapability(int cap);
    int CapabilityFromName(const std::string& name);
};

} // namespace common
} // namespace logwarden

#endif // LOGWARDEN_CAPABILITIES_MANAGER_H
