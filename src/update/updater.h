// src/update/updater.h
#ifndef LOGWARDEN_UPDATER_H
#define LOGWARDEN_UPDATER_H

#include "../common/http_client.h"
#include <logwarden/types.h>
#include <string>
#include <functional>
#include <mutex>

namespace logwarden {
namespace update {

/**
 * Self-updater
 *
 * Fetches <update_url>/latest.json, downloads a newer artifact next to
 * the installed binary, verifies its RSA-SHA256 signature and only then
 * renames it into place and asks for a restart. Fails closed: an
 * artifact that does not verify is deleted and never installed.
 */
class Updater {
public:
    enum class UpdateStatus {
        UP_TO_DATE,
        INSTALLED,
        FETCH_FAILED,
        DOWNLOAD_FAILED,
        VERIFICATION_FAILED,
        INSTALL_FAILED
    };

    struct Options {
        std::string current_version;
        std::string update_url;
        std::string binary_path;
        std::string public_key_path;
        std::string service_name;
    };

    // Returns false when the restart could not be requested
    using RestartHook = std::function<bool()>;

    Updater(common::HttpTransport& http, const Options& options);
    Updater(common::HttpTransport& http, const Options& options, RestartHook restart_hook);

    UpdateStatus CheckAndInstall();

    bool FetchManifest(VersionManifest& manifest);
    bool IsNewer(const VersionManifest& manifest) const;
    UpdateStatus Install(const VersionManifest& manifest);

    void SetOptions(const Options& options);
    Options GetOptions() const;
    std::string InstalledVersion() const;

    static bool ParseManifest(const std::string& body, const std::string& base_url,
                              VersionManifest& manifest);
    static std::string StatusName(UpdateStatus status);

private:
    common::HttpTransport& http_;
    RestartHook restart_hook_;

    mutable std::mutex mutex_;
    Options options_;
    std::string installed_version_;

    std::mutex install_mutex_;

    static bool RestartService(const std::string& service_name);
};

} // namespace update
} // namespace logwarden

#endif // LOGWARDEN_UPDATER_H
