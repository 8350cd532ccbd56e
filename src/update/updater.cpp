// src/update/updater.cpp
#include "updater.h"
#include "signature_verifier.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <cstdio>
#include <cctype>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace logwarden {
namespace update {

namespace {

std::string TrimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

Updater::Updater(common::HttpTransport& http, const Options& options)
    : Updater(http, options, nullptr) {
}

Updater::Updater(common::HttpTransport& http, const Options& options, RestartHook restart_hook)
    : http_(http), restart_hook_(std::move(restart_hook)),
      options_(options), installed_version_(options.current_version) {
    if (!restart_hook_) {
        restart_hook_ = [this]() { return RestartService(GetOptions().service_name); };
    }
}

void Updater::SetOptions(const Options& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (options.current_version != options_.current_version) {
        installed_version_ = options.current_version;
    }
    options_ = options;
}

Updater::Options Updater::GetOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

std::string Updater::InstalledVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return installed_version_;
}

bool Updater::ParseManifest(const std::string& body, const std::string& base_url,
                            VersionManifest& manifest) {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return false;
    }

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_string() || version->get<std::string>().empty()) {
        return false;
    }

    VersionManifest parsed;
    parsed.version = version->get<std::string>();

    auto url = doc.find("url");
    if (url != doc.end() && url->is_string() && !url->get<std::string>().empty()) {
        parsed.download_url = url->get<std::string>();
    } else {
        parsed.download_url = TrimTrailingSlash(base_url) + "/" + parsed.version;
    }

    auto signature = doc.find("signature");
    if (signature != doc.end() && signature->is_string()) {
        parsed.signature = signature->get<std::string>();
    }

    manifest = parsed;
    return true;
}

bool Updater::FetchManifest(VersionManifest& manifest) {
    Options options = GetOptions();
    if (options.update_url.empty()) {
        std::cerr << "Update check skipped: no update URL configured" << std::endl;
        return false;
    }

    const std::string url = TrimTrailingSlash(options.update_url) + "/latest.json";
    common::HttpResponse response = http_.Get(url);
    if (!response.ok()) {
        std::cerr << "⚠️  Update check failed (" << url << "): "
                  << (response.error.empty() ? "HTTP " + std::to_string(response.status)
                                             : response.error)
                  << std::endl;
        return false;
    }

    if (!ParseManifest(response.body, options.update_url, manifest)) {
        std::cerr << "⚠️  Update manifest is malformed" << std::endl;
        return false;
    }
    return true;
}

bool Updater::IsNewer(const VersionManifest& manifest) const {
    // Plain inequality: any published version different from ours wins
    return manifest.version != InstalledVersion();
}

Updater::UpdateStatus Updater::CheckAndInstall() {
    VersionManifest manifest;
    if (!FetchManifest(manifest)) {
        return UpdateStatus::FETCH_FAILED;
    }

    if (!IsNewer(manifest)) {
        return UpdateStatus::UP_TO_DATE;
    }

    std::cout << "Update available: " << InstalledVersion() << " -> " << manifest.version << std::endl;
    return Install(manifest);
}

Updater::UpdateStatus Updater::Install(const VersionManifest& manifest) {
    std::lock_guard<std::mutex> install_lock(install_mutex_);
    Options options = GetOptions();

    if (manifest.signature.empty()) {
        std::cerr << "❌ Update " << manifest.version << " rejected: no signature" << std::endl;
        return UpdateStatus::VERIFICATION_FAILED;
    }

    // Same directory as the binary, so the final rename is atomic
    const std::string temp_path = options.binary_path + ".download";

    std::string error;
    if (!http_.Download(manifest.download_url, temp_path, error)) {
        unlink(temp_path.c_str());
        std::cerr << "⚠️  Update download failed: " << error << std::endl;
        return UpdateStatus::DOWNLOAD_FAILED;
    }

    std::string public_key;
    if (!SignatureVerifier::ReadPublicKey(options.public_key_path, public_key)) {
        unlink(temp_path.c_str());
        std::cerr << "❌ Update rejected: cannot read public key "
                  << options.public_key_path << std::endl;
        return UpdateStatus::VERIFICATION_FAILED;
    }

    if (!SignatureVerifier::VerifyFile(temp_path, manifest.signature, public_key, error)) {
        unlink(temp_path.c_str());
        std::cerr << "❌ Update " << manifest.version << " rejected: " << error << std::endl;
        return UpdateStatus::VERIFICATION_FAILED;
    }

    if (chmod(temp_path.c_str(), 0755) != 0 ||
        rename(temp_path.c_str(), options.binary_path.c_str()) != 0) {
        unlink(temp_path.c_str());
        std::cerr << "❌ Cannot install update to " << options.binary_path << std::endl;
        return UpdateStatus::INSTALL_FAILED;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        installed_version_ = manifest.version;
    }
    std::cout << "✓ Installed version " << manifest.version << ", restarting" << std::endl;

    if (!restart_hook_()) {
        std::cerr << "⚠️  Restart request failed, new version runs after the next restart" << std::endl;
    }
    return UpdateStatus::INSTALLED;
}

bool Updater::RestartService(const std::string& service_name) {
    for (char c : service_name) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' &&
            c != '.' && c != '@') {
            std::cerr << "Invalid service name: " << service_name << std::endl;
            return false;
        }
    }
    if (service_name.empty()) {
        return false;
    }

    // --no-block: the restart stops this process, do not wait for it
    std::string cmd = "systemctl --no-block restart " + service_name + " >/dev/null 2>&1";
    int result = system(cmd.c_str());
    return result != -1 && WIFEXITED(result) && WEXITSTATUS(result) == 0;
}

std::string Updater::StatusName(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::UP_TO_DATE: return "up-to-date";
        case UpdateStatus::INSTALLED: return "installed";
        case UpdateStatus::FETCH_FAILED: return "fetch-failed";
        case UpdateStatus::DOWNLOAD_FAILED: return "download-failed";
        case UpdateStatus::VERIFICATION_FAILED: return "verification-failed";
        case UpdateStatus::INSTALL_FAILED: return "install-failed";
    }
    return "unknown";
}

} // namespace update
} // namespace logwarden
