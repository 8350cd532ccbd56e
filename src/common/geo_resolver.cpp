// src/common/geo_resolver.cpp
#include "geo_resolver.h"
#include <maxminddb.h>
#include <iostream>
#include <mutex>
#include <cstdio>
#include <unistd.h>

namespace logwarden {
namespace common {

namespace {

bool LookupString(MMDB_entry_s* entry, std::string& out, const char* key, const char* subkey) {
    MMDB_entry_data_s data;
    int status = subkey
        ? MMDB_get_value(entry, &data, key, subkey, NULL)
        : MMDB_get_value(entry, &data, key, NULL);

    if (status != MMDB_SUCCESS || !data.has_data || data.type != MMDB_DATA_TYPE_UTF8_STRING) {
        return false;
    }
    out.assign(data.utf8_string, data.data_size);
    return true;
}

bool FindEntry(MMDB_s* db, const std::string& ip, MMDB_lookup_result_s& result) {
    int gai_error = 0;
    int mmdb_error = MMDB_SUCCESS;
    result = MMDB_lookup_string(db, ip.c_str(), &gai_error, &mmdb_error);
    return gai_error == 0 && mmdb_error == MMDB_SUCCESS && result.found_entry;
}

} // namespace

GeoResolver::GeoResolver() {
}

GeoResolver::~GeoResolver() {
    Close(asn_db_);
    Close(country_db_);
}

std::unique_ptr<MMDB_s> GeoResolver::Open(const std::string& path) {
    if (path.empty()) {
        return nullptr;
    }

    auto db = std::make_unique<MMDB_s>();
    int status = MMDB_open(path.c_str(), MMDB_MODE_MMAP, db.get());
    if (status != MMDB_SUCCESS) {
        std::cerr << "⚠️  Cannot open geo database " << path << ": "
                  << MMDB_strerror(status) << std::endl;
        return nullptr;
    }
    return db;
}

void GeoResolver::Close(std::unique_ptr<MMDB_s>& db) {
    if (db) {
        MMDB_close(db.get());
        db.reset();
    }
}

bool GeoResolver::Load(const std::string& asn_path, const std::string& country_path) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        asn_path_ = asn_path;
        country_path_ = country_path;
    }
    return Reload();
}

bool GeoResolver::Reload() {
    std::string asn_path;
    std::string country_path;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        asn_path = asn_path_;
        country_path = country_path_;
    }

    // Open outside the lock, swap in under it
    auto asn_db = Open(asn_path);
    auto country_db = Open(country_path);
    bool any = asn_db || country_db;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Close(asn_db_);
        Close(country_db_);
        asn_db_ = std::move(asn_db);
        country_db_ = std::move(country_db);
    }

    if (any) {
        std::cout << "✓ Geo databases loaded (asn: " << (HasAsnDatabase() ? "yes" : "no")
                  << ", country: " << (HasCountryDatabase() ? "yes" : "no") << ")" << std::endl;
    }
    return any;
}

bool GeoResolver::DownloadInto(HttpTransport& http, const std::string& url,
                               const std::string& path) {
    const std::string temp_path = path + ".download";
    std::string error;

    if (!http.Download(url, temp_path, error)) {
        std::cerr << "⚠️  Geo database download failed (" << url << "): " << error << std::endl;
        unlink(temp_path.c_str());
        return false;
    }

    // A database that does not open is never moved into place
    auto probe = Open(temp_path);
    if (!probe) {
        unlink(temp_path.c_str());
        return false;
    }
    Close(probe);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        std::cerr << "⚠️  Cannot install geo database " << path << std::endl;
        unlink(temp_path.c_str());
        return false;
    }
    return true;
}

bool GeoResolver::Refresh(HttpTransport& http, const std::string& asn_url,
                          const std::string& country_url) {
    std::string asn_path;
    std::string country_path;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        asn_path = asn_path_;
        country_path = country_path_;
    }

    bool updated = false;
    if (!asn_url.empty() && !asn_path.empty()) {
        updated = DownloadInto(http, asn_url, asn_path) || updated;
    }
    if (!country_url.empty() && !country_path.empty()) {
        updated = DownloadInto(http, country_url, country_path) || updated;
    }

    if (updated) {
        Reload();
    }
    return updated;
}

GeoInfo GeoResolver::Lookup(const std::string& ip) const {
    GeoInfo info;
    info.ip = ip;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    MMDB_lookup_result_s result;

    if (asn_db_ && FindEntry(asn_db_.get(), ip, result)) {
        MMDB_entry_data_s data;
        if (MMDB_get_value(&result.entry, &data, "autonomous_system_number", NULL) == MMDB_SUCCESS &&
            data.has_data && data.type == MMDB_DATA_TYPE_UINT32) {
            info.asn = data.uint32;
        }
        LookupString(&result.entry, info.org, "autonomous_system_organization", nullptr);
    }

    if (country_db_ && FindEntry(country_db_.get(), ip, result)) {
        // City databases carry the same country block
        if (!LookupString(&result.entry, info.country, "country", "iso_code")) {
            LookupString(&result.entry, info.country, "registered_country", "iso_code");
        }
    }

    return info;
}

bool GeoResolver::HasAsnDatabase() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return asn_db_ != nullptr;
}

bool GeoResolver::HasCountryDatabase() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return country_db_ != nullptr;
}

} // namespace common
} // namespace logwarden
