// src/common/geo_resolver.h
#ifndef LOGWARDEN_GEO_RESOLVER_H
#define LOGWARDEN_GEO_RESOLVER_H

#include "http_client.h"
#include <logwarden/types.h>
#include <string>
#include <memory>
#include <shared_mutex>

struct MMDB_s;

namespace logwarden {
namespace common {

/**
 * Geo Resolver
 * ASN and country lookups against two local MaxMind databases.
 * Either database may be absent; lookups then carry only what is known.
 */
class GeoResolver {
public:
    GeoResolver();
    ~GeoResolver();

    GeoResolver(const GeoResolver&) = delete;
    GeoResolver& operator=(const GeoResolver&) = delete;

    /**
     * Open both databases. Returns true when at least one opened.
     */
    bool Load(const std::string& asn_path, const std::string& country_path);

    /**
     * Reopen the databases from the paths given to Load
     */
    bool Reload();

    /**
     * Download fresh copies next to the current files, move them into
     * place and reload. A URL left empty skips that database.
     */
    bool Refresh(HttpTransport& http, const std::string& asn_url,
                 const std::string& country_url);

    GeoInfo Lookup(const std::string& ip) const;

    bool HasAsnDatabase() const;
    bool HasCountryDatabase() const;

private:
    std::string asn_path_;
    std::string country_path_;

    std::unique_ptr<MMDB_s> asn_db_;
    std::unique_ptr<MMDB_s> country_db_;

    mutable std::shared_mutex mutex_;

    static std::unique_ptr<MMDB_s> Open(const std::string& path);
    static void Close(std::unique_ptr<MMDB_s>& db);
    static bool DownloadInto(HttpTransport& http, const std::string& url,
                             const std::string& path);
};

} // namespace common
} // namespace logwarden

#endif // LOGWARDEN_GEO_RESOLVER_H
