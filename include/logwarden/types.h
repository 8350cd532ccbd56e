// include/logwarden/types.h
#ifndef LOGWARDEN_TYPES_H
#define LOGWARDEN_TYPES_H

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>
#include <functional>

namespace logwarden {

// Access log dialects understood by the parser
enum class LogDialect {
    APACHE_CLF,     // Apache common/combined log format
    NGINX,          // Nginx plaintext "main" format
    NGINX_JSON      // One JSON object per line
};

// Normalized record derived from one access log line
struct RequestEvent {
    std::string ip;
    std::string path;
    std::string method;       // Empty when the dialect does not carry it
    int status = 0;
    std::string user_agent;   // Empty when absent
    std::chrono::system_clock::time_point timestamp;  // UTC
    std::string source;       // Log file the line came from
};

// A time-bounded record that an IP is denied at the firewall
struct BlockedIpEntry {
    std::string reason;
    std::chrono::system_clock::time_point blocked_at;
    std::chrono::system_clock::time_point expires_at;

    bool is_expired(std::chrono::system_clock::time_point now) const {
        return expires_at <= now;
    }
};

// Decision emitted by the detection engine, consumed by the blocker
struct BlockDecision {
    std::string ip;
    std::string reason;
    std::chrono::system_clock::time_point detected_at;
};

// Geo attributes of an address (every field except ip may be empty)
struct GeoInfo {
    std::string ip;
    uint32_t asn = 0;          // 0 = unknown
    std::string org;
    std::string country;       // ISO 3166-1 alpha-2
};

// Descriptor of an available agent update
struct VersionManifest {
    std::string version;
    std::string download_url;
    std::string signature;     // Base64 RSA-SHA256 signature of the artifact
};

// Receives raw lines from the tailer
using LineCallback = std::function<void(const std::string& source, const std::string& line)>;

// Receives block decisions from the detection engine
using DecisionSink = std::function<void(const BlockDecision& decision)>;

// Milliseconds since the Unix epoch, the wire representation of time points
inline int64_t ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace logwarden

#endif // LOGWARDEN_TYPES_H
