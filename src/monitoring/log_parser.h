// src/monitoring/log_parser.h
#ifndef LOGWARDEN_LOG_PARSER_H
#define LOGWARDEN_LOG_PARSER_H

#include <logwarden/types.h>
#include <string>
#include <chrono>

namespace logwarden {
namespace monitoring {

/**
 * Access Log Parser
 * Converts one raw access log line into a RequestEvent.
 * A line starting with '{' is parsed as JSON. Plaintext lines try the
 * preferred dialect first (Apache CLF unless told otherwise), then the other.
 * Deterministic and side-effect free.
 */
class LogParser {
public:
    // Longest prefix of a plaintext line handed to the regex dialects
    static constexpr size_t MAX_MATCH_LENGTH = 8192;

    /**
     * Parse a line. Returns false when no dialect matches (line is discarded).
     * received_at is used when the line carries no usable timestamp.
     */
    static bool ParseLine(const std::string& line, RequestEvent& event,
                          std::chrono::system_clock::time_point received_at);

    /**
     * Same, trying the configured plaintext dialect before the other one.
     * JSON lines are recognized whatever the preference.
     */
    static bool ParseLine(const std::string& line, RequestEvent& event,
                          std::chrono::system_clock::time_point received_at,
                          LogDialect preferred);

    /**
     * Parse "10/Oct/2023:13:55:36 +0000" (zone optional, UTC assumed)
     */
    static bool ParseClfTimestamp(const std::string& text,
                                  std::chrono::system_clock::time_point& tp);

    /**
     * Parse "2023-10-10T13:55:36+00:00" / "...Z"
     */
    static bool ParseIsoTimestamp(const std::string& text,
                                  std::chrono::system_clock::time_point& tp);

private:
    static bool ParseJson(const std::string& line, RequestEvent& event);
    static bool ParseApache(const std::string& line, RequestEvent& event);
    static bool ParseNginx(const std::string& line, RequestEvent& event);
    static bool ParsePlaintext(const std::string& line, RequestEvent& event,
                               LogDialect preferred);
    static bool ParseZoneOffset(const std::string& zone, long& offset_seconds);
};

} // namespace monitoring
} // namespace logwarden

#endif // LOGWARDEN_LOG_PARSER_H
