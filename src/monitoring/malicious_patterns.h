// src/monitoring/malicious_patterns.h
#ifndef LOGWARDEN_MALICIOUS_PATTERNS_H
#define LOGWARDEN_MALICIOUS_PATTERNS_H

#include <string>
#include <vector>
#include <regex>

namespace logwarden {
namespace monitoring {

/**
 * Known-malicious request path patterns
 * Credential endpoints, SQL injection markers, path traversal, scanner probes.
 * Order matters: the first matching pattern names the block reason.
 */
class MaliciousPatterns {
public:
    MaliciousPatterns();

    /**
     * Returns true and sets the pattern source text on the first match
     */
    bool Match(const std::string& path, std::string& matched_pattern) const;

    size_t Size() const { return patterns_.size(); }

private:
    struct Pattern {
        std::string source;
        std::regex regex;
    };

    std::vector<Pattern> patterns_;

    void InitializePatterns();
    void Add(const std::string& source);
};

} // namespace monitoring
} // namespace logwarden

#endif // LOGWARDEN_MALICIOUS_PATTERNS_H
