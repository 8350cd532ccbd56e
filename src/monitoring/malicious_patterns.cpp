// src/monitoring/malicious_patterns.cpp
#include "malicious_patterns.h"

namespace logwarden {
namespace monitoring {

MaliciousPatterns::MaliciousPatterns() {
    InitializePatterns();
}

void MaliciousPatterns::Add(const std::string& source) {
    patterns_.push_back({
        source,
        std::regex(source, std::regex::icase | std::regex::optimize)
    });
}

void MaliciousPatterns::InitializePatterns() {
    // WordPress brute force
    Add(R"(wp-login\.php)");
    Add(R"(xmlrpc\.php)");

    // PHP backdoors
    Add(R"(.*\.php\?.*=)");
    Add(R"(eval\()");

    // SQL injection
    Add(R"(union.*select)");
    Add(R"(information_schema)");
    Add(R"(or 1=1)");

    // Path traversal
    Add(R"(\.\./)");

    // Common scanners
    Add(R"(admin/?)");
    Add(R"(phpmyadmin)");
    Add(R"(sqlmanager)");
    Add(R"(wp-admin)");
    Add(R"(config\.bak)");
    Add(R"(config\.old)");
}

bool MaliciousPatterns::Match(const std::string& path, std::string& matched_pattern) const {
    for (const auto& pattern : patterns_) {
        if (std::regex_search(path, pattern.regex)) {
            matched_pattern = pattern.source;
            return true;
        }
    }
    return false;
}

} // namespace monitoring
} // namespace logwarden
