// src/monitoring/log_parser.cpp
#include "log_parser.h"
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>
#include <cstring>
#include <ctime>

namespace logwarden {
namespace monitoring {

namespace {

// 203.0.113.5 - - [10/Oct/2023:13:55:36 +0000] "GET /path HTTP/1.1" 404 512 "ref" "agent"
const std::regex& ApacheRegex() {
    static const std::regex re(
        R"re(^(\S+) \S+ \S+ \[([^\]]+)\] "(\S+) ([^" ]+)(?: HTTP/[0-9.]+)?" (\d{3})(?: \S+)?(?: "([^"]*)" "([^"]*)")?)re");
    return re;
}

// Looser request line: anything after the path up to the closing quote
const std::regex& NginxRegex() {
    static const std::regex re(
        R"re(^(\S+) - \S+ \[([^\]]+)\] "(\S+) ([^" ]+)(?: [^"]*)?" (\d{3})(?: \S+)?(?: "([^"]*)" "([^"]*)")?)re");
    return re;
}

bool IsBlankOrDash(const std::string& s) {
    return s.empty() || s == "-";
}

bool FillFromMatch(const std::smatch& m, RequestEvent& event) {
    event.ip = m[1].str();
    event.method = m[3].str();
    event.path = m[4].str();
    event.status = std::stoi(m[5].str());

    if (m.size() > 7 && m[7].matched && !IsBlankOrDash(m[7].str())) {
        event.user_agent = m[7].str();
    }

    std::chrono::system_clock::time_point tp;
    if (LogParser::ParseClfTimestamp(m[2].str(), tp)) {
        event.timestamp = tp;
    }
    return true;
}

} // namespace

bool LogParser::ParseLine(const std::string& line, RequestEvent& event,
                          std::chrono::system_clock::time_point received_at) {
    return ParseLine(line, event, received_at, LogDialect::APACHE_CLF);
}

bool LogParser::ParseLine(const std::string& line, RequestEvent& event,
                          std::chrono::system_clock::time_point received_at,
                          LogDialect preferred) {
    if (line.size() < 5) {
        return false;
    }

    RequestEvent parsed;
    parsed.timestamp = received_at;

    size_t first = line.find_first_not_of(" \t");
    bool ok = false;

    if (first != std::string::npos && line[first] == '{') {
        // A JSON line never falls through to the plaintext dialects
        ok = ParseJson(line, parsed);
    } else {
        // The regex executor recurses per character, so only a bounded
        // prefix is matched. Request line and status come first; an
        // oversized referer or user agent is dropped with the rest.
        if (line.size() > MAX_MATCH_LENGTH) {
            ok = ParsePlaintext(line.substr(0, MAX_MATCH_LENGTH), parsed, preferred);
        } else {
            ok = ParsePlaintext(line, parsed, preferred);
        }
    }

    if (!ok || parsed.ip.empty() || parsed.path.empty()) {
        return false;
    }

    event = parsed;
    return true;
}

bool LogParser::ParseJson(const std::string& line, RequestEvent& event) {
    nlohmann::json doc = nlohmann::json::parse(line, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return false;
    }

    auto addr = doc.find("remote_addr");
    auto request = doc.find("request");
    auto status = doc.find("status");
    if (addr == doc.end() || !addr->is_string() ||
        request == doc.end() || !request->is_string() ||
        status == doc.end()) {
        return false;
    }

    // "GET /x HTTP/1.1" -> method, path
    std::istringstream iss(request->get<std::string>());
    std::string method, path;
    if (!(iss >> method >> path)) {
        return false;
    }

    int code = 0;
    if (status->is_number_integer()) {
        code = status->get<int>();
    } else if (status->is_string()) {
        const std::string text = status->get<std::string>();
        if (text.empty() || text.size() > 3 ||
            text.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        code = std::stoi(text);
    } else {
        return false;
    }

    event.ip = addr->get<std::string>();
    event.method = method;
    event.path = path;
    event.status = code;

    auto ua = doc.find("http_user_agent");
    if (ua != doc.end() && ua->is_string() && !IsBlankOrDash(ua->get<std::string>())) {
        event.user_agent = ua->get<std::string>();
    }

    std::chrono::system_clock::time_point tp;
    auto iso = doc.find("time_iso8601");
    if (iso != doc.end() && iso->is_string() && ParseIsoTimestamp(iso->get<std::string>(), tp)) {
        event.timestamp = tp;
    } else {
        auto local = doc.find("time_local");
        if (local != doc.end() && local->is_string() && ParseClfTimestamp(local->get<std::string>(), tp)) {
            event.timestamp = tp;
        }
    }

    return true;
}

bool LogParser::ParsePlaintext(const std::string& line, RequestEvent& event,
                               LogDialect preferred) {
    if (preferred == LogDialect::NGINX) {
        return ParseNginx(line, event) || ParseApache(line, event);
    }
    return ParseApache(line, event) || ParseNginx(line, event);
}

bool LogParser::ParseApache(const std::string& line, RequestEvent& event) {
    std::smatch m;
    if (!std::regex_search(line, m, ApacheRegex())) {
        return false;
    }
    return FillFromMatch(m, event);
}

bool LogParser::ParseNginx(const std::string& line, RequestEvent& event) {
    std::smatch m;
    if (!std::regex_search(line, m, NginxRegex())) {
        return false;
    }
    return FillFromMatch(m, event);
}

bool LogParser::ParseZoneOffset(const std::string& zone, long& offset_seconds) {
    offset_seconds = 0;
    if (zone.empty() || zone == "Z") {
        return true;
    }

    // +0000, -0700, +02:00
    std::string digits;
    for (char c : zone.substr(1)) {
        if (c != ':') digits += c;
    }
    if ((zone[0] != '+' && zone[0] != '-') || digits.size() != 4 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }

    long hours = std::stol(digits.substr(0, 2));
    long minutes = std::stol(digits.substr(2, 2));
    offset_seconds = hours * 3600 + minutes * 60;
    if (zone[0] == '-') {
        offset_seconds = -offset_seconds;
    }
    return true;
}

bool LogParser::ParseClfTimestamp(const std::string& text,
                                  std::chrono::system_clock::time_point& tp) {
    struct tm tm;
    memset(&tm, 0, sizeof(tm));

    const char* rest = strptime(text.c_str(), "%d/%b/%Y:%H:%M:%S", &tm);
    if (!rest) {
        return false;
    }

    std::string zone(rest);
    size_t start = zone.find_first_not_of(' ');
    zone = (start == std::string::npos) ? "" : zone.substr(start);

    long offset = 0;
    if (!ParseZoneOffset(zone, offset)) {
        return false;
    }

    time_t utc = timegm(&tm) - offset;
    tp = std::chrono::system_clock::from_time_t(utc);
    return true;
}

bool LogParser::ParseIsoTimestamp(const std::string& text,
                                  std::chrono::system_clock::time_point& tp) {
    struct tm tm;
    memset(&tm, 0, sizeof(tm));

    const char* rest = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (!rest) {
        return false;
    }

    std::string zone(rest);
    // Drop fractional seconds
    if (!zone.empty() && zone[0] == '.') {
        size_t end = zone.find_first_not_of("0123456789", 1);
        zone = (end == std::string::npos) ? "" : zone.substr(end);
    }

    long offset = 0;
    if (!ParseZoneOffset(zone, offset)) {
        return false;
    }

    time_t utc = timegm(&tm) - offset;
    tp = std::chrono::system_clock::from_time_t(utc);
    return true;
}

} // namespace monitoring
} // namespace logwarden
