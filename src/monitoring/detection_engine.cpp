// src/monitoring/detection_engine.cpp
#include "detection_engine.h"
#include <iostream>

namespace logwarden {
namespace monitoring {

DetectionEngine::DetectionEngine(DecisionSink sink)
    : DetectionEngine(std::move(sink), Thresholds()) {
}

DetectionEngine::DetectionEngine(DecisionSink sink, const Thresholds& thresholds)
    : sink_(std::move(sink)), thresholds_(thresholds) {
}

bool DetectionEngine::ProcessEvent(const RequestEvent& event) {
    return ProcessEvent(event, std::chrono::steady_clock::now());
}

bool DetectionEngine::ProcessEvent(const RequestEvent& event,
                                   std::chrono::steady_clock::time_point now) {
    events_processed_++;

    std::string reason = Evaluate(event, now);
    if (reason.empty()) {
        return false;
    }

    decisions_emitted_++;

    if (sink_) {
        BlockDecision decision;
        decision.ip = event.ip;
        decision.reason = reason;
        decision.detected_at = std::chrono::system_clock::now();
        sink_(decision);
    }
    return true;
}

std::string DetectionEngine::Evaluate(const RequestEvent& event,
                                      std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto inserted = counters_.emplace(event.ip, DetectionCounter());
    DetectionCounter& counter = inserted.first->second;
    if (inserted.second) {
        counter.window_start = now;
    }

    // RATE: fixed window, counted before the window age is checked
    counter.count++;
    if (now - counter.window_start > thresholds_.rate_window) {
        counter.count = 1;
        counter.window_start = now;
        counter.scan_404 = 0;
    }

    if (counter.count > thresholds_.rate_threshold) {
        std::cerr << "⚠️  Rate limit exceeded: " << event.ip
                  << " (" << counter.count << " requests)" << std::endl;
        return "high-rate";
    }

    // PATTERN: first match wins
    std::string pattern;
    if (patterns_.Match(event.path, pattern)) {
        std::cerr << "⚠️  Malicious pattern match: " << event.ip
                  << " " << event.path << std::endl;
        return "pattern:" + pattern;
    }

    // 404 SCAN
    if (event.status == 404) {
        counter.scan_404++;
        if (counter.scan_404 > thresholds_.scan_threshold) {
            std::cerr << "⚠️  Suspicious 404 scan: " << event.ip
                      << " (" << counter.scan_404 << " not-found responses)" << std::endl;
            return "404-scan";
        }
    }

    return "";
}

void DetectionEngine::UpdateThresholds(const Thresholds& thresholds) {
    std::lock_guard<std::mutex> lock(mutex_);
    thresholds_ = thresholds;
}

DetectionEngine::Thresholds DetectionEngine::GetThresholds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thresholds_;
}

size_t DetectionEngine::TrackedIpCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.size();
}

} // namespace monitoring
} // namespace logwarden
