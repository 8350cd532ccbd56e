// src/monitoring/detection_engine.h
#ifndef LOGWARDEN_DETECTION_ENGINE_H
#define LOGWARDEN_DETECTION_ENGINE_H

#include "malicious_patterns.h"
#include <logwarden/types.h>
#include <string>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include <atomic>

namespace logwarden {
namespace monitoring {

/**
 * Abuse Detection Engine
 * Evaluates each request against three detectors in fixed precedence:
 *   1. rate (fixed window per IP)
 *   2. malicious path pattern
 *   3. 404 scanning
 * The first detector that fires emits a BlockDecision to the sink.
 * No network or disk I/O happens here.
 */
class DetectionEngine {
public:
    struct Thresholds {
        int rate_threshold = 80;
        std::chrono::seconds rate_window{10};
        int scan_threshold = 20;
    };

    explicit DetectionEngine(DecisionSink sink);
    DetectionEngine(DecisionSink sink, const Thresholds& thresholds);

    /**
     * Evaluate one event. Returns true when a decision was emitted.
     */
    bool ProcessEvent(const RequestEvent& event);
    bool ProcessEvent(const RequestEvent& event, std::chrono::steady_clock::time_point now);

    void UpdateThresholds(const Thresholds& thresholds);
    Thresholds GetThresholds() const;

    size_t TrackedIpCount() const;
    uint64_t EventsProcessed() const { return events_processed_.load(); }
    uint64_t DecisionsEmitted() const { return decisions_emitted_.load(); }

private:
    // Per-IP state, lives for the process lifetime
    struct DetectionCounter {
        int count = 0;
        std::chrono::steady_clock::time_point window_start;
        int scan_404 = 0;
    };

    DecisionSink sink_;
    MaliciousPatterns patterns_;
    Thresholds thresholds_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, DetectionCounter> counters_;

    std::atomic<uint64_t> events_processed_{0};
    std::atomic<uint64_t> decisions_emitted_{0};

    // Returns the block reason, or empty when nothing fired
    std::string Evaluate(const RequestEvent& event, std::chrono::steady_clock::time_point now);
};

} // namespace monitoring
} // namespace logwarden

#endif // LOGWARDEN_DETECTION_ENGINE_H
