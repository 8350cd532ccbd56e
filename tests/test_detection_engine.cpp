/**
 * @file test_detection_engine.cpp
 * @brief Unit tests for rate, pattern and 404-scan detection
 */

#include <gtest/gtest.h>
#include "monitoring/detection_engine.h"

using namespace logwarden;
using namespace logwarden::monitoring;

class DetectionEngineTest : public ::testing::Test {
protected:
    std::vector<BlockDecision> decisions;
    std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();

    DecisionSink Sink() {
        return [this](const BlockDecision& decision) { decisions.push_back(decision); };
    }

    static RequestEvent Event(const std::string& ip, const std::string& path, int status = 200) {
        RequestEvent event;
        event.ip = ip;
        event.path = path;
        event.status = status;
        return event;
    }
};

// Test 1: 81 requests inside the window trip the rate detector once
TEST_F(DetectionEngineTest, RateThreshold) {
    DetectionEngine engine(Sink());

    for (int i = 0; i < 80; i++) {
        EXPECT_FALSE(engine.ProcessEvent(Event("203.0.113.1", "/"), t0 + std::chrono::milliseconds(i)));
    }
    EXPECT_TRUE(decisions.empty());

    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.1", "/"), t0 + std::chrono::seconds(5)));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].ip, "203.0.113.1");
    EXPECT_EQ(decisions[0].reason, "high-rate");
}

// Test 2: The window resets once it is older than its length
TEST_F(DetectionEngineTest, FixedWindowReset) {
    DetectionEngine engine(Sink());

    for (int i = 0; i < 80; i++) {
        engine.ProcessEvent(Event("203.0.113.2", "/"), t0);
    }

    // Exactly at the window length the window is still open
    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.2", "/"), t0 + std::chrono::seconds(10)));
    decisions.clear();

    DetectionEngine fresh(Sink());
    for (int i = 0; i < 80; i++) {
        fresh.ProcessEvent(Event("203.0.113.3", "/"), t0);
    }
    EXPECT_FALSE(fresh.ProcessEvent(Event("203.0.113.3", "/"), t0 + std::chrono::seconds(11)));
    EXPECT_TRUE(decisions.empty());
}

// Test 3: Counters are per IP
TEST_F(DetectionEngineTest, CountersPerIp) {
    DetectionEngine engine(Sink());

    for (int i = 0; i < 60; i++) {
        engine.ProcessEvent(Event("198.51.100.1", "/"), t0);
        engine.ProcessEvent(Event("198.51.100.2", "/"), t0);
    }
    EXPECT_TRUE(decisions.empty());
    EXPECT_EQ(engine.TrackedIpCount(), 2u);
    EXPECT_EQ(engine.EventsProcessed(), 120u);
}

// Test 4: A malicious path blocks on the first request
TEST_F(DetectionEngineTest, PatternMatch) {
    DetectionEngine engine(Sink());

    EXPECT_TRUE(engine.ProcessEvent(Event("192.0.2.9", "/wp-login.php"), t0));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].reason.rfind("pattern:", 0), 0u);
}

TEST_F(DetectionEngineTest, PatternCaseInsensitive) {
    DetectionEngine engine(Sink());

    EXPECT_TRUE(engine.ProcessEvent(Event("192.0.2.9", "/search?q=UNION%20SELECT"), t0));
    EXPECT_TRUE(engine.ProcessEvent(Event("192.0.2.10", "/static/../../etc/passwd"), t0));
    EXPECT_TRUE(engine.ProcessEvent(Event("192.0.2.11", "/PhpMyAdmin/"), t0));
    EXPECT_EQ(decisions.size(), 3u);
}

TEST_F(DetectionEngineTest, BenignPathsPass) {
    DetectionEngine engine(Sink());

    EXPECT_FALSE(engine.ProcessEvent(Event("192.0.2.9", "/index.html"), t0));
    EXPECT_FALSE(engine.ProcessEvent(Event("192.0.2.9", "/css/site.css"), t0));
    EXPECT_FALSE(engine.ProcessEvent(Event("192.0.2.9", "/blog/2023/10/hello"), t0));
    EXPECT_TRUE(decisions.empty());
}

// Test 5: 21 not-found responses trip the scan detector
TEST_F(DetectionEngineTest, NotFoundScan) {
    DetectionEngine engine(Sink());

    for (int i = 0; i < 20; i++) {
        EXPECT_FALSE(engine.ProcessEvent(Event("203.0.113.7", "/missing" + std::to_string(i), 404), t0));
    }
    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.7", "/missing-last", 404), t0));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].reason, "404-scan");
}

// Test 6: The scan counter only resets with the rate window
TEST_F(DetectionEngineTest, ScanCounterResetsWithWindow) {
    DetectionEngine engine(Sink());

    for (int i = 0; i < 20; i++) {
        engine.ProcessEvent(Event("203.0.113.8", "/nope", 404), t0);
    }
    EXPECT_FALSE(engine.ProcessEvent(Event("203.0.113.8", "/nope", 404), t0 + std::chrono::seconds(11)));
    EXPECT_TRUE(decisions.empty());
}

// Test 7: Rate takes precedence over pattern
TEST_F(DetectionEngineTest, RateBeforePattern) {
    DetectionEngine::Thresholds thresholds;
    thresholds.rate_threshold = 2;
    DetectionEngine engine(Sink(), thresholds);

    engine.ProcessEvent(Event("203.0.113.9", "/"), t0);
    engine.ProcessEvent(Event("203.0.113.9", "/"), t0);
    decisions.clear();

    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.9", "/wp-login.php", 404), t0));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].reason, "high-rate");
}

// Test 8: Pattern takes precedence over scan, and a pattern hit does not count as a 404
TEST_F(DetectionEngineTest, PatternBeforeScan) {
    DetectionEngine::Thresholds thresholds;
    thresholds.scan_threshold = 1;
    DetectionEngine engine(Sink(), thresholds);

    engine.ProcessEvent(Event("203.0.113.10", "/gone", 404), t0);
    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.10", "/xmlrpc.php", 404), t0));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].reason.rfind("pattern:", 0), 0u);

    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.10", "/gone", 404), t0));
    EXPECT_EQ(decisions.back().reason, "404-scan");
}

// Test 9: Updated thresholds apply to the next event
TEST_F(DetectionEngineTest, UpdateThresholds) {
    DetectionEngine engine(Sink());

    DetectionEngine::Thresholds thresholds;
    thresholds.rate_threshold = 3;
    thresholds.rate_window = std::chrono::seconds(60);
    thresholds.scan_threshold = 5;
    engine.UpdateThresholds(thresholds);

    auto current = engine.GetThresholds();
    EXPECT_EQ(current.rate_threshold, 3);
    EXPECT_EQ(current.rate_window, std::chrono::seconds(60));
    EXPECT_EQ(current.scan_threshold, 5);

    for (int i = 0; i < 3; i++) {
        engine.ProcessEvent(Event("203.0.113.11", "/"), t0 + std::chrono::seconds(i * 15));
    }
    EXPECT_TRUE(engine.ProcessEvent(Event("203.0.113.11", "/"), t0 + std::chrono::seconds(50)));
    EXPECT_EQ(engine.DecisionsEmitted(), 1u);
}
