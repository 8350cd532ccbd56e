/**
 * @file test_ip_blocker.cpp
 * @brief Unit tests for the block table against a fake firewall
 */

#include <gtest/gtest.h>
#include "response/ip_blocker.h"
#include <condition_variable>
#include <future>
#include <set>

using namespace logwarden;
using namespace logwarden::response;

namespace {

// In-memory firewall that records calls and can fail or stall on demand
class FakeFirewall : public FirewallBackend {
public:
    std::set<std::string> rules;
    int add_calls = 0;
    int remove_calls = 0;
    bool fail_add = false;
    bool fail_remove = false;

    // When set, RemoveIngressDenyRule waits until Release() is called
    bool stall_remove = false;
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
    std::promise<void> remove_entered;

    AddResult AddIngressDenyRule(const std::string& ip) override {
        add_calls++;
        if (fail_add) return AddResult::ERROR;
        return rules.insert(ip).second ? AddResult::OK : AddResult::DUPLICATE;
    }

    RemoveResult RemoveIngressDenyRule(const std::string& ip) override {
        remove_calls++;
        if (stall_remove) {
            remove_entered.set_value();
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return released; });
            stall_remove = false;
        }
        if (fail_remove) return RemoveResult::ERROR;
        return rules.erase(ip) ? RemoveResult::OK : RemoveResult::NOT_FOUND;
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }
};

} // namespace

class IpBlockerTest : public ::testing::Test {
protected:
    FakeFirewall firewall;
    IpBlocker blocker{firewall, std::chrono::minutes(30)};
    std::vector<std::string> actions;

    void SetUp() override {
        blocker.SetActionListener([this](const std::string& action, const std::string& ip,
                                         const BlockedIpEntry&) {
            actions.push_back(action + ":" + ip);
        });
    }
};

// Test 1: Block installs a rule and a bounded entry
TEST_F(IpBlockerTest, BlockCreatesEntry) {
    auto before = std::chrono::system_clock::now();
    EXPECT_EQ(blocker.Block("203.0.113.1", "high-rate"), IpBlocker::BlockResult::BLOCKED);

    EXPECT_TRUE(firewall.rules.count("203.0.113.1"));
    EXPECT_TRUE(blocker.IsBlocked("203.0.113.1"));

    auto snapshot = blocker.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].first, "203.0.113.1");
    EXPECT_EQ(snapshot[0].second.reason, "high-rate");
    EXPECT_GE(snapshot[0].second.blocked_at, before);
    EXPECT_EQ(snapshot[0].second.expires_at - snapshot[0].second.blocked_at,
              std::chrono::minutes(30));

    EXPECT_EQ(actions, (std::vector<std::string>{"block:203.0.113.1"}));
}

// Test 2: A second block of an active entry is a no-op
TEST_F(IpBlockerTest, BlockIdempotent) {
    ASSERT_EQ(blocker.Block("203.0.113.2", "high-rate"), IpBlocker::BlockResult::BLOCKED);
    EXPECT_EQ(blocker.Block("203.0.113.2", "404-scan"), IpBlocker::BlockResult::ALREADY_BLOCKED);

    EXPECT_EQ(firewall.add_calls, 1);
    EXPECT_EQ(blocker.ActiveCount(), 1u);
    EXPECT_EQ(blocker.Snapshot()[0].second.reason, "high-rate");
    EXPECT_EQ(blocker.TotalBlocks(), 1u);
}

// Test 3: A rule left over in the firewall counts as success
TEST_F(IpBlockerTest, DuplicateRuleIsSuccess) {
    firewall.rules.insert("203.0.113.3");
    EXPECT_EQ(blocker.Block("203.0.113.3", "remote"), IpBlocker::BlockResult::BLOCKED);
    EXPECT_TRUE(blocker.IsBlocked("203.0.113.3"));
}

// Test 4: Firewall failure leaves no entry so the next event retries
TEST_F(IpBlockerTest, FirewallErrorNotRecorded) {
    firewall.fail_add = true;
    EXPECT_EQ(blocker.Block("203.0.113.4", "high-rate"), IpBlocker::BlockResult::FIREWALL_ERROR);
    EXPECT_FALSE(blocker.IsBlocked("203.0.113.4"));
    EXPECT_TRUE(actions.empty());

    firewall.fail_add = false;
    EXPECT_EQ(blocker.Block("203.0.113.4", "high-rate"), IpBlocker::BlockResult::BLOCKED);
}

TEST_F(IpBlockerTest, InvalidAddressRejected) {
    EXPECT_EQ(blocker.Block("not-an-ip", "remote"), IpBlocker::BlockResult::INVALID_ADDRESS);
    EXPECT_EQ(blocker.Block("1.2.3.4; rm -rf /", "remote"), IpBlocker::BlockResult::INVALID_ADDRESS);
    EXPECT_EQ(blocker.Block("", "remote"), IpBlocker::BlockResult::INVALID_ADDRESS);
    EXPECT_FALSE(blocker.Unblock("999.1.1.1"));
    EXPECT_EQ(firewall.add_calls, 0);
}

TEST_F(IpBlockerTest, IPv6Address) {
    EXPECT_EQ(blocker.Block("2001:db8::7", "pattern:wp-login"), IpBlocker::BlockResult::BLOCKED);
    EXPECT_TRUE(firewall.rules.count("2001:db8::7"));
}

// Test 5: Unblock removes rule and entry, and tolerates absence
TEST_F(IpBlockerTest, Unblock) {
    blocker.Block("203.0.113.5", "remote");
    EXPECT_TRUE(blocker.Unblock("203.0.113.5"));
    EXPECT_FALSE(blocker.IsBlocked("203.0.113.5"));
    EXPECT_FALSE(firewall.rules.count("203.0.113.5"));

    // Not blocked: still succeeds
    EXPECT_TRUE(blocker.Unblock("203.0.113.5"));
    EXPECT_EQ(actions, (std::vector<std::string>{"block:203.0.113.5", "unblock:203.0.113.5"}));
}

// Test 6: The local entry goes even if the firewall refuses
TEST_F(IpBlockerTest, UnblockDropsEntryOnFirewallError) {
    blocker.Block("203.0.113.6", "remote");
    firewall.fail_remove = true;
    EXPECT_TRUE(blocker.Unblock("203.0.113.6"));
    EXPECT_FALSE(blocker.IsBlocked("203.0.113.6"));
}

// Test 7: Sweep removes only expired entries
TEST_F(IpBlockerTest, SweepExpired) {
    blocker.Block("203.0.113.7", "high-rate");
    blocker.SetBlockDuration(std::chrono::minutes(120));
    blocker.Block("203.0.113.8", "high-rate");

    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(blocker.Sweep(now), 0u);

    EXPECT_EQ(blocker.Sweep(now + std::chrono::minutes(31)), 1u);
    EXPECT_FALSE(blocker.IsBlocked("203.0.113.7"));
    EXPECT_TRUE(blocker.IsBlocked("203.0.113.8"));
    EXPECT_FALSE(firewall.rules.count("203.0.113.7"));
    EXPECT_EQ(actions.back(), "expire:203.0.113.7");
}

// Test 8: A removal that cannot be confirmed still expires the entry
TEST_F(IpBlockerTest, SweepDropsEntryOnFirewallError) {
    blocker.Block("203.0.113.9", "high-rate");
    firewall.fail_remove = true;

    auto later = std::chrono::system_clock::now() + std::chrono::minutes(31);
    EXPECT_EQ(blocker.Sweep(later), 1u);
    EXPECT_EQ(firewall.remove_calls, 1);
    EXPECT_FALSE(blocker.IsBlocked("203.0.113.9"));
    EXPECT_EQ(actions.back(), "expire:203.0.113.9");
}

// Test 9: An expired entry can be blocked again before the sweep
TEST_F(IpBlockerTest, ExpiredEntryReblocked) {
    blocker.SetBlockDuration(std::chrono::minutes(0));
    blocker.Block("203.0.113.9", "high-rate");

    blocker.SetBlockDuration(std::chrono::minutes(30));
    EXPECT_EQ(blocker.Block("203.0.113.9", "404-scan"), IpBlocker::BlockResult::BLOCKED);
    EXPECT_EQ(blocker.Snapshot()[0].second.reason, "404-scan");

    EXPECT_EQ(blocker.Sweep(), 0u);
    EXPECT_TRUE(blocker.IsBlocked("203.0.113.9"));
}

// Test 10: Overlapping sweeps do not run twice
TEST_F(IpBlockerTest, SweepSingleFlight) {
    blocker.SetBlockDuration(std::chrono::minutes(0));
    blocker.Block("203.0.113.10", "high-rate");

    firewall.stall_remove = true;
    auto entered = firewall.remove_entered.get_future();
    auto first = std::async(std::launch::async, [this] { return blocker.Sweep(); });

    ASSERT_EQ(entered.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(blocker.Sweep(), 0u);

    firewall.Release();
    EXPECT_EQ(first.get(), 1u);
    EXPECT_EQ(firewall.remove_calls, 1);
    EXPECT_EQ(blocker.ActiveCount(), 0u);
}

TEST_F(IpBlockerTest, ResultNames) {
    EXPECT_EQ(IpBlocker::ResultName(IpBlocker::BlockResult::BLOCKED), "blocked");
    EXPECT_EQ(IpBlocker::ResultName(IpBlocker::BlockResult::FIREWALL_ERROR), "firewall-error");
}
