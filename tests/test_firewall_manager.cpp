/**
 * @file test_firewall_manager.cpp
 * @brief Unit tests for firewall command result handling
 *
 * Only the parts that need no nft/iptables binary are covered here:
 * address validation, existence-check classification and the
 * behavior of a manager that found no firewall.
 */

#include <gtest/gtest.h>
#include "response/firewall_manager.h"

using namespace logwarden::response;

using CheckResult = FirewallManager::CheckResult;

// Test 1: Exit 0 and 1 are the only answers about the rule itself
TEST(FirewallManagerTest, ClassifyCheckPresentAndAbsent) {
    EXPECT_EQ(FirewallManager::ClassifyCheck(0), CheckResult::PRESENT);
    EXPECT_EQ(FirewallManager::ClassifyCheck(1), CheckResult::ABSENT);
}

// Test 2: A check killed by timeout(1) is not mistaken for a missing rule
TEST(FirewallManagerTest, ClassifyCheckTimeout) {
    EXPECT_EQ(FirewallManager::ClassifyCheck(124), CheckResult::TIMED_OUT);
}

// Test 3: Usage errors, lock contention and abnormal exits are failures
TEST(FirewallManagerTest, ClassifyCheckFailures) {
    EXPECT_EQ(FirewallManager::ClassifyCheck(2), CheckResult::FAILED);
    EXPECT_EQ(FirewallManager::ClassifyCheck(4), CheckResult::FAILED);
    EXPECT_EQ(FirewallManager::ClassifyCheck(127), CheckResult::FAILED);
    EXPECT_EQ(FirewallManager::ClassifyCheck(-1), CheckResult::FAILED);
}

// Test 4: Only literal addresses reach a command line
TEST(FirewallManagerTest, ParseAddress) {
    bool is_v6 = true;
    EXPECT_TRUE(FirewallManager::ParseAddress("203.0.113.5", is_v6));
    EXPECT_FALSE(is_v6);

    EXPECT_TRUE(FirewallManager::ParseAddress("2001:db8::1", is_v6));
    EXPECT_TRUE(is_v6);

    EXPECT_FALSE(FirewallManager::ParseAddress("", is_v6));
    EXPECT_FALSE(FirewallManager::ParseAddress("203.0.113.5; reboot", is_v6));
    EXPECT_FALSE(FirewallManager::ParseAddress("example.com", is_v6));
    EXPECT_FALSE(FirewallManager::ParseAddress("10.0.0.0/8", is_v6));
}

// Test 5: Without a detected firewall every change is an error, never a silent success
TEST(FirewallManagerTest, UninitializedManagerReportsErrors) {
    FirewallManager firewall;
    EXPECT_EQ(firewall.GetFirewallType(), FirewallManager::FirewallType::NONE);
    EXPECT_EQ(firewall.AddIngressDenyRule("203.0.113.5"), FirewallBackend::AddResult::ERROR);
    EXPECT_EQ(firewall.RemoveIngressDenyRule("203.0.113.5"), FirewallBackend::RemoveResult::ERROR);
}

// Test 6: An invalid address has nothing to remove
TEST(FirewallManagerTest, RemoveInvalidAddressIsNotFound) {
    FirewallManager firewall;
    EXPECT_EQ(firewall.RemoveIngressDenyRule("not-an-ip"), FirewallBackend::RemoveResult::NOT_FOUND);
}
