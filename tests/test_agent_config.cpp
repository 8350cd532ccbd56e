/**
 * @file test_agent_config.cpp
 * @brief Unit tests for configuration loading and runtime merges
 */

#include <gtest/gtest.h>
#include "common/agent_config.h"
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace logwarden;

class AgentConfigTest : public ::testing::Test {
protected:
    std::string path;

    void SetUp() override {
        char tmpl[] = "/tmp/logwarden_config_XXXXXX";
        int fd = mkstemp(tmpl);
        ASSERT_GE(fd, 0);
        close(fd);
        path = tmpl;

        unsetenv("LOGWARDEN_TOKEN");
        unsetenv("AGENT_TOKEN");
    }

    void TearDown() override {
        unlink(path.c_str());
        unsetenv("LOGWARDEN_TOKEN");
        unsetenv("AGENT_TOKEN");
    }

    void Write(const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }
};

// Test 1: Missing file gives defaults
TEST_F(AgentConfigTest, MissingFileUsesDefaults) {
    AgentConfig config;
    ASSERT_TRUE(LoadAgentConfig("/nonexistent/logwarden.conf", config));

    EXPECT_EQ(config.rate_threshold, 80);
    EXPECT_EQ(config.rate_window_seconds, 10);
    EXPECT_EQ(config.scan_threshold, 20);
    EXPECT_EQ(config.block_minutes, 30);
    EXPECT_EQ(config.control_port, 9876);
    EXPECT_EQ(config.monitored_port, 80);
    EXPECT_FALSE(config.instance_id.empty());
    EXPECT_FALSE(config.log_paths.empty());
}

// Test 2: Sections and keys override defaults
TEST_F(AgentConfigTest, ParsesSections) {
    Write(R"(
# comment
[agent]
dashboard_url = https://dash.example
instance_id = web-01
heartbeat_interval = 30

[logs]
paths = /var/log/a.log, /var/log/b.log
format = nginx-json

[detection]
rate_threshold = 200
scan_threshold = 5

[response]
block_minutes = 60

[firewall]
backend = iptables
monitored_port = 443

[control]
port = 7000
token = s3cret

[logging]
enable_detailed_logging = true
)");

    AgentConfig config;
    ASSERT_TRUE(LoadAgentConfig(path, config));

    EXPECT_EQ(config.dashboard_url, "https://dash.example");
    EXPECT_EQ(config.instance_id, "web-01");
    EXPECT_EQ(config.heartbeat_interval_seconds, 30);
    EXPECT_EQ(config.log_paths, (std::vector<std::string>{"/var/log/a.log", "/var/log/b.log"}));
    EXPECT_EQ(config.tail_format, LogDialect::NGINX_JSON);
    EXPECT_EQ(config.rate_threshold, 200);
    EXPECT_EQ(config.scan_threshold, 5);
    EXPECT_EQ(config.block_minutes, 60);
    EXPECT_EQ(config.firewall_backend, "iptables");
    EXPECT_EQ(config.monitored_port, 443);
    EXPECT_EQ(config.control_port, 7000);
    EXPECT_EQ(config.control_token, "s3cret");
    EXPECT_TRUE(config.detailed_logging);
}

// Test 3: Unparsable values fail the load
TEST_F(AgentConfigTest, RejectsInvalidValues) {
    AgentConfig config;

    Write("[detection]\nrate_threshold = lots\n");
    EXPECT_FALSE(LoadAgentConfig(path, config));

    Write("[detection]\nrate_threshold = -5\n");
    EXPECT_FALSE(LoadAgentConfig(path, config));

    Write("[logs]\nformat = w3c\n");
    EXPECT_FALSE(LoadAgentConfig(path, config));

    Write("[firewall]\nbackend = pf\n");
    EXPECT_FALSE(LoadAgentConfig(path, config));

    Write("[control]\nport = 70000\n");
    EXPECT_FALSE(LoadAgentConfig(path, config));
}

// Test 4: Environment token overrides the file
TEST_F(AgentConfigTest, EnvironmentToken) {
    Write("[control]\ntoken = from-file\n");

    setenv("AGENT_TOKEN", "legacy", 1);
    AgentConfig legacy;
    ASSERT_TRUE(LoadAgentConfig(path, legacy));
    EXPECT_EQ(legacy.control_token, "legacy");

    setenv("LOGWARDEN_TOKEN", "from-env", 1);
    AgentConfig config;
    ASSERT_TRUE(LoadAgentConfig(path, config));
    EXPECT_EQ(config.control_token, "from-env");
}

// Test 5: The public view never carries the token
TEST_F(AgentConfigTest, JsonOmitsToken) {
    AgentConfig config;
    config.control_token = "s3cret";

    auto j = AgentConfigToJson(config);
    EXPECT_FALSE(j.dump().find("s3cret") != std::string::npos);
    EXPECT_EQ(j["rateThreshold"], 80);
    EXPECT_EQ(j["tailFormat"], "apache-clf");
    EXPECT_EQ(j["blockMinutes"], 30);
}

// Test 6: A valid patch is applied field by field
TEST_F(AgentConfigTest, MergeApplies) {
    AgentConfig config;
    std::string error;

    ASSERT_TRUE(MergeAgentConfig(config, {
        {"rateThreshold", 150},
        {"blockMinutes", 5},
        {"autoUpdate", false},
        {"logPaths", nlohmann::json::array({"/srv/www/access.log"})},
        {"tailFormat", "nginx"},
        {"somethingElse", "ignored"}
    }, error)) << error;

    EXPECT_EQ(config.rate_threshold, 150);
    EXPECT_EQ(config.block_minutes, 5);
    EXPECT_FALSE(config.auto_update);
    EXPECT_EQ(config.log_paths, (std::vector<std::string>{"/srv/www/access.log"}));
    EXPECT_EQ(config.tail_format, LogDialect::NGINX);
    EXPECT_EQ(config.scan_threshold, 20);
}

// Test 7: One bad field rejects the whole patch
TEST_F(AgentConfigTest, MergeIsAllOrNothing) {
    AgentConfig config;
    std::string error;

    EXPECT_FALSE(MergeAgentConfig(config, {{"rateThreshold", 150}, {"blockMinutes", "soon"}}, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(config.rate_threshold, 80);

    EXPECT_FALSE(MergeAgentConfig(config, {{"monitoredPort", 0}}, error));
    EXPECT_FALSE(MergeAgentConfig(config, {{"logPaths", "/one/path"}}, error));
    EXPECT_FALSE(MergeAgentConfig(config, {{"tailFormat", "iis"}}, error));
    EXPECT_FALSE(MergeAgentConfig(config, nlohmann::json::array(), error));
    EXPECT_EQ(config.monitored_port, 80);
}

// Test 8: Store notifies listeners with the merged config
TEST_F(AgentConfigTest, StoreNotifiesListeners) {
    ConfigStore store{AgentConfig()};
    int notified = 0;
    int seen_threshold = 0;
    store.OnChange([&](const AgentConfig& updated) {
        notified++;
        seen_threshold = updated.rate_threshold;
    });

    std::string error;
    AgentConfig merged;
    ASSERT_TRUE(store.Merge({{"rateThreshold", 42}}, error, &merged));
    EXPECT_EQ(merged.rate_threshold, 42);
    EXPECT_EQ(store.Get().rate_threshold, 42);
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(seen_threshold, 42);

    EXPECT_FALSE(store.Merge({{"rateThreshold", "x"}}, error));
    EXPECT_EQ(notified, 1);
}
