#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "health/HealthCheckService.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace np::config;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path tmpFile;

    void TearDown() override {
        if (!tmpFile.empty()) fs::remove(tmpFile);
    }

    fs::path writeTemp(const std::string& content) {
        tmpFile = fs::temp_directory_path() / ("newsprobe_config_" + std::to_string(::getpid()) + ".yaml");
        std::ofstream(tmpFile) << content;
        return tmpFile;
    }
};

TEST_F(ConfigTest, FullDocument) {
    const auto cfg = loadConfigFromString(R"(
logging:
  log_dir: /tmp/newsprobe-logs
  log_levels:
    console_log_level: debug
    file_log_level: error
    subsystem_levels:
      nntp: trace
health_check:
  sample_budget: 5
  fetch_timeout_seconds: 15
  probe_timeout_seconds: 7
  use_pool: true
usenet:
  - name: Primary
    host: news.example.com
    port: 443
    ssl: true
    username: user
    password: secret
    connections: 30
  - name: Backup
    host: backup.example.net
    ssl: false
    enabled: false
)");

    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/newsprobe-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.nntp, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.health, spdlog::level::info);

    EXPECT_EQ(cfg.health_check.sample_budget, 5u);
    EXPECT_EQ(cfg.health_check.fetch_timeout, std::chrono::seconds(15));
    EXPECT_EQ(cfg.health_check.probe_timeout, std::chrono::seconds(7));
    EXPECT_TRUE(cfg.health_check.use_pool);

    ASSERT_EQ(cfg.usenet.size(), 2u);
    EXPECT_EQ(cfg.usenet[0].name, "Primary");
    EXPECT_EQ(cfg.usenet[0].port, 443);
    EXPECT_TRUE(cfg.usenet[0].use_tls);
    EXPECT_EQ(cfg.usenet[0].username, "user");
    EXPECT_EQ(cfg.usenet[0].password, "secret");
    EXPECT_EQ(cfg.usenet[0].max_connections, 30u);
    EXPECT_TRUE(cfg.usenet[0].enabled);

    EXPECT_FALSE(cfg.usenet[1].use_tls);
    EXPECT_EQ(cfg.usenet[1].port, 119);
    EXPECT_FALSE(cfg.usenet[1].enabled);
}

TEST_F(ConfigTest, MissingKeysFallBackToDefaults) {
    const auto cfg = loadConfigFromString("usenet:\n  - host: news.example.com\n");

    EXPECT_EQ(cfg.health_check.sample_budget, 3u);
    EXPECT_EQ(cfg.health_check.fetch_timeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.health_check.probe_timeout, std::chrono::seconds(20));
    EXPECT_FALSE(cfg.health_check.use_pool);
    EXPECT_EQ(cfg.logging.log_dir.string(), DEFAULT_LOG_DIR);

    ASSERT_EQ(cfg.usenet.size(), 1u);
    EXPECT_EQ(cfg.usenet[0].name, "news.example.com");
    EXPECT_EQ(cfg.usenet[0].port, 563);
    EXPECT_TRUE(cfg.usenet[0].use_tls);
    EXPECT_EQ(cfg.usenet[0].max_connections, 8u);
}

TEST_F(ConfigTest, EmptyDocumentIsAllDefaults) {
    const auto cfg = loadConfigFromString("");
    EXPECT_TRUE(cfg.usenet.empty());
    EXPECT_EQ(cfg.health_check.sample_budget, 3u);
}

TEST_F(ConfigTest, MalformedDocumentsThrow) {
    EXPECT_THROW(loadConfigFromString("usenet: [unclosed"), std::runtime_error);
    EXPECT_THROW(loadConfigFromString("- just\n- a list\n"), std::runtime_error);
    EXPECT_THROW(loadConfigFromString("usenet:\n  host: not-a-list\n"), std::runtime_error);
    EXPECT_THROW(loadConfigFromString("usenet:\n  - plain string\n"), std::runtime_error);
}

TEST_F(ConfigTest, LoadConfigFromFile) {
    const auto path = writeTemp("health_check:\n  sample_budget: 9\n");
    EXPECT_EQ(loadConfig(path).health_check.sample_budget, 9u);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig("/nonexistent/newsprobe/config.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, UsableProvidersFiltersDisabledAndBlankHosts) {
    UsenetProviderConfig a, b, c, d;
    a.name = "a"; a.host = "a.example.com";
    b.name = "b"; b.host = "b.example.com"; b.enabled = false;
    c.name = "c"; c.host = " \t ";
    d.name = "d"; d.host = "d.example.com";

    const auto usable = usableProviders({a, b, c, d});

    ASSERT_EQ(usable.size(), 2u);
    EXPECT_EQ(usable[0].name, "a");
    EXPECT_EQ(usable[1].name, "d");
}

TEST_F(ConfigTest, ServiceOptionsFollowConfig) {
    auto cfg = loadConfigFromString(R"(
health_check:
  sample_budget: 0
  fetch_timeout_seconds: 5
  probe_timeout_seconds: 2
  use_pool: true
usenet:
  - host: news.example.com
)");

    const auto o = np::health::HealthCheckService::Options::fromConfig(cfg);

    EXPECT_EQ(o.sample_budget, 0u);
    EXPECT_EQ(o.fetch_timeout, std::chrono::seconds(5));
    EXPECT_EQ(o.probe_timeout, std::chrono::seconds(2));
    EXPECT_TRUE(o.use_pool);
    ASSERT_NE(o.pool_manager, nullptr);
    EXPECT_TRUE(o.pool_manager->hasPool());
    EXPECT_TRUE(static_cast<bool>(o.dialer));
}

TEST(ConfigRegistryTest, GetAfterInit) {
    Config cfg;
    cfg.health_check.sample_budget = 11;
    ConfigRegistry::init(cfg);

    ASSERT_TRUE(ConfigRegistry::isInitialized());
    // init is once-only, so a second call keeps the first value
    Config other;
    other.health_check.sample_budget = 99;
    ConfigRegistry::init(other);
    EXPECT_EQ(ConfigRegistry::get().health_check.sample_budget, 11u);
}
