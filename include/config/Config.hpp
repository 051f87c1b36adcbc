#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace np::config {

constexpr static auto DEFAULT_CONFIG_PATH = "/etc/newsprobe/config.yaml";
constexpr static auto DEFAULT_LOG_DIR = "/var/log/newsprobe";

struct UsenetProviderConfig {
    std::string name;
    std::string host;
    uint16_t port = 563;
    bool use_tls = true;
    std::string username;
    std::string password;
    unsigned int max_connections = 8;
    bool enabled = true;

    // Enabled with a non-blank host; only these take part in checks.
    [[nodiscard]] bool usable() const;
};

struct HealthCheckConfig {
    unsigned int sample_budget = 3; // 0 = check every segment
    std::chrono::seconds fetch_timeout{60};
    std::chrono::seconds probe_timeout{20};
    bool use_pool = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum newsprobe = spdlog::level::info;   // Process start/stop, CLI
    spdlog::level::level_enum nzb       = spdlog::level::warn;   // Malformed documents
    spdlog::level::level_enum nntp      = spdlog::level::warn;   // Connect/auth failures, not every STAT
    spdlog::level::level_enum health    = spdlog::level::info;   // One line per check
    spdlog::level::level_enum http      = spdlog::level::warn;   // Fetch failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = DEFAULT_LOG_DIR;
    LogLevelsConfig levels;
};

struct Config {
    LoggingConfig logging;
    HealthCheckConfig health_check;
    std::vector<UsenetProviderConfig> usenet;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

std::vector<UsenetProviderConfig> usableProviders(const std::vector<UsenetProviderConfig>& providers);

} // namespace np::config
