#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace np::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<UsenetProviderConfig> {
    static Node encode(const UsenetProviderConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["ssl"] = rhs.use_tls;
        node["username"] = rhs.username;
        node["password"] = rhs.password;
        node["connections"] = rhs.max_connections;
        node["enabled"] = rhs.enabled;
        return node;
    }

    static bool decode(const Node& node, UsenetProviderConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("");
        rhs.name = node["name"].as<std::string>(rhs.host);
        rhs.use_tls = node["ssl"].as<bool>(true);
        rhs.port = node["port"].as<uint16_t>(rhs.use_tls ? 563 : 119);
        rhs.username = node["username"].as<std::string>("");
        rhs.password = node["password"].as<std::string>("");
        rhs.max_connections = node["connections"].as<unsigned int>(8);
        rhs.enabled = node["enabled"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<HealthCheckConfig> {
    static Node encode(const HealthCheckConfig& rhs) {
        Node node;
        node["sample_budget"] = rhs.sample_budget;
        node["fetch_timeout_seconds"] = rhs.fetch_timeout.count();
        node["probe_timeout_seconds"] = rhs.probe_timeout.count();
        node["use_pool"] = rhs.use_pool;
        return node;
    }

    static bool decode(const Node& node, HealthCheckConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sample_budget = node["sample_budget"].as<unsigned int>(3);
        rhs.fetch_timeout = std::chrono::seconds(node["fetch_timeout_seconds"].as<unsigned int>(60));
        rhs.probe_timeout = std::chrono::seconds(node["probe_timeout_seconds"].as<unsigned int>(20));
        rhs.use_pool = node["use_pool"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["newsprobe"] = to_std_string(spdlog::level::to_string_view(rhs.newsprobe));
        node["nzb"]       = to_std_string(spdlog::level::to_string_view(rhs.nzb));
        node["nntp"]      = to_std_string(spdlog::level::to_string_view(rhs.nntp));
        node["health"]    = to_std_string(spdlog::level::to_string_view(rhs.health));
        node["http"]      = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.newsprobe = spdlog::level::from_str(node["newsprobe"].as<std::string>("info"));
        rhs.nzb = spdlog::level::from_str(node["nzb"].as<std::string>("warn"));
        rhs.nntp = spdlog::level::from_str(node["nntp"].as<std::string>("warn"));
        rhs.health = spdlog::level::from_str(node["health"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(DEFAULT_LOG_DIR);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
