#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace np::config {

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["health_check"]) YAML::convert<HealthCheckConfig>::decode(node, cfg.health_check);

    if (auto node = root["usenet"]) {
        if (!node.IsSequence()) throw std::runtime_error("Config key 'usenet' must be a list of providers");
        for (const auto& entry : node) {
            UsenetProviderConfig provider;
            if (!YAML::convert<UsenetProviderConfig>::decode(entry, provider))
                throw std::runtime_error("Each 'usenet' entry must be a mapping");
            cfg.usenet.push_back(std::move(provider));
        }
    }

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error(fmt::format("Config file not found: {}", path.string()));

    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config: {}", e.what()));
    }
}

bool UsenetProviderConfig::usable() const {
    return enabled && std::ranges::any_of(host, [](const unsigned char c) { return !std::isspace(c); });
}

std::vector<UsenetProviderConfig> usableProviders(const std::vector<UsenetProviderConfig>& providers) {
    std::vector<UsenetProviderConfig> out;
    out.reserve(providers.size());
    for (const auto& p : providers)
        if (p.usable()) out.push_back(p);
    return out;
}

} // namespace np::config
