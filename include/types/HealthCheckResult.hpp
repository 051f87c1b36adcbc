#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace np::types {

enum class HealthStatus { Healthy, MissingSegments };

std::string to_string(HealthStatus status);
HealthStatus health_status_from_string(const std::string& str);

struct HealthCheckResult {
    bool healthy{false};
    HealthStatus status{HealthStatus::MissingSegments};
    size_t total_segments{0};
    size_t checked_segments{0};
    std::vector<std::string> missing_segments;
    bool sampled{false};

    // Derived NZB file name, always ending in .nzb
    std::string file_name;
};

void to_json(nlohmann::json& j, const HealthCheckResult& r);
void from_json(const nlohmann::json& j, HealthCheckResult& r);

std::string to_string(const HealthCheckResult& r);

}
