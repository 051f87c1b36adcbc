#include "types/HealthCheckResult.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace np::types;

std::string np::types::to_string(const HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::MissingSegments: return "missing_segments";
        default: throw std::invalid_argument("Unknown HealthStatus enum value");
    }
}

HealthStatus np::types::health_status_from_string(const std::string& str) {
    if (str == "healthy") return HealthStatus::Healthy;
    if (str == "missing_segments") return HealthStatus::MissingSegments;
    throw std::invalid_argument("Invalid HealthStatus string: " + str);
}

void np::types::to_json(nlohmann::json& j, const HealthCheckResult& r) {
    j = {
        {"healthy", r.healthy},
        {"status", to_string(r.status)},
        {"total_segments", r.total_segments},
        {"checked_segments", r.checked_segments},
        {"missing_segments", r.missing_segments},
        {"sampled", r.sampled},
        {"file_name", r.file_name}
    };
}

void np::types::from_json(const nlohmann::json& j, HealthCheckResult& r) {
    r.healthy = j.at("healthy").get<bool>();
    r.status = health_status_from_string(j.at("status").get<std::string>());
    r.total_segments = j.at("total_segments").get<size_t>();
    r.checked_segments = j.at("checked_segments").get<size_t>();
    r.missing_segments = j.value("missing_segments", std::vector<std::string>{});
    r.sampled = j.value("sampled", false);
    r.file_name = j.value("file_name", std::string{});
}

std::string np::types::to_string(const HealthCheckResult& r) {
    return nlohmann::json(r).dump(2);
}
