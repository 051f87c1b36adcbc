#include "health/HealthCheckService.hpp"
#include "health/SamplingPlanner.hpp"
#include "health/errors.hpp"
#include "config/ConfigRegistry.hpp"
#include "http/CurlFetcher.hpp"
#include "nntp/Client.hpp"
#include "nntp/ConnectionPool.hpp"
#include "nzb/Parser.hpp"
#include "util/parse.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/chrono.h>
#include <fmt/format.h>

using namespace np::health;
using np::concurrency::Context;
using np::log::Registry;
using np::types::HealthCheckResult;
using np::types::HealthStatus;
using np::types::NZBCandidate;

namespace {

constexpr size_t MAX_ERROR_BODY = 2048;

HealthCheckService::Options withDefaults(HealthCheckService::Options o) {
    if (!o.providers)
        o.providers = [] { return np::config::ConfigRegistry::get().usenet; };

    if (!o.fetcher) o.fetcher = std::make_shared<np::http::CurlFetcher>();
    if (!o.dialer) o.dialer = np::nntp::Client::dialer(o.probe_timeout);

    if (!o.rng_factory)
        o.rng_factory = [] {
            std::random_device rd;
            std::seed_seq seed{rd(), rd(), rd(), rd()};
            return std::mt19937_64(seed);
        };

    return o;
}

}

HealthCheckService::Options HealthCheckService::Options::fromConfig(const config::Config& cfg) {
    Options o;
    o.sample_budget = cfg.health_check.sample_budget;
    o.fetch_timeout = cfg.health_check.fetch_timeout;
    o.probe_timeout = cfg.health_check.probe_timeout;
    o.use_pool = cfg.health_check.use_pool;
    o.dialer = nntp::Client::dialer(o.probe_timeout);

    if (o.use_pool) o.pool_manager = std::make_shared<nntp::ConnectionPoolManager>(cfg.usenet, o.dialer);

    return o;
}

HealthCheckService::HealthCheckService()
    : HealthCheckService(Options::fromConfig(config::ConfigRegistry::get())) {}

HealthCheckService::HealthCheckService(Options options)
    : options_(withDefaults(std::move(options))),
      verifier_({options_.dialer, options_.pool_manager, options_.use_pool}) {}

std::vector<np::config::UsenetProviderConfig> HealthCheckService::loadProviders() const {
    auto providers = config::usableProviders(options_.providers());
    if (providers.empty()) throw ConfigError("no enabled usenet providers configured");
    return providers;
}

HealthCheckResult HealthCheckService::checkHealth(const Context& ctx, const NZBCandidate& candidate) const {
    const auto start = std::chrono::steady_clock::now();
    const auto providers = loadProviders();

    const auto url = resolveDownloadUrl(candidate);
    if (url.empty()) throw FetchError("nzb result is missing a download URL");

    Registry::health()->info("[HealthCheckService] Health check start title=\"{}\" url=\"{}\"",
                             util::trim(candidate.title), url);

    const auto resp = options_.fetcher->get(ctx, url, options_.fetch_timeout);

    if (resp.status >= 400) {
        const auto body = util::trim(std::string_view(resp.body).substr(0, MAX_ERROR_BODY));
        Registry::http()->warn("[HealthCheckService] NZB download {} returned {}", url, resp.status);
        throw FetchError(fmt::format("nzb download failed with status {}: {}", resp.status, body), resp.status);
    }

    const auto fileName = deriveNzbFileName(resp.content_disposition, url, candidate.title);
    return evaluate(ctx, providers, candidate, resp.body, fileName, start);
}

HealthCheckResult HealthCheckService::checkHealthWithNZB(const Context& ctx,
                                                         const NZBCandidate& candidate,
                                                         const std::string_view nzbBytes,
                                                         const std::string& fileName) const {
    const auto start = std::chrono::steady_clock::now();
    const auto url = resolveDownloadUrl(candidate);

    Registry::health()->info("[HealthCheckService] Health check start title=\"{}\" url=\"{}\" (prefetched)",
                             util::trim(candidate.title), url);

    const auto providers = loadProviders();
    if (nzbBytes.empty()) throw ParseError("nzb payload is empty");

    const auto trimmedName = util::trim(fileName);
    const auto name = trimmedName.empty() ? deriveNzbFileName("", url, candidate.title)
                                          : ensureNzbExtension(trimmedName);

    return evaluate(ctx, providers, candidate, nzbBytes, name, start);
}

HealthCheckResult HealthCheckService::evaluate(const Context& ctx,
                                               const std::vector<config::UsenetProviderConfig>& providers,
                                               const NZBCandidate& candidate,
                                               const std::string_view nzbBytes,
                                               const std::string& fileName,
                                               const std::chrono::steady_clock::time_point start) const {
    const auto title = util::trim(candidate.title);
    const auto parsed = nzb::Parser::parse(nzbBytes);

    if (!parsed.subjects.empty())
        Registry::health()->info("[HealthCheckService] Files title=\"{}\" count={} list={}",
                                 title, parsed.subjects.size(), nzb::summarizeSubjects(parsed.subjects));

    auto rng = options_.rng_factory();
    const auto plan = SamplingPlanner::plan(parsed.total_segments, options_.sample_budget, rng);

    std::vector<std::string> planned;
    planned.reserve(plan.indices.size());
    for (const auto i : plan.indices) planned.push_back(parsed.segment_ids[i]);

    const auto missing = verifier_.verifyAll(ctx, planned, providers, parsed.groups);

    HealthCheckResult result;
    result.healthy = missing.empty();
    result.status = result.healthy ? HealthStatus::Healthy : HealthStatus::MissingSegments;
    result.total_segments = parsed.total_segments;
    result.checked_segments = planned.size();
    result.missing_segments = missing;
    result.sampled = plan.sampled;
    result.file_name = fileName;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Registry::health()->info(
        "[HealthCheckService] Health result title=\"{}\" status={} sampled={} checked={} total={} missing={} duration={} file=\"{}\"",
        title, types::to_string(result.status), result.sampled, result.checked_segments, result.total_segments,
        result.missing_segments.size(), elapsed, result.file_name);

    return result;
}

std::string np::health::resolveDownloadUrl(const NZBCandidate& candidate) {
    auto url = util::trim(candidate.download_url);
    if (url.empty()) url = util::trim(candidate.link);
    return url;
}

std::string np::health::ensureNzbExtension(std::string name) {
    if (!util::endsWithIgnoreCase(name, ".nzb")) name += ".nzb";
    return name;
}

std::string np::health::deriveNzbFileName(const std::string_view contentDisposition,
                                          const std::string_view url,
                                          const std::string_view title) {
    if (auto name = util::contentDispositionFileName(contentDisposition); !name.empty())
        return ensureNzbExtension(std::move(name));

    if (auto name = util::urlPathBasename(url); !name.empty())
        return ensureNzbExtension(std::move(name));

    std::string safe;
    for (const char c : util::trim(title)) {
        if (c == ' ') safe += '.';
        else if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_') safe += c;
    }
    if (!safe.empty()) return ensureNzbExtension(std::move(safe));

    return ensureNzbExtension("newsprobe");
}
