#pragma once

#include "concurrency/Context.hpp"
#include "config/Config.hpp"
#include "health/SegmentVerifier.hpp"
#include "http/Fetcher.hpp"
#include "nntp/Pool.hpp"
#include "nntp/StatClient.hpp"
#include "types/HealthCheckResult.hpp"
#include "types/NZBCandidate.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace np::health {

/**
 * Answers "can this NZB be downloaded right now?".
 *
 * Fetches the NZB behind a search result, parses it, samples a few
 * segments (edges always included) and asks the configured providers
 * whether they still carry them. Collaborators are injected through
 * Options; anything left empty gets its production default.
 */
class HealthCheckService {
public:
    using ProviderSource = std::function<std::vector<config::UsenetProviderConfig>()>;
    using RngFactory = std::function<std::mt19937_64()>;

    struct Options {
        size_t sample_budget = 3; // 0 = check every segment
        std::chrono::milliseconds fetch_timeout{std::chrono::seconds(60)};
        std::chrono::milliseconds probe_timeout{std::chrono::seconds(20)};
        bool use_pool = false;

        ProviderSource providers;                      // default: ConfigRegistry
        std::shared_ptr<http::Fetcher> fetcher;        // default: CurlFetcher
        nntp::Dialer dialer;                           // default: nntp::Client::dialer(probe_timeout)
        std::shared_ptr<nntp::PoolManager> pool_manager;
        RngFactory rng_factory;                        // default: random_device seeded

        static Options fromConfig(const config::Config& cfg);
    };

    HealthCheckService();
    explicit HealthCheckService(Options options);

    types::HealthCheckResult checkHealth(const concurrency::Context& ctx, const types::NZBCandidate& candidate) const;

    // Same pipeline on an already downloaded NZB. A blank fileName is derived
    // from the candidate's URL or title.
    types::HealthCheckResult checkHealthWithNZB(const concurrency::Context& ctx,
                                                const types::NZBCandidate& candidate,
                                                std::string_view nzbBytes,
                                                const std::string& fileName = "") const;

    [[nodiscard]] const Options& options() const { return options_; }

private:
    std::vector<config::UsenetProviderConfig> loadProviders() const;

    types::HealthCheckResult evaluate(const concurrency::Context& ctx,
                                      const std::vector<config::UsenetProviderConfig>& providers,
                                      const types::NZBCandidate& candidate,
                                      std::string_view nzbBytes,
                                      const std::string& fileName,
                                      std::chrono::steady_clock::time_point start) const;

    Options options_;
    SegmentVerifier verifier_;
};

// Trimmed download_url, else trimmed link, else "".
std::string resolveDownloadUrl(const types::NZBCandidate& candidate);

// Content-Disposition filename, else last URL path segment, else the
// sanitised title, else "newsprobe"; ".nzb" appended when missing.
std::string deriveNzbFileName(std::string_view contentDisposition, std::string_view url, std::string_view title);

std::string ensureNzbExtension(std::string name);

}
