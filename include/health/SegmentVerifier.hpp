#pragma once

#include "concurrency/Context.hpp"
#include "config/Config.hpp"
#include "health/ProviderProbe.hpp"
#include "nntp/Pool.hpp"
#include "nntp/StatClient.hpp"

#include <memory>
#include <string>
#include <vector>

namespace np::health {

/**
 * Checks a batch of message-ids against the configured providers.
 *
 * Each segment is checked independently on a per-call worker pool sized by
 * the providers' connection limits. A segment counts as present as soon as
 * one source confirms it (pool first when enabled, then each provider in
 * order); anything not confirmed is reported missing.
 */
class SegmentVerifier {
public:
    struct Options {
        nntp::Dialer dialer;
        std::shared_ptr<nntp::PoolManager> pool_manager;
        bool use_pool = false;
        unsigned int max_workers = 0; // 0 = derived from provider connection limits
    };

    explicit SegmentVerifier(Options options);

    // Returns the ids that no source confirmed, in input order. Throws
    // ConfigError without usable providers and CancellationError when ctx
    // is done before every segment was answered.
    std::vector<std::string> verifyAll(const concurrency::Context& ctx,
                                       const std::vector<std::string>& segmentIds,
                                       const std::vector<config::UsenetProviderConfig>& providers,
                                       const std::vector<std::string>& groups = {}) const;

    [[nodiscard]] static unsigned int workerCount(size_t segments,
                                                  const std::vector<config::UsenetProviderConfig>& providers);

private:
    std::shared_ptr<ProviderProbe> poolProbe() const;

    Options options_;
};

}
