#pragma once

#include "concurrency/Context.hpp"
#include "config/Config.hpp"
#include "nntp/Pool.hpp"
#include "nntp/StatClient.hpp"

#include <memory>
#include <string>
#include <vector>

namespace np::health {

enum class ProbeOutcome { Present, Absent, Inconclusive };

std::string to_string(ProbeOutcome outcome);

// Answers "does this provider (or pool) have the article?". Transient
// failures come back as Inconclusive; only cancellation throws.
class ProviderProbe {
public:
    virtual ~ProviderProbe() = default;

    virtual ProbeOutcome checkAvailability(const concurrency::Context& ctx,
                                           const std::string& messageId,
                                           const std::vector<std::string>& groups) = 0;
};

class PoolBackedProbe : public ProviderProbe {
public:
    explicit PoolBackedProbe(std::shared_ptr<nntp::Pool> pool);

    ProbeOutcome checkAvailability(const concurrency::Context& ctx,
                                   const std::string& messageId,
                                   const std::vector<std::string>& groups) override;

private:
    std::shared_ptr<nntp::Pool> pool_;
};

// One fresh connection per check: dial, STAT, close.
class DirectDialProbe : public ProviderProbe {
public:
    DirectDialProbe(config::UsenetProviderConfig provider, nntp::Dialer dialer);

    ProbeOutcome checkAvailability(const concurrency::Context& ctx,
                                   const std::string& messageId,
                                   const std::vector<std::string>& groups) override;

    [[nodiscard]] const config::UsenetProviderConfig& provider() const { return provider_; }

private:
    config::UsenetProviderConfig provider_;
    nntp::Dialer dialer_;
};

}
