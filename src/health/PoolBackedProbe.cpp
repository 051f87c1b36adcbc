#include "health/ProviderProbe.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace np::health;
using np::concurrency::Context;
using np::log::Registry;

std::string np::health::to_string(const ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Present: return "present";
        case ProbeOutcome::Absent: return "absent";
        case ProbeOutcome::Inconclusive: return "inconclusive";
    }
    return "unknown";
}

PoolBackedProbe::PoolBackedProbe(std::shared_ptr<nntp::Pool> pool) : pool_(std::move(pool)) {
    if (!pool_) throw std::invalid_argument("PoolBackedProbe requires a pool");
}

ProbeOutcome PoolBackedProbe::checkAvailability(const Context& ctx,
                                                const std::string& messageId,
                                                const std::vector<std::string>& groups) {
    ctx.throwIfDone("pool stat");

    try {
        const int code = pool_->stat(ctx, messageId, groups);
        if (code == nntp::ARTICLE_EXISTS) return ProbeOutcome::Present;

        // A bare 430 from the pool only speaks for one connection
        Registry::health()->debug("[PoolBackedProbe] {} -> status {}, falling back", messageId, code);
        return ProbeOutcome::Inconclusive;
    } catch (const nntp::ArticleNotFoundInProviders&) {
        return ProbeOutcome::Absent;
    } catch (const CancellationError&) {
        throw;
    } catch (const std::exception& e) {
        if (ctx.done()) ctx.throwIfDone("pool stat");
        Registry::health()->debug("[PoolBackedProbe] {} -> {}", messageId, e.what());
        return ProbeOutcome::Inconclusive;
    }
}
