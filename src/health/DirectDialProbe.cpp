#include "health/ProviderProbe.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace np::health;
using np::concurrency::Context;
using np::log::Registry;

DirectDialProbe::DirectDialProbe(config::UsenetProviderConfig provider, nntp::Dialer dialer)
    : provider_(std::move(provider)), dialer_(std::move(dialer)) {
    if (!dialer_) throw std::invalid_argument("DirectDialProbe requires a dialer");
}

ProbeOutcome DirectDialProbe::checkAvailability(const Context& ctx,
                                                const std::string& messageId,
                                                const std::vector<std::string>&) {
    ctx.throwIfDone("direct stat");

    std::unique_ptr<nntp::StatClient> conn;
    try {
        conn = dialer_(ctx, provider_);
        if (!conn) {
            Registry::health()->warn("[DirectDialProbe] Dialer returned no connection for {}", provider_.name);
            return ProbeOutcome::Inconclusive;
        }

        const bool present = conn->checkArticle(ctx, messageId);
        conn->close();
        return present ? ProbeOutcome::Present : ProbeOutcome::Absent;
    } catch (const CancellationError&) {
        if (conn) conn->close();
        throw;
    } catch (const nntp::NntpError& e) {
        if (conn) conn->close();
        if (ctx.done()) ctx.throwIfDone("direct stat");
        if (e.code != 0)
            Registry::health()->debug("[DirectDialProbe] {} on {} -> unexpected status {}", messageId, provider_.name, e.code);
        else
            Registry::health()->debug("[DirectDialProbe] {} on {} failed: {}", messageId, provider_.name, e.what());
        return ProbeOutcome::Inconclusive;
    } catch (const std::exception& e) {
        if (conn) conn->close();
        if (ctx.done()) ctx.throwIfDone("direct stat");
        Registry::health()->debug("[DirectDialProbe] {} on {} failed: {}", messageId, provider_.name, e.what());
        return ProbeOutcome::Inconclusive;
    }
}
