#include "health/SegmentVerifier.hpp"
#include "health/errors.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/Task.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_set>

using namespace np::health;
using np::concurrency::Context;
using np::log::Registry;

namespace {

struct MissingCollector {
    std::mutex mtx;
    std::unordered_set<std::string> ids;

    void add(const std::string& id) {
        std::scoped_lock lock(mtx);
        ids.insert(id);
    }
};

struct SegmentCheckTask : np::concurrency::PromisedTask {
    SegmentCheckTask(Context ctx,
                     std::string messageId,
                     std::shared_ptr<ProviderProbe> poolProbe,
                     std::shared_ptr<const std::vector<std::shared_ptr<ProviderProbe>>> directProbes,
                     std::shared_ptr<const std::vector<std::string>> groups,
                     std::shared_ptr<MissingCollector> missing)
        : ctx(std::move(ctx)),
          messageId(std::move(messageId)),
          poolProbe(std::move(poolProbe)),
          directProbes(std::move(directProbes)),
          groups(std::move(groups)),
          missing(std::move(missing)) {}

    void operator()() override {
        try {
            check();
            promise.set_value();
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }

private:
    void check() const {
        ctx.throwIfDone("segment check");

        if (poolProbe) {
            switch (poolProbe->checkAvailability(ctx, messageId, *groups)) {
                case ProbeOutcome::Present: return;
                case ProbeOutcome::Absent:
                    missing->add(messageId);
                    return;
                case ProbeOutcome::Inconclusive: break;
            }
        }

        for (const auto& probe : *directProbes)
            if (probe->checkAvailability(ctx, messageId, *groups) == ProbeOutcome::Present) return;

        missing->add(messageId);
    }

    Context ctx;
    std::string messageId;
    std::shared_ptr<ProviderProbe> poolProbe;
    std::shared_ptr<const std::vector<std::shared_ptr<ProviderProbe>>> directProbes;
    std::shared_ptr<const std::vector<std::string>> groups;
    std::shared_ptr<MissingCollector> missing;
};

}

SegmentVerifier::SegmentVerifier(Options options) : options_(std::move(options)) {
    if (!options_.dialer) throw std::invalid_argument("SegmentVerifier requires a dialer");
}

unsigned int SegmentVerifier::workerCount(const size_t segments,
                                          const std::vector<config::UsenetProviderConfig>& providers) {
    size_t capacity = 0;
    for (const auto& p : providers) capacity += std::max(1u, p.max_connections);
    return static_cast<unsigned int>(std::max<size_t>(1, std::min(segments, capacity)));
}

std::shared_ptr<ProviderProbe> SegmentVerifier::poolProbe() const {
    if (!options_.use_pool || !options_.pool_manager || !options_.pool_manager->hasPool()) return nullptr;

    try {
        return std::make_shared<PoolBackedProbe>(options_.pool_manager->getPool());
    } catch (const std::exception& e) {
        Registry::health()->warn("[SegmentVerifier] Connection pool unavailable, dialling providers directly: {}", e.what());
        return nullptr;
    }
}

std::vector<std::string> SegmentVerifier::verifyAll(const Context& ctx,
                                                    const std::vector<std::string>& segmentIds,
                                                    const std::vector<config::UsenetProviderConfig>& providers,
                                                    const std::vector<std::string>& groups) const {
    const auto usable = config::usableProviders(providers);
    if (usable.empty()) throw ConfigError("no usenet providers are enabled");

    std::vector<std::string> ids;
    ids.reserve(segmentIds.size());
    {
        std::unordered_set<std::string> seen;
        for (const auto& id : segmentIds)
            if (seen.insert(id).second) ids.push_back(id);
    }
    if (ids.empty()) return {};

    ctx.throwIfDone("verify segments");

    auto direct = std::make_shared<std::vector<std::shared_ptr<ProviderProbe>>>();
    direct->reserve(usable.size());
    for (const auto& p : usable) direct->push_back(std::make_shared<DirectDialProbe>(p, options_.dialer));

    const auto pool = poolProbe();
    const auto sharedGroups = std::make_shared<std::vector<std::string>>(groups);
    const auto missing = std::make_shared<MissingCollector>();

    const auto workers = options_.max_workers ? std::min(options_.max_workers, static_cast<unsigned int>(ids.size()))
                                              : workerCount(ids.size(), usable);

    // Child context so a failing task can stop its siblings
    const auto callCtx = ctx.withCancel();

    std::vector<std::future<void>> futures;
    futures.reserve(ids.size());

    concurrency::ThreadPool threads(workers);
    for (const auto& id : ids) {
        auto task = std::make_shared<SegmentCheckTask>(callCtx, id, pool, direct, sharedGroups, missing);
        futures.push_back(*task->getFuture());
        threads.submit(task);
    }

    std::exception_ptr firstError;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception&) {
            if (!firstError) {
                firstError = std::current_exception();
                callCtx.cancel();
            }
        }
    }
    threads.stop();

    if (firstError) std::rethrow_exception(firstError);

    // A cancellation that raced the last task still voids the result
    ctx.throwIfDone("verify segments");

    std::vector<std::string> result;
    for (const auto& id : ids)
        if (missing->ids.count(id)) result.push_back(id);

    Registry::health()->debug("[SegmentVerifier] {} of {} segments unconfirmed across {} provider(s), {} worker(s){}",
                              result.size(), ids.size(), usable.size(), workers, pool ? ", pool first" : "");
    return result;
}
