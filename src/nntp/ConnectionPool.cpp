#include "nntp/ConnectionPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <exception>
#include <fmt/format.h>

using namespace np::nntp;
using np::concurrency::CancellationError;
using np::concurrency::Context;
using np::log::Registry;

namespace {

constexpr std::chrono::milliseconds ACQUIRE_POLL{50};

}

ConnectionPool::ConnectionPool(std::vector<config::UsenetProviderConfig> providers, Dialer dialer)
    : dialer_(std::move(dialer)) {
    if (!dialer_) throw std::invalid_argument("ConnectionPool requires a dialer");

    slots_.reserve(providers.size());
    for (auto& p : providers) slots_.push_back(std::make_unique<Slot>(std::move(p)));
}

ConnectionPool::~ConnectionPool() {
    close();
}

void ConnectionPool::close() {
    for (auto& slot : slots_) {
        std::vector<std::unique_ptr<StatClient>> idle;
        {
            std::lock_guard lock(slot->mtx);
            slot->closed = true;
            idle.swap(slot->idle);
            slot->open -= idle.size();
        }
        slot->cv.notify_all();
        for (auto& conn : idle) conn->close();
    }
}

size_t ConnectionPool::idleConnections(const size_t provider) const {
    const auto& slot = slots_.at(provider);
    std::lock_guard lock(slot->mtx);
    return slot->idle.size();
}

size_t ConnectionPool::openConnections(const size_t provider) const {
    const auto& slot = slots_.at(provider);
    std::lock_guard lock(slot->mtx);
    return slot->open;
}

std::unique_ptr<StatClient> ConnectionPool::acquire(const Context& ctx, Slot& slot) {
    const size_t limit = std::max<size_t>(1, slot.config.max_connections);

    {
        std::unique_lock lock(slot.mtx);
        while (true) {
            if (slot.closed) throw NntpError(0, fmt::format("pool for {} is closed", slot.config.name));
            if (!slot.idle.empty()) {
                auto conn = std::move(slot.idle.back());
                slot.idle.pop_back();
                return conn;
            }
            if (slot.open < limit) {
                ++slot.open;
                break;
            }

            lock.unlock();
            ctx.throwIfDone(fmt::format("acquire connection to {}", slot.config.name));
            lock.lock();
            slot.cv.wait_for(lock, ACQUIRE_POLL);
        }
    }

    // dial without holding the slot lock; the reserved slot is returned on failure
    try {
        auto conn = dialer_(ctx, slot.config);
        if (!conn) throw NntpError(0, fmt::format("dialer returned no connection for {}", slot.config.name));
        return conn;
    } catch (...) {
        {
            std::lock_guard lock(slot.mtx);
            --slot.open;
        }
        slot.cv.notify_one();
        throw;
    }
}

void ConnectionPool::release(Slot& slot, std::unique_ptr<StatClient> conn) {
    {
        std::lock_guard lock(slot.mtx);
        if (!slot.closed) {
            slot.idle.push_back(std::move(conn));
        } else {
            --slot.open;
        }
    }
    slot.cv.notify_one();
    if (conn) conn->close();
}

void ConnectionPool::discard(Slot& slot, std::unique_ptr<StatClient> conn) {
    if (conn) conn->close();
    {
        std::lock_guard lock(slot.mtx);
        --slot.open;
    }
    slot.cv.notify_one();
}

int ConnectionPool::stat(const Context& ctx, const std::string& messageId, const std::vector<std::string>& groups) {
    if (slots_.empty()) throw NntpError(0, "connection pool has no providers");

    size_t absent = 0;
    std::exception_ptr lastError;

    for (auto& slot : slots_) {
        std::unique_ptr<StatClient> conn;
        try {
            conn = acquire(ctx, *slot);
            const int code = conn->stat(ctx, messageId);

            if (code == ARTICLE_EXISTS) {
                release(*slot, std::move(conn));
                return code;
            }

            release(*slot, std::move(conn));
            if (isArticleMissing(code)) ++absent;
            else lastError = std::make_exception_ptr(
                NntpError(code, fmt::format("{}: unexpected STAT response {} for {}", slot->config.name, code, messageId)));
        } catch (const CancellationError&) {
            if (conn) discard(*slot, std::move(conn));
            throw;
        } catch (const std::exception& e) {
            if (conn) discard(*slot, std::move(conn));
            Registry::nntp()->debug("[ConnectionPool] STAT {} on {} failed: {}", messageId, slot->config.name, e.what());
            lastError = std::current_exception();
        }
    }

    if (absent == slots_.size()) {
        Registry::nntp()->trace("[ConnectionPool] {} absent from {} providers (groups: {})",
                                messageId, absent, groups.size());
        throw ArticleNotFoundInProviders(messageId);
    }

    std::rethrow_exception(lastError);
}

ConnectionPoolManager::ConnectionPoolManager(const std::vector<config::UsenetProviderConfig>& providers, Dialer dialer) {
    auto usable = config::usableProviders(providers);
    if (!usable.empty()) pool_ = std::make_shared<ConnectionPool>(std::move(usable), std::move(dialer));
}

std::shared_ptr<Pool> ConnectionPoolManager::getPool() {
    if (!pool_) throw std::runtime_error("no usenet connection pool configured");
    return pool_;
}
