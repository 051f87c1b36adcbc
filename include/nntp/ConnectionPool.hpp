#pragma once

#include "nntp/Pool.hpp"
#include "nntp/StatClient.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace np::nntp {

// Per-provider idle connection queues, dialled on demand and bounded by
// max_connections. Safe for concurrent stat() calls.
class ConnectionPool : public Pool {
public:
    ConnectionPool(std::vector<config::UsenetProviderConfig> providers, Dialer dialer);
    ~ConnectionPool() override;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    int stat(const concurrency::Context& ctx,
             const std::string& messageId,
             const std::vector<std::string>& groups) override;

    void close();

    [[nodiscard]] size_t providerCount() const { return slots_.size(); }
    [[nodiscard]] size_t idleConnections(size_t provider) const;
    [[nodiscard]] size_t openConnections(size_t provider) const;

private:
    struct Slot {
        explicit Slot(config::UsenetProviderConfig cfg) : config(std::move(cfg)) {}

        config::UsenetProviderConfig config;
        mutable std::mutex mtx;
        std::condition_variable cv;
        std::vector<std::unique_ptr<StatClient>> idle;
        size_t open = 0;
        bool closed = false;
    };

    std::unique_ptr<StatClient> acquire(const concurrency::Context& ctx, Slot& slot);
    void release(Slot& slot, std::unique_ptr<StatClient> conn);
    void discard(Slot& slot, std::unique_ptr<StatClient> conn);

    std::vector<std::unique_ptr<Slot>> slots_;
    Dialer dialer_;
};

class ConnectionPoolManager : public PoolManager {
public:
    // An empty provider list leaves the manager without a pool.
    ConnectionPoolManager(const std::vector<config::UsenetProviderConfig>& providers, Dialer dialer);

    std::shared_ptr<Pool> getPool() override;
    [[nodiscard]] bool hasPool() const override { return pool_ != nullptr; }

private:
    std::shared_ptr<ConnectionPool> pool_;
};

}
