#pragma once

#include "concurrency/Context.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace np::nntp {

// Every configured provider answered 430/423 for the article.
struct ArticleNotFoundInProviders : std::runtime_error {
    explicit ArticleNotFoundInProviders(const std::string& messageId)
        : std::runtime_error("article " + messageId + " not found in any provider"), message_id(messageId) {}

    std::string message_id;
};

/**
 * Shared multi-provider connection pool.
 *
 * stat() returns the NNTP status of the first provider that had the article,
 * throws ArticleNotFoundInProviders when all of them confirmed absence, and
 * throws anything else when the answer is unknown.
 */
class Pool {
public:
    virtual ~Pool() = default;

    virtual int stat(const concurrency::Context& ctx,
                     const std::string& messageId,
                     const std::vector<std::string>& groups) = 0;
};

class PoolManager {
public:
    virtual ~PoolManager() = default;

    // Throws when no pool is configured.
    virtual std::shared_ptr<Pool> getPool() = 0;

    [[nodiscard]] virtual bool hasPool() const = 0;
};

}
