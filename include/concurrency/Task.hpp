#pragma once

#include <future>
#include <optional>

namespace np::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Optional future for reporting
    virtual std::optional<std::future<void>> getFuture() { return std::nullopt; }
};

struct PromisedTask : Task {
    std::promise<void> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<void> p) : promise(std::move(p)) {}

    std::optional<std::future<void>> getFuture() override { return promise.get_future(); }
};

}
