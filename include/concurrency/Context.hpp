#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace np::concurrency {

struct CancellationError : std::runtime_error {
    CancellationError(const std::string& what, const bool deadlineExceeded)
        : std::runtime_error(what), deadline_exceeded(deadlineExceeded) {}

    bool deadline_exceeded;
};

/**
 * Cancellation and deadline handle threaded through every blocking call.
 *
 * Copies share state. A derived context (withCancel / withTimeout) observes
 * cancellation of its parent and the earliest deadline in the chain, while
 * cancelling a derived context leaves the parent untouched.
 */
class Context {
public:
    using clock = std::chrono::steady_clock;

    Context();

    [[nodiscard]] Context withCancel() const;
    [[nodiscard]] Context withTimeout(std::chrono::milliseconds timeout) const;
    [[nodiscard]] Context withDeadline(clock::time_point deadline) const;

    void cancel() const noexcept;

    [[nodiscard]] bool cancelled() const noexcept;
    [[nodiscard]] bool deadlineExceeded() const noexcept;
    [[nodiscard]] bool done() const noexcept { return cancelled() || deadlineExceeded(); }

    [[nodiscard]] std::optional<clock::time_point> deadline() const noexcept;

    // Time left before the deadline, capped at `cap`; zero once expired.
    [[nodiscard]] std::chrono::milliseconds remaining(std::chrono::milliseconds cap) const noexcept;

    // Throws CancellationError naming `what` when the context is done.
    void throwIfDone(std::string_view what) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<clock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

}
