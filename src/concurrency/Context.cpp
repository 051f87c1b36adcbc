#include "concurrency/Context.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace np::concurrency;

Context::Context() : state_(std::make_shared<State>()) {}

Context Context::withCancel() const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    return Context(std::move(child));
}

Context Context::withTimeout(const std::chrono::milliseconds timeout) const {
    return withDeadline(clock::now() + timeout);
}

Context Context::withDeadline(const clock::time_point deadline) const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    child->deadline = deadline;
    return Context(std::move(child));
}

void Context::cancel() const noexcept {
    state_->cancelled.store(true);
}

bool Context::cancelled() const noexcept {
    for (const State* s = state_.get(); s; s = s->parent.get())
        if (s->cancelled.load()) return true;
    return false;
}

bool Context::deadlineExceeded() const noexcept {
    const auto dl = deadline();
    return dl && clock::now() >= *dl;
}

std::optional<Context::clock::time_point> Context::deadline() const noexcept {
    std::optional<clock::time_point> earliest;
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (!s->deadline) continue;
        if (!earliest || *s->deadline < *earliest) earliest = s->deadline;
    }
    return earliest;
}

std::chrono::milliseconds Context::remaining(const std::chrono::milliseconds cap) const noexcept {
    const auto dl = deadline();
    if (!dl) return cap;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*dl - clock::now());
    return std::clamp(left, std::chrono::milliseconds::zero(), cap);
}

void Context::throwIfDone(const std::string_view what) const {
    if (cancelled()) throw CancellationError(fmt::format("{}: context cancelled", what), false);
    if (deadlineExceeded()) throw CancellationError(fmt::format("{}: context deadline exceeded", what), true);
}
