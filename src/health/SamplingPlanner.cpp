#include "health/SamplingPlanner.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <unordered_map>

using namespace np::health;

SamplingPlan SamplingPlanner::plan(const size_t total, const size_t budget, std::mt19937_64& rng) {
    SamplingPlan plan;

    if (budget == 0 || total <= budget) {
        for (size_t i = 0; i < total; ++i) plan.indices.insert(i);
        return plan;
    }

    plan.sampled = true;

    // With a budget too small for both edges, the head wins over the tail.
    const size_t head = std::min(kEdgeSlots, (budget + 1) / 2);
    const size_t tail = std::min(kEdgeSlots, budget - head);

    for (size_t i = 0; i < head; ++i) plan.indices.insert(i);
    for (size_t i = 0; i < tail; ++i) plan.indices.insert(total - 1 - i);

    // Interior is [head, total - tail); total > budget guarantees it holds
    // at least budget - head - tail indices.
    const size_t interiorBegin = head;
    const size_t interiorSize = total - head - tail;
    const size_t needed = budget - plan.indices.size();

    // Partial Fisher-Yates over a virtual [0, interiorSize) range; only the
    // swapped slots are materialised so huge posts stay cheap.
    std::unordered_map<size_t, size_t> swapped;
    auto slot = [&](const size_t i) {
        const auto it = swapped.find(i);
        return it == swapped.end() ? i : it->second;
    };

    for (size_t i = 0; i < needed; ++i) {
        std::uniform_int_distribution<size_t> dist(i, interiorSize - 1);
        const size_t j = dist(rng);
        const size_t picked = slot(j);
        swapped[j] = slot(i);
        swapped[i] = picked;
        plan.indices.insert(interiorBegin + picked);
    }

    log::Registry::health()->debug("[SamplingPlanner] Sampled {} of {} segments", plan.indices.size(), total);
    return plan;
}
