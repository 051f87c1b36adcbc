#pragma once

#include <cstddef>
#include <random>
#include <set>

namespace np::health {

struct SamplingPlan {
    std::set<size_t> indices;
    bool sampled = false;
};

class SamplingPlanner {
public:
    // Leading and trailing indices reserved in every sampled plan.
    static constexpr size_t kEdgeSlots = 1;

    // budget == 0 means no limit. When total <= budget every index is planned
    // and sampled is false; otherwise exactly `budget` distinct indices.
    static SamplingPlan plan(size_t total, size_t budget, std::mt19937_64& rng);
};

}
