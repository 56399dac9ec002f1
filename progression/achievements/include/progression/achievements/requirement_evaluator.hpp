#pragma once

#include <progression/achievements/achievement_definition.hpp>
#include <progression/counters/counter_store.hpp>
#include <vector>
#include <cstdint>

namespace progression::achievements {

// ============================================================================
// Requirement Evaluation
// ============================================================================

struct EvaluationResult {
    bool satisfied = false;     // Every counter reached its threshold
    int64_t progress = 0;       // Sum of min(current, threshold)
    int64_t target = 0;         // Sum of thresholds
};

// Pure function of the requirement set and the counters. The result does not
// depend on requirement order.
EvaluationResult evaluate_requirements(const std::vector<Requirement>& requirements,
                                       const counters::CounterStore& counters);

} // namespace progression::achievements
