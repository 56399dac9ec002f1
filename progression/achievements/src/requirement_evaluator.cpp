#include <progression/achievements/requirement_evaluator.hpp>
#include <algorithm>

namespace progression::achievements {

EvaluationResult evaluate_requirements(const std::vector<Requirement>& requirements,
                                       const counters::CounterStore& counters) {
    EvaluationResult result;
    result.satisfied = true;

    for (const auto& req : requirements) {
        int64_t current = counters.get(req.key);
        if (current < req.threshold) {
            result.satisfied = false;
        }
        result.progress = counters::saturating_add(result.progress, std::min(current, req.threshold));
        result.target = counters::saturating_add(result.target, req.threshold);
    }

    return result;
}

} // namespace progression::achievements
