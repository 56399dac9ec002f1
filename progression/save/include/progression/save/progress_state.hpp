#pragma once

#include <progression/counters/counter_store.hpp>
#include <progression/achievements/achievement_manager.hpp>
#include <progression/collections/collection_manager.hpp>
#include <string>
#include <unordered_map>

namespace progression::save {

// Mutable progression state at one point in time. Definitions are not part
// of it; they come from configuration and are matched by id on load.
struct ProgressState {
    counters::CounterStore::Snapshot counters;
    std::unordered_map<std::string, achievements::AchievementState> achievements;
    std::unordered_map<std::string, collections::CollectionState> collections;

    bool empty() const { return counters.empty() && achievements.empty() && collections.empty(); }

    bool operator==(const ProgressState& other) const = default;
};

} // namespace progression::save
