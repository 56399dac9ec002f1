#pragma once

#include <progression/achievements/achievement_definition.hpp>
#include <progression/achievements/achievement_events.hpp>
#include <progression/counters/counter_store.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace progression::achievements {

// ============================================================================
// Achievement State
// ============================================================================

enum class AchievementStatus : uint8_t {
    Locked,
    Unlocked,
    Claimed
};

const char* to_string(AchievementStatus status);

struct AchievementState {
    bool unlocked = false;
    bool claimed = false;
    bool grant_pending = false;     // Claimed, reward not yet confirmed
    std::optional<uint64_t> unlock_timestamp;
    int64_t progress = 0;

    AchievementStatus status() const {
        if (claimed) return AchievementStatus::Claimed;
        if (unlocked) return AchievementStatus::Unlocked;
        return AchievementStatus::Locked;
    }

    bool operator==(const AchievementState& other) const = default;
};

// claimed => unlocked, grant_pending => claimed
bool is_consistent(const AchievementState& state);

// ============================================================================
// Achievement Manager
// ============================================================================
//
// Owns the mutable state of every registered achievement and drives the
// Locked -> Unlocked -> Claimed state machine. Operations on unknown ids are
// no-ops. Unlocked achievements never return to Locked.

class AchievementManager {
public:
    explicit AchievementManager(const AchievementRegistry& registry);

    AchievementManager(const AchievementManager&) = delete;
    AchievementManager& operator=(const AchievementManager&) = delete;

    // ========================================================================
    // Evaluation
    // ========================================================================

    // Refreshes progress of a locked achievement and unlocks it when every
    // requirement is met. Returns the unlock event on transition.
    std::optional<AchievementUnlockedEvent> evaluate(const std::string& achievement_id,
                                                     const counters::CounterStore& counters,
                                                     uint64_t now);

    // Evaluates every locked achievement
    std::vector<AchievementUnlockedEvent> evaluate_all(const counters::CounterStore& counters, uint64_t now);

    // Evaluates locked achievements that read counter_key
    std::vector<AchievementUnlockedEvent> evaluate_dependents(const std::string& counter_key,
                                                              const counters::CounterStore& counters,
                                                              uint64_t now);

    // ========================================================================
    // Claiming
    // ========================================================================

    // Unlocked -> Claimed. Marks the reward grant pending and returns true on
    // transition; returns false (no-op) otherwise.
    bool begin_claim(const std::string& achievement_id);

    // Reward handed over successfully
    void complete_grant(const std::string& achievement_id);

    // ========================================================================
    // Queries
    // ========================================================================

    const AchievementState* get_state(const std::string& achievement_id) const;
    AchievementStatus get_status(const std::string& achievement_id) const;
    bool is_unlocked(const std::string& achievement_id) const;
    bool is_claimed(const std::string& achievement_id) const;
    bool is_grant_pending(const std::string& achievement_id) const;
    int64_t get_progress(const std::string& achievement_id) const;
    float get_progress_percent(const std::string& achievement_id) const;

    std::vector<std::string> list_unlocked() const;
    std::vector<std::string> list_claimable() const;   // Unlocked and not claimed
    std::vector<std::string> list_locked() const;
    std::vector<std::string> list_grant_pending() const;
    std::vector<std::string> list_by_category(AchievementCategory category) const;

    int get_unlocked_count() const;
    int get_total_count() const;
    float get_completion_percent() const;

    const AchievementRegistry& registry() const { return m_registry; }

    // ========================================================================
    // Persistence
    // ========================================================================

    const std::unordered_map<std::string, AchievementState>& get_all_states() const { return m_states; }

    // Replaces the state of a registered achievement. Unknown ids and
    // inconsistent states are rejected.
    bool restore_state(const std::string& achievement_id, const AchievementState& state);

    // Every achievement back to Locked
    void reset();

private:
    AchievementState* find_state(const std::string& achievement_id);

    const AchievementRegistry& m_registry;
    std::unordered_map<std::string, AchievementState> m_states;
};

} // namespace progression::achievements
