#include <progression/achievements/achievement_manager.hpp>
#include <progression/achievements/requirement_evaluator.hpp>
#include <progression/core/log.hpp>
#include <algorithm>

namespace progression::achievements {

const char* to_string(AchievementStatus status) {
    switch (status) {
        case AchievementStatus::Locked:   return "locked";
        case AchievementStatus::Unlocked: return "unlocked";
        case AchievementStatus::Claimed:  return "claimed";
    }
    return "unknown";
}

bool is_consistent(const AchievementState& state) {
    if (state.claimed && !state.unlocked) return false;
    if (state.grant_pending && !state.claimed) return false;
    if (state.progress < 0) return false;
    return true;
}

AchievementManager::AchievementManager(const AchievementRegistry& registry)
    : m_registry(registry) {
    reset();
}

// ============================================================================
// Evaluation
// ============================================================================

std::optional<AchievementUnlockedEvent> AchievementManager::evaluate(const std::string& achievement_id,
                                                                     const counters::CounterStore& counters,
                                                                     uint64_t now) {
    const auto* def = m_registry.get(achievement_id);
    auto* state = find_state(achievement_id);
    if (!def || !state) {
        core::log_debug("achievements", "Evaluate skipped, unknown achievement: {}", achievement_id);
        return std::nullopt;
    }

    if (state->unlocked) {
        return std::nullopt;
    }

    auto result = evaluate_requirements(def->requirements, counters);
    state->progress = result.progress;

    if (!result.satisfied) {
        return std::nullopt;
    }

    state->unlocked = true;
    state->unlock_timestamp = now;

    core::log_info("achievements", "Achievement unlocked: {} ({})", achievement_id, def->display_name);

    AchievementUnlockedEvent event;
    event.achievement_id = achievement_id;
    event.category = def->category;
    event.rarity = def->rarity;
    event.timestamp = now;
    return event;
}

std::vector<AchievementUnlockedEvent> AchievementManager::evaluate_all(const counters::CounterStore& counters,
                                                                       uint64_t now) {
    std::vector<AchievementUnlockedEvent> unlocked;
    for (const auto& id : m_registry.get_all_achievement_ids()) {
        if (auto event = evaluate(id, counters, now)) {
            unlocked.push_back(std::move(*event));
        }
    }
    return unlocked;
}

std::vector<AchievementUnlockedEvent> AchievementManager::evaluate_dependents(const std::string& counter_key,
                                                                              const counters::CounterStore& counters,
                                                                              uint64_t now) {
    std::vector<AchievementUnlockedEvent> unlocked;
    for (const auto& id : m_registry.get_dependents(counter_key)) {
        if (auto event = evaluate(id, counters, now)) {
            unlocked.push_back(std::move(*event));
        }
    }
    return unlocked;
}

// ============================================================================
// Claiming
// ============================================================================

bool AchievementManager::begin_claim(const std::string& achievement_id) {
    auto* state = find_state(achievement_id);
    if (!state) {
        core::log_debug("achievements", "Claim ignored, unknown achievement: {}", achievement_id);
        return false;
    }

    if (!state->unlocked || state->claimed) {
        return false;
    }

    state->claimed = true;
    state->grant_pending = true;
    core::log_info("achievements", "Achievement claimed: {}", achievement_id);
    return true;
}

void AchievementManager::complete_grant(const std::string& achievement_id) {
    if (auto* state = find_state(achievement_id)) {
        state->grant_pending = false;
    }
}

// ============================================================================
// Queries
// ============================================================================

const AchievementState* AchievementManager::get_state(const std::string& achievement_id) const {
    auto it = m_states.find(achievement_id);
    if (it != m_states.end()) {
        return &it->second;
    }
    return nullptr;
}

AchievementStatus AchievementManager::get_status(const std::string& achievement_id) const {
    const auto* state = get_state(achievement_id);
    return state ? state->status() : AchievementStatus::Locked;
}

bool AchievementManager::is_unlocked(const std::string& achievement_id) const {
    const auto* state = get_state(achievement_id);
    return state && state->unlocked;
}

bool AchievementManager::is_claimed(const std::string& achievement_id) const {
    const auto* state = get_state(achievement_id);
    return state && state->claimed;
}

bool AchievementManager::is_grant_pending(const std::string& achievement_id) const {
    const auto* state = get_state(achievement_id);
    return state && state->grant_pending;
}

int64_t AchievementManager::get_progress(const std::string& achievement_id) const {
    const auto* state = get_state(achievement_id);
    return state ? state->progress : 0;
}

float AchievementManager::get_progress_percent(const std::string& achievement_id) const {
    const auto* def = m_registry.get(achievement_id);
    if (!def || def->get_target() <= 0) {
        return is_unlocked(achievement_id) ? 1.0f : 0.0f;
    }

    int64_t current = get_progress(achievement_id);
    return std::min(1.0f, static_cast<float>(current) / static_cast<float>(def->get_target()));
}

std::vector<std::string> AchievementManager::list_unlocked() const {
    std::vector<std::string> result;
    for (const auto& id : m_registry.get_all_achievement_ids()) {
        if (is_unlocked(id)) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> AchievementManager::list_claimable() const {
    std::vector<std::string> result;
    for (const auto& id : m_registry.get_all_achievement_ids()) {
        if (get_status(id) == AchievementStatus::Unlocked) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> AchievementManager::list_locked() const {
    std::vector<std::string> result;
    for (const auto& id : m_registry.get_all_achievement_ids()) {
        if (!is_unlocked(id)) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> AchievementManager::list_grant_pending() const {
    std::vector<std::string> result;
    for (const auto& id : m_registry.get_all_achievement_ids()) {
        if (is_grant_pending(id)) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> AchievementManager::list_by_category(AchievementCategory category) const {
    return m_registry.get_by_category(category);
}

int AchievementManager::get_unlocked_count() const {
    int count = 0;
    for (const auto& [id, state] : m_states) {
        if (state.unlocked) {
            ++count;
        }
    }
    return count;
}

int AchievementManager::get_total_count() const {
    return m_registry.get_total_achievements();
}

float AchievementManager::get_completion_percent() const {
    int total = get_total_count();
    if (total <= 0) return 0.0f;
    return static_cast<float>(get_unlocked_count()) / static_cast<float>(total);
}

// ============================================================================
// Persistence
// ============================================================================

bool AchievementManager::restore_state(const std::string& achievement_id, const AchievementState& state) {
    auto* current = find_state(achievement_id);
    if (!current) {
        core::log_debug("achievements", "Ignoring saved state for unknown achievement: {}", achievement_id);
        return false;
    }

    if (!is_consistent(state)) {
        core::log_warning("achievements", "Rejecting inconsistent saved state for: {}", achievement_id);
        return false;
    }

    *current = state;
    return true;
}

void AchievementManager::reset() {
    m_states.clear();
    for (const auto& id : m_registry.get_all_achievement_ids()) {
        m_states.emplace(id, AchievementState{});
    }
}

AchievementState* AchievementManager::find_state(const std::string& achievement_id) {
    auto it = m_states.find(achievement_id);
    if (it != m_states.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace progression::achievements
