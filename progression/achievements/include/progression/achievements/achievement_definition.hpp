#pragma once

#include <progression/rewards/reward.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace progression::achievements {

// ============================================================================
// Achievement Category
// ============================================================================

enum class AchievementCategory : uint8_t {
    Progression,    // Level/campaign progression
    Skill,          // Skill-based feats
    Collection,     // Collecting items
    Social,         // Friends, leaderboards
    Special,        // Streaks and one-off feats
    TimeBased       // Time-limited or time-measured
};

// ============================================================================
// Achievement Rarity
// ============================================================================

enum class AchievementRarity : uint8_t {
    Common,
    Uncommon,
    Rare,
    Epic,
    Legendary
};

const char* to_string(AchievementCategory category);
const char* to_string(AchievementRarity rarity);

// Case-insensitive name or numeric index
std::optional<AchievementCategory> category_from_json(const nlohmann::json& j);
std::optional<AchievementRarity> rarity_from_json(const nlohmann::json& j);

// ============================================================================
// Requirement
// ============================================================================

struct Requirement {
    std::string key;            // Counter key
    int64_t threshold = 0;      // Counter must reach at least this value
};

// ============================================================================
// Achievement Definition
// ============================================================================

struct AchievementDefinition {
    std::string achievement_id;
    std::string display_name;
    std::string description;

    AchievementCategory category = AchievementCategory::Progression;
    AchievementRarity rarity = AchievementRarity::Common;

    // All requirements must be met (keys unique)
    std::vector<Requirement> requirements;

    // Granted on claim
    rewards::RewardManifest rewards;

    // Display ordering only, higher first
    int priority = 0;

    // ========================================================================
    // Helpers
    // ========================================================================

    // Sum of thresholds
    int64_t get_target() const;
    bool depends_on(const std::string& counter_key) const;
};

// Checks ids, requirement set and reward manifest
bool validate_definition(const AchievementDefinition& def, std::string& out_error);

// Deserialize a single definition; nullopt with out_error on malformed input
std::optional<AchievementDefinition> deserialize_achievement(const nlohmann::json& j, std::string& out_error);

// ============================================================================
// Achievement Registry
// ============================================================================
//
// Immutable after configuration. Keeps definition order and an index from
// counter key to the achievements that read it.

class AchievementRegistry {
public:
    AchievementRegistry() = default;

    // Rejects invalid definitions and duplicate ids
    bool register_achievement(const AchievementDefinition& def, std::string& out_error);
    bool register_achievement(const AchievementDefinition& def);

    // Lookup
    const AchievementDefinition* get(const std::string& achievement_id) const;
    bool exists(const std::string& achievement_id) const;

    // Queries (definition order)
    const std::vector<std::string>& get_all_achievement_ids() const { return m_order; }
    std::vector<std::string> get_by_category(AchievementCategory category) const;
    const std::vector<std::string>& get_dependents(const std::string& counter_key) const;

    int get_total_achievements() const { return static_cast<int>(m_order.size()); }

    void clear();

private:
    std::unordered_map<std::string, AchievementDefinition> m_achievements;
    std::vector<std::string> m_order;
    std::unordered_map<std::string, std::vector<std::string>> m_dependents;
};

// ============================================================================
// Achievement Builder
// ============================================================================

class AchievementBuilder {
public:
    AchievementBuilder& id(const std::string& achievement_id);
    AchievementBuilder& name(const std::string& display_name);
    AchievementBuilder& description(const std::string& desc);
    AchievementBuilder& category(AchievementCategory cat);
    AchievementBuilder& rarity(AchievementRarity r);
    AchievementBuilder& require(const std::string& counter_key, int64_t threshold);
    AchievementBuilder& reward(rewards::RewardKind kind, int64_t amount, const std::string& item_id = "");
    AchievementBuilder& coins(int64_t amount) { return reward(rewards::RewardKind::Currency, amount); }
    AchievementBuilder& gems(int64_t amount) { return reward(rewards::RewardKind::PremiumCurrency, amount); }
    AchievementBuilder& priority(int value);

    AchievementDefinition build() const;
    bool register_achievement(AchievementRegistry& registry) const;

private:
    AchievementDefinition m_def;
};

inline AchievementBuilder achievement() { return AchievementBuilder{}; }

} // namespace progression::achievements
