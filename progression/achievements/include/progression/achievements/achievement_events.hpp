#pragma once

#include <progression/achievements/achievement_definition.hpp>
#include <string>
#include <cstdint>

namespace progression::achievements {

// ============================================================================
// Achievement Unlocked Event
// ============================================================================

struct AchievementUnlockedEvent {
    std::string achievement_id;
    AchievementCategory category = AchievementCategory::Progression;
    AchievementRarity rarity = AchievementRarity::Common;
    uint64_t timestamp = 0;
};

} // namespace progression::achievements
