#pragma once

#include <progression/achievements/achievement_definition.hpp>
#include <progression/collections/collection_definition.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace progression::engine {

inline constexpr float DEFAULT_SWEEP_INTERVAL = 5.0f;

// ============================================================================
// ProgressionConfig
// ============================================================================

struct ProgressionConfig {
    std::vector<achievements::AchievementDefinition> achievements;
    std::vector<collections::CollectionDefinition> collections;

    // Seconds between safety-net evaluation sweeps
    float sweep_interval_seconds = DEFAULT_SWEEP_INTERVAL;

    // Where progress is stored; empty keeps progress in memory only
    std::string save_path;
};

struct ConfigResult {
    std::optional<ProgressionConfig> config;
    std::vector<std::string> errors;

    bool success() const { return config.has_value() && errors.empty(); }
};

// Checks cross-definition rules: unique achievement and collection ids,
// valid definitions, positive sweep interval
bool validate_config(const ProgressionConfig& config, std::vector<std::string>& out_errors);

// Document layout:
// {
//   "sweep_interval_seconds": 5.0,
//   "save_path": "saves/progression.json",
//   "achievements": [ { "achievement_id": ..., "requirements": ..., "rewards": ... } ],
//   "collections": [ { "collection_id": ..., "items": [ ... ], "rewards": ... } ]
// }
ConfigResult parse_config(const nlohmann::json& root);
ConfigResult load_config(const std::string& path);

} // namespace progression::engine
