#include <progression/engine/config.hpp>
#include <progression/data/json_loader.hpp>
#include <progression/core/log.hpp>
#include <unordered_set>

namespace progression::engine {

bool validate_config(const ProgressionConfig& config, std::vector<std::string>& out_errors) {
    size_t error_count = out_errors.size();

    if (!(config.sweep_interval_seconds > 0.0f)) {
        out_errors.push_back("sweep_interval_seconds must be positive");
    }

    std::unordered_set<std::string> achievement_ids;
    for (const auto& def : config.achievements) {
        std::string error;
        if (!achievements::validate_definition(def, error)) {
            out_errors.push_back(error);
        } else if (!achievement_ids.insert(def.achievement_id).second) {
            out_errors.push_back("Duplicate achievement id: " + def.achievement_id);
        }
    }

    std::unordered_set<std::string> collection_ids;
    for (const auto& def : config.collections) {
        std::string error;
        if (!collections::validate_definition(def, error)) {
            out_errors.push_back(error);
        } else if (!collection_ids.insert(def.collection_id).second) {
            out_errors.push_back("Duplicate collection id: " + def.collection_id);
        }
    }

    return out_errors.size() == error_count;
}

ConfigResult parse_config(const nlohmann::json& root) {
    using namespace data::json_helpers;

    ConfigResult result;
    if (!root.is_object()) {
        result.errors.push_back("Configuration root must be an object");
        return result;
    }

    ProgressionConfig config;
    config.sweep_interval_seconds = get_float(root, "sweep_interval_seconds", DEFAULT_SWEEP_INTERVAL);
    config.save_path = get_string(root, "save_path");

    if (root.contains("achievements")) {
        auto loaded = data::load_json_array<achievements::AchievementDefinition>(
            root, achievements::deserialize_achievement, "achievements");
        config.achievements = std::move(loaded.items);
        result.errors.insert(result.errors.end(), loaded.errors.begin(), loaded.errors.end());
    }

    if (root.contains("collections")) {
        auto loaded = data::load_json_array<collections::CollectionDefinition>(
            root, collections::deserialize_collection, "collections");
        config.collections = std::move(loaded.items);
        result.errors.insert(result.errors.end(), loaded.errors.begin(), loaded.errors.end());
    }

    validate_config(config, result.errors);

    if (result.errors.empty()) {
        core::log_info("config", "Loaded {} achievements and {} collections",
                       config.achievements.size(), config.collections.size());
        result.config = std::move(config);
    } else {
        for (const auto& error : result.errors) {
            core::log_error("config", "{}", error);
        }
    }
    return result;
}

ConfigResult load_config(const std::string& path) {
    auto root = data::load_json_file(path);
    if (!root) {
        ConfigResult result;
        result.errors.push_back("Failed to read configuration file: " + path);
        return result;
    }
    return parse_config(*root);
}

} // namespace progression::engine
