#include <progression/achievements/achievement_definition.hpp>
#include <progression/data/json_loader.hpp>
#include <progression/counters/counter_store.hpp>
#include <progression/core/log.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace progression::achievements {

// ============================================================================
// Enum Names
// ============================================================================

namespace {

constexpr std::array<const char*, 6> k_category_names = {
    "Progression", "Skill", "Collection", "Social", "Special", "TimeBased"
};

constexpr std::array<const char*, 5> k_rarity_names = {
    "Common", "Uncommon", "Rare", "Epic", "Legendary"
};

bool iequals(const std::string& a, const char* b) {
    std::string other(b);
    if (a.size() != other.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(other[i]))) {
            return false;
        }
    }
    return true;
}

template<typename E, size_t N>
std::optional<E> enum_from_json(const nlohmann::json& j, const std::array<const char*, N>& names) {
    if (j.is_number_integer()) {
        int64_t index = j.get<int64_t>();
        if (index >= 0 && index < static_cast<int64_t>(N)) {
            return static_cast<E>(index);
        }
        return std::nullopt;
    }
    if (j.is_string()) {
        std::string name = j.get<std::string>();
        for (size_t i = 0; i < N; ++i) {
            if (iequals(name, names[i])) {
                return static_cast<E>(i);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::vector<Requirement>> deserialize_requirements(const nlohmann::json& j, std::string& error) {
    std::vector<Requirement> requirements;

    if (j.is_object()) {
        // {"levels_completed": 1, ...}
        for (const auto& [key, threshold] : j.items()) {
            if (!threshold.is_number_integer()) {
                error = "Requirement '" + key + "' threshold must be an integer";
                return std::nullopt;
            }
            requirements.push_back({key, threshold.get<int64_t>()});
        }
        return requirements;
    }

    if (!j.is_array()) {
        error = "Field 'requirements' must be an array or an object";
        return std::nullopt;
    }

    // [{"key": "levels_completed", "threshold": 1}, ...]
    for (const auto& req_json : j) {
        if (!req_json.is_object()) {
            error = "Requirement entry must be an object";
            return std::nullopt;
        }
        if (!data::json_helpers::require_string(req_json, "key", error) ||
            !data::json_helpers::require_int(req_json, "threshold", error)) {
            return std::nullopt;
        }
        requirements.push_back({req_json["key"].get<std::string>(), req_json["threshold"].get<int64_t>()});
    }
    return requirements;
}

} // anonymous namespace

const char* to_string(AchievementCategory category) {
    return k_category_names[static_cast<size_t>(category)];
}

const char* to_string(AchievementRarity rarity) {
    return k_rarity_names[static_cast<size_t>(rarity)];
}

std::optional<AchievementCategory> category_from_json(const nlohmann::json& j) {
    return enum_from_json<AchievementCategory>(j, k_category_names);
}

std::optional<AchievementRarity> rarity_from_json(const nlohmann::json& j) {
    return enum_from_json<AchievementRarity>(j, k_rarity_names);
}

// ============================================================================
// AchievementDefinition
// ============================================================================

int64_t AchievementDefinition::get_target() const {
    int64_t total = 0;
    for (const auto& req : requirements) {
        total = counters::saturating_add(total, req.threshold);
    }
    return total;
}

bool AchievementDefinition::depends_on(const std::string& counter_key) const {
    return std::any_of(requirements.begin(), requirements.end(),
                       [&](const Requirement& req) { return req.key == counter_key; });
}

bool validate_definition(const AchievementDefinition& def, std::string& out_error) {
    if (def.achievement_id.empty()) {
        out_error = "Achievement id is empty";
        return false;
    }

    if (def.requirements.empty()) {
        out_error = "Achievement '" + def.achievement_id + "' has no requirements";
        return false;
    }

    std::unordered_set<std::string> keys;
    for (const auto& req : def.requirements) {
        if (req.key.empty()) {
            out_error = "Achievement '" + def.achievement_id + "' has a requirement with an empty key";
            return false;
        }
        if (req.threshold < 0) {
            out_error = "Achievement '" + def.achievement_id + "' requirement '" + req.key + "' has a negative threshold";
            return false;
        }
        if (!keys.insert(req.key).second) {
            out_error = "Achievement '" + def.achievement_id + "' lists requirement '" + req.key + "' twice";
            return false;
        }
    }

    std::string reward_error;
    if (!rewards::validate_manifest(def.rewards, reward_error)) {
        out_error = "Achievement '" + def.achievement_id + "': " + reward_error;
        return false;
    }

    return true;
}

std::optional<AchievementDefinition> deserialize_achievement(const nlohmann::json& j, std::string& out_error) {
    using namespace data::json_helpers;

    if (!require_string(j, "achievement_id", out_error)) {
        return std::nullopt;
    }

    AchievementDefinition def;
    def.achievement_id = j["achievement_id"].get<std::string>();
    def.display_name = get_string(j, "display_name", def.achievement_id);
    def.description = get_string(j, "description");
    def.priority = get_int(j, "priority", 0);

    if (j.contains("category")) {
        auto category = category_from_json(j["category"]);
        if (!category) {
            out_error = "Achievement '" + def.achievement_id + "' has an unknown category";
            return std::nullopt;
        }
        def.category = *category;
    }

    if (j.contains("rarity")) {
        auto rarity = rarity_from_json(j["rarity"]);
        if (!rarity) {
            out_error = "Achievement '" + def.achievement_id + "' has an unknown rarity";
            return std::nullopt;
        }
        def.rarity = *rarity;
    }

    if (!j.contains("requirements")) {
        out_error = "Achievement '" + def.achievement_id + "' is missing 'requirements'";
        return std::nullopt;
    }
    auto requirements = deserialize_requirements(j["requirements"], out_error);
    if (!requirements) {
        out_error = "Achievement '" + def.achievement_id + "': " + out_error;
        return std::nullopt;
    }
    def.requirements = std::move(*requirements);

    if (j.contains("rewards")) {
        auto manifest = rewards::deserialize_manifest(j["rewards"], out_error);
        if (!manifest) {
            out_error = "Achievement '" + def.achievement_id + "': " + out_error;
            return std::nullopt;
        }
        def.rewards = std::move(*manifest);
    }

    if (!validate_definition(def, out_error)) {
        return std::nullopt;
    }
    return def;
}

// ============================================================================
// AchievementRegistry
// ============================================================================

bool AchievementRegistry::register_achievement(const AchievementDefinition& def, std::string& out_error) {
    if (!validate_definition(def, out_error)) {
        return false;
    }

    if (m_achievements.contains(def.achievement_id)) {
        out_error = "Duplicate achievement id '" + def.achievement_id + "'";
        return false;
    }

    m_achievements.emplace(def.achievement_id, def);
    m_order.push_back(def.achievement_id);
    for (const auto& req : def.requirements) {
        m_dependents[req.key].push_back(def.achievement_id);
    }

    core::log_debug("achievements", "Registered achievement: {} ({})", def.achievement_id, def.display_name);
    return true;
}

bool AchievementRegistry::register_achievement(const AchievementDefinition& def) {
    std::string error;
    if (!register_achievement(def, error)) {
        core::log_error("achievements", "{}", error);
        return false;
    }
    return true;
}

const AchievementDefinition* AchievementRegistry::get(const std::string& achievement_id) const {
    auto it = m_achievements.find(achievement_id);
    if (it != m_achievements.end()) {
        return &it->second;
    }
    return nullptr;
}

bool AchievementRegistry::exists(const std::string& achievement_id) const {
    return m_achievements.contains(achievement_id);
}

std::vector<std::string> AchievementRegistry::get_by_category(AchievementCategory category) const {
    std::vector<std::string> result;
    for (const auto& id : m_order) {
        if (m_achievements.at(id).category == category) {
            result.push_back(id);
        }
    }
    return result;
}

const std::vector<std::string>& AchievementRegistry::get_dependents(const std::string& counter_key) const {
    static const std::vector<std::string> s_empty;
    auto it = m_dependents.find(counter_key);
    if (it != m_dependents.end()) {
        return it->second;
    }
    return s_empty;
}

void AchievementRegistry::clear() {
    m_achievements.clear();
    m_order.clear();
    m_dependents.clear();
}

// ============================================================================
// AchievementBuilder
// ============================================================================

AchievementBuilder& AchievementBuilder::id(const std::string& achievement_id) {
    m_def.achievement_id = achievement_id;
    return *this;
}

AchievementBuilder& AchievementBuilder::name(const std::string& display_name) {
    m_def.display_name = display_name;
    return *this;
}

AchievementBuilder& AchievementBuilder::description(const std::string& desc) {
    m_def.description = desc;
    return *this;
}

AchievementBuilder& AchievementBuilder::category(AchievementCategory cat) {
    m_def.category = cat;
    return *this;
}

AchievementBuilder& AchievementBuilder::rarity(AchievementRarity r) {
    m_def.rarity = r;
    return *this;
}

AchievementBuilder& AchievementBuilder::require(const std::string& counter_key, int64_t threshold) {
    m_def.requirements.push_back({counter_key, threshold});
    return *this;
}

AchievementBuilder& AchievementBuilder::reward(rewards::RewardKind kind, int64_t amount, const std::string& item_id) {
    m_def.rewards.push_back({kind, amount, item_id});
    return *this;
}

AchievementBuilder& AchievementBuilder::priority(int value) {
    m_def.priority = value;
    return *this;
}

AchievementDefinition AchievementBuilder::build() const {
    AchievementDefinition def = m_def;
    if (def.display_name.empty()) {
        def.display_name = def.achievement_id;
    }
    return def;
}

bool AchievementBuilder::register_achievement(AchievementRegistry& registry) const {
    return registry.register_achievement(build());
}

} // namespace progression::achievements
