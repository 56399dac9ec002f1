#pragma once

#include <progression/rewards/reward.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace progression::collections {

// ============================================================================
// Collection Item
// ============================================================================

struct CollectionItemDefinition {
    std::string item_id;
    std::string display_name;
    std::string description;
    std::string category;       // Free-form tag, e.g. "gems"
    std::string rarity;         // Free-form tag, e.g. "common"
};

// ============================================================================
// Collection Definition
// ============================================================================

struct CollectionDefinition {
    std::string collection_id;
    std::string display_name;
    std::string description;

    // Ordered, ids unique within the collection
    std::vector<CollectionItemDefinition> items;

    // Granted once when every item is collected
    rewards::RewardManifest completion_rewards;

    const CollectionItemDefinition* get_item(const std::string& item_id) const;
    int get_item_count() const { return static_cast<int>(items.size()); }
};

bool validate_definition(const CollectionDefinition& def, std::string& out_error);

std::optional<CollectionDefinition> deserialize_collection(const nlohmann::json& j, std::string& out_error);

// ============================================================================
// Collection Registry
// ============================================================================

class CollectionRegistry {
public:
    CollectionRegistry() = default;

    // Rejects invalid definitions and duplicate ids
    bool register_collection(const CollectionDefinition& def, std::string& out_error);
    bool register_collection(const CollectionDefinition& def);

    const CollectionDefinition* get(const std::string& collection_id) const;
    bool exists(const std::string& collection_id) const;

    // Definition order
    const std::vector<std::string>& get_all_collection_ids() const { return m_order; }
    int get_total_collections() const { return static_cast<int>(m_order.size()); }

    void clear();

private:
    std::unordered_map<std::string, CollectionDefinition> m_collections;
    std::vector<std::string> m_order;
};

// ============================================================================
// Collection Builder
// ============================================================================

class CollectionBuilder {
public:
    CollectionBuilder& id(const std::string& collection_id);
    CollectionBuilder& name(const std::string& display_name);
    CollectionBuilder& description(const std::string& desc);
    CollectionBuilder& item(const std::string& item_id, const std::string& item_name,
                            const std::string& rarity = "common", const std::string& category = "");
    CollectionBuilder& reward(rewards::RewardKind kind, int64_t amount, const std::string& item_id = "");
    CollectionBuilder& coins(int64_t amount) { return reward(rewards::RewardKind::Currency, amount); }
    CollectionBuilder& gems(int64_t amount) { return reward(rewards::RewardKind::PremiumCurrency, amount); }

    CollectionDefinition build() const;
    bool register_collection(CollectionRegistry& registry) const;

private:
    CollectionDefinition m_def;
};

inline CollectionBuilder collection() { return CollectionBuilder{}; }

} // namespace progression::collections
