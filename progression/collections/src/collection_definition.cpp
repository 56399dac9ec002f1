#include <progression/collections/collection_definition.hpp>
#include <progression/data/json_loader.hpp>
#include <progression/core/log.hpp>
#include <unordered_set>

namespace progression::collections {

// ============================================================================
// CollectionDefinition
// ============================================================================

const CollectionItemDefinition* CollectionDefinition::get_item(const std::string& item_id) const {
    for (const auto& item : items) {
        if (item.item_id == item_id) {
            return &item;
        }
    }
    return nullptr;
}

bool validate_definition(const CollectionDefinition& def, std::string& out_error) {
    if (def.collection_id.empty()) {
        out_error = "Collection id is empty";
        return false;
    }

    if (def.items.empty()) {
        out_error = "Collection '" + def.collection_id + "' has no items";
        return false;
    }

    std::unordered_set<std::string> item_ids;
    for (const auto& item : def.items) {
        if (item.item_id.empty()) {
            out_error = "Collection '" + def.collection_id + "' has an item with an empty id";
            return false;
        }
        if (!item_ids.insert(item.item_id).second) {
            out_error = "Collection '" + def.collection_id + "' lists item '" + item.item_id + "' twice";
            return false;
        }
    }

    std::string reward_error;
    if (!rewards::validate_manifest(def.completion_rewards, reward_error)) {
        out_error = "Collection '" + def.collection_id + "': " + reward_error;
        return false;
    }

    return true;
}

std::optional<CollectionDefinition> deserialize_collection(const nlohmann::json& j, std::string& out_error) {
    using namespace data::json_helpers;

    if (!require_string(j, "collection_id", out_error)) {
        return std::nullopt;
    }

    CollectionDefinition def;
    def.collection_id = j["collection_id"].get<std::string>();
    def.display_name = get_string(j, "display_name", def.collection_id);
    def.description = get_string(j, "description");

    if (!require_array(j, "items", out_error)) {
        out_error = "Collection '" + def.collection_id + "': " + out_error;
        return std::nullopt;
    }

    for (const auto& item_json : j["items"]) {
        if (!item_json.is_object() || !require_string(item_json, "item_id", out_error)) {
            out_error = "Collection '" + def.collection_id + "' has a malformed item";
            return std::nullopt;
        }

        CollectionItemDefinition item;
        item.item_id = item_json["item_id"].get<std::string>();
        item.display_name = get_string(item_json, "display_name", item.item_id);
        item.description = get_string(item_json, "description");
        item.category = get_string(item_json, "category");
        item.rarity = get_string(item_json, "rarity", "common");
        def.items.push_back(std::move(item));
    }

    if (j.contains("rewards")) {
        auto manifest = rewards::deserialize_manifest(j["rewards"], out_error);
        if (!manifest) {
            out_error = "Collection '" + def.collection_id + "': " + out_error;
            return std::nullopt;
        }
        def.completion_rewards = std::move(*manifest);
    }

    if (!validate_definition(def, out_error)) {
        return std::nullopt;
    }
    return def;
}

// ============================================================================
// CollectionRegistry
// ============================================================================

bool CollectionRegistry::register_collection(const CollectionDefinition& def, std::string& out_error) {
    if (!validate_definition(def, out_error)) {
        return false;
    }

    if (m_collections.contains(def.collection_id)) {
        out_error = "Duplicate collection id '" + def.collection_id + "'";
        return false;
    }

    m_collections.emplace(def.collection_id, def);
    m_order.push_back(def.collection_id);

    core::log_debug("collections", "Registered collection: {} ({} items)", def.collection_id, def.items.size());
    return true;
}

bool CollectionRegistry::register_collection(const CollectionDefinition& def) {
    std::string error;
    if (!register_collection(def, error)) {
        core::log_error("collections", "{}", error);
        return false;
    }
    return true;
}

const CollectionDefinition* CollectionRegistry::get(const std::string& collection_id) const {
    auto it = m_collections.find(collection_id);
    if (it != m_collections.end()) {
        return &it->second;
    }
    return nullptr;
}

bool CollectionRegistry::exists(const std::string& collection_id) const {
    return m_collections.contains(collection_id);
}

void CollectionRegistry::clear() {
    m_collections.clear();
    m_order.clear();
}

// ============================================================================
// CollectionBuilder
// ============================================================================

CollectionBuilder& CollectionBuilder::id(const std::string& collection_id) {
    m_def.collection_id = collection_id;
    return *this;
}

CollectionBuilder& CollectionBuilder::name(const std::string& display_name) {
    m_def.display_name = display_name;
    return *this;
}

CollectionBuilder& CollectionBuilder::description(const std::string& desc) {
    m_def.description = desc;
    return *this;
}

CollectionBuilder& CollectionBuilder::item(const std::string& item_id, const std::string& item_name,
                                           const std::string& rarity, const std::string& category) {
    CollectionItemDefinition item;
    item.item_id = item_id;
    item.display_name = item_name;
    item.rarity = rarity;
    item.category = category;
    m_def.items.push_back(std::move(item));
    return *this;
}

CollectionBuilder& CollectionBuilder::reward(rewards::RewardKind kind, int64_t amount, const std::string& item_id) {
    m_def.completion_rewards.push_back({kind, amount, item_id});
    return *this;
}

CollectionDefinition CollectionBuilder::build() const {
    CollectionDefinition def = m_def;
    if (def.display_name.empty()) {
        def.display_name = def.collection_id;
    }
    return def;
}

bool CollectionBuilder::register_collection(CollectionRegistry& registry) const {
    return registry.register_collection(build());
}

} // namespace progression::collections
