#include <progression/collections/collection_manager.hpp>
#include <progression/core/log.hpp>
#include <cmath>

namespace progression::collections {

CollectionManager::CollectionManager(const CollectionRegistry& registry)
    : m_registry(registry) {
    reset();
}

// ============================================================================
// Collecting
// ============================================================================

CollectResult CollectionManager::collect_item(const std::string& collection_id,
                                              const std::string& item_id,
                                              uint64_t now) {
    CollectResult result;

    const auto* def = m_registry.get(collection_id);
    auto* state = find_state(collection_id);
    if (!def || !state) {
        core::log_debug("collections", "Collect ignored, unknown collection: {}", collection_id);
        return result;
    }

    const auto* item_def = def->get_item(item_id);
    if (!item_def) {
        core::log_debug("collections", "Collect ignored, unknown item: {}/{}", collection_id, item_id);
        return result;
    }

    auto& item = state->items[item_id];
    if (item.collected) {
        return result;
    }

    item.collected = true;
    item.collect_timestamp = now;

    core::log_info("collections", "Item collected: {}/{} ({})", collection_id, item_id, item_def->display_name);

    ItemCollectedEvent event;
    event.collection_id = collection_id;
    event.item_id = item_id;
    event.rarity = item_def->rarity;
    event.timestamp = now;
    result.collected = std::move(event);

    result.completed = check_completion(collection_id, now);
    return result;
}

std::optional<CollectionCompletedEvent> CollectionManager::check_completion(const std::string& collection_id,
                                                                            uint64_t now) {
    const auto* def = m_registry.get(collection_id);
    auto* state = find_state(collection_id);
    if (!def || !state || state->completed) {
        return std::nullopt;
    }

    // The rounded percentage can read 100 with an item still missing
    if (get_collected_count(collection_id) != static_cast<int>(def->items.size())) {
        return std::nullopt;
    }

    state->completed = true;
    state->grant_pending = true;

    core::log_info("collections", "Collection completed: {}", collection_id);

    CollectionCompletedEvent event;
    event.collection_id = collection_id;
    event.timestamp = now;
    return event;
}

std::vector<CollectionCompletedEvent> CollectionManager::check_all_completions(uint64_t now) {
    std::vector<CollectionCompletedEvent> completed;
    for (const auto& id : m_registry.get_all_collection_ids()) {
        if (auto event = check_completion(id, now)) {
            completed.push_back(std::move(*event));
        }
    }
    return completed;
}

void CollectionManager::complete_grant(const std::string& collection_id) {
    if (auto* state = find_state(collection_id)) {
        state->grant_pending = false;
    }
}

// ============================================================================
// Queries
// ============================================================================

const CollectionState* CollectionManager::get_state(const std::string& collection_id) const {
    auto it = m_states.find(collection_id);
    if (it != m_states.end()) {
        return &it->second;
    }
    return nullptr;
}

bool CollectionManager::is_collected(const std::string& collection_id, const std::string& item_id) const {
    const auto* state = get_state(collection_id);
    if (!state) return false;

    auto it = state->items.find(item_id);
    return it != state->items.end() && it->second.collected;
}

bool CollectionManager::is_completed(const std::string& collection_id) const {
    const auto* state = get_state(collection_id);
    return state && state->completed;
}

bool CollectionManager::is_grant_pending(const std::string& collection_id) const {
    const auto* state = get_state(collection_id);
    return state && state->grant_pending;
}

int CollectionManager::get_collected_count(const std::string& collection_id) const {
    const auto* def = m_registry.get(collection_id);
    if (!def) return 0;

    int count = 0;
    for (const auto& item : def->items) {
        if (is_collected(collection_id, item.item_id)) {
            ++count;
        }
    }
    return count;
}

int CollectionManager::get_completion_percentage(const std::string& collection_id) const {
    const auto* def = m_registry.get(collection_id);
    if (!def || def->items.empty()) return 0;

    double percent = static_cast<double>(get_collected_count(collection_id)) * 100.0 /
                     static_cast<double>(def->items.size());
    return static_cast<int>(std::nearbyint(percent));
}

std::vector<std::string> CollectionManager::list_completed() const {
    std::vector<std::string> result;
    for (const auto& id : m_registry.get_all_collection_ids()) {
        if (is_completed(id)) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> CollectionManager::list_grant_pending() const {
    std::vector<std::string> result;
    for (const auto& id : m_registry.get_all_collection_ids()) {
        if (is_grant_pending(id)) {
            result.push_back(id);
        }
    }
    return result;
}

// ============================================================================
// Persistence
// ============================================================================

bool CollectionManager::restore_state(const std::string& collection_id, const CollectionState& state) {
    const auto* def = m_registry.get(collection_id);
    auto* current = find_state(collection_id);
    if (!def || !current) {
        core::log_debug("collections", "Ignoring saved state for unknown collection: {}", collection_id);
        return false;
    }

    if (state.grant_pending && !state.completed) {
        core::log_warning("collections", "Rejecting inconsistent saved state for: {}", collection_id);
        return false;
    }

    CollectionState restored;
    restored.completed = state.completed;
    restored.grant_pending = state.grant_pending;
    for (const auto& item : def->items) {
        auto it = state.items.find(item.item_id);
        restored.items[item.item_id] = (it != state.items.end()) ? it->second : ItemState{};
    }

    for (const auto& [item_id, item_state] : state.items) {
        if (!def->get_item(item_id)) {
            core::log_debug("collections", "Ignoring saved state for unknown item: {}/{}", collection_id, item_id);
        }
    }

    *current = std::move(restored);
    return true;
}

void CollectionManager::reset() {
    m_states.clear();
    for (const auto& id : m_registry.get_all_collection_ids()) {
        CollectionState state;
        for (const auto& item : m_registry.get(id)->items) {
            state.items.emplace(item.item_id, ItemState{});
        }
        m_states.emplace(id, std::move(state));
    }
}

CollectionState* CollectionManager::find_state(const std::string& collection_id) {
    auto it = m_states.find(collection_id);
    if (it != m_states.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace progression::collections
