#pragma once

#include <progression/collections/collection_definition.hpp>
#include <progression/collections/collection_events.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace progression::collections {

// ============================================================================
// Collection State
// ============================================================================

struct ItemState {
    bool collected = false;
    std::optional<uint64_t> collect_timestamp;

    bool operator==(const ItemState& other) const = default;
};

struct CollectionState {
    bool completed = false;
    bool grant_pending = false;     // Completed, reward not yet confirmed
    std::unordered_map<std::string, ItemState> items;

    bool operator==(const CollectionState& other) const = default;
};

// Result of a collect_item call; both empty when the call was a no-op
struct CollectResult {
    std::optional<ItemCollectedEvent> collected;
    std::optional<CollectionCompletedEvent> completed;
};

// ============================================================================
// Collection Manager
// ============================================================================
//
// Tracks collected items per collection. Completion is derived from the item
// flags and latches: once a collection completes it stays completed, so its
// reward is handed out at most once.

class CollectionManager {
public:
    explicit CollectionManager(const CollectionRegistry& registry);

    CollectionManager(const CollectionManager&) = delete;
    CollectionManager& operator=(const CollectionManager&) = delete;

    // Marks an item collected and completes the collection when it was the
    // last one. Unknown ids and already collected items are no-ops.
    CollectResult collect_item(const std::string& collection_id, const std::string& item_id, uint64_t now);

    // Completes the collection if every item is collected and it was not
    // completed before. Safe to call repeatedly.
    std::optional<CollectionCompletedEvent> check_completion(const std::string& collection_id, uint64_t now);
    std::vector<CollectionCompletedEvent> check_all_completions(uint64_t now);

    // Reward handed over successfully
    void complete_grant(const std::string& collection_id);

    // ========================================================================
    // Queries
    // ========================================================================

    const CollectionState* get_state(const std::string& collection_id) const;
    bool is_collected(const std::string& collection_id, const std::string& item_id) const;
    bool is_completed(const std::string& collection_id) const;
    bool is_grant_pending(const std::string& collection_id) const;
    int get_collected_count(const std::string& collection_id) const;

    // Rounded to nearest, ties to even
    int get_completion_percentage(const std::string& collection_id) const;

    std::vector<std::string> list_completed() const;
    std::vector<std::string> list_grant_pending() const;

    const CollectionRegistry& registry() const { return m_registry; }

    // ========================================================================
    // Persistence
    // ========================================================================

    const std::unordered_map<std::string, CollectionState>& get_all_states() const { return m_states; }

    // Replaces the state of a registered collection. Unknown item ids are
    // dropped; items missing from the saved state start uncollected.
    bool restore_state(const std::string& collection_id, const CollectionState& state);

    void reset();

private:
    CollectionState* find_state(const std::string& collection_id);

    const CollectionRegistry& m_registry;
    std::unordered_map<std::string, CollectionState> m_states;
};

} // namespace progression::collections
