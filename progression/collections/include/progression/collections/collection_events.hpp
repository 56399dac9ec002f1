#pragma once

#include <string>
#include <cstdint>

namespace progression::collections {

// ============================================================================
// Item Collected Event
// ============================================================================

struct ItemCollectedEvent {
    std::string collection_id;
    std::string item_id;
    std::string rarity;
    uint64_t timestamp = 0;
};

// ============================================================================
// Collection Completed Event
// ============================================================================

struct CollectionCompletedEvent {
    std::string collection_id;
    uint64_t timestamp = 0;
};

} // namespace progression::collections
