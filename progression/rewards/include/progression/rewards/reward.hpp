#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <cstdint>

namespace progression::rewards {

// ============================================================================
// Reward Kind
// ============================================================================

enum class RewardKind : uint8_t {
    Currency,           // Soft currency ("coins")
    PremiumCurrency,    // Hard currency ("gems")
    Item                // Inventory item, identified by item_id
};

// ============================================================================
// Reward Entry / Manifest
// ============================================================================

struct RewardEntry {
    RewardKind kind = RewardKind::Currency;
    int64_t amount = 0;
    std::string item_id;    // Item kind only

    bool operator==(const RewardEntry& other) const = default;
};

using RewardManifest = std::vector<RewardEntry>;

// Where a grant originates
enum class RewardSource : uint8_t {
    Achievement,
    Collection
};

// Handed to the reward grant service
struct RewardGrant {
    RewardSource source = RewardSource::Achievement;
    std::string source_id;
    RewardManifest manifest;
};

// Per-kind sums of a manifest
struct RewardTotals {
    int64_t currency = 0;
    int64_t premium_currency = 0;
    std::unordered_map<std::string, int64_t> items;
};

// ============================================================================
// Helpers
// ============================================================================

const char* to_string(RewardKind kind);
const char* to_string(RewardSource source);

// Accepts "currency"/"coins", "premium_currency"/"gems", "item"
std::optional<RewardKind> reward_kind_from_string(const std::string& name);

RewardTotals summarize(const RewardManifest& manifest);

// Amounts must be positive; item entries need an item_id
bool validate_manifest(const RewardManifest& manifest, std::string& out_error);

// Array form:  [{"kind": "currency", "amount": 100}, {"kind": "item", "item_id": "bomb", "amount": 1}]
// Object form: {"coins": 100, "gems": 10}
std::optional<RewardManifest> deserialize_manifest(const nlohmann::json& j, std::string& out_error);

} // namespace progression::rewards
