#pragma once

#include <progression/save/progress_state.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

namespace progression::save {

// Current save format version
inline constexpr uint32_t PROGRESS_SAVE_VERSION = 1;

// Version assigned to documents written before the format carried one:
// a bare array of achievement records
inline constexpr uint32_t LEGACY_SAVE_VERSION = 0;

// Upgrades a document in place from from_version to from_version + 1
using ProgressMigrationFunc = std::function<bool(nlohmann::json&, uint32_t)>;

// Load operation result
struct LoadReport {
    bool success = false;               // Document was readable
    ProgressState state;
    uint32_t source_version = 0;
    std::vector<std::string> warnings;  // One per dropped entry
    std::string error_message;
};

// ============================================================================
// ProgressSerializer
// ============================================================================
//
// JSON layout:
// {
//   "version": 1,
//   "counters": { "<key>": <int> },
//   "achievements": { "<id>": { "unlocked", "claimed", "grant_pending",
//                               "unlock_timestamp"?, "progress" } },
//   "collections": { "<id>": { "completed", "grant_pending",
//                              "items": { "<item_id>": { "collected", "collect_timestamp"? } } } }
// }
//
// Loading is tolerant: a malformed entry is dropped with a warning and the
// rest of the document still loads. A document that cannot be read at all
// yields a fresh empty state.

class ProgressSerializer {
public:
    ProgressSerializer();

    std::string save(const ProgressState& state) const;
    nlohmann::json to_json(const ProgressState& state) const;

    LoadReport load(const std::string& blob) const;
    LoadReport from_json(nlohmann::json document) const;

    // Register a migration from one version to the next
    // Migrations are applied sequentially: v0 -> v1 -> v2 -> ... -> current
    void register_migration(uint32_t from_version, ProgressMigrationFunc migration);
    void clear_migrations();

private:
    bool apply_migrations(nlohmann::json& document, uint32_t version, std::string& out_error) const;

    std::map<uint32_t, ProgressMigrationFunc> m_migrations;
};

// Converts the legacy achievement array into the version 1 layout
bool migrate_legacy_document(nlohmann::json& document, uint32_t from_version);

} // namespace progression::save
