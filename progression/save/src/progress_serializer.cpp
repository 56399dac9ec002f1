#include <progression/save/progress_serializer.hpp>
#include <progression/data/json_loader.hpp>
#include <progression/core/log.hpp>
#include <format>
#include <limits>

namespace progression::save {

using json = nlohmann::json;

namespace {

// Field readers leave out untouched when the field is absent or null and
// return false when it is present with the wrong type or range.

bool read_flag(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_boolean()) return false;
    out = it->get<bool>();
    return true;
}

bool read_non_negative(const json& value, int64_t& out) {
    if (!value.is_number_integer()) return false;
    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
        out = static_cast<int64_t>(raw);
        return true;
    }
    int64_t raw = value.get<int64_t>();
    if (raw < 0) return false;
    out = raw;
    return true;
}

bool read_timestamp(const json& j, const char* key, std::optional<uint64_t>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    int64_t value = 0;
    if (!read_non_negative(*it, value)) return false;
    out = static_cast<uint64_t>(value);
    return true;
}

class EntryReader {
public:
    explicit EntryReader(LoadReport& report) : m_report(report) {}

    void drop(const std::string& what, const std::string& reason) {
        std::string message = what + ": " + reason;
        core::log_warning("save", "Dropping saved entry {}", message);
        m_report.warnings.push_back(std::move(message));
    }

    void read_counters(const json& section) {
        if (!section.is_object()) {
            drop("counters", "not an object");
            return;
        }
        for (const auto& [key, value] : section.items()) {
            int64_t amount = 0;
            if (!read_non_negative(value, amount)) {
                drop("counters." + key, "not a non-negative integer");
                continue;
            }
            m_report.state.counters[key] = amount;
        }
    }

    void read_achievements(const json& section) {
        if (!section.is_object()) {
            drop("achievements", "not an object");
            return;
        }
        for (const auto& [id, entry] : section.items()) {
            std::string where = "achievements." + id;
            if (!entry.is_object()) {
                drop(where, "not an object");
                continue;
            }

            achievements::AchievementState state;
            if (!read_flag(entry, "unlocked", state.unlocked) ||
                !read_flag(entry, "claimed", state.claimed) ||
                !read_flag(entry, "grant_pending", state.grant_pending)) {
                drop(where, "flag is not a boolean");
                continue;
            }
            if (!read_timestamp(entry, "unlock_timestamp", state.unlock_timestamp)) {
                drop(where, "invalid unlock_timestamp");
                continue;
            }
            if (entry.contains("progress") && !read_non_negative(entry.at("progress"), state.progress)) {
                drop(where, "invalid progress");
                continue;
            }
            if (!achievements::is_consistent(state)) {
                drop(where, "inconsistent flags");
                continue;
            }

            m_report.state.achievements[id] = std::move(state);
        }
    }

    void read_collections(const json& section) {
        if (!section.is_object()) {
            drop("collections", "not an object");
            return;
        }
        for (const auto& [id, entry] : section.items()) {
            std::string where = "collections." + id;
            if (!entry.is_object()) {
                drop(where, "not an object");
                continue;
            }

            collections::CollectionState state;
            if (!read_flag(entry, "completed", state.completed) ||
                !read_flag(entry, "grant_pending", state.grant_pending)) {
                drop(where, "flag is not a boolean");
                continue;
            }
            if (state.grant_pending && !state.completed) {
                drop(where, "grant pending without completion");
                continue;
            }

            if (entry.contains("items")) {
                const auto& items = entry.at("items");
                if (!items.is_object()) {
                    drop(where + ".items", "not an object");
                } else {
                    for (const auto& [item_id, item_entry] : items.items()) {
                        std::string item_where = where + ".items." + item_id;
                        collections::ItemState item;
                        if (!item_entry.is_object() ||
                            !read_flag(item_entry, "collected", item.collected) ||
                            !read_timestamp(item_entry, "collect_timestamp", item.collect_timestamp)) {
                            drop(item_where, "malformed item");
                            continue;
                        }
                        state.items[item_id] = std::move(item);
                    }
                }
            }

            m_report.state.collections[id] = std::move(state);
        }
    }

private:
    LoadReport& m_report;
};

} // namespace

// ============================================================================
// ProgressSerializer
// ============================================================================

ProgressSerializer::ProgressSerializer() {
    register_migration(LEGACY_SAVE_VERSION, migrate_legacy_document);
}

json ProgressSerializer::to_json(const ProgressState& state) const {
    json document;
    document["version"] = PROGRESS_SAVE_VERSION;

    json counters = json::object();
    for (const auto& [key, value] : state.counters) {
        counters[key] = value;
    }
    document["counters"] = std::move(counters);

    json achievements = json::object();
    for (const auto& [id, s] : state.achievements) {
        json entry;
        entry["unlocked"] = s.unlocked;
        entry["claimed"] = s.claimed;
        entry["grant_pending"] = s.grant_pending;
        if (s.unlock_timestamp) {
            entry["unlock_timestamp"] = *s.unlock_timestamp;
        }
        entry["progress"] = s.progress;
        achievements[id] = std::move(entry);
    }
    document["achievements"] = std::move(achievements);

    json collections = json::object();
    for (const auto& [id, s] : state.collections) {
        json items = json::object();
        for (const auto& [item_id, item] : s.items) {
            json item_entry;
            item_entry["collected"] = item.collected;
            if (item.collect_timestamp) {
                item_entry["collect_timestamp"] = *item.collect_timestamp;
            }
            items[item_id] = std::move(item_entry);
        }

        json entry;
        entry["completed"] = s.completed;
        entry["grant_pending"] = s.grant_pending;
        entry["items"] = std::move(items);
        collections[id] = std::move(entry);
    }
    document["collections"] = std::move(collections);

    return document;
}

std::string ProgressSerializer::save(const ProgressState& state) const {
    return to_json(state).dump(2);
}

LoadReport ProgressSerializer::load(const std::string& blob) const {
    auto document = data::parse_json(blob);
    if (!document) {
        LoadReport report;
        report.error_message = "Save document is not valid JSON";
        core::log_error("save", "{}, starting from a fresh state", report.error_message);
        return report;
    }
    return from_json(std::move(*document));
}

LoadReport ProgressSerializer::from_json(json document) const {
    LoadReport report;

    if (document.is_array()) {
        json wrapped;
        wrapped["version"] = LEGACY_SAVE_VERSION;
        wrapped["achievements"] = std::move(document);
        document = std::move(wrapped);
    }

    if (!document.is_object()) {
        report.error_message = "Save document is not an object";
        core::log_error("save", "{}, starting from a fresh state", report.error_message);
        return report;
    }

    uint32_t version = PROGRESS_SAVE_VERSION;
    if (auto it = document.find("version"); it != document.end()) {
        if (!it->is_number_unsigned() || it->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            report.error_message = "Save document has an invalid version";
            core::log_error("save", "{}, starting from a fresh state", report.error_message);
            return report;
        }
        version = it->get<uint32_t>();
    } else {
        core::log_warning("save", "Save document has no version, reading as version {}", PROGRESS_SAVE_VERSION);
    }
    report.source_version = version;

    if (version > PROGRESS_SAVE_VERSION) {
        core::log_warning("save", "Save version {} is newer than supported version {}, loading best-effort",
                          version, PROGRESS_SAVE_VERSION);
    } else if (version < PROGRESS_SAVE_VERSION) {
        std::string error;
        if (!apply_migrations(document, version, error)) {
            report.error_message = error;
            core::log_error("save", "{}, starting from a fresh state", error);
            return report;
        }
        core::log_info("save", "Migrated save from version {} to {}", version, PROGRESS_SAVE_VERSION);
    }

    EntryReader reader(report);
    if (document.contains("counters")) {
        reader.read_counters(document["counters"]);
    }
    if (document.contains("achievements")) {
        reader.read_achievements(document["achievements"]);
    }
    if (document.contains("collections")) {
        reader.read_collections(document["collections"]);
    }

    report.success = true;
    return report;
}

// ============================================================================
// Migrations
// ============================================================================

void ProgressSerializer::register_migration(uint32_t from_version, ProgressMigrationFunc migration) {
    m_migrations[from_version] = std::move(migration);
}

void ProgressSerializer::clear_migrations() {
    m_migrations.clear();
}

bool ProgressSerializer::apply_migrations(json& document, uint32_t version, std::string& out_error) const {
    for (uint32_t v = version; v < PROGRESS_SAVE_VERSION; ++v) {
        auto it = m_migrations.find(v);
        if (it == m_migrations.end()) {
            out_error = std::format("No migration registered from save version {}", v);
            return false;
        }

        try {
            if (!it->second(document, v)) {
                out_error = std::format("Migration from save version {} failed", v);
                return false;
            }
        } catch (const std::exception& e) {
            out_error = std::format("Migration from save version {} threw: {}", v, e.what());
            return false;
        }
    }

    document["version"] = PROGRESS_SAVE_VERSION;
    return true;
}

// Legacy records: { "achievementId", "isUnlocked", "isClaimed", "unlockTime", "progress" }
// with unlockTime 0 meaning never unlocked. Rewards were handed out on claim,
// so nothing is left pending.
bool migrate_legacy_document(json& document, uint32_t from_version) {
    if (from_version != LEGACY_SAVE_VERSION) return false;

    json achievements = json::object();
    if (auto it = document.find("achievements"); it != document.end() && it->is_array()) {
        for (const auto& record : *it) {
            if (!record.is_object()) continue;

            std::string id = data::json_helpers::get_string(record, "achievementId");
            if (id.empty()) {
                core::log_warning("save", "Skipping legacy achievement record without an id");
                continue;
            }

            json entry;
            entry["unlocked"] = record.value("isUnlocked", json(false));
            entry["claimed"] = record.value("isClaimed", json(false));
            entry["grant_pending"] = false;
            if (auto time = record.find("unlockTime"); time != record.end() &&
                time->is_number_integer() && time->get<int64_t>() > 0) {
                entry["unlock_timestamp"] = *time;
            }
            entry["progress"] = record.value("progress", json(0));
            achievements[id] = std::move(entry);
        }
    }

    document["achievements"] = std::move(achievements);
    if (!document.contains("counters")) {
        document["counters"] = json::object();
    }
    if (!document.contains("collections")) {
        document["collections"] = json::object();
    }
    return true;
}

} // namespace progression::save
