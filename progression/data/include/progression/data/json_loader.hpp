#pragma once

#include <progression/core/log.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <fstream>
#include <cstdint>

namespace progression::data {

// ============================================================================
// LoadResult
// ============================================================================

// Outcome of reading a list of definitions. Bad entries land in errors and
// the rest are still loaded, so callers can report every problem at once.
template<typename T>
struct LoadResult {
    std::vector<T> items;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    size_t total_processed = 0;

    bool success() const { return errors.empty(); }
    size_t loaded_count() const { return items.size(); }
    size_t error_count() const { return errors.size(); }
};

// ============================================================================
// Documents
// ============================================================================

inline std::optional<nlohmann::json> parse_json(const std::string& text) {
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        core::log_error("data", "Malformed JSON ({} bytes)", text.size());
        return std::nullopt;
    }
    return doc;
}

inline std::optional<nlohmann::json> load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        core::log_error("data", "Cannot open {}", path);
        return std::nullopt;
    }

    auto doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        core::log_error("data", "Malformed JSON in {}", path);
        return std::nullopt;
    }
    return doc;
}

// ============================================================================
// load_json_array
// ============================================================================

// deserialize_fn: std::optional<T>(const nlohmann::json& obj, std::string& out_error)
// With an empty array_key the root itself must be the array.
template<typename T, typename Deserializer>
LoadResult<T> load_json_array(const nlohmann::json& root,
                              Deserializer deserialize_fn,
                              const std::string& array_key = "") {
    LoadResult<T> result;

    const nlohmann::json* entries = &root;
    if (!array_key.empty()) {
        auto it = root.is_object() ? root.find(array_key) : root.end();
        if (!root.is_object() || it == root.end()) {
            result.errors.push_back("Missing key '" + array_key + "'");
            return result;
        }
        entries = &*it;
    }

    if (!entries->is_array()) {
        result.errors.push_back(array_key.empty() ? std::string("Root is not an array")
                                                  : "Key '" + array_key + "' is not an array");
        return result;
    }

    result.items.reserve(entries->size());
    for (size_t i = 0; i < entries->size(); ++i) {
        const auto& entry = (*entries)[i];
        const std::string where = array_key + "[" + std::to_string(i) + "]";
        ++result.total_processed;

        if (!entry.is_object()) {
            result.errors.push_back(where + ": not an object");
            continue;
        }

        std::string error;
        if (auto item = deserialize_fn(entry, error)) {
            result.items.push_back(std::move(*item));
        } else {
            result.errors.push_back(where + ": " + error);
        }
    }

    return result;
}

// ============================================================================
// json_helpers
// ============================================================================

namespace json_helpers {

// Field value when present and accepted by is_type, nullptr otherwise
template<typename Pred>
const nlohmann::json* find_field(const nlohmann::json& j, const std::string& key, Pred is_type) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end() || !is_type(*it)) return nullptr;
    return &*it;
}

inline std::string get_string(const nlohmann::json& j, const std::string& key, const std::string& def = "") {
    const auto* v = find_field(j, key, [](const nlohmann::json& x) { return x.is_string(); });
    return v ? v->get<std::string>() : def;
}

inline int get_int(const nlohmann::json& j, const std::string& key, int def = 0) {
    const auto* v = find_field(j, key, [](const nlohmann::json& x) { return x.is_number_integer(); });
    return v ? v->get<int>() : def;
}

inline int64_t get_int64(const nlohmann::json& j, const std::string& key, int64_t def = 0) {
    const auto* v = find_field(j, key, [](const nlohmann::json& x) { return x.is_number_integer(); });
    return v ? v->get<int64_t>() : def;
}

inline float get_float(const nlohmann::json& j, const std::string& key, float def = 0.0f) {
    const auto* v = find_field(j, key, [](const nlohmann::json& x) { return x.is_number(); });
    return v ? v->get<float>() : def;
}

inline bool get_bool(const nlohmann::json& j, const std::string& key, bool def = false) {
    const auto* v = find_field(j, key, [](const nlohmann::json& x) { return x.is_boolean(); });
    return v ? v->get<bool>() : def;
}

// Non-string elements are skipped
inline std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> out;
    if (const auto* v = find_field(j, key, [](const nlohmann::json& x) { return x.is_array(); })) {
        for (const auto& element : *v) {
            if (element.is_string()) out.push_back(element.get<std::string>());
        }
    }
    return out;
}

template<typename Pred>
bool require_field(const nlohmann::json& j, const std::string& key, Pred is_type,
                   const char* type_name, std::string& out_error) {
    if (!j.is_object() || !j.contains(key)) {
        out_error = "Missing required field '" + key + "'";
        return false;
    }
    if (!is_type(j.at(key))) {
        out_error = "Field '" + key + "' must be " + type_name;
        return false;
    }
    return true;
}

inline bool require_string(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    return require_field(j, key, [](const nlohmann::json& x) { return x.is_string(); }, "a string", out_error);
}

inline bool require_int(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    return require_field(j, key, [](const nlohmann::json& x) { return x.is_number_integer(); }, "an integer", out_error);
}

inline bool require_array(const nlohmann::json& j, const std::string& key, std::string& out_error) {
    return require_field(j, key, [](const nlohmann::json& x) { return x.is_array(); }, "an array", out_error);
}

} // namespace json_helpers

} // namespace progression::data
