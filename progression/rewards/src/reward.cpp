#include <progression/rewards/reward.hpp>
#include <progression/data/json_loader.hpp>

namespace progression::rewards {

const char* to_string(RewardKind kind) {
    switch (kind) {
        case RewardKind::Currency:        return "currency";
        case RewardKind::PremiumCurrency: return "premium_currency";
        case RewardKind::Item:            return "item";
    }
    return "unknown";
}

const char* to_string(RewardSource source) {
    switch (source) {
        case RewardSource::Achievement: return "achievement";
        case RewardSource::Collection:  return "collection";
    }
    return "unknown";
}

std::optional<RewardKind> reward_kind_from_string(const std::string& name) {
    if (name == "currency" || name == "coins") return RewardKind::Currency;
    if (name == "premium_currency" || name == "gems") return RewardKind::PremiumCurrency;
    if (name == "item") return RewardKind::Item;
    return std::nullopt;
}

RewardTotals summarize(const RewardManifest& manifest) {
    RewardTotals totals;
    for (const auto& entry : manifest) {
        switch (entry.kind) {
            case RewardKind::Currency:
                totals.currency += entry.amount;
                break;
            case RewardKind::PremiumCurrency:
                totals.premium_currency += entry.amount;
                break;
            case RewardKind::Item:
                totals.items[entry.item_id] += entry.amount;
                break;
        }
    }
    return totals;
}

bool validate_manifest(const RewardManifest& manifest, std::string& out_error) {
    for (const auto& entry : manifest) {
        if (entry.amount <= 0) {
            out_error = std::string("Reward '") + to_string(entry.kind) + "' must have a positive amount";
            return false;
        }
        if (entry.kind == RewardKind::Item && entry.item_id.empty()) {
            out_error = "Item reward is missing 'item_id'";
            return false;
        }
    }
    return true;
}

namespace {

std::optional<RewardEntry> deserialize_entry(const nlohmann::json& j, std::string& error) {
    using namespace data::json_helpers;

    if (!require_string(j, "kind", error)) {
        return std::nullopt;
    }
    auto kind = reward_kind_from_string(j["kind"].get<std::string>());
    if (!kind) {
        error = "Unknown reward kind '" + j["kind"].get<std::string>() + "'";
        return std::nullopt;
    }
    if (!require_int(j, "amount", error)) {
        return std::nullopt;
    }

    RewardEntry entry;
    entry.kind = *kind;
    entry.amount = j["amount"].get<int64_t>();
    entry.item_id = get_string(j, "item_id");
    return entry;
}

} // anonymous namespace

std::optional<RewardManifest> deserialize_manifest(const nlohmann::json& j, std::string& out_error) {
    RewardManifest manifest;

    if (j.is_array()) {
        for (const auto& entry_json : j) {
            if (!entry_json.is_object()) {
                out_error = "Reward entry must be an object";
                return std::nullopt;
            }
            auto entry = deserialize_entry(entry_json, out_error);
            if (!entry) {
                return std::nullopt;
            }
            manifest.push_back(std::move(*entry));
        }
    } else if (j.is_object()) {
        for (const auto& [name, amount] : j.items()) {
            auto kind = reward_kind_from_string(name);
            if (!kind || *kind == RewardKind::Item) {
                out_error = "Unknown reward kind '" + name + "'";
                return std::nullopt;
            }
            if (!amount.is_number_integer()) {
                out_error = "Reward '" + name + "' must be an integer";
                return std::nullopt;
            }
            manifest.push_back({*kind, amount.get<int64_t>(), ""});
        }
    } else if (!j.is_null()) {
        out_error = "Rewards must be an array or an object";
        return std::nullopt;
    }

    if (!validate_manifest(manifest, out_error)) {
        return std::nullopt;
    }
    return manifest;
}

} // namespace progression::rewards
