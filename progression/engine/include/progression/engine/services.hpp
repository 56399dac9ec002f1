#pragma once

#include <progression/achievements/achievement_events.hpp>
#include <progression/collections/collection_events.hpp>
#include <progression/rewards/reward.hpp>
#include <progression/save/progress_store.hpp>
#include <progression/core/clock.hpp>
#include <string>
#include <map>

namespace progression::engine {

// ============================================================================
// Collaborator interfaces
// ============================================================================
//
// Implemented by the host. Calls are made synchronously from inside engine
// operations; a collaborator may call back into the engine; any evaluation
// that triggers is deferred until the current pass finishes.

// Player-facing toasts and popups
class INotificationService {
public:
    virtual ~INotificationService() = default;

    virtual void on_achievement_unlocked(const achievements::AchievementUnlockedEvent& event) = 0;
    virtual void on_item_collected(const collections::ItemCollectedEvent& event) = 0;
    virtual void on_collection_completed(const collections::CollectionCompletedEvent& event) = 0;
};

struct AnalyticsEvent {
    std::string name;
    std::map<std::string, std::string> properties;
};

namespace analytics_events {
inline constexpr const char* ACHIEVEMENT_UNLOCKED = "achievement_unlocked";
inline constexpr const char* ACHIEVEMENT_CLAIMED = "achievement_claimed";
inline constexpr const char* ITEM_COLLECTED = "item_collected";
inline constexpr const char* COLLECTION_COMPLETED = "collection_completed";
} // namespace analytics_events

class IAnalyticsSink {
public:
    virtual ~IAnalyticsSink() = default;

    virtual void track(const AnalyticsEvent& event) = 0;
};

// Hands rewards to the economy. Returns false when the grant did not go
// through; the engine keeps it pending and retries on the next load.
class IRewardGrantService {
public:
    virtual ~IRewardGrantService() = default;

    virtual bool grant(const rewards::RewardGrant& grant) = 0;
};

// ============================================================================
// EngineServices
// ============================================================================
//
// Non-owning. Every pointer is optional; the engine skips missing
// collaborators. Pointees must outlive the engine.

struct EngineServices {
    INotificationService* notifications = nullptr;
    IAnalyticsSink* analytics = nullptr;
    IRewardGrantService* rewards = nullptr;

    // Overrides the file store built from the configured save path
    save::IProgressStore* store = nullptr;

    // System clock when null
    const core::IClock* clock = nullptr;
};

} // namespace progression::engine
