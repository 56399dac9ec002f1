#pragma once

#include <progression/engine/config.hpp>
#include <progression/engine/services.hpp>
#include <progression/engine/evaluation_scheduler.hpp>
#include <progression/achievements/achievements.hpp>
#include <progression/collections/collection_manager.hpp>
#include <progression/counters/counter_store.hpp>
#include <progression/save/progress_serializer.hpp>
#include <progression/save/progress_store.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <optional>

namespace progression::engine {

// ============================================================================
// Views - value snapshots returned by queries
// ============================================================================

struct AchievementView {
    std::string id;
    std::string name;
    std::string description;
    achievements::AchievementCategory category = achievements::AchievementCategory::Progression;
    achievements::AchievementRarity rarity = achievements::AchievementRarity::Common;
    bool unlocked = false;
    bool claimed = false;
    int64_t progress = 0;
    int64_t target = 0;
    int priority = 0;
    std::optional<uint64_t> unlock_timestamp;
};

struct CollectionItemView {
    std::string id;
    std::string name;
    std::string rarity;
    bool collected = false;
};

struct CollectionView {
    std::string id;
    std::string name;
    std::string description;
    int completion_percentage = 0;
    bool completed = false;
    std::vector<CollectionItemView> items;
};

class ProgressionEngine;

struct InitResult {
    std::unique_ptr<ProgressionEngine> engine;
    std::vector<std::string> errors;

    bool success() const { return engine != nullptr; }
};

// Validates the configuration, builds the engine and loads saved progress
// from the store. On configuration errors no engine is returned.
InitResult init(const ProgressionConfig& config, const EngineServices& services = {});

// Flushes unsaved progress and destroys the engine
void shutdown(std::unique_ptr<ProgressionEngine> engine);

// ============================================================================
// ProgressionEngine
// ============================================================================
//
// Facade over counters, achievements, collections, persistence and the
// evaluation scheduler. Operations never throw; unknown ids are no-ops.
// Mutating calls are serialized by a per-engine mutex, which is recursive so
// collaborators may call back into the engine from their callbacks.

class ProgressionEngine {
public:
    ~ProgressionEngine() = default;

    ProgressionEngine(const ProgressionEngine&) = delete;
    ProgressionEngine& operator=(const ProgressionEngine&) = delete;

    // ========================================================================
    // Progress
    // ========================================================================

    // Negative deltas and values are ignored
    void report_progress(const std::string& key, int64_t delta);
    void set_progress(const std::string& key, int64_t value);

    void collect_item(const std::string& collection_id, const std::string& item_id);

    // Unlocked -> Claimed and grants the reward. Returns false when the
    // achievement is unknown, still locked or already claimed.
    bool claim_achievement(const std::string& achievement_id);

    // ========================================================================
    // Queries
    // ========================================================================

    // Ordered by priority, highest first; ties keep definition order
    std::vector<AchievementView> get_achievements() const;
    std::optional<AchievementView> get_achievement(const std::string& achievement_id) const;

    // Definition order
    std::vector<CollectionView> get_collections() const;
    std::optional<CollectionView> get_collection(const std::string& collection_id) const;

    int64_t get_counter(const std::string& key) const;
    std::vector<std::string> list_unlocked() const;
    std::vector<std::string> list_claimable() const;

    // ========================================================================
    // Evaluation
    // ========================================================================

    // Advances the sweep timer by dt seconds
    void update(float dt);

    // Runs a full sweep now
    void evaluate_all();

    // ========================================================================
    // Persistence
    // ========================================================================

    std::string save() const;

    // Replaces all progress with the document's. An unreadable document
    // resets to a fresh state and returns false. Retries pending grants.
    bool load(const std::string& blob);

    // Writes to the store if anything changed since the last write
    bool flush();
    bool is_dirty() const;

    const ProgressionConfig& config() const { return m_config; }

private:
    friend InitResult init(const ProgressionConfig& config, const EngineServices& services);

    ProgressionEngine(ProgressionConfig config,
                      achievements::AchievementRegistry achievement_registry,
                      collections::CollectionRegistry collection_registry,
                      const EngineServices& services);

    void load_from_store();

    void on_evaluate(EvaluationReason reason, const std::string& counter_key);
    void handle_unlocks(const std::vector<achievements::AchievementUnlockedEvent>& events);
    void handle_collection_completed(const collections::CollectionCompletedEvent& event);

    bool try_grant(const rewards::RewardGrant& grant);
    void retry_pending_grants();

    void notify_unlocked(const achievements::AchievementUnlockedEvent& event);
    void notify_item_collected(const collections::ItemCollectedEvent& event);
    void notify_collection_completed(const collections::CollectionCompletedEvent& event);
    void track(AnalyticsEvent event);

    save::ProgressState snapshot_state() const;
    void apply_state(const save::ProgressState& state);
    bool persist();

    AchievementView make_view(const achievements::AchievementDefinition& def) const;
    CollectionView make_view(const collections::CollectionDefinition& def) const;

    uint64_t now() const { return m_clock->now(); }

    mutable std::recursive_mutex m_mutex;

    ProgressionConfig m_config;
    EngineServices m_services;
    const core::IClock* m_clock;

    achievements::AchievementRegistry m_achievement_registry;
    collections::CollectionRegistry m_collection_registry;

    counters::CounterStore m_counters;
    achievements::AchievementManager m_achievements;
    collections::CollectionManager m_collections;

    save::ProgressSerializer m_serializer;
    std::unique_ptr<save::IProgressStore> m_owned_store;
    save::IProgressStore* m_store = nullptr;

    EvaluationScheduler m_scheduler;
    bool m_dirty = false;
};

} // namespace progression::engine
