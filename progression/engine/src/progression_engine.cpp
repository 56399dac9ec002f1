#include <progression/engine/progression_engine.hpp>
#include <progression/core/log.hpp>
#include <algorithm>

namespace progression::engine {

// ============================================================================
// Lifecycle
// ============================================================================

InitResult init(const ProgressionConfig& config, const EngineServices& services) {
    InitResult result;

    achievements::AchievementRegistry achievement_registry;
    collections::CollectionRegistry collection_registry;

    if (validate_config(config, result.errors)) {
        for (const auto& def : config.achievements) {
            std::string error;
            if (!achievement_registry.register_achievement(def, error)) {
                result.errors.push_back(error);
            }
        }
        for (const auto& def : config.collections) {
            std::string error;
            if (!collection_registry.register_collection(def, error)) {
                result.errors.push_back(error);
            }
        }
    }

    if (!result.errors.empty()) {
        for (const auto& error : result.errors) {
            core::log_error("progression", "Configuration error: {}", error);
        }
        return result;
    }

    result.engine.reset(new ProgressionEngine(config, std::move(achievement_registry),
                                              std::move(collection_registry), services));
    result.engine->load_from_store();

    core::log_info("progression", "Initialized with {} achievements and {} collections",
                   config.achievements.size(), config.collections.size());
    return result;
}

void shutdown(std::unique_ptr<ProgressionEngine> engine) {
    if (!engine) return;

    if (!engine->flush()) {
        core::log_warning("progression", "Shutting down with unsaved progress");
    }
    engine.reset();
    core::log_info("progression", "Shutdown complete");
}

ProgressionEngine::ProgressionEngine(ProgressionConfig config,
                                     achievements::AchievementRegistry achievement_registry,
                                     collections::CollectionRegistry collection_registry,
                                     const EngineServices& services)
    : m_config(std::move(config))
    , m_services(services)
    , m_clock(services.clock ? services.clock : &core::system_clock())
    , m_achievement_registry(std::move(achievement_registry))
    , m_collection_registry(std::move(collection_registry))
    , m_achievements(m_achievement_registry)
    , m_collections(m_collection_registry)
    , m_scheduler(m_config.sweep_interval_seconds) {

    if (services.store) {
        m_store = services.store;
    } else if (!m_config.save_path.empty()) {
        m_owned_store = std::make_unique<save::FileProgressStore>(m_config.save_path);
        m_store = m_owned_store.get();
    }

    m_scheduler.set_callback([this](EvaluationReason reason, const std::string& counter_key) {
        on_evaluate(reason, counter_key);
    });
}

void ProgressionEngine::load_from_store() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_store) return;

    auto blob = m_store->read();
    if (!blob) {
        core::log_info("progression", "No saved progress, starting fresh");
        return;
    }
    load(*blob);
}

// ============================================================================
// Progress
// ============================================================================

void ProgressionEngine::report_progress(const std::string& key, int64_t delta) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (delta < 0) {
        core::log_debug("progression", "Ignoring negative progress {} for '{}'", delta, key);
        return;
    }

    int64_t before = m_counters.get(key);
    if (m_counters.increment(key, delta) == before) {
        return;
    }

    m_dirty = true;
    m_scheduler.trigger(EvaluationReason::Mutation, key);
}

void ProgressionEngine::set_progress(const std::string& key, int64_t value) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (value < 0) {
        core::log_debug("progression", "Ignoring negative value {} for '{}'", value, key);
        return;
    }

    if (m_counters.contains(key) && m_counters.get(key) == value) {
        return;
    }
    m_counters.set(key, value);

    m_dirty = true;
    m_scheduler.trigger(EvaluationReason::Mutation, key);
}

void ProgressionEngine::collect_item(const std::string& collection_id, const std::string& item_id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto result = m_collections.collect_item(collection_id, item_id, now());
    if (!result.collected) {
        return;
    }

    m_counters.increment(counters::ITEMS_COLLECTED_KEY, 1);
    m_dirty = true;

    notify_item_collected(*result.collected);

    if (result.completed) {
        handle_collection_completed(*result.completed);
    }

    m_scheduler.trigger(EvaluationReason::Mutation, counters::ITEMS_COLLECTED_KEY);
}

bool ProgressionEngine::claim_achievement(const std::string& achievement_id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_achievements.begin_claim(achievement_id)) {
        core::log_debug("progression", "Claim ignored for '{}': {}", achievement_id,
                        m_achievement_registry.exists(achievement_id)
                            ? achievements::to_string(m_achievements.get_status(achievement_id))
                            : "unknown achievement");
        return false;
    }

    // Pending grant is persisted before the reward goes out
    m_dirty = true;
    persist();

    const auto* def = m_achievement_registry.get(achievement_id);
    rewards::RewardGrant grant;
    grant.source = rewards::RewardSource::Achievement;
    grant.source_id = achievement_id;
    grant.manifest = def->rewards;

    if (try_grant(grant)) {
        m_achievements.complete_grant(achievement_id);
        m_dirty = true;
        persist();
    }

    track({analytics_events::ACHIEVEMENT_CLAIMED, {{"achievement_id", achievement_id}}});

    core::log_info("progression", "Achievement claimed: {}", achievement_id);
    return true;
}

// ============================================================================
// Queries
// ============================================================================

AchievementView ProgressionEngine::make_view(const achievements::AchievementDefinition& def) const {
    AchievementView view;
    view.id = def.achievement_id;
    view.name = def.display_name;
    view.description = def.description;
    view.category = def.category;
    view.rarity = def.rarity;
    view.priority = def.priority;
    view.target = def.get_target();

    if (const auto* state = m_achievements.get_state(def.achievement_id)) {
        view.unlocked = state->unlocked;
        view.claimed = state->claimed;
        view.progress = state->progress;
        view.unlock_timestamp = state->unlock_timestamp;
    }
    return view;
}

CollectionView ProgressionEngine::make_view(const collections::CollectionDefinition& def) const {
    CollectionView view;
    view.id = def.collection_id;
    view.name = def.display_name;
    view.description = def.description;
    view.completion_percentage = m_collections.get_completion_percentage(def.collection_id);
    view.completed = m_collections.is_completed(def.collection_id);

    view.items.reserve(def.items.size());
    for (const auto& item : def.items) {
        CollectionItemView item_view;
        item_view.id = item.item_id;
        item_view.name = item.display_name;
        item_view.rarity = item.rarity;
        item_view.collected = m_collections.is_collected(def.collection_id, item.item_id);
        view.items.push_back(std::move(item_view));
    }
    return view;
}

std::vector<AchievementView> ProgressionEngine::get_achievements() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    std::vector<AchievementView> views;
    views.reserve(m_achievement_registry.get_all_achievement_ids().size());
    for (const auto& id : m_achievement_registry.get_all_achievement_ids()) {
        views.push_back(make_view(*m_achievement_registry.get(id)));
    }

    std::stable_sort(views.begin(), views.end(), [](const AchievementView& a, const AchievementView& b) {
        return a.priority > b.priority;
    });
    return views;
}

std::optional<AchievementView> ProgressionEngine::get_achievement(const std::string& achievement_id) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    const auto* def = m_achievement_registry.get(achievement_id);
    if (!def) return std::nullopt;
    return make_view(*def);
}

std::vector<CollectionView> ProgressionEngine::get_collections() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    std::vector<CollectionView> views;
    views.reserve(m_collection_registry.get_all_collection_ids().size());
    for (const auto& id : m_collection_registry.get_all_collection_ids()) {
        views.push_back(make_view(*m_collection_registry.get(id)));
    }
    return views;
}

std::optional<CollectionView> ProgressionEngine::get_collection(const std::string& collection_id) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    const auto* def = m_collection_registry.get(collection_id);
    if (!def) return std::nullopt;
    return make_view(*def);
}

int64_t ProgressionEngine::get_counter(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_counters.get(key);
}

std::vector<std::string> ProgressionEngine::list_unlocked() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_achievements.list_unlocked();
}

std::vector<std::string> ProgressionEngine::list_claimable() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_achievements.list_claimable();
}

// ============================================================================
// Evaluation
// ============================================================================

void ProgressionEngine::update(float dt) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_scheduler.update(dt);
}

void ProgressionEngine::evaluate_all() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_scheduler.trigger(EvaluationReason::Sweep);
}

void ProgressionEngine::on_evaluate(EvaluationReason reason, const std::string& counter_key) {
    uint64_t timestamp = now();

    if (reason == EvaluationReason::Mutation && !counter_key.empty()) {
        handle_unlocks(m_achievements.evaluate_dependents(counter_key, m_counters, timestamp));
        return;
    }

    handle_unlocks(m_achievements.evaluate_all(m_counters, timestamp));

    for (const auto& event : m_collections.check_all_completions(timestamp)) {
        handle_collection_completed(event);
    }

    if (m_dirty) {
        persist();
    }
}

void ProgressionEngine::handle_unlocks(const std::vector<achievements::AchievementUnlockedEvent>& events) {
    if (events.empty()) return;

    for (const auto& event : events) {
        notify_unlocked(event);
        track({analytics_events::ACHIEVEMENT_UNLOCKED, {
            {"achievement_id", event.achievement_id},
            {"category", achievements::to_string(event.category)},
            {"rarity", achievements::to_string(event.rarity)}
        }});
    }

    m_dirty = true;
    persist();
}

void ProgressionEngine::handle_collection_completed(const collections::CollectionCompletedEvent& event) {
    m_dirty = true;
    persist();

    const auto* def = m_collection_registry.get(event.collection_id);
    rewards::RewardGrant grant;
    grant.source = rewards::RewardSource::Collection;
    grant.source_id = event.collection_id;
    grant.manifest = def->completion_rewards;

    if (try_grant(grant)) {
        m_collections.complete_grant(event.collection_id);
        m_dirty = true;
        persist();
    }

    notify_collection_completed(event);
}

// ============================================================================
// Rewards
// ============================================================================

bool ProgressionEngine::try_grant(const rewards::RewardGrant& grant) {
    if (grant.manifest.empty() || !m_services.rewards) {
        return true;
    }

    bool granted = false;
    try {
        granted = m_services.rewards->grant(grant);
    } catch (const std::exception& e) {
        core::log_error("progression", "Reward grant for {} '{}' threw: {}",
                        rewards::to_string(grant.source), grant.source_id, e.what());
    } catch (...) {
        core::log_error("progression", "Reward grant for {} '{}' threw an unknown exception",
                        rewards::to_string(grant.source), grant.source_id);
    }

    if (!granted) {
        core::log_warning("progression", "Reward grant for {} '{}' failed, will retry on next load",
                          rewards::to_string(grant.source), grant.source_id);
    }
    return granted;
}

void ProgressionEngine::retry_pending_grants() {
    bool changed = false;

    for (const auto& id : m_achievements.list_grant_pending()) {
        rewards::RewardGrant grant;
        grant.source = rewards::RewardSource::Achievement;
        grant.source_id = id;
        grant.manifest = m_achievement_registry.get(id)->rewards;

        core::log_info("progression", "Retrying pending reward for achievement '{}'", id);
        if (try_grant(grant)) {
            m_achievements.complete_grant(id);
            changed = true;
        }
    }

    for (const auto& id : m_collections.list_grant_pending()) {
        rewards::RewardGrant grant;
        grant.source = rewards::RewardSource::Collection;
        grant.source_id = id;
        grant.manifest = m_collection_registry.get(id)->completion_rewards;

        core::log_info("progression", "Retrying pending reward for collection '{}'", id);
        if (try_grant(grant)) {
            m_collections.complete_grant(id);
            changed = true;
        }
    }

    if (changed) {
        m_dirty = true;
        persist();
    }
}

// ============================================================================
// Collaborators
// ============================================================================

void ProgressionEngine::notify_unlocked(const achievements::AchievementUnlockedEvent& event) {
    if (!m_services.notifications) return;
    try {
        m_services.notifications->on_achievement_unlocked(event);
    } catch (const std::exception& e) {
        core::log_error("progression", "Notification for '{}' threw: {}", event.achievement_id, e.what());
    } catch (...) {
        core::log_error("progression", "Notification for '{}' threw an unknown exception", event.achievement_id);
    }
}

void ProgressionEngine::notify_item_collected(const collections::ItemCollectedEvent& event) {
    track({analytics_events::ITEM_COLLECTED, {
        {"collection_id", event.collection_id},
        {"item_id", event.item_id},
        {"rarity", event.rarity}
    }});

    if (!m_services.notifications) return;
    try {
        m_services.notifications->on_item_collected(event);
    } catch (const std::exception& e) {
        core::log_error("progression", "Notification for '{}/{}' threw: {}",
                        event.collection_id, event.item_id, e.what());
    } catch (...) {
        core::log_error("progression", "Notification for '{}/{}' threw an unknown exception",
                        event.collection_id, event.item_id);
    }
}

void ProgressionEngine::notify_collection_completed(const collections::CollectionCompletedEvent& event) {
    track({analytics_events::COLLECTION_COMPLETED, {{"collection_id", event.collection_id}}});

    if (!m_services.notifications) return;
    try {
        m_services.notifications->on_collection_completed(event);
    } catch (const std::exception& e) {
        core::log_error("progression", "Notification for '{}' threw: {}", event.collection_id, e.what());
    } catch (...) {
        core::log_error("progression", "Notification for '{}' threw an unknown exception", event.collection_id);
    }
}

void ProgressionEngine::track(AnalyticsEvent event) {
    if (!m_services.analytics) return;
    try {
        m_services.analytics->track(event);
    } catch (const std::exception& e) {
        core::log_error("progression", "Analytics event '{}' threw: {}", event.name, e.what());
    } catch (...) {
        core::log_error("progression", "Analytics event '{}' threw an unknown exception", event.name);
    }
}

// ============================================================================
// Persistence
// ============================================================================

save::ProgressState ProgressionEngine::snapshot_state() const {
    save::ProgressState state;
    state.counters = m_counters.snapshot();
    state.achievements = m_achievements.get_all_states();
    state.collections = m_collections.get_all_states();
    return state;
}

void ProgressionEngine::apply_state(const save::ProgressState& state) {
    m_counters.restore(state.counters);

    for (const auto& [id, achievement_state] : state.achievements) {
        m_achievements.restore_state(id, achievement_state);
    }
    for (const auto& [id, collection_state] : state.collections) {
        m_collections.restore_state(id, collection_state);
    }
}

std::string ProgressionEngine::save() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_serializer.save(snapshot_state());
}

bool ProgressionEngine::load(const std::string& blob) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto report = m_serializer.load(blob);

    m_counters.clear();
    m_achievements.reset();
    m_collections.reset();
    m_dirty = false;

    if (report.success) {
        apply_state(report.state);
        core::log_info("progression", "Loaded progress (save version {}, {} entries dropped)",
                       report.source_version, report.warnings.size());
    }

    retry_pending_grants();

    // Definitions may have changed since the save was written
    m_scheduler.trigger(EvaluationReason::Sweep);
    m_scheduler.reset_timer();

    return report.success;
}

bool ProgressionEngine::persist() {
    // Memory-only: the host saves through save()
    if (!m_store) {
        return true;
    }

    if (!m_store->write(m_serializer.save(snapshot_state()))) {
        core::log_error("progression", "Failed to write progress, will retry on next flush");
        m_dirty = true;
        return false;
    }

    m_dirty = false;
    return true;
}

bool ProgressionEngine::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_dirty) return true;
    return persist();
}

bool ProgressionEngine::is_dirty() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_dirty;
}

} // namespace progression::engine
