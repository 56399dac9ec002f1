#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <progression/achievements/achievement_manager.hpp>
#include <memory>

using namespace progression::achievements;
using progression::counters::CounterStore;
using Catch::Matchers::WithinAbs;

class ManagerFixture {
protected:
    ManagerFixture() {
        achievement()
            .id("first_level")
            .name("First Steps")
            .require("levels_completed", 1)
            .coins(100)
            .gems(10)
            .register_achievement(registry);

        achievement()
            .id("level_master")
            .name("Level Master")
            .rarity(AchievementRarity::Rare)
            .require("levels_completed", 100)
            .register_achievement(registry);

        achievement()
            .id("all_rounder")
            .name("All Rounder")
            .category(AchievementCategory::Special)
            .rarity(AchievementRarity::Epic)
            .require("A", 5)
            .require("B", 3)
            .register_achievement(registry);

        manager = std::make_unique<AchievementManager>(registry);
    }

    AchievementRegistry registry;
    std::unique_ptr<AchievementManager> manager;
    CounterStore counters;
    uint64_t now = 1700000000;
};

TEST_CASE_METHOD(ManagerFixture, "AchievementManager initial state", "[achievements][manager]") {
    REQUIRE(manager->get_total_count() == 3);
    REQUIRE(manager->get_unlocked_count() == 0);
    REQUIRE(manager->list_locked().size() == 3);
    REQUIRE(manager->list_unlocked().empty());
    REQUIRE(manager->list_claimable().empty());

    const auto* state = manager->get_state("first_level");
    REQUIRE(state != nullptr);
    REQUIRE(state->status() == AchievementStatus::Locked);
    REQUIRE_FALSE(state->unlock_timestamp.has_value());
}

TEST_CASE_METHOD(ManagerFixture, "AchievementManager unlocks when requirements are met", "[achievements][manager]") {
    SECTION("Below threshold stays locked") {
        counters.set("levels_completed", 0);
        REQUIRE_FALSE(manager->evaluate("first_level", counters, now).has_value());
        REQUIRE_FALSE(manager->is_unlocked("first_level"));
    }

    SECTION("Reaching threshold unlocks once") {
        counters.increment("levels_completed", 1);

        auto event = manager->evaluate("first_level", counters, now);
        REQUIRE(event.has_value());
        REQUIRE(event->achievement_id == "first_level");
        REQUIRE(event->timestamp == now);

        REQUIRE(manager->is_unlocked("first_level"));
        REQUIRE(manager->get_state("first_level")->unlock_timestamp == now);
        REQUIRE(manager->get_progress("first_level") == 1);

        // Second evaluation is not a new transition
        REQUIRE_FALSE(manager->evaluate("first_level", counters, now + 5).has_value());
        REQUIRE(manager->get_state("first_level")->unlock_timestamp == now);
    }

    SECTION("Unlock event carries category and rarity") {
        counters.set("A", 5);
        counters.set("B", 3);
        auto event = manager->evaluate("all_rounder", counters, now);
        REQUIRE(event.has_value());
        REQUIRE(event->category == AchievementCategory::Special);
        REQUIRE(event->rarity == AchievementRarity::Epic);
    }

    SECTION("Unknown achievement is a no-op") {
        REQUIRE_FALSE(manager->evaluate("does-not-exist", counters, now).has_value());
        REQUIRE(manager->get_state("does-not-exist") == nullptr);
    }
}

TEST_CASE_METHOD(ManagerFixture, "AchievementManager conjunctive requirements", "[achievements][manager]") {
    SECTION("A first, then B") {
        counters.increment("A", 5);
        REQUIRE(manager->evaluate_all(counters, now).empty());
        REQUIRE(manager->get_progress("all_rounder") == 5);

        counters.increment("B", 3);
        auto unlocked = manager->evaluate_all(counters, now);
        REQUIRE(unlocked.size() == 1);
        REQUIRE(unlocked[0].achievement_id == "all_rounder");
    }

    SECTION("B first, then A") {
        counters.increment("B", 3);
        REQUIRE(manager->evaluate_dependents("B", counters, now).empty());

        counters.increment("A", 4);
        REQUIRE(manager->evaluate_dependents("A", counters, now).empty());
        REQUIRE(manager->get_progress("all_rounder") == 7);

        counters.increment("A", 1);
        auto unlocked = manager->evaluate_dependents("A", counters, now);
        REQUIRE(unlocked.size() == 1);
        REQUIRE(manager->is_unlocked("all_rounder"));
    }
}

TEST_CASE_METHOD(ManagerFixture, "AchievementManager progress tracking", "[achievements][manager]") {
    counters.set("levels_completed", 40);
    manager->evaluate_all(counters, now);

    REQUIRE(manager->get_progress("level_master") == 40);
    REQUIRE_THAT(manager->get_progress_percent("level_master"), WithinAbs(0.4f, 0.001f));

    SECTION("Repeated evaluation keeps the same progress") {
        manager->evaluate_all(counters, now);
        manager->evaluate_all(counters, now);
        REQUIRE(manager->get_progress("level_master") == 40);
    }

    SECTION("Lowered counter lowers locked progress but never re-locks") {
        counters.set("levels_completed", 10);
        manager->evaluate_all(counters, now);
        REQUIRE(manager->get_progress("level_master") == 10);

        REQUIRE(manager->is_unlocked("first_level"));
        counters.set("levels_completed", 0);
        manager->evaluate_all(counters, now);
        REQUIRE(manager->is_unlocked("first_level"));
        REQUIRE(manager->get_progress("first_level") == 1);
    }
}

TEST_CASE_METHOD(ManagerFixture, "AchievementManager claim lifecycle", "[achievements][manager]") {
    SECTION("Cannot claim a locked achievement") {
        REQUIRE_FALSE(manager->begin_claim("first_level"));
        REQUIRE_FALSE(manager->is_claimed("first_level"));
    }

    SECTION("Claim an unlocked achievement once") {
        counters.set("levels_completed", 1);
        manager->evaluate_all(counters, now);
        REQUIRE(manager->list_claimable() == std::vector<std::string>{"first_level"});

        REQUIRE(manager->begin_claim("first_level"));
        REQUIRE(manager->get_status("first_level") == AchievementStatus::Claimed);
        REQUIRE(manager->is_grant_pending("first_level"));
        REQUIRE(manager->list_grant_pending() == std::vector<std::string>{"first_level"});
        REQUIRE(manager->list_claimable().empty());

        manager->complete_grant("first_level");
        REQUIRE_FALSE(manager->is_grant_pending("first_level"));

        auto before = *manager->get_state("first_level");
        REQUIRE_FALSE(manager->begin_claim("first_level"));
        REQUIRE_FALSE(manager->begin_claim("first_level"));
        REQUIRE(*manager->get_state("first_level") == before);
    }

    SECTION("Claiming an unknown id is a no-op") {
        REQUIRE_FALSE(manager->begin_claim("does-not-exist"));
        manager->complete_grant("does-not-exist");
        REQUIRE(manager->list_unlocked().empty());
    }
}

TEST_CASE_METHOD(ManagerFixture, "AchievementManager statistics", "[achievements][manager]") {
    counters.set("levels_completed", 1);
    manager->evaluate_all(counters, now);

    REQUIRE(manager->get_unlocked_count() == 1);
    REQUIRE_THAT(manager->get_completion_percent(), WithinAbs(1.0f / 3.0f, 0.001f));
    REQUIRE(manager->list_by_category(AchievementCategory::Special).size() == 1);
}

TEST_CASE_METHOD(ManagerFixture, "AchievementManager state restore", "[achievements][manager]") {
    AchievementState saved;
    saved.unlocked = true;
    saved.claimed = true;
    saved.unlock_timestamp = 1600000000;
    saved.progress = 1;

    SECTION("Restores registered achievement") {
        REQUIRE(manager->restore_state("first_level", saved));
        REQUIRE(manager->is_claimed("first_level"));
        REQUIRE(manager->get_state("first_level")->unlock_timestamp == 1600000000u);
    }

    SECTION("Ignores unknown achievement") {
        REQUIRE_FALSE(manager->restore_state("retired_achievement", saved));
        REQUIRE(manager->get_state("retired_achievement") == nullptr);
    }

    SECTION("Rejects claimed without unlocked") {
        saved.unlocked = false;
        REQUIRE_FALSE(manager->restore_state("first_level", saved));
        REQUIRE(manager->get_status("first_level") == AchievementStatus::Locked);
    }

    SECTION("Rejects pending grant without claim") {
        AchievementState pending;
        pending.unlocked = true;
        pending.grant_pending = true;
        REQUIRE_FALSE(is_consistent(pending));
        REQUIRE_FALSE(manager->restore_state("first_level", pending));
    }

    SECTION("Reset locks everything") {
        manager->restore_state("first_level", saved);
        manager->reset();
        REQUIRE(manager->get_unlocked_count() == 0);
        REQUIRE(manager->get_all_states().size() == 3);
    }
}
