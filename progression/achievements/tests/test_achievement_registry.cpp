#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <progression/achievements/achievement_definition.hpp>

using namespace progression::achievements;
using Catch::Matchers::ContainsSubstring;

class RegistryFixture {
protected:
    void register_test_achievements() {
        achievement()
            .id("first_level")
            .name("First Steps")
            .category(AchievementCategory::Progression)
            .require("levels_completed", 1)
            .coins(100)
            .gems(10)
            .register_achievement(registry);

        achievement()
            .id("level_master")
            .name("Level Master")
            .category(AchievementCategory::Progression)
            .rarity(AchievementRarity::Rare)
            .require("levels_completed", 100)
            .register_achievement(registry);

        achievement()
            .id("match_master")
            .name("Match Master")
            .category(AchievementCategory::Skill)
            .require("matches_made", 1000)
            .register_achievement(registry);

        achievement()
            .id("all_rounder")
            .name("All Rounder")
            .category(AchievementCategory::Special)
            .require("matches_made", 50)
            .require("levels_completed", 10)
            .register_achievement(registry);
    }

    AchievementRegistry registry;
};

TEST_CASE_METHOD(RegistryFixture, "AchievementRegistry empty state", "[achievements][registry]") {
    REQUIRE(registry.get_total_achievements() == 0);
    REQUIRE(registry.get_all_achievement_ids().empty());
    REQUIRE(registry.get_dependents("levels_completed").empty());
}

TEST_CASE_METHOD(RegistryFixture, "AchievementRegistry registration", "[achievements][registry]") {
    SECTION("Register single achievement") {
        AchievementDefinition def;
        def.achievement_id = "test_1";
        def.display_name = "Test Achievement";
        def.requirements = {{"k", 1}};

        REQUIRE(registry.register_achievement(def));
        REQUIRE(registry.exists("test_1"));
        REQUIRE(registry.get_total_achievements() == 1);
    }

    SECTION("Register multiple achievements keeps definition order") {
        register_test_achievements();
        const auto& ids = registry.get_all_achievement_ids();
        REQUIRE(ids.size() == 4);
        REQUIRE(ids[0] == "first_level");
        REQUIRE(ids[3] == "all_rounder");
    }

    SECTION("Duplicate id is rejected") {
        register_test_achievements();
        std::string error;
        auto dup = achievement().id("first_level").require("levels_completed", 2).build();

        REQUIRE_FALSE(registry.register_achievement(dup, error));
        REQUIRE_THAT(error, ContainsSubstring("Duplicate"));
        REQUIRE(registry.get_total_achievements() == 4);
        REQUIRE(registry.get("first_level")->requirements[0].threshold == 1);
    }

    SECTION("Invalid definition is rejected") {
        std::string error;
        REQUIRE_FALSE(registry.register_achievement(achievement().id("empty").build(), error));
        REQUIRE_FALSE(registry.exists("empty"));
    }
}

TEST_CASE_METHOD(RegistryFixture, "AchievementRegistry lookup", "[achievements][registry]") {
    register_test_achievements();

    SECTION("Get existing achievement") {
        const auto* def = registry.get("first_level");
        REQUIRE(def != nullptr);
        REQUIRE(def->display_name == "First Steps");
        REQUIRE(def->rewards.size() == 2);
    }

    SECTION("Get non-existent achievement") {
        REQUIRE(registry.get("nonexistent") == nullptr);
        REQUIRE_FALSE(registry.exists("nonexistent"));
    }
}

TEST_CASE_METHOD(RegistryFixture, "AchievementRegistry queries", "[achievements][registry]") {
    register_test_achievements();

    SECTION("Get by category") {
        REQUIRE(registry.get_by_category(AchievementCategory::Progression).size() == 2);
        REQUIRE(registry.get_by_category(AchievementCategory::Skill).size() == 1);
        REQUIRE(registry.get_by_category(AchievementCategory::Social).empty());
    }

    SECTION("Dependents index") {
        const auto& levels = registry.get_dependents("levels_completed");
        REQUIRE(levels.size() == 3);

        const auto& matches = registry.get_dependents("matches_made");
        REQUIRE(matches.size() == 2);
        REQUIRE(matches[0] == "match_master");
        REQUIRE(matches[1] == "all_rounder");

        REQUIRE(registry.get_dependents("friends_added").empty());
    }
}

TEST_CASE_METHOD(RegistryFixture, "AchievementRegistry clear", "[achievements][registry]") {
    register_test_achievements();
    REQUIRE(registry.get_total_achievements() == 4);

    registry.clear();

    REQUIRE(registry.get_total_achievements() == 0);
    REQUIRE_FALSE(registry.exists("first_level"));
    REQUIRE(registry.get_dependents("levels_completed").empty());
}
