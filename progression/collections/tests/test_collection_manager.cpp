#include <catch2/catch_test_macros.hpp>
#include <progression/collections/collection_manager.hpp>
#include <memory>
#include <string>

using namespace progression::collections;

class CollectionFixture {
protected:
    CollectionFixture() {
        collection()
            .id("special_pieces")
            .name("Special Pieces")
            .item("rocket_h", "Horizontal Rocket")
            .item("rocket_v", "Vertical Rocket")
            .item("bomb", "Bomb", "uncommon")
            .item("color_bomb", "Color Bomb", "rare")
            .coins(3000)
            .gems(150)
            .register_collection(registry);

        collection()
            .id("trio")
            .item("a", "A")
            .item("b", "B")
            .item("c", "C")
            .register_collection(registry);

        manager = std::make_unique<CollectionManager>(registry);
    }

    CollectionRegistry registry;
    std::unique_ptr<CollectionManager> manager;
    uint64_t now = 1700000000;
};

TEST_CASE_METHOD(CollectionFixture, "CollectionManager initial state", "[collections][manager]") {
    REQUIRE(manager->get_completion_percentage("special_pieces") == 0);
    REQUIRE(manager->get_collected_count("special_pieces") == 0);
    REQUIRE_FALSE(manager->is_completed("special_pieces"));
    REQUIRE(manager->get_state("special_pieces")->items.size() == 4);
    REQUIRE(manager->list_completed().empty());
}

TEST_CASE_METHOD(CollectionFixture, "CollectionManager collect item", "[collections][manager]") {
    SECTION("First collection emits an event") {
        auto result = manager->collect_item("special_pieces", "bomb", now);

        REQUIRE(result.collected.has_value());
        REQUIRE(result.collected->collection_id == "special_pieces");
        REQUIRE(result.collected->item_id == "bomb");
        REQUIRE(result.collected->rarity == "uncommon");
        REQUIRE_FALSE(result.completed.has_value());

        REQUIRE(manager->is_collected("special_pieces", "bomb"));
        REQUIRE(manager->get_state("special_pieces")->items.at("bomb").collect_timestamp == now);
        REQUIRE(manager->get_completion_percentage("special_pieces") == 25);
    }

    SECTION("Collecting twice is a no-op") {
        manager->collect_item("special_pieces", "bomb", now);
        auto again = manager->collect_item("special_pieces", "bomb", now + 10);

        REQUIRE_FALSE(again.collected.has_value());
        REQUIRE_FALSE(again.completed.has_value());
        REQUIRE(manager->get_state("special_pieces")->items.at("bomb").collect_timestamp == now);
        REQUIRE(manager->get_collected_count("special_pieces") == 1);
    }

    SECTION("Unknown ids are no-ops") {
        auto before = *manager->get_state("special_pieces");

        REQUIRE_FALSE(manager->collect_item("bogus", "bogus", now).collected.has_value());
        REQUIRE_FALSE(manager->collect_item("special_pieces", "bogus", now).collected.has_value());

        REQUIRE(*manager->get_state("special_pieces") == before);
        REQUIRE(manager->get_state("bogus") == nullptr);
    }
}

TEST_CASE_METHOD(CollectionFixture, "CollectionManager completion", "[collections][manager]") {
    int completed_events = 0;
    for (const char* item : {"rocket_h", "rocket_v", "bomb", "color_bomb"}) {
        auto result = manager->collect_item("special_pieces", item, now);
        if (result.completed) {
            ++completed_events;
            REQUIRE(result.completed->collection_id == "special_pieces");
        }
    }

    REQUIRE(completed_events == 1);
    REQUIRE(manager->is_completed("special_pieces"));
    REQUIRE(manager->is_grant_pending("special_pieces"));
    REQUIRE(manager->get_completion_percentage("special_pieces") == 100);
    REQUIRE(manager->list_completed() == std::vector<std::string>{"special_pieces"});

    SECTION("Re-checking is a no-op") {
        REQUIRE_FALSE(manager->check_completion("special_pieces", now).has_value());
        REQUIRE(manager->check_all_completions(now).empty());
        REQUIRE_FALSE(manager->collect_item("special_pieces", "bomb", now).completed.has_value());
    }

    SECTION("Grant completion clears the pending flag") {
        manager->complete_grant("special_pieces");
        REQUIRE_FALSE(manager->is_grant_pending("special_pieces"));
        REQUIRE(manager->list_grant_pending().empty());
        REQUIRE(manager->is_completed("special_pieces"));
    }
}

TEST_CASE_METHOD(CollectionFixture, "CollectionManager percentage rounding", "[collections][manager]") {
    manager->collect_item("trio", "a", now);
    REQUIRE(manager->get_completion_percentage("trio") == 33);

    manager->collect_item("trio", "b", now);
    REQUIRE(manager->get_completion_percentage("trio") == 67);

    REQUIRE(manager->get_completion_percentage("bogus") == 0);
}

TEST_CASE_METHOD(CollectionFixture, "CollectionManager state restore", "[collections][manager]") {
    CollectionState saved;
    saved.items["rocket_h"] = {true, 1600000000};
    saved.items["retired_piece"] = {true, 1600000000};

    SECTION("Known items restore, unknown items drop, missing items default") {
        REQUIRE(manager->restore_state("special_pieces", saved));

        const auto* state = manager->get_state("special_pieces");
        REQUIRE(state->items.size() == 4);
        REQUIRE(state->items.at("rocket_h").collected);
        REQUIRE_FALSE(state->items.at("bomb").collected);
        REQUIRE_FALSE(state->items.contains("retired_piece"));
    }

    SECTION("Collections restored as complete stay complete") {
        saved.completed = true;
        REQUIRE(manager->restore_state("special_pieces", saved));
        REQUIRE(manager->is_completed("special_pieces"));

        // No second completion even after collecting the rest
        manager->collect_item("special_pieces", "rocket_v", now);
        manager->collect_item("special_pieces", "bomb", now);
        auto last = manager->collect_item("special_pieces", "color_bomb", now);
        REQUIRE(last.collected.has_value());
        REQUIRE_FALSE(last.completed.has_value());
    }

    SECTION("All items collected but not completed completes on check") {
        for (const char* item : {"rocket_h", "rocket_v", "bomb", "color_bomb"}) {
            saved.items[item] = {true, 1600000000};
        }
        REQUIRE(manager->restore_state("special_pieces", saved));
        REQUIRE_FALSE(manager->is_completed("special_pieces"));

        auto completed = manager->check_all_completions(now);
        REQUIRE(completed.size() == 1);
        REQUIRE(manager->is_completed("special_pieces"));
    }

    SECTION("Pending grant without completion is rejected") {
        saved.grant_pending = true;
        REQUIRE_FALSE(manager->restore_state("special_pieces", saved));
        REQUIRE_FALSE(manager->is_collected("special_pieces", "rocket_h"));
    }

    SECTION("Unknown collection is ignored") {
        REQUIRE_FALSE(manager->restore_state("retired_collection", saved));
    }
}

TEST_CASE("CollectionManager large collection needs every item", "[collections][manager]") {
    CollectionRegistry registry;
    auto builder = collection().id("stickers");
    for (int i = 0; i < 200; ++i) {
        builder.item("sticker_" + std::to_string(i), "Sticker " + std::to_string(i));
    }
    REQUIRE(builder.register_collection(registry));

    CollectionManager manager(registry);
    uint64_t now = 1700000000;

    for (int i = 0; i < 199; ++i) {
        auto result = manager.collect_item("stickers", "sticker_" + std::to_string(i), now);
        REQUIRE_FALSE(result.completed.has_value());
    }

    REQUIRE(manager.get_collected_count("stickers") == 199);
    REQUIRE(manager.get_completion_percentage("stickers") == 100);
    REQUIRE_FALSE(manager.is_completed("stickers"));
    REQUIRE(manager.check_all_completions(now).empty());
    REQUIRE_FALSE(manager.is_grant_pending("stickers"));

    auto last = manager.collect_item("stickers", "sticker_199", now);
    REQUIRE(last.completed.has_value());
    REQUIRE(manager.is_completed("stickers"));
}
