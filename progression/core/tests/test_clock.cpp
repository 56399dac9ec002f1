#include <catch2/catch_test_macros.hpp>
#include <progression/core/clock.hpp>

using namespace progression::core;

TEST_CASE("ManualClock", "[core][clock]") {
    ManualClock clock(1700000000);

    REQUIRE(clock.now() == 1700000000);

    clock.advance(30);
    REQUIRE(clock.now() == 1700000030);

    clock.set(42);
    REQUIRE(clock.now() == 42);
}

TEST_CASE("SystemClock reports epoch seconds", "[core][clock]") {
    auto& clock = system_clock();

    // 2023-01-01T00:00:00Z
    REQUIRE(clock.now() > 1672531200u);
    REQUIRE(&clock == &system_clock());
}
