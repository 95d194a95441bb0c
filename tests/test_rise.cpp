#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vector>

#include "core/Grid.hpp"
#include "GridTestHelpers.hpp"

using namespace panelrise::core;
using panelrise::test::quietConfig;
using panelrise::test::runFor;
using panelrise::test::RecordingListener;

namespace {

GridConfig risingConfig(float speed) {
    GridConfig cfg = quietConfig();
    cfg.baseRiseSpeed = speed;
    return cfg;
}

} // namespace

TEST_CASE("Rise speed grows with the speed level", "[rise]") {
    Grid grid{risingConfig(0.1f)};
    RiseController& rise = grid.rise();

    REQUIRE(rise.speedLevel() == 1);
    REQUIRE(rise.speedForLevel(1) == Catch::Approx(0.1f));
    REQUIRE(rise.speedForLevel(99) == Catch::Approx(8.0f));
    REQUIRE(rise.speedForLevel(500) == Catch::Approx(8.0f));
    REQUIRE(rise.speedForLevel(50) > rise.speedForLevel(49));

    rise.setSpeedLevel(0);
    REQUIRE(rise.speedLevel() == 1);
    rise.setSpeedLevel(120);
    REQUIRE(rise.speedLevel() == 99);
}

TEST_CASE("Speed level goes up every interval", "[rise]") {
    GridConfig cfg = risingConfig(0.0f);
    cfg.speedLevelInterval = 1.0f;
    Grid grid{cfg};

    grid.rise().tick(0.6f);
    REQUIRE(grid.rise().speedLevel() == 1);
    grid.rise().tick(0.6f);
    REQUIRE(grid.rise().speedLevel() == 2);
}

TEST_CASE("A full row of rise injects the preload row", "[rise]") {
    Grid grid{risingConfig(1.0f)};
    RecordingListener listener;
    grid.addListener(&listener);

    std::vector<TileId> depth0;
    std::vector<TileId> depth1;
    for (int x = 0; x < grid.width(); ++x) {
        depth0.push_back(grid.tileAt(GridPos{x, -1})->id());
        depth1.push_back(grid.tileAt(GridPos{x, -2})->id());
    }
    const GridPos cursorBefore = grid.cursor().position();

    grid.tick(0.5f);
    REQUIRE(grid.riseOffset() == Catch::Approx(0.5f));
    REQUIRE(listener.rowsInjected == 0);

    grid.tick(0.5f);
    REQUIRE(listener.rowsInjected == 1);
    REQUIRE(grid.riseOffset() == Catch::Approx(0.0f).margin(1e-5));

    for (int x = 0; x < grid.width(); ++x) {
        REQUIRE(grid.tileAt(GridPos{x, 0})->id() == depth0[x]);
        REQUIRE(grid.tileAt(GridPos{x, -1})->id() == depth1[x]);
        REQUIRE(grid.tileAt(GridPos{x, -2}) != nullptr);
    }
    REQUIRE(grid.cursor().position() == GridPos{cursorBefore.x, cursorBefore.y + 1});
    REQUIRE(grid.checkInvariants());

    grid.removeListener(&listener);
}

TEST_CASE("Row injection is refused while the top row is occupied", "[rise]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{2, grid.height() - 1}, 0);

    REQUIRE_FALSE(grid.injectRow());
    REQUIRE(grid.board().cell(2, grid.height() - 1).isTile());
}

TEST_CASE("Swaps pause the rise and leave time debt", "[rise]") {
    Grid grid{risingConfig(0.5f)};
    RiseController& rise = grid.rise();

    grid.setSwapping(true);
    rise.tick(0.2f);
    REQUIRE(rise.offset() == 0.0f);
    REQUIRE(rise.timeDebt() == Catch::Approx(0.2f));

    grid.setSwapping(false);
    rise.tick(0.1f);
    // catch-up at 1.5x pays back 0.5 * dt of debt
    REQUIRE(rise.offset() == Catch::Approx(0.5f * 1.5f * 0.1f));
    REQUIRE(rise.timeDebt() == Catch::Approx(0.15f));
}

TEST_CASE("Fast rise multiplies the speed", "[rise]") {
    Grid grid{risingConfig(0.5f)};
    RiseController& rise = grid.rise();

    grid.requestFastRise();
    REQUIRE(rise.isFastRising());
    rise.tick(0.1f);
    REQUIRE(rise.offset() == Catch::Approx(0.2f));

    grid.stopFastRise();
    REQUIRE_FALSE(rise.isFastRising());

    SECTION("refused while swapping") {
        grid.setSwapping(true);
        grid.requestFastRise();
        REQUIRE_FALSE(rise.isFastRising());
    }
}

TEST_CASE("Breathing room pauses the rise", "[rise]") {
    Grid grid{risingConfig(0.5f)};
    RiseController& rise = grid.rise();

    rise.addBreathingRoom(3);
    REQUIRE(rise.breathingRoom() == Catch::Approx(0.6f));

    rise.tick(0.5f);
    REQUIRE(rise.offset() == 0.0f);
    REQUIRE(rise.breathingRoom() == Catch::Approx(0.1f));

    rise.addBreathingRoom(100);
    REQUIRE(rise.breathingRoom() == Catch::Approx(5.0f));

    SECTION("disabled") {
        GridConfig cfg = risingConfig(0.5f);
        cfg.breathingRoomEnabled = false;
        Grid other{cfg};
        other.rise().addBreathingRoom(10);
        REQUIRE(other.rise().breathingRoom() == 0.0f);
    }
}

TEST_CASE("Matches pause the rise without debt", "[rise][cascade]") {
    Grid grid{risingConfig(0.5f)};
    grid.placeTile(GridPos{0, 0}, 0);
    grid.placeTile(GridPos{1, 0}, 0);
    grid.placeTile(GridPos{2, 0}, 0);
    REQUIRE(grid.checkForMatches());

    grid.rise().tick(0.1f);
    REQUIRE(grid.rise().offset() == 0.0f);
    REQUIRE(grid.rise().timeDebt() == 0.0f);
}

TEST_CASE("A topped-out grid gets a grace period, then game over", "[rise]") {
    GridConfig cfg = quietConfig();
    cfg.gracePeriod = 1.0f;
    Grid grid{cfg};
    RecordingListener listener;
    grid.addListener(&listener);

    const TileId top = grid.placeTile(GridPos{0, grid.height() - 1}, 0);

    grid.tick(0.1f);
    REQUIRE(grid.rise().isInGracePeriod());
    REQUIRE_FALSE(grid.isGameOver());

    SECTION("clearing the top row ends the grace period") {
        grid.popTile(top);
        grid.tick(0.1f);
        REQUIRE_FALSE(grid.rise().isInGracePeriod());
        REQUIRE(grid.rise().graceTimer() == Catch::Approx(1.0f));
    }

    SECTION("running out of grace ends the game") {
        runFor(grid, 1.5f);
        REQUIRE(grid.isGameOver());
        REQUIRE(listener.gameOvers == 1);

        grid.setCursor(GridPos{0, 0});
        REQUIRE_FALSE(grid.requestSwap());

        // nothing moves any more
        grid.tick(1.0f);
        REQUIRE(listener.gameOvers == 1);
    }

    grid.removeListener(&listener);
}
