#include <catch2/catch_test_macros.hpp>

#include "core/Grid.hpp"
#include "GridTestHelpers.hpp"

using namespace panelrise::core;
using panelrise::test::quietConfig;
using panelrise::test::runFor;

TEST_CASE("Cursor moves are clamped to the grid", "[swap][cursor]") {
    Grid grid{quietConfig()};
    grid.setCursor(GridPos{0, 0});

    REQUIRE_FALSE(grid.moveCursor(-1, 0));
    REQUIRE_FALSE(grid.moveCursor(0, -1));
    REQUIRE(grid.moveCursor(1, 0));
    REQUIRE(grid.cursor().position() == GridPos{1, 0});

    grid.setCursor(GridPos{10, 40});
    REQUIRE(grid.cursor().position() == GridPos{4, 13});
    REQUIRE(grid.cursor().right() == GridPos{5, 13});
    REQUIRE_FALSE(grid.moveCursor(1, 0));
}

TEST_CASE("A plain swap exchanges two tiles", "[swap]") {
    Grid grid{quietConfig()};
    const TileId a = grid.placeTile(GridPos{0, 0}, 0);
    const TileId b = grid.placeTile(GridPos{1, 0}, 1);
    grid.setCursor(GridPos{0, 0});

    REQUIRE(grid.requestSwap());
    REQUIRE(grid.isSwapping());
    REQUIRE(grid.board().cell(0, 0) == Occupant::tile(b));
    REQUIRE(grid.board().cell(1, 0) == Occupant::tile(a));
    REQUIRE(grid.tile(a)->isSwapping());

    // one swap at a time
    REQUIRE_FALSE(grid.requestSwap());

    runFor(grid, 0.3f);
    REQUIRE_FALSE(grid.isSwapping());
    REQUIRE(grid.tile(a)->isIdle());
    REQUIRE(grid.tile(a)->visualX() == 1.0f);
    REQUIRE(grid.tile(b)->visualX() == 0.0f);
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("Swapping into a gap lets the tile fall afterwards", "[swap]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{0, 0}, 0);
    const TileId top = grid.placeTile(GridPos{0, 1}, 1);
    grid.setCursor(GridPos{0, 1});

    REQUIRE(grid.requestSwap());
    REQUIRE(grid.board().cell(1, 1) == Occupant::tile(top));
    REQUIRE(grid.board().isEmpty(0, 1));

    runFor(grid, 1.0f);
    REQUIRE(grid.tileAt(GridPos{1, 0})->id() == top);
    REQUIRE(grid.tile(top)->isIdle());
}

TEST_CASE("A swap can complete a match", "[swap][cascade]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{0, 0}, 0);
    grid.placeTile(GridPos{1, 0}, 0);
    const TileId odd = grid.placeTile(GridPos{2, 0}, 1);
    grid.placeTile(GridPos{3, 0}, 0);
    grid.setCursor(GridPos{2, 0});

    REQUIRE(grid.requestSwap());
    runFor(grid, 3.0f);

    REQUIRE(grid.tileAt(GridPos{3, 0})->id() == odd);
    for (int x = 0; x < 3; ++x) {
        REQUIRE(grid.board().isEmpty(x, 0));
    }
    REQUIRE(grid.score() == 30);
}

TEST_CASE("Swap requests that are rejected", "[swap]") {
    Grid grid{quietConfig()};

    SECTION("both cells empty") {
        grid.setCursor(GridPos{0, 0});
        REQUIRE_FALSE(grid.requestSwap());
    }

    SECTION("garbage under the cursor") {
        GridConfig cfg = quietConfig();
        cfg.garbageDropDelay = 0.0f;
        Grid g{cfg};
        REQUIRE(g.garbage().spawnGarbage(6, 1).has_value());
        runFor(g, 3.0f);
        g.setCursor(GridPos{0, 0});
        REQUIRE_FALSE(g.requestSwap());
    }

    SECTION("locked tile") {
        grid.placeTile(GridPos{0, 0}, 0);
        grid.placeTile(GridPos{1, 0}, 1);
        grid.tileAt(GridPos{0, 0})->applyStatus(TileStatus::Locked);
        grid.setCursor(GridPos{0, 0});
        REQUIRE_FALSE(grid.requestSwap());
    }

    SECTION("two falling tiles") {
        grid.placeTile(GridPos{0, 8}, 0);
        grid.placeTile(GridPos{1, 9}, 1);
        grid.dropResolver().resolve();
        grid.setCursor(GridPos{0, 0});
        REQUIRE_FALSE(grid.requestSwap());
    }
}

TEST_CASE("Frozen tiles keep sliding until blocked", "[swap][status]") {
    Grid grid{quietConfig()};
    const TileId frozen = grid.placeTile(GridPos{0, 0}, 0);
    grid.placeTile(GridPos{4, 0}, 1);
    grid.tile(frozen)->applyStatus(TileStatus::Frozen);
    grid.setCursor(GridPos{0, 0});

    REQUIRE(grid.requestSwap());
    runFor(grid, 1.5f);

    REQUIRE(grid.tileAt(GridPos{3, 0})->id() == frozen);
    REQUIRE(grid.tile(frozen)->isIdle());
    REQUIRE(grid.checkInvariants());
}
