#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "core/BlockSlipResolver.hpp"
#include "core/Grid.hpp"
#include "GridTestHelpers.hpp"

using namespace panelrise::core;
using panelrise::test::quietConfig;
using panelrise::test::runFor;

namespace {

// Drops a tile from `fromY` to the floor of `column`; returns its id.
TileId startFaller(Grid& grid, int column, int fromY, TileType type) {
    const TileId id = grid.placeTile(GridPos{column, fromY}, type);
    grid.dropResolver().resolve();
    return id;
}

struct GarbageOverFaller {
    TileId kicked{};
    TileId faller{};
    GarbageId block{};
};

// Column 0 holds four tiles, columns 2 and 3 six each. A tile drops down
// column 1 towards the floor while a 3x1 garbage block settles at row 6
// across columns 1-3, above the faller's landing cell.
GarbageOverFaller garbageOverFaller(Grid& grid) {
    GarbageOverFaller setup;
    for (int y = 0; y < 4; ++y) {
        const TileId id = grid.placeTile(GridPos{0, y}, 2 + y % 2);
        if (y == 3) setup.kicked = id;
    }
    for (int y = 0; y < 6; ++y) {
        grid.placeTile(GridPos{2, y}, y % 2);
        grid.placeTile(GridPos{3, y}, 4 + y % 2);
    }
    setup.faller = startFaller(grid, 1, 8, 4);
    setup.block = *grid.garbage().spawnGarbage(3, 1);
    return setup;
}

} // namespace

TEST_CASE("fallDepth measures how far a tile sank into its cell", "[slip]") {
    Tile t{1, 0, GridPos{0, 4}};
    REQUIRE(BlockSlipResolver::fallDepth(t) == 0.0f);

    t.beginFall(GridPos{0, 0});
    t.setVisual(0.0f, 4.0f);
    REQUIRE(BlockSlipResolver::fallDepth(t) == 0.0f);

    t.setVisual(0.0f, 0.75f);
    REQUIRE(BlockSlipResolver::fallDepth(t) == Catch::Approx(0.25f));
    REQUIRE_FALSE(BlockSlipResolver::isPastHalfway(t));

    t.setVisual(0.0f, 0.4f);
    REQUIRE(BlockSlipResolver::isPastHalfway(t));
}

TEST_CASE("Kick-under slides the idle tile beneath a faller", "[slip]") {
    Grid grid{quietConfig()};
    const TileId idle = grid.placeTile(GridPos{0, 0}, 0);
    const TileId faller = startFaller(grid, 1, 8, 1);
    REQUIRE(grid.board().cell(1, 0) == Occupant::tile(faller));

    grid.setCursor(GridPos{0, 0});
    REQUIRE(grid.requestSwap());

    REQUIRE(grid.blockSlip().isActive());
    REQUIRE(grid.isSwapping());
    REQUIRE(grid.board().cell(1, 0) == Occupant::tile(idle));
    REQUIRE(grid.board().cell(1, 1) == Occupant::tile(faller));
    REQUIRE(grid.board().isEmpty(0, 0));
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 1});
    REQUIRE(grid.checkInvariants());

    runFor(grid, 2.0f);
    REQUIRE_FALSE(grid.blockSlip().isActive());
    REQUIRE(grid.tileAt(GridPos{1, 0})->id() == idle);
    REQUIRE(grid.tileAt(GridPos{1, 1})->id() == faller);
    REQUIRE(grid.tile(faller)->isIdle());
}

TEST_CASE("Slip kicks a tile into a column a faller is passing", "[slip]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{0, 0}, 0);
    grid.placeTile(GridPos{0, 1}, 1);
    grid.placeTile(GridPos{0, 2}, 2);
    const TileId kicked = grid.placeTile(GridPos{0, 3}, 3);
    const TileId faller = startFaller(grid, 1, 8, 4);

    grid.setCursor(GridPos{0, 3});
    REQUIRE(grid.requestSwap());

    REQUIRE(grid.blockSlip().isActive());
    REQUIRE(grid.board().cell(1, 3) == Occupant::tile(kicked));
    REQUIRE(grid.board().cell(1, 4) == Occupant::tile(faller));
    REQUIRE(grid.board().isEmpty(1, 0));
    REQUIRE(grid.tile(faller)->isFalling());
    REQUIRE(grid.checkInvariants());

    runFor(grid, 3.0f);

    // once the slip is over, ordinary gravity takes both to the floor
    REQUIRE(grid.tileAt(GridPos{1, 0})->id() == kicked);
    REQUIRE(grid.tileAt(GridPos{1, 1})->id() == faller);
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("A faller just above the slip row is nudged up", "[slip]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{0, 0}, 0);
    grid.placeTile(GridPos{0, 1}, 1);
    grid.placeTile(GridPos{0, 2}, 2);
    const TileId kicked = grid.placeTile(GridPos{0, 3}, 3);
    const TileId faller = startFaller(grid, 1, 8, 4);

    // let it sink into the upper half of row 3
    for (int i = 0; i < 64; ++i) {
        grid.tick(0.01f);
    }
    REQUIRE(grid.tile(faller)->visualY() >= 3.5f);
    REQUIRE(grid.tile(faller)->visualY() < 4.0f);

    grid.setCursor(GridPos{0, 3});
    REQUIRE(grid.requestSwap());

    REQUIRE(grid.board().cell(1, 3) == Occupant::tile(kicked));
    REQUIRE(grid.board().cell(1, 4) == Occupant::tile(faller));
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 4});
    REQUIRE(grid.animations().find(faller)->kind == AnimationKind::Nudge);
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("Swaps are refused once a faller is halfway into its cell", "[slip]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{0, 0}, 0);
    const TileId faller = startFaller(grid, 1, 8, 1);

    // 8 rows at 0.15s per row; stop at roughly visualY 0.4
    for (int i = 0; i < 114; ++i) {
        grid.tick(0.01f);
    }
    REQUIRE(grid.tile(faller)->isFalling());
    REQUIRE(grid.tile(faller)->visualY() < 0.5f);

    grid.setCursor(GridPos{0, 0});
    REQUIRE_FALSE(grid.requestSwap());
}

TEST_CASE("Interception stacks fallers on top of a swapped tile", "[slip]") {
    Grid grid{quietConfig()};
    const TileId faller = startFaller(grid, 1, 8, 1);
    const TileId swapped = grid.placeTile(GridPos{1, 3}, 2);

    const float wait = grid.blockSlip().interceptFallingAbove(*grid.tile(swapped));

    REQUIRE(wait >= grid.config().dropDuration * 0.5f);
    REQUIRE(grid.board().isEmpty(1, 0));
    REQUIRE(grid.board().cell(1, 4) == Occupant::tile(faller));
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 4});
    REQUIRE(grid.animations().find(faller)->kind == AnimationKind::Nudge);
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("Interception ignores fallers landing above the swapped tile", "[slip]") {
    Grid grid{quietConfig()};
    const TileId swapped = grid.placeTile(GridPos{1, 0}, 2);
    const TileId faller = startFaller(grid, 1, 8, 1);
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 1});

    REQUIRE(grid.blockSlip().interceptFallingAbove(*grid.tile(swapped)) == 0.0f);
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 1});
}

TEST_CASE("A retargeted faller stops above a new obstruction", "[slip][drop]") {
    Grid grid{quietConfig()};
    grid.placeTile(GridPos{0, 0}, 0);
    const TileId faller = startFaller(grid, 1, 8, 1);

    grid.setCursor(GridPos{0, 0});
    REQUIRE(grid.requestSwap()); // kick-under, faller retargeted to (1,1)
    REQUIRE(grid.animations().find(faller)->retargeted);

    // the slip owns the faller for the first tick
    grid.tick(0.01f);
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 1});

    const TileId wall = grid.placeTile(GridPos{1, 5}, 2);
    grid.tick(0.01f);

    REQUIRE(grid.tile(faller)->target() == GridPos{1, 6});
    REQUIRE(grid.board().cell(1, 6) == Occupant::tile(faller));
    REQUIRE(grid.board().isEmpty(1, 1));
    REQUIRE(grid.board().cell(1, 5) == Occupant::tile(wall));
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("A slip is refused when garbage sits above the slip row", "[slip][garbage]") {
    Grid grid{quietConfig()};
    const GarbageOverFaller setup = garbageOverFaller(grid);
    REQUIRE(grid.garbage().block(setup.block)->anchor() == GridPos{1, 6});
    REQUIRE(grid.tile(setup.faller)->target() == GridPos{1, 0});

    grid.setCursor(GridPos{0, 3});
    REQUIRE_FALSE(grid.requestSwap());

    REQUIRE_FALSE(grid.blockSlip().isActive());
    REQUIRE_FALSE(grid.isSwapping());
    REQUIRE(grid.board().cell(0, 3) == Occupant::tile(setup.kicked));
    REQUIRE(grid.board().isEmpty(1, 3));
    REQUIRE(grid.tile(setup.faller)->target() == GridPos{1, 0});

    runFor(grid, 3.0f);

    // the faller lands under the garbage, the garbage stays put
    REQUIRE(grid.tileAt(GridPos{1, 0})->id() == setup.faller);
    REQUIRE(grid.tile(setup.faller)->isIdle());
    REQUIRE(grid.garbage().block(setup.block)->anchor() == GridPos{1, 6});
    REQUIRE(grid.tileAt(GridPos{0, 3})->id() == setup.kicked);
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("A slip that would push the column past the top is refused", "[slip]") {
    Grid grid{quietConfig()};
    const TileId kicked = grid.placeTile(GridPos{0, 2}, 2);
    grid.placeTile(GridPos{0, 1}, 3);
    grid.placeTile(GridPos{0, 0}, 2);
    const TileId faller = startFaller(grid, 1, 4, 4);

    // stationary tiles from row 5 up to the top of column 1
    TileId top{};
    for (int y = 5; y < grid.height(); ++y) {
        top = grid.placeTile(GridPos{1, y}, y % 2);
    }

    grid.setCursor(GridPos{0, 2});
    REQUIRE_FALSE(grid.requestSwap());

    REQUIRE_FALSE(grid.blockSlip().isActive());
    REQUIRE(grid.board().cell(0, 2) == Occupant::tile(kicked));
    REQUIRE(grid.board().isEmpty(1, 2));
    REQUIRE(grid.board().cell(1, grid.height() - 1) == Occupant::tile(top));
    REQUIRE(grid.tile(faller)->target() == GridPos{1, 0});
    REQUIRE(grid.checkInvariants());
}

TEST_CASE("Interception never lifts a faller over garbage", "[slip][garbage]") {
    Grid grid{quietConfig()};
    const GarbageOverFaller setup = garbageOverFaller(grid);

    SECTION("garbage directly above the swapped tile") {
        const TileId swapped = grid.placeTile(GridPos{1, 5}, 1);

        REQUIRE(grid.blockSlip().interceptFallingAbove(*grid.tile(swapped)) == 0.0f);

        REQUIRE(grid.tile(setup.faller)->target() == GridPos{1, 0});
        REQUIRE(grid.board().cell(1, 0) == Occupant::tile(setup.faller));
        REQUIRE(grid.board().isEmpty(1, 7));
        REQUIRE(grid.animations().find(setup.faller)->kind == AnimationKind::Fall);
        REQUIRE(grid.checkInvariants());
    }

    SECTION("room left below the garbage") {
        const TileId swapped = grid.placeTile(GridPos{1, 3}, 1);

        REQUIRE(grid.blockSlip().interceptFallingAbove(*grid.tile(swapped)) > 0.0f);

        REQUIRE(grid.board().cell(1, 4) == Occupant::tile(setup.faller));
        REQUIRE(grid.tile(setup.faller)->target() == GridPos{1, 4});
        REQUIRE(grid.board().isEmpty(1, 0));
        REQUIRE(grid.checkInvariants());
    }
}
