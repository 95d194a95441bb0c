#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "core/Board.hpp"
#include "core/Types.hpp"

using namespace panelrise::core;

TEST_CASE("Board basic cell operations", "[board]") {
    Board b{6, 14, 2};

    REQUIRE(b.width() == 6);
    REQUIRE(b.height() == 14);
    REQUIRE(b.preloadRows() == 2);

    for (int y = 0; y < b.height(); ++y) {
        for (int x = 0; x < b.width(); ++x) {
            REQUIRE(b.isEmpty(x, y));
        }
    }

    b.setCell(1, 1, Occupant::tile(7));
    REQUIRE(b.cell(1, 1) == Occupant::tile(7));
    REQUIRE(b.cell(GridPos{1, 1}).isTile());
    REQUIRE(b.rowHasOccupant(1));
    REQUIRE_FALSE(b.rowHasOccupant(0));

    b.clearCell(GridPos{1, 1});
    REQUIRE(b.isEmpty(1, 1));
}

TEST_CASE("Board rejects bad dimensions and coordinates", "[board]") {
    REQUIRE_THROWS_AS(Board(0, 14, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(Board(6, 0, 2), std::invalid_argument);

    Board b{6, 14, 2};
    REQUIRE_THROWS_AS(b.cell(6, 0), std::out_of_range);
    REQUIRE_THROWS_AS(b.cell(0, -1), std::out_of_range);
    REQUIRE_THROWS_AS(b.setCell(0, 14, Occupant::tile(1)), std::out_of_range);
    REQUIRE_THROWS_AS(b.preloadCell(0, 2), std::out_of_range);

    REQUIRE(b.isInside(5, 13));
    REQUIRE_FALSE(b.isInside(6, 13));
    REQUIRE_FALSE(b.isInside(0, -1));
}

TEST_CASE("Board stack height is the highest occupied row", "[board]") {
    Board b{6, 14, 2};
    REQUIRE(b.stackHeight() == 0);

    b.setCell(0, 3, Occupant::tile(1));
    b.setCell(4, 7, Occupant::garbage(1));
    REQUIRE(b.stackHeight() == 7);
}

TEST_CASE("Board shiftUp promotes the preload row", "[board]") {
    Board b{3, 4, 2};

    b.setCell(0, 0, Occupant::tile(1));
    b.setCell(2, 1, Occupant::garbage(5));
    b.setPreloadCell(0, 0, Occupant::tile(10));
    b.setPreloadCell(1, 0, Occupant::tile(11));
    b.setPreloadCell(2, 1, Occupant::tile(12));

    REQUIRE(b.shiftUp());

    REQUIRE(b.cell(0, 1) == Occupant::tile(1));
    REQUIRE(b.cell(2, 2) == Occupant::garbage(5));
    REQUIRE(b.cell(0, 0) == Occupant::tile(10));
    REQUIRE(b.cell(1, 0) == Occupant::tile(11));
    REQUIRE(b.isEmpty(2, 0));

    // depth 1 moved up to depth 0, depth 1 is left empty
    REQUIRE(b.preloadCell(2, 0) == Occupant::tile(12));
    REQUIRE(b.preloadCell(2, 1).empty());
}

TEST_CASE("Board shiftUp refuses when the top row is occupied", "[board]") {
    Board b{3, 4, 1};
    b.setCell(1, 3, Occupant::tile(1));
    b.setPreloadCell(0, 0, Occupant::tile(2));

    REQUIRE_FALSE(b.shiftUp());
    REQUIRE(b.cell(1, 3) == Occupant::tile(1));
    REQUIRE(b.preloadCell(0, 0) == Occupant::tile(2));
    REQUIRE(b.isEmpty(0, 0));
}
