#pragma once

#include "Types.hpp"
#include <set>
#include <vector>

namespace panelrise::core {

class Grid;

// Tiles connected through straight-line triples of equal type.
struct MatchGroup {
    std::vector<TileId> tiles;
    std::vector<GridPos> cells;

    int size() const noexcept { return static_cast<int>(tiles.size()); }
};

class MatchDetector {
public:
    explicit MatchDetector(const Grid& grid);

    /// Every cell that belongs to at least one horizontal or vertical triple.
    std::set<GridPos> findMatchedCells() const;

    /// Matched cells split into 4-connected, same-typed components of the
    /// matched set. Corner-touching matches stay separate groups.
    std::vector<MatchGroup> findMatchGroups() const;

    /// In-bounds 4-neighbours of a cell.
    std::vector<GridPos> adjacentCells(GridPos pos) const;

    /// Idle, matchable tile type at a cell, or -1.
    TileType matchableType(int x, int y) const;

private:
    const Grid& grid_;
};

} // namespace panelrise::core
