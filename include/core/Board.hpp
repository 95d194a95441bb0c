#pragma once

#include "Types.hpp"
#include <vector>

namespace panelrise::core {

// Logical cell array of one grid plus the hidden preload rows below it.
// Preload depth 0 is the row directly under visible row 0.
class Board {
public:
    Board(int width, int height, int preloadRows);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    int preloadRows() const noexcept { return preloadRows_; }

    Occupant cell(int x, int y) const;
    Occupant cell(GridPos pos) const { return cell(pos.x, pos.y); }
    void setCell(int x, int y, Occupant occupant);
    void setCell(GridPos pos, Occupant occupant) { setCell(pos.x, pos.y, occupant); }
    void clearCell(GridPos pos) { setCell(pos.x, pos.y, Occupant{}); }

    bool isEmpty(int x, int y) const { return cell(x, y).empty(); }
    bool isEmpty(GridPos pos) const { return cell(pos).empty(); }

    Occupant preloadCell(int x, int depth) const;
    void setPreloadCell(int x, int depth, Occupant occupant);

    bool isInside(int x, int y) const noexcept {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }
    bool isInside(GridPos pos) const noexcept { return isInside(pos.x, pos.y); }

    bool rowHasOccupant(int y) const;

    // Highest occupied row index over all columns, 0 for an empty board.
    int stackHeight() const noexcept;

    // Shift every column up by one row, promoting preload depth 0 into row 0
    // and leaving the deepest preload row empty. Returns false (and changes
    // nothing) if the top row is not empty.
    bool shiftUp();

    void clear() noexcept;

private:
    int width_;
    int height_;
    int preloadRows_;
    std::vector<Occupant> cells_;   // width_ * height_
    std::vector<Occupant> preload_; // width_ * preloadRows_

    int index(int x, int y) const noexcept {
        return y * width_ + x;
    }

    int preloadIndex(int x, int depth) const noexcept {
        return depth * width_ + x;
    }
};

} // namespace panelrise::core
