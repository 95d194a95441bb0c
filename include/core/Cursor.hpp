#pragma once

#include "Types.hpp"

namespace panelrise::core {

// Two-wide swap cursor; position() is its left cell.
class Cursor {
public:
    Cursor(int gridWidth, int gridHeight);

    GridPos position() const noexcept { return pos_; }
    GridPos left() const noexcept { return pos_; }
    GridPos right() const noexcept { return GridPos{pos_.x + 1, pos_.y}; }

    // Clamped destination of a move, without applying it.
    GridPos clampedMove(int dx, int dy) const noexcept;

    void setPosition(GridPos pos) noexcept;

    // Follows the stack when a row is injected.
    void shiftUp() noexcept;

private:
    int gridWidth_;
    int gridHeight_;
    GridPos pos_;

    GridPos clamp(GridPos pos) const noexcept;
};

} // namespace panelrise::core
