#include "core/Cursor.hpp"
#include <algorithm>

namespace panelrise::core {

Cursor::Cursor(int gridWidth, int gridHeight)
    : gridWidth_{gridWidth}
    , gridHeight_{gridHeight}
    , pos_{0, gridHeight / 2}
{
}

GridPos Cursor::clampedMove(int dx, int dy) const noexcept {
    return clamp(GridPos{pos_.x + dx, pos_.y + dy});
}

void Cursor::setPosition(GridPos pos) noexcept {
    pos_ = clamp(pos);
}

void Cursor::shiftUp() noexcept {
    pos_ = clamp(GridPos{pos_.x, pos_.y + 1});
}

GridPos Cursor::clamp(GridPos pos) const noexcept {
    return GridPos{
        std::clamp(pos.x, 0, std::max(gridWidth_ - 2, 0)),
        std::clamp(pos.y, 0, std::max(gridHeight_ - 1, 0))
    };
}

} // namespace panelrise::core
