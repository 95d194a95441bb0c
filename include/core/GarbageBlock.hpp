#pragma once

#include "Types.hpp"
#include <vector>

namespace panelrise::core {

// Multi-cell occupant. The anchor is the bottom-left covered cell; every
// covered cell on the board stores Occupant::garbage(id()).
class GarbageBlock {
public:
    GarbageBlock(GarbageId id, GridPos anchor, int width, int height);

    GarbageId id() const noexcept { return id_; }
    GridPos anchor() const noexcept { return anchor_; }
    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool covers(GridPos pos) const noexcept;
    std::vector<GridPos> cells() const;

    // Falling: the anchor is already the landing cell, visualY interpolates.
    bool isFalling() const noexcept { return falling_; }
    bool isConverting() const noexcept { return converting_; }
    bool isSettled() const noexcept { return !falling_ && !converting_; }
    float visualY() const noexcept { return visualY_; }

    void beginFall(int targetY, float duration) noexcept;
    // Returns true on the step the block lands.
    bool advanceFall(float dt) noexcept;
    void markConverting() noexcept { converting_ = true; }

    void shiftUp() noexcept;

private:
    GarbageId id_;
    GridPos anchor_;
    int width_;
    int height_;

    bool falling_{false};
    bool converting_{false};
    float visualY_;
    float fallStartY_{0.0f};
    float fallElapsed_{0.0f};
    float fallDuration_{0.0f};
};

} // namespace panelrise::core
