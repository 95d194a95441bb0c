#include "core/GarbageBlock.hpp"
#include <stdexcept>

namespace panelrise::core {

GarbageBlock::GarbageBlock(GarbageId id, GridPos anchor, int width, int height)
    : id_{id}
    , anchor_{anchor}
    , width_{width}
    , height_{height}
    , visualY_{static_cast<float>(anchor.y)}
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("GarbageBlock dimensions must be positive");
    }
}

bool GarbageBlock::covers(GridPos pos) const noexcept {
    return pos.x >= anchor_.x && pos.x < anchor_.x + width_
        && pos.y >= anchor_.y && pos.y < anchor_.y + height_;
}

std::vector<GridPos> GarbageBlock::cells() const {
    std::vector<GridPos> result;
    result.reserve(static_cast<std::size_t>(width_ * height_));
    for (int dy = 0; dy < height_; ++dy) {
        for (int dx = 0; dx < width_; ++dx) {
            result.push_back(GridPos{anchor_.x + dx, anchor_.y + dy});
        }
    }
    return result;
}

void GarbageBlock::beginFall(int targetY, float duration) noexcept {
    fallStartY_ = visualY_;
    anchor_.y = targetY;
    fallElapsed_ = 0.0f;
    fallDuration_ = duration;
    falling_ = true;
}

bool GarbageBlock::advanceFall(float dt) noexcept {
    if (!falling_) return false;

    fallElapsed_ += dt;
    const float target = static_cast<float>(anchor_.y);
    if (fallDuration_ <= 0.0f || fallElapsed_ >= fallDuration_) {
        visualY_ = target;
        falling_ = false;
        return true;
    }
    const float t = fallElapsed_ / fallDuration_;
    visualY_ = fallStartY_ + (target - fallStartY_) * t;
    return false;
}

void GarbageBlock::shiftUp() noexcept {
    anchor_.y += 1;
    visualY_ += 1.0f;
    fallStartY_ += 1.0f;
}

} // namespace panelrise::core
