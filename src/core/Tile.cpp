#include "core/Tile.hpp"

namespace panelrise::core {

Tile::Tile(TileId id, TileType type, GridPos pos)
    : id_{id}
    , type_{type}
    , pos_{pos}
    , target_{pos}
    , visualX_{static_cast<float>(pos.x)}
    , visualY_{static_cast<float>(pos.y)}
{
}

void Tile::beginSwap(GridPos target) noexcept {
    state_ = MovementState::Swapping;
    target_ = target;
    pos_ = target;
}

void Tile::beginFall(GridPos target) noexcept {
    state_ = MovementState::Falling;
    target_ = target;
    pos_ = target;
}

void Tile::finishMovement() noexcept {
    state_ = MovementState::Idle;
    target_ = pos_;
    visualX_ = static_cast<float>(pos_.x);
    visualY_ = static_cast<float>(pos_.y);
}

void Tile::shiftUp() noexcept {
    pos_.y += 1;
    target_.y += 1;
    visualY_ += 1.0f;
}

void Tile::applyStatus(TileStatus status, float duration) noexcept {
    status_ = status;
    statusTimer_ = duration;

    switch (status) {
    case TileStatus::Frozen:
        canSwap_ = true;
        canMatch_ = true;
        momentum_ = true;
        break;
    case TileStatus::Burning:
        canSwap_ = true;
        canMatch_ = false;
        momentum_ = false;
        break;
    case TileStatus::Locked:
        canSwap_ = false;
        canMatch_ = false;
        momentum_ = false;
        break;
    case TileStatus::None:
    case TileStatus::Poisoned:
    case TileStatus::Charged:
        canSwap_ = true;
        canMatch_ = true;
        momentum_ = false;
        break;
    }
}

void Tile::clearStatus() noexcept {
    applyStatus(TileStatus::None);
}

void Tile::tickStatus(float dt) noexcept {
    if (status_ == TileStatus::None || statusTimer_ <= 0.0f) return;

    statusTimer_ -= dt;
    if (statusTimer_ <= 0.0f) {
        clearStatus();
    }
}

void Tile::onAdjacentMatch() noexcept {
    if (status_ == TileStatus::Burning) {
        clearStatus();
    }
}

} // namespace panelrise::core
