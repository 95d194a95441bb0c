#pragma once

#include "Types.hpp"
#include <cstdint>

namespace panelrise::core {

// Status effects an external system can put on a tile. Each status maps to
// the capability flags the simulation actually queries.
enum class TileStatus : std::uint8_t {
    None,
    Frozen,   // slides after a swap until blocked
    Burning,  // cannot match until an adjacent match cures it
    Poisoned,
    Locked,   // cannot swap or match
    Charged
};

class Tile {
public:
    Tile(TileId id, TileType type, GridPos pos);

    TileId id() const noexcept { return id_; }
    TileType type() const noexcept { return type_; }

    // Logical coordinate. While Swapping/Falling this is already the target.
    GridPos pos() const noexcept { return pos_; }
    void setPos(GridPos pos) noexcept { pos_ = pos; }

    MovementState state() const noexcept { return state_; }
    GridPos target() const noexcept { return target_; }
    bool isIdle() const noexcept { return state_ == MovementState::Idle; }
    bool isFalling() const noexcept { return state_ == MovementState::Falling; }
    bool isSwapping() const noexcept { return state_ == MovementState::Swapping; }

    // Interpolated position in grid units (same axes as pos()).
    float visualX() const noexcept { return visualX_; }
    float visualY() const noexcept { return visualY_; }
    void setVisual(float x, float y) noexcept { visualX_ = x; visualY_ = y; }

    std::uint32_t animationVersion() const noexcept { return version_; }
    std::uint32_t bumpVersion() noexcept { return ++version_; }

    void beginSwap(GridPos target) noexcept;
    void beginFall(GridPos target) noexcept;
    void finishMovement() noexcept;

    // Row injection moves everything up one row in lockstep.
    void shiftUp() noexcept;

    // Capability flags
    bool canMatch() const noexcept { return canMatch_; }
    bool canSwap() const noexcept { return canSwap_; }
    bool hasMomentum() const noexcept { return momentum_; }
    void setCanMatch(bool value) noexcept { canMatch_ = value; }
    void setCanSwap(bool value) noexcept { canSwap_ = value; }
    void setMomentum(bool value) noexcept { momentum_ = value; }

    // Status effects. A positive duration makes the status expire on its own.
    TileStatus status() const noexcept { return status_; }
    float statusTimer() const noexcept { return statusTimer_; }
    void applyStatus(TileStatus status, float duration = 0.0f) noexcept;
    void clearStatus() noexcept;
    void tickStatus(float dt) noexcept;
    void onAdjacentMatch() noexcept;

private:
    TileId id_;
    TileType type_;
    GridPos pos_;
    GridPos target_;
    MovementState state_{MovementState::Idle};
    float visualX_;
    float visualY_;
    std::uint32_t version_{0};

    bool canMatch_{true};
    bool canSwap_{true};
    bool momentum_{false};

    TileStatus status_{TileStatus::None};
    float statusTimer_{0.0f};
};

} // namespace panelrise::core
