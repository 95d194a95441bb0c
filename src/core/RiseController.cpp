#include "core/RiseController.hpp"
#include "core/Grid.hpp"
#include <algorithm>
#include <cmath>

namespace panelrise::core {

RiseController::RiseController(Grid& grid)
    : grid_{grid}
    , speedLevel_{grid.config().startingSpeedLevel}
    , graceTimer_{grid.config().gracePeriod}
{
}

void RiseController::requestFastRise() noexcept {
    if (grid_.isSwapping() || grid_.matchResolver().isProcessing()) return;
    fastRise_ = true;
}

void RiseController::addBreathingRoom(int tiles) noexcept {
    const GridConfig& cfg = grid_.config();
    if (!cfg.breathingRoomEnabled || tiles <= 0) return;

    breathingRoom_ = std::min(breathingRoom_ + static_cast<float>(tiles) * cfg.breathingRoomPerTile,
                              cfg.maxBreathingRoom);
}

void RiseController::setSpeedLevel(int level) noexcept {
    speedLevel_ = std::clamp(level, 1, grid_.config().maxSpeedLevel);
    levelTimer_ = 0.0f;
}

float RiseController::speedForLevel(int level) const noexcept {
    const GridConfig& cfg = grid_.config();
    if (level <= 1 || cfg.maxSpeedLevel <= 1) return cfg.baseRiseSpeed;

    const int clamped = std::min(level, cfg.maxSpeedLevel);
    const float t = static_cast<float>(clamped - 1) / static_cast<float>(cfg.maxSpeedLevel - 1);
    return cfg.baseRiseSpeed * std::pow(80.0f, t);
}

void RiseController::tick(float dt) {
    if (gameOver_) return;

    updateSpeedLevel(dt);
    updateBreathingRoom(dt);

    if (inGracePeriod_) {
        handleGracePeriod(dt);
    } else if (grid_.isSwapping()) {
        timeDebt_ += dt;
    } else if (grid_.matchResolver().isProcessing()) {
        // paused, no debt
    } else if (breathingRoom_ > 0.0f) {
        // reward pause, no debt
    } else {
        performRise(dt);
    }
}

void RiseController::updateSpeedLevel(float dt) noexcept {
    const GridConfig& cfg = grid_.config();
    if (speedLevel_ >= cfg.maxSpeedLevel) return;

    levelTimer_ += dt;
    if (levelTimer_ >= cfg.speedLevelInterval) {
        ++speedLevel_;
        levelTimer_ = 0.0f;
    }
}

void RiseController::updateBreathingRoom(float dt) {
    if (breathingRoom_ <= 0.0f) return;
    if (grid_.matchResolver().isProcessing()) return;

    breathingRoom_ = std::max(breathingRoom_ - dt, 0.0f);
}

void RiseController::handleGracePeriod(float dt) {
    if (!topRowOccupied()) {
        inGracePeriod_ = false;
        graceTimer_ = grid_.config().gracePeriod;
        return;
    }

    if (grid_.matchResolver().isProcessing()) return;

    graceTimer_ -= dt;
    if (graceTimer_ <= 0.0f) {
        graceTimer_ = 0.0f;
        gameOver_ = true;
        fastRise_ = false;
    }
}

void RiseController::performRise(float dt) {
    checkTopRow();
    if (inGracePeriod_) return;

    const GridConfig& cfg = grid_.config();
    float speed = currentSpeed();
    if (fastRise_) {
        speed *= cfg.fastRiseMultiplier;
    }

    float multiplier = 1.0f;
    if (timeDebt_ > 0.0f) {
        multiplier = cfg.catchUpMultiplier;
        // The extra distance over normal speed pays the debt back.
        timeDebt_ = std::max(timeDebt_ - (multiplier - 1.0f) * dt, 0.0f);
    }

    offset_ += speed * multiplier * dt;

    if (offset_ >= 1.0f) {
        if (grid_.injectRow()) {
            offset_ -= 1.0f;
        } else {
            offset_ = 1.0f;
        }
    }

    checkTopRow();
}

bool RiseController::topRowOccupied() const {
    const Board& board = grid_.board();
    const int top = board.height() - 1;

    for (int x = 0; x < board.width(); ++x) {
        const Occupant occ = board.cell(x, top);
        if (occ.isTile()) {
            const Tile* tile = grid_.tile(occ.id);
            if (tile != nullptr && !tile->isFalling()) return true;
        } else if (occ.isGarbage()) {
            const GarbageBlock* block = grid_.garbage().block(occ.id);
            if (block != nullptr && !block->isFalling()) return true;
        }
    }
    return false;
}

void RiseController::checkTopRow() {
    if (gameOver_) return;

    if (topRowOccupied()) {
        inGracePeriod_ = true;
    } else if (inGracePeriod_) {
        inGracePeriod_ = false;
        graceTimer_ = grid_.config().gracePeriod;
    }
}

} // namespace panelrise::core
