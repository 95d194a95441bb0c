#include "controller/GridController.hpp"

namespace panelrise::controller {

GridController::GridController(panelrise::core::Grid& grid)
    : grid_{grid}
{
}

bool GridController::handleAction(InputAction action) {
    if (grid_.isGameOver()) {
        return false;
    }

    if (action == InputAction::PauseResume) {
        paused_ = !paused_;
        resetTiming();
        return true;
    }
    if (paused_) {
        return false;
    }

    switch (action) {
    case InputAction::MoveLeft:
        return grid_.moveCursor(-1, 0);
    case InputAction::MoveRight:
        return grid_.moveCursor(1, 0);
    case InputAction::MoveUp:
        return grid_.moveCursor(0, 1);
    case InputAction::MoveDown:
        return grid_.moveCursor(0, -1);
    case InputAction::Swap:
        return grid_.requestSwap();
    case InputAction::FastRise:
        grid_.requestFastRise();
        return grid_.rise().isFastRising();
    case InputAction::FastRiseRelease:
        grid_.stopFastRise();
        return true;
    case InputAction::PauseResume:
        break;
    }
    return false;
}

void GridController::update(Duration elapsed) {
    if (paused_ || grid_.isGameOver()) {
        return;
    }

    accumulated_ += elapsed;

    // After a long stall several steps run back to back.
    while (accumulated_ >= kStep && !grid_.isGameOver()) {
        grid_.tick(static_cast<float>(kStep.count()) / 1000.0f);
        accumulated_ -= kStep;
    }
}

void GridController::resetTiming() {
    accumulated_ = Duration{0};
}

} // namespace panelrise::controller
