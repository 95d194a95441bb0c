#pragma once

namespace panelrise::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, gamepad, replay, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    MoveUp,
    MoveDown,
    Swap,
    FastRise,         // held: raise the stack faster
    FastRiseRelease,
    PauseResume
};

} // namespace panelrise::controller
