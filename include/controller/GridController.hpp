#pragma once

#include "core/Grid.hpp"
#include "controller/InputAction.hpp"
#include <chrono>

namespace panelrise::controller {

class GridController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    static constexpr Duration kStep{16};

    /// Controller does not own the Grid; caller keeps it alive.
    explicit GridController(panelrise::core::Grid& grid);

    /// Handle a single discrete player action (e.g. key press).
    /// Returns true if the grid accepted it.
    bool handleAction(InputAction action);

    // Called periodically with elapsed time since last call.
    // Time is accumulated and fed to the grid in fixed steps.
    void update(Duration elapsed);

    bool isPaused() const noexcept { return paused_; }

    // Reset timing accumulator (e.g. after a pause)
    void resetTiming();

private:
    panelrise::core::Grid& grid_;
    Duration accumulated_{0};
    bool paused_{false};
};

} // namespace panelrise::controller
