#pragma once

namespace panelrise::core {

class Grid;

// Continuous upward movement of one grid: speed levels, fast rise, time
// debt after swaps, breathing room, grace period and game over.
class RiseController {
public:
    explicit RiseController(Grid& grid);

    void tick(float dt);

    void requestFastRise() noexcept;
    void stopFastRise() noexcept { fastRise_ = false; }
    bool isFastRising() const noexcept { return fastRise_; }

    /// Adds breathing room for matched tiles, capped at the configured max.
    void addBreathingRoom(int tiles) noexcept;

    float offset() const noexcept { return offset_; }
    int speedLevel() const noexcept { return speedLevel_; }
    void setSpeedLevel(int level) noexcept;

    /// base * 80^((level-1)/(maxLevel-1)) in rows per second
    float speedForLevel(int level) const noexcept;
    float currentSpeed() const noexcept { return speedForLevel(speedLevel_); }

    float breathingRoom() const noexcept { return breathingRoom_; }
    float timeDebt() const noexcept { return timeDebt_; }
    bool isInGracePeriod() const noexcept { return inGracePeriod_; }
    float graceTimer() const noexcept { return graceTimer_; }
    bool isGameOver() const noexcept { return gameOver_; }

    /// Re-evaluates the top row: enters or leaves the grace period.
    void checkTopRow();

private:
    Grid& grid_;

    float offset_{0.0f};
    int speedLevel_;
    float levelTimer_{0.0f};
    bool fastRise_{false};
    float breathingRoom_{0.0f};
    float timeDebt_{0.0f};
    bool inGracePeriod_{false};
    float graceTimer_{0.0f};
    bool gameOver_{false};

    void updateSpeedLevel(float dt) noexcept;
    void updateBreathingRoom(float dt);
    void handleGracePeriod(float dt);
    void performRise(float dt);
    bool topRowOccupied() const;
};

} // namespace panelrise::core
