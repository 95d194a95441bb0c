#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "core/Grid.hpp"
#include "core/GarbageEconomy.hpp"
#include "session/GarbageListener.hpp"
#include "session/SessionConfig.hpp"

namespace panelrise::session {

// Turns finished combos into attacks and hands them to other grids.
// The router only talks to grids through their listener events and their
// garbage queues; grids never see each other.
class GarbageRouter {
public:
    /// Grids are not owned and must outlive the router.
    GarbageRouter(std::vector<core::Grid*> grids,
                  core::GarbageEconomy economy,
                  TargetingMode mode,
                  float sendDelay = 0.0f,
                  std::uint32_t seed = 0);
    ~GarbageRouter();

    GarbageRouter(const GarbageRouter&) = delete;
    GarbageRouter& operator=(const GarbageRouter&) = delete;

    void setListener(GarbageListener* listener) noexcept { m_listener = listener; }

    TargetingMode mode() const noexcept { return m_mode; }
    void setMode(TargetingMode mode) noexcept { m_mode = mode; }
    int playerCount() const noexcept { return static_cast<int>(m_grids.size()); }
    const core::GarbageEconomy& economy() const noexcept { return m_economy; }

    /// Advances delayed sends.
    void tick(float dt);

    // Grid events, also callable directly.
    void handleComboStarted(int player);
    void handleComboEnded(int player, const std::vector<int>& matchSizes, int combo, int maxChain);

    /// Routes an attack score from `sender` according to the targeting mode.
    void sendGarbage(int sender, int score);

    /// Receivers the current mode would pick for `sender`.
    std::vector<int> determineTargets(int sender);

    /// Delivers garbage held back while the player was in a combo.
    void forceDeliverPending(int player);

    int pendingIncoming(int player) const;
    bool isInCombo(int player) const;
    int stackHeight(int player) const;

private:
    class PlayerHook;

    struct DelayedSend {
        int sender{};
        int score{};
        float timer{};
    };

    std::vector<core::Grid*> m_grids;
    core::GarbageEconomy m_economy;
    TargetingMode m_mode;
    float m_sendDelay;
    std::mt19937 m_rng;
    GarbageListener* m_listener{nullptr};

    std::vector<std::unique_ptr<PlayerHook>> m_hooks;
    std::vector<int> m_pendingIncoming;
    std::vector<bool> m_inCombo;
    std::vector<DelayedSend> m_delayed;
    int m_sequentialIndex{0};

    bool isValidPlayer(int player) const noexcept;
    bool isAlive(int player) const;
    void queueGarbageForPlayer(int sender, int target, int score);
    void deliver(int player);
    int findStackExtreme(int sender, bool lowest) const;
};

} // namespace panelrise::session
