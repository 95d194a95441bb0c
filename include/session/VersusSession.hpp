#pragma once

#include <memory>
#include <vector>

#include "core/Grid.hpp"
#include "session/GarbageRouter.hpp"
#include "session/SessionConfig.hpp"

namespace panelrise::session {

// A local match: N grids stepped together with a garbage router between
// them. The last grid standing wins.
class VersusSession {
public:
    /// Throws std::invalid_argument if the configuration is invalid.
    explicit VersusSession(SessionConfig config);

    VersusSession(const VersusSession&) = delete;
    VersusSession& operator=(const VersusSession&) = delete;

    const SessionConfig& config() const noexcept { return m_config; }
    int playerCount() const noexcept { return static_cast<int>(m_grids.size()); }

    /// Throws std::out_of_range for a bad player index.
    core::Grid& grid(int player);
    const core::Grid& grid(int player) const;

    GarbageRouter& router() noexcept { return *m_router; }
    const GarbageRouter& router() const noexcept { return *m_router; }

    /// Steps every surviving grid, then the router, then records eliminations.
    void update(float dt);

    bool isFinished() const noexcept { return m_finished; }
    int aliveCount() const;
    float elapsed() const noexcept { return m_elapsed; }

    /// Players in the order they topped out.
    const std::vector<int>& eliminationOrder() const noexcept { return m_eliminated; }

    /// One entry per player; empty until the match is finished.
    std::vector<MatchResult> results() const;

private:
    SessionConfig m_config;
    std::vector<std::unique_ptr<core::Grid>> m_grids;
    std::unique_ptr<GarbageRouter> m_router;
    std::vector<bool> m_recorded;
    std::vector<int> m_eliminated;
    std::vector<int> m_lastWave; // players eliminated in the finishing update
    float m_elapsed{0.0f};
    bool m_finished{false};

    void recordEliminations();
};

} // namespace panelrise::session
