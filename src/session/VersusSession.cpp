#include "session/VersusSession.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace panelrise::session {

VersusSession::VersusSession(SessionConfig config)
    : m_config(std::move(config))
{
    if (!m_config.isValid()) {
        throw std::invalid_argument("VersusSession: invalid configuration");
    }

    std::vector<core::Grid*> raw;
    for (int i = 0; i < m_config.playerCount; ++i) {
        core::GridConfig gridConfig = m_config.grid;
        gridConfig.seed = m_config.grid.seed + static_cast<std::uint32_t>(i);
        m_grids.push_back(std::make_unique<core::Grid>(gridConfig));
        raw.push_back(m_grids.back().get());
    }

    m_router = std::make_unique<GarbageRouter>(std::move(raw),
                                               core::GarbageEconomy{m_config.garbage},
                                               m_config.targeting,
                                               m_config.garbageSendDelay,
                                               m_config.seed);
    m_recorded.assign(m_grids.size(), false);
}

core::Grid& VersusSession::grid(int player)
{
    if (player < 0 || player >= playerCount()) {
        throw std::out_of_range("VersusSession: player index out of range");
    }
    return *m_grids[player];
}

const core::Grid& VersusSession::grid(int player) const
{
    if (player < 0 || player >= playerCount()) {
        throw std::out_of_range("VersusSession: player index out of range");
    }
    return *m_grids[player];
}

int VersusSession::aliveCount() const
{
    int alive = 0;
    for (const auto& g : m_grids) {
        if (!g->isGameOver()) ++alive;
    }
    return alive;
}

void VersusSession::update(float dt)
{
    if (m_finished || dt <= 0.0f) return;

    m_elapsed += dt;
    for (auto& g : m_grids) {
        if (!g->isGameOver()) {
            g->tick(dt);
        }
    }
    m_router->tick(dt);

    recordEliminations();

    const int alive = aliveCount();
    const bool solo = playerCount() == 1;
    if ((solo && alive == 0) || (!solo && alive <= 1)) {
        m_finished = true;
        std::cerr << "VersusSession: match finished after " << m_elapsed << "s\n";
    }
}

void VersusSession::recordEliminations()
{
    m_lastWave.clear();
    for (int i = 0; i < playerCount(); ++i) {
        if (!m_recorded[i] && m_grids[i]->isGameOver()) {
            m_recorded[i] = true;
            m_eliminated.push_back(i);
            m_lastWave.push_back(i);
        }
    }
}

std::vector<MatchResult> VersusSession::results() const
{
    std::vector<MatchResult> out;
    if (!m_finished) return out;

    const bool nobodyLeft = aliveCount() == 0;
    for (int i = 0; i < playerCount(); ++i) {
        MatchResult r;
        r.player = i;
        r.finalScore = m_grids[i]->score();

        if (!m_grids[i]->isGameOver()) {
            r.outcome = MatchOutcome::Win;
        } else if (nobodyLeft && playerCount() > 1
                   && std::find(m_lastWave.begin(), m_lastWave.end(), i) != m_lastWave.end()) {
            // Everyone still standing topped out on the same step.
            r.outcome = MatchOutcome::Draw;
        } else {
            r.outcome = MatchOutcome::Lose;
        }
        out.push_back(r);
    }
    return out;
}

} // namespace panelrise::session
