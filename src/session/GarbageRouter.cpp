#include "session/GarbageRouter.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace panelrise::session {

// Forwards one grid's events to the router with the player index attached.
class GarbageRouter::PlayerHook : public core::GridListener {
public:
    PlayerHook(GarbageRouter& router, int player, const core::Grid* grid)
        : m_router(router)
        , m_player(player)
        , m_grid(grid)
    {
    }

    void onComboStarted() override { m_router.handleComboStarted(m_player); }

    // Fired before the grid resets its combo state.
    void onComboEnded(int combo, int maxChain) override
    {
        if (!m_grid) return;
        m_router.handleComboEnded(m_player, m_grid->scoreManager().matchSizes(), combo, maxChain);
    }

private:
    GarbageRouter& m_router;
    int m_player;
    const core::Grid* m_grid;
};

GarbageRouter::GarbageRouter(std::vector<core::Grid*> grids,
                             core::GarbageEconomy economy,
                             TargetingMode mode,
                             float sendDelay,
                             std::uint32_t seed)
    : m_grids(std::move(grids))
    , m_economy(std::move(economy))
    , m_mode(mode)
    , m_sendDelay(sendDelay < 0.0f ? 0.0f : sendDelay)
    , m_rng(seed)
{
    const std::size_t n = m_grids.size();
    m_pendingIncoming.assign(n, 0);
    m_inCombo.assign(n, false);

    m_hooks.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        m_hooks.push_back(std::make_unique<PlayerHook>(*this, static_cast<int>(i), m_grids[i]));
        if (m_grids[i]) {
            m_grids[i]->addListener(m_hooks.back().get());
        }
    }
}

GarbageRouter::~GarbageRouter()
{
    for (std::size_t i = 0; i < m_grids.size(); ++i) {
        if (m_grids[i]) {
            m_grids[i]->removeListener(m_hooks[i].get());
        }
    }
}

bool GarbageRouter::isValidPlayer(int player) const noexcept
{
    return player >= 0 && player < playerCount();
}

bool GarbageRouter::isAlive(int player) const
{
    return isValidPlayer(player) && m_grids[player] && !m_grids[player]->isGameOver();
}

int GarbageRouter::pendingIncoming(int player) const
{
    return isValidPlayer(player) ? m_pendingIncoming[player] : 0;
}

bool GarbageRouter::isInCombo(int player) const
{
    return isValidPlayer(player) && m_inCombo[player];
}

int GarbageRouter::stackHeight(int player) const
{
    if (!isValidPlayer(player) || !m_grids[player]) return 0;
    return m_grids[player]->stackHeight();
}

void GarbageRouter::tick(float dt)
{
    if (m_delayed.empty()) return;

    std::vector<DelayedSend> ready;
    for (auto it = m_delayed.begin(); it != m_delayed.end();) {
        it->timer -= dt;
        if (it->timer <= 0.0f) {
            ready.push_back(*it);
            it = m_delayed.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& send : ready) {
        sendGarbage(send.sender, send.score);
    }
}

void GarbageRouter::handleComboStarted(int player)
{
    if (!isValidPlayer(player)) return;
    m_inCombo[player] = true;
}

void GarbageRouter::handleComboEnded(int player, const std::vector<int>& matchSizes, int combo, int maxChain)
{
    if (!isValidPlayer(player)) return;

    m_inCombo[player] = false;

    int score = m_economy.attackScore(matchSizes, combo, maxChain);

    // Garbage that arrived during the combo is paid off first.
    int& incoming = m_pendingIncoming[player];
    if (score > 0 && incoming > 0) {
        const int countered = std::min(score, incoming);
        incoming -= countered;
        score -= countered;
        if (m_listener) m_listener->onGarbageCountered(player, countered, incoming);
    }

    if (score > 0) {
        if (m_sendDelay > 0.0f) {
            m_delayed.push_back(DelayedSend{player, score, m_sendDelay});
        } else {
            sendGarbage(player, score);
        }
    }

    if (incoming > 0) {
        deliver(player);
    }
}

std::vector<int> GarbageRouter::determineTargets(int sender)
{
    std::vector<int> targets;
    const int n = playerCount();
    if (n < 2) return targets;

    switch (m_mode) {
    case TargetingMode::Sequential:
        for (int i = 0; i < n; ++i) {
            const int candidate = (m_sequentialIndex + i) % n;
            if (candidate != sender && isAlive(candidate)) {
                targets.push_back(candidate);
                break;
            }
        }
        break;

    case TargetingMode::SplitEvenly:
    case TargetingMode::AllOpponents:
        for (int i = 0; i < n; ++i) {
            if (i != sender && isAlive(i)) targets.push_back(i);
        }
        break;

    case TargetingMode::Random: {
        std::vector<int> candidates;
        for (int i = 0; i < n; ++i) {
            if (i != sender && isAlive(i)) candidates.push_back(i);
        }
        if (!candidates.empty()) {
            std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
            targets.push_back(candidates[dist(m_rng)]);
        }
        break;
    }

    case TargetingMode::LowestStack:
    case TargetingMode::HighestStack: {
        const int target = findStackExtreme(sender, m_mode == TargetingMode::LowestStack);
        if (target >= 0) targets.push_back(target);
        break;
    }
    }

    return targets;
}

int GarbageRouter::findStackExtreme(int sender, bool lowest) const
{
    int best = -1;
    int bestHeight = 0;
    for (int i = 0; i < playerCount(); ++i) {
        if (i == sender || !isAlive(i)) continue;
        const int h = stackHeight(i);
        if (best < 0 || (lowest ? h < bestHeight : h > bestHeight)) {
            best = i;
            bestHeight = h;
        }
    }
    return best;
}

void GarbageRouter::sendGarbage(int sender, int score)
{
    if (score <= 0 || playerCount() < 2) return;

    const std::vector<int> targets = determineTargets(sender);
    if (targets.empty()) return;

    switch (m_mode) {
    case TargetingMode::SplitEvenly: {
        const int count = static_cast<int>(targets.size());
        const int share = score / count;
        const int remainder = score % count;
        for (int i = 0; i < count; ++i) {
            const int part = share + (i < remainder ? 1 : 0);
            if (part > 0) queueGarbageForPlayer(sender, targets[i], part);
        }
        break;
    }
    case TargetingMode::AllOpponents:
        for (int target : targets) {
            queueGarbageForPlayer(sender, target, score);
        }
        break;
    default:
        queueGarbageForPlayer(sender, targets.front(), score);
        break;
    }

    if (m_mode == TargetingMode::Sequential) {
        m_sequentialIndex = (targets.front() + 1) % playerCount();
    }
}

void GarbageRouter::queueGarbageForPlayer(int sender, int target, int score)
{
    if (!isValidPlayer(target)) return;

    m_pendingIncoming[target] += score;
    if (m_listener) m_listener->onGarbageSent(sender, target, score);

    // A player mid-combo gets the chance to counter first.
    if (!m_inCombo[target]) {
        deliver(target);
    }
}

void GarbageRouter::forceDeliverPending(int player)
{
    if (!isValidPlayer(player)) return;
    if (m_pendingIncoming[player] > 0) {
        deliver(player);
    }
}

void GarbageRouter::deliver(int player)
{
    const int score = m_pendingIncoming[player];
    m_pendingIncoming[player] = 0;
    if (score <= 0 || !isAlive(player)) return;

    core::Grid& grid = *m_grids[player];
    const core::PackingResult packing = m_economy.convertScoreToBlocks(score);
    int queued = 0;
    for (const auto& shape : packing.blocks) {
        if (grid.garbage().queueGarbage(shape.width, shape.height)) {
            ++queued;
        }
    }
    if (queued < static_cast<int>(packing.blocks.size())) {
        std::cerr << "GarbageRouter: player " << player << " dropped "
                  << (packing.blocks.size() - queued) << " block(s), queue full\n";
    }
    if (queued > 0) {
        grid.garbage().dropPendingGarbage();
    }

    if (m_listener) m_listener->onGarbageReceived(player, score);
}

} // namespace panelrise::session
