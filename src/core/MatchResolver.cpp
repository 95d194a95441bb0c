#include "core/MatchResolver.hpp"
#include "core/Grid.hpp"
#include <iostream>
#include <set>
#include <utility>

namespace panelrise::core {

MatchResolver::MatchResolver(Grid& grid)
    : grid_{grid}
{
}

bool MatchResolver::checkForMatches() {
    if (isProcessing() || grid_.isGameOver()) return false;

    auto groups = grid_.detector().findMatchGroups();
    if (groups.empty()) return false;

    beginStep(std::move(groups));
    return true;
}

void MatchResolver::beginStep(std::vector<MatchGroup> groups) {
    if (steps_ == 0) {
        grid_.notify([](GridListener& l) { l.onComboStarted(); });
    }
    ++steps_;

    groups_ = std::move(groups);
    std::set<GridPos> matchedCells;
    for (const auto& group : groups_) {
        for (TileId id : group.tiles) {
            processing_.insert(id);
        }
        matchedCells.insert(group.cells.begin(), group.cells.end());
    }

    // Neighbours of the match: cure statuses, start garbage conversion.
    const MatchDetector detector = grid_.detector();
    for (const GridPos& cell : matchedCells) {
        for (const GridPos& n : detector.adjacentCells(cell)) {
            if (matchedCells.count(n) != 0) continue;
            if (Tile* neighbour = grid_.tileAt(n)) {
                neighbour->onAdjacentMatch();
            }
        }
    }
    grid_.garbage().triggerConversion(std::vector<GridPos>(matchedCells.begin(), matchedCells.end()));

    phase_ = Phase::Highlighting;
    timer_ = grid_.config().highlightDuration;
}

void MatchResolver::scoreStep() {
    ScoreManager& score = grid_.scoreManager();
    const int previousCombo = score.combo();
    const int combo = score.beginStep();
    const int chain = score.chain();

    int totalTiles = 0;
    for (const auto& group : groups_) {
        score.addMatch(group.size());
        totalTiles += group.size();
        const int size = group.size();
        grid_.notify([size, combo, chain](GridListener& l) { l.onMatchScored(size, combo, chain); });
    }

    if (previousCombo > 0) {
        grid_.rise().addBreathingRoom(totalTiles);
    }

    pops_.assign(groups_.size(), PopCursor{});
    phase_ = Phase::Popping;
}

void MatchResolver::advancePops(float dt) {
    const float stagger = grid_.config().popStagger;
    bool allDone = true;

    for (std::size_t g = 0; g < groups_.size(); ++g) {
        PopCursor& cursor = pops_[g];
        const auto& tiles = groups_[g].tiles;

        cursor.timer -= dt;
        while (cursor.timer <= 0.0f && cursor.next < tiles.size()) {
            const TileId id = tiles[cursor.next++];
            processing_.erase(id);
            grid_.popTile(id);
            cursor.timer += stagger;
        }

        if (cursor.next < tiles.size() || cursor.timer > 0.0f) {
            allDone = false;
        }
    }

    if (allDone) {
        phase_ = Phase::PostPop;
        timer_ = grid_.config().postPopDelay;
    }
}

void MatchResolver::settle() {
    const DropResult drops = grid_.dropResolver().resolve();
    phase_ = Phase::Settling;
    timer_ = drops.settleTime;
}

void MatchResolver::scan() {
    auto groups = grid_.detector().findMatchGroups();
    if (groups.empty()) {
        endLoop();
        return;
    }

    const int ceiling = grid_.config().iterationLimit();
    if (steps_ >= ceiling) {
        std::cerr << "MatchResolver: cascade exceeded " << ceiling << " steps, ending loop\n";
        endLoop();
        return;
    }
    beginStep(std::move(groups));
}

void MatchResolver::endLoop() {
    ScoreManager& score = grid_.scoreManager();
    const int combo = score.combo();
    const int maxChain = score.maxChain();

    groups_.clear();
    pops_.clear();
    processing_.clear();
    steps_ = 0;
    phase_ = Phase::Idle;

    // Listeners still see the loop's match sizes in the score manager.
    if (combo > 0) {
        grid_.notify([combo, maxChain](GridListener& l) { l.onComboEnded(combo, maxChain); });
        score.endCombo();
    }
}

void MatchResolver::tick(float dt) {
    switch (phase_) {
    case Phase::Idle:
        return;

    case Phase::Highlighting:
        timer_ -= dt;
        if (timer_ <= 0.0f) {
            scoreStep();
            advancePops(0.0f);
        }
        return;

    case Phase::Popping:
        advancePops(dt);
        return;

    case Phase::PostPop:
        timer_ -= dt;
        if (timer_ <= 0.0f) {
            processing_.clear();
            phase_ = Phase::WaitingConversion;
        }
        return;

    case Phase::WaitingConversion:
        if (!grid_.garbage().isConverting()) {
            settle();
        }
        return;

    case Phase::Settling:
        timer_ -= dt;
        if (timer_ <= 0.0f) {
            scan();
        }
        return;
    }
}

} // namespace panelrise::core
