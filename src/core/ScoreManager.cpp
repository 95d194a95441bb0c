#include "core/ScoreManager.hpp"
#include <algorithm>

namespace panelrise::core {

int ScoreManager::beginStep() {
    ++combo_;
    // The first cascade of a loop is already a x2 chain.
    if (combo_ >= 2) {
        chain_ = chain_ == 0 ? 2 : chain_ + 1;
        maxChain_ = std::max(maxChain_, chain_);
    }
    return combo_;
}

std::uint64_t ScoreManager::addMatch(int tiles) {
    if (tiles <= 0) return 0;

    matchSizes_.push_back(tiles);
    const std::uint64_t points = pointsFor(tiles, combo_, chain_);
    score_ += points;
    return points;
}

void ScoreManager::endCombo() noexcept {
    combo_ = 0;
    chain_ = 0;
    maxChain_ = 0;
    matchSizes_.clear();
}

std::uint64_t ScoreManager::pointsFor(int tiles, int combo, int chain) noexcept {
    if (tiles <= 0) return 0;

    const double comboFactor = 1.0 + 0.5 * static_cast<double>(std::max(combo - 1, 0));
    double points = static_cast<double>(tiles) * 10.0 * comboFactor;

    if (chain >= 2) {
        points += static_cast<double>(chain) * 50.0;
    }

    if (tiles >= 6) {
        points += 100.0;
    } else if (tiles >= 5) {
        points += 50.0;
    } else if (tiles >= 4) {
        points += 20.0;
    }

    return static_cast<std::uint64_t>(points);
}

void ScoreManager::reset() noexcept {
    score_ = 0;
    endCombo();
}

} // namespace panelrise::core
