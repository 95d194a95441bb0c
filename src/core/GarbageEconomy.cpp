#include "core/GarbageEconomy.hpp"
#include <algorithm>
#include <utility>

namespace panelrise::core {

GarbageEconomy::GarbageEconomy()
    : GarbageEconomy(GarbageTables{})
{
}

GarbageEconomy::GarbageEconomy(GarbageTables tables)
    : tables_{std::move(tables)}
{
    for (const BlockCost& c : tables_.blockCosts) {
        if (c.cost > 0 && c.width > 0 && c.height > 0) {
            sortedCosts_.push_back(c);
        }
    }
    std::stable_sort(sortedCosts_.begin(), sortedCosts_.end(),
                     [](const BlockCost& a, const BlockCost& b) { return a.cost > b.cost; });
}

int GarbageEconomy::lookup(const std::vector<int>& table, int index) noexcept {
    if (table.empty()) return 0;
    const int last = static_cast<int>(table.size()) - 1;
    return table[static_cast<std::size_t>(std::clamp(index, 0, last))];
}

int GarbageEconomy::attackScore(const std::vector<int>& matchSizes, int combo, int maxChain) const {
    int score = 0;
    for (int size : matchSizes) {
        score += lookup(tables_.matchSizeScores, size);
    }
    score += lookup(tables_.comboBonusScores, combo);
    score += lookup(tables_.chainBonusScores, maxChain);
    return score;
}

PackingResult GarbageEconomy::convertScoreToBlocks(int score) const {
    PackingResult result;
    int remaining = std::max(score, 0);

    for (const BlockCost& c : sortedCosts_) {
        while (remaining >= c.cost) {
            result.blocks.push_back(GarbageShape{c.width, c.height});
            remaining -= c.cost;
            result.spent += c.cost;
        }
    }
    result.wasted = remaining;
    return result;
}

} // namespace panelrise::core
