#pragma once

#include <vector>

namespace panelrise::core {

struct BlockCost {
    int width{1};
    int height{1};
    int cost{0}; // <= 0 disables the shape
};

struct GarbageShape {
    int width{1};
    int height{1};
};

// Difficulty tables for attacks. Lookups past the end of a table use its
// last entry.
struct GarbageTables {
    std::vector<int> matchSizeScores{0, 0, 0, 50, 100, 175, 300, 400, 500, 550, 600};
    std::vector<int> comboBonusScores{0, 0, 100, 150, 200, 250, 300, 350, 400, 450, 500};
    std::vector<int> chainBonusScores{0, 0, 100, 200, 300, 400, 500, 600, 700, 800, 900};

    std::vector<BlockCost> blockCosts{
        {6, 6, 10000}, {6, 5, 8000}, {6, 4, 7000}, {6, 3, 6000}, {6, 2, 4000},
        {6, 1, 1500},  {5, 2, 1000}, {4, 2, 800},  {3, 2, 700},  {5, 1, 600},
        {2, 2, 500},   {1, 2, 400},  {1, 1, 250}
    };
};

struct PackingResult {
    std::vector<GarbageShape> blocks;
    int spent{0};
    int wasted{0};
};

class GarbageEconomy {
public:
    GarbageEconomy();
    explicit GarbageEconomy(GarbageTables tables);

    const GarbageTables& tables() const noexcept { return tables_; }

    static int lookup(const std::vector<int>& table, int index) noexcept;

    /// Attack score of a finished combo.
    int attackScore(const std::vector<int>& matchSizes, int combo, int maxChain) const;

    /// Greedy packing: repeatedly take the most expensive affordable shape.
    /// Whatever is left when nothing fits is wasted.
    PackingResult convertScoreToBlocks(int score) const;

private:
    GarbageTables tables_;
    std::vector<BlockCost> sortedCosts_; // enabled shapes, most expensive first
};

} // namespace panelrise::core
