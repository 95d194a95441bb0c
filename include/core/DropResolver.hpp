#pragma once

#include "Types.hpp"
#include "AnimationTable.hpp"
#include <vector>

namespace panelrise::core {

class Grid;

struct DropRecord {
    TileId tile{};
    GridPos from{};
    GridPos to{};
};

struct DropResult {
    int passes{0};
    int tilesMoved{0};
    int garbageMoved{0};
    int maxDistance{0};
    float settleTime{0.0f};
    bool aborted{false};
};

// Gravity for one grid. Falls are committed to the board before they are
// animated, so a pass can be validated as a whole.
class DropResolver {
public:
    explicit DropResolver(Grid& grid);

    /// One bottom-up sweep over every column. Eligible tiles are moved in the
    /// board immediately; the records describe those moves.
    std::vector<DropRecord> collectDrops();

    /// True when all destinations are pairwise distinct.
    static bool validate(const std::vector<DropRecord>& records);

    /// Runs sweeps (tiles, then whole garbage blocks) until nothing moves or
    /// the pass ceiling is hit, and starts the falls.
    DropResult resolve();

    /// Mid-flight check for slip/interception falls. Retargets the tile to
    /// land above a solid occupant found between it and its target.
    bool checkObstruction(Tile& tile, Animation& anim);

private:
    Grid& grid_;

    bool canFall(const Tile& tile) const;
    bool isSolidObstruction(Occupant occupant) const;
    void rollback(const std::vector<DropRecord>& records);
};

} // namespace panelrise::core
