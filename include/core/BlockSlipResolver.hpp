#pragma once

#include "Types.hpp"
#include "Tile.hpp"
#include <cstdint>
#include <vector>

namespace panelrise::core {

class Grid;

// Swaps that interact with tiles still in the air.
//
// Kick-under: one cursor cell holds a falling tile, the other an idle one;
// the idle tile is kicked into the falling tile's column at the cursor row.
// Slip: both cursor cells are idle but a tile falling in one column will
// land at or below the cursor row; the idle tile of the other column is
// kicked into that column.
//
// Everything in the target column at or above the slip row is then either
// nudged up one row (stationary tiles, and fallers less than halfway into the
// slip row) or retargeted to the lowest free rows above the kicked tile
// (all other fallers, lowest visual first).
class BlockSlipResolver {
public:
    enum class Outcome : std::uint8_t {
        NotApplicable, // plain swap rules apply
        Started,
        Rejected       // a slip applies but cannot be carried out; the swap is refused
    };

    explicit BlockSlipResolver(Grid& grid);

    /// How deep (0..1) a falling tile has sunk into its destination cell.
    static float fallDepth(const Tile& tile) noexcept;
    static bool isPastHalfway(const Tile& tile) noexcept { return fallDepth(tile) >= 0.5f; }

    Outcome tryKickUnder(GridPos left, GridPos right);
    Outcome trySlip(GridPos left, GridPos right);

    /// Closest falling tile in `column` still above `row` that lands at or below it.
    Tile* findFallerPassingRow(int column, int row);

    /// After a plain swap: fallers above `swapped` in its column that would
    /// land at or below it are stopped and stacked on top of it. Returns the
    /// longest nudge started, 0 if none. Nothing moves when a restack row is
    /// held by garbage or any other occupant.
    float interceptFallingAbove(const Tile& swapped);

    void tick(float dt);
    bool isActive() const noexcept { return active_; }

private:
    struct Move {
        Tile* tile{nullptr};
        GridPos from{};
        GridPos to{};
    };

    Grid& grid_;
    bool active_{false};
    float timer_{0.0f};

    Outcome execute(Tile& kicked, GridPos slipCell);
    void commit(Tile& kicked, GridPos slipCell, const std::vector<Move>& moves);
};

} // namespace panelrise::core
