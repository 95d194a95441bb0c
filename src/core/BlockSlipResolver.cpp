#include "core/BlockSlipResolver.hpp"
#include "core/Grid.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <utility>

namespace panelrise::core {

BlockSlipResolver::BlockSlipResolver(Grid& grid)
    : grid_{grid}
{
}

float BlockSlipResolver::fallDepth(const Tile& tile) noexcept {
    if (!tile.isFalling()) return 0.0f;

    const float cellTop = static_cast<float>(tile.target().y) + 1.0f;
    const float depth = cellTop - tile.visualY();
    return std::clamp(depth, 0.0f, 1.0f);
}

BlockSlipResolver::Outcome BlockSlipResolver::tryKickUnder(GridPos left, GridPos right) {
    Tile* lt = grid_.tileAt(left);
    Tile* rt = grid_.tileAt(right);
    if (lt == nullptr || rt == nullptr) return Outcome::NotApplicable;

    if (lt->isFalling() && rt->isIdle()) {
        return execute(*rt, left);
    }
    if (rt->isFalling() && lt->isIdle()) {
        return execute(*lt, right);
    }
    return Outcome::NotApplicable;
}

BlockSlipResolver::Outcome BlockSlipResolver::trySlip(GridPos left, GridPos right) {
    const std::pair<GridPos, GridPos> options[] = {{left, right}, {right, left}};

    for (const auto& option : options) {
        const GridPos slipCell = option.first;
        Tile* other = grid_.tileAt(option.second);
        if (other == nullptr || !other->isIdle()) continue;
        if (!grid_.board().isEmpty(slipCell)) continue;
        if (findFallerPassingRow(slipCell.x, slipCell.y) == nullptr) continue;

        return execute(*other, slipCell);
    }
    return Outcome::NotApplicable;
}

Tile* BlockSlipResolver::findFallerPassingRow(int column, int row) {
    Tile* closest = nullptr;
    for (TileId id : grid_.animations().ids()) {
        if (!grid_.animations().isFalling(id)) continue;
        Tile* tile = grid_.tile(id);
        if (tile == nullptr) continue;

        const GridPos target = tile->target();
        if (target.x != column || target.y > row) continue;
        if (tile->visualY() <= static_cast<float>(row)) continue;

        if (closest == nullptr || tile->visualY() < closest->visualY()) {
            closest = tile;
        }
    }
    return closest;
}

BlockSlipResolver::Outcome BlockSlipResolver::execute(Tile& kicked, GridPos slipCell) {
    Board& board = grid_.board();
    const int column = slipCell.x;
    const int row = slipCell.y;

    std::vector<Move> nudges;
    std::vector<Move> retargets;
    std::set<TileId> moving{kicked.id()};

    // Stationary occupants of the column. Garbage or a matched tile above the
    // slip row cannot be pushed, so the swap is refused.
    for (int y = row; y < board.height(); ++y) {
        const Occupant occ = board.cell(column, y);
        if (occ.empty()) continue;
        if (occ.isGarbage()) return Outcome::Rejected;

        Tile* tile = grid_.tile(occ.id);
        if (tile == nullptr || tile->isFalling()) continue;
        if (grid_.isTileProcessing(tile->id())) return Outcome::Rejected;
        nudges.push_back(Move{tile, GridPos{column, y}, GridPos{column, y + 1}});
        moving.insert(tile->id());
    }

    // Tiles in the air heading into the column
    for (TileId id : grid_.animations().ids()) {
        if (!grid_.animations().isFalling(id) || moving.count(id) != 0) continue;
        Tile* tile = grid_.tile(id);
        if (tile == nullptr || tile->target().x != column) continue;

        const float v = tile->visualY();
        if (v < static_cast<float>(row)) continue;

        const bool insideSlipRow = v < static_cast<float>(row) + 1.0f;
        const bool beforeMidpoint = v >= static_cast<float>(row) + 0.5f;
        if (insideSlipRow && beforeMidpoint) {
            nudges.push_back(Move{tile, tile->pos(), GridPos{column, row + 1}});
        } else {
            retargets.push_back(Move{tile, tile->pos(), GridPos{}});
        }
        moving.insert(id);
    }

    // Stack retargeted fallers above the kicked tile, lowest first.
    std::sort(retargets.begin(), retargets.end(), [](const Move& a, const Move& b) {
        return a.tile->visualY() < b.tile->visualY();
    });
    std::set<int> taken{row};
    for (const Move& n : nudges) {
        taken.insert(n.to.y);
    }
    int next = row + 1;
    for (Move& r : retargets) {
        while (taken.count(next) != 0) ++next;
        r.to = GridPos{column, next};
        taken.insert(next);
    }

    std::vector<Move> moves(nudges);
    moves.insert(moves.end(), retargets.begin(), retargets.end());

    std::set<GridPos> destinations{slipCell};
    for (const Move& m : moves) {
        if (m.to.y >= board.height()) {
            std::cerr << "BlockSlipResolver: cascade would overflow column " << column
                      << ", slip aborted\n";
            return Outcome::Rejected;
        }
        if (!destinations.insert(m.to).second) {
            std::cerr << "BlockSlipResolver: duplicate destination (" << m.to.x << "," << m.to.y
                      << "), slip aborted\n";
            return Outcome::Rejected;
        }
    }
    for (const GridPos& dest : destinations) {
        const Occupant occ = board.cell(dest);
        if (!occ.empty() && !(occ.isTile() && moving.count(occ.id) != 0)) {
            std::cerr << "BlockSlipResolver: destination (" << dest.x << "," << dest.y
                      << ") is occupied, slip aborted\n";
            return Outcome::Rejected;
        }
    }

    commit(kicked, slipCell, moves);

    // Animate: kicked tile slides in, nudges are quick, retargets keep falling.
    float wait = grid_.startSlide(kicked, slipCell);
    for (const Move& n : nudges) {
        grid_.animations().cancel(*n.tile);
        wait = std::max(wait, grid_.startNudge(*n.tile, n.to));
    }
    for (const Move& r : retargets) {
        grid_.animations().cancel(*r.tile);
        grid_.claimRetarget(r.tile->id());
        wait = std::max(wait, grid_.startFall(*r.tile, r.to, true));
        if (Animation* anim = grid_.animations().find(r.tile->id())) {
            anim->retargeted = true;
        }
    }

    grid_.setSwapping(true);
    active_ = true;
    timer_ = wait;
    return Outcome::Started;
}

void BlockSlipResolver::commit(Tile& kicked, GridPos slipCell, const std::vector<Move>& moves) {
    Board& board = grid_.board();
    auto clearIfHolds = [&board](GridPos pos, TileId id) {
        if (board.isInside(pos) && board.cell(pos) == Occupant::tile(id)) {
            board.clearCell(pos);
        }
    };

    // Every old slot goes before any new one is written.
    clearIfHolds(kicked.pos(), kicked.id());
    for (const Move& m : moves) {
        clearIfHolds(m.from, m.tile->id());
    }

    board.setCell(slipCell, Occupant::tile(kicked.id()));
    for (const Move& m : moves) {
        board.setCell(m.to, Occupant::tile(m.tile->id()));
    }
}

float BlockSlipResolver::interceptFallingAbove(const Tile& swapped) {
    Board& board = grid_.board();
    const GridPos base = swapped.pos();

    std::vector<Tile*> fallers;
    for (TileId id : grid_.animations().ids()) {
        if (id == swapped.id() || !grid_.animations().isFalling(id)) continue;
        Tile* tile = grid_.tile(id);
        if (tile == nullptr) continue;
        if (tile->target().x != base.x || tile->target().y > base.y) continue;
        if (tile->visualY() <= static_cast<float>(base.y)) continue;
        fallers.push_back(tile);
    }
    if (fallers.empty()) return 0.0f;

    std::sort(fallers.begin(), fallers.end(), [](const Tile* a, const Tile* b) {
        return a->visualY() < b->visualY();
    });

    std::set<TileId> intercepted;
    for (const Tile* t : fallers) {
        intercepted.insert(t->id());
    }

    // Fallers take the rows directly above the swapped tile, lowest first.
    // Each of those rows must be free or hold one of the fallers.
    std::vector<Move> moves;
    int next = base.y + 1;
    for (Tile* tile : fallers) {
        if (next >= board.height()) {
            std::cerr << "BlockSlipResolver: interception would overflow column " << base.x
                      << ", skipped\n";
            return 0.0f;
        }
        const Occupant occ = board.cell(base.x, next);
        if (!occ.empty() && !(occ.isTile() && intercepted.count(occ.id) != 0)) {
            std::cerr << "BlockSlipResolver: column " << base.x << " blocked at row " << next
                      << ", interception skipped\n";
            return 0.0f;
        }
        moves.push_back(Move{tile, tile->pos(), GridPos{base.x, next}});
        ++next;
    }

    for (const Move& m : moves) {
        if (board.cell(m.from) == Occupant::tile(m.tile->id())) {
            board.clearCell(m.from);
        }
    }
    for (const Move& m : moves) {
        board.setCell(m.to, Occupant::tile(m.tile->id()));
    }

    float wait = grid_.config().dropDuration * 0.5f;
    for (const Move& m : moves) {
        grid_.animations().cancel(*m.tile);
        wait = std::max(wait, grid_.startNudge(*m.tile, m.to));
    }
    return wait;
}

void BlockSlipResolver::tick(float dt) {
    if (!active_) return;

    timer_ -= dt;
    if (timer_ > 0.0f) return;

    active_ = false;
    grid_.setSwapping(false);
    grid_.dropResolver().resolve();
    grid_.matchResolver().checkForMatches();
}

} // namespace panelrise::core
