#include "core/DropResolver.hpp"
#include "core/Grid.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace panelrise::core {

DropResolver::DropResolver(Grid& grid)
    : grid_{grid}
{
}

bool DropResolver::canFall(const Tile& tile) const {
    return tile.isIdle() && !grid_.isTileProcessing(tile.id());
}

std::vector<DropRecord> DropResolver::collectDrops() {
    std::vector<DropRecord> records;
    Board& board = grid_.board();

    for (int x = 0; x < board.width(); ++x) {
        for (int y = 0; y < board.height(); ++y) {
            if (!board.isEmpty(x, y)) continue;

            for (int above = y + 1; above < board.height(); ++above) {
                const Occupant occ = board.cell(x, above);
                if (occ.empty()) continue;
                if (occ.isGarbage()) break; // nothing falls through garbage

                Tile* tile = grid_.tile(occ.id);
                if (tile == nullptr || !canFall(*tile)) break;

                board.clearCell(GridPos{x, above});
                board.setCell(x, y, occ);
                records.push_back(DropRecord{occ.id, GridPos{x, above}, GridPos{x, y}});
                break;
            }
        }
    }

    return records;
}

bool DropResolver::validate(const std::vector<DropRecord>& records) {
    std::set<GridPos> targets;
    for (const auto& r : records) {
        if (!targets.insert(r.to).second) {
            return false;
        }
    }
    return true;
}

void DropResolver::rollback(const std::vector<DropRecord>& records) {
    Board& board = grid_.board();
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        if (board.cell(it->to) == Occupant::tile(it->tile)) {
            board.clearCell(it->to);
        }
        board.setCell(it->from, Occupant::tile(it->tile));
    }
}

DropResult DropResolver::resolve() {
    DropResult result;
    const GridConfig& cfg = grid_.config();
    const int ceiling = cfg.iterationLimit();

    while (true) {
        if (result.passes >= ceiling) {
            std::cerr << "DropResolver: pass ceiling of " << ceiling << " reached, stopping\n";
            result.aborted = true;
            break;
        }

        auto records = collectDrops();
        if (!validate(records)) {
            std::cerr << "DropResolver: conflicting drop targets, pass aborted\n";
            rollback(records);
            result.aborted = true;
            break;
        }

        for (const auto& r : records) {
            Tile* tile = grid_.tile(r.tile);
            if (tile == nullptr) continue;
            grid_.startFall(*tile, r.to, false);
            result.maxDistance = std::max(result.maxDistance, r.from.y - r.to.y);
        }
        result.tilesMoved += static_cast<int>(records.size());

        const auto garbageFall = grid_.garbage().applyGravity();
        result.garbageMoved += garbageFall.blocksMoved;
        result.maxDistance = std::max(result.maxDistance, garbageFall.maxDistance);

        if (records.empty() && garbageFall.blocksMoved == 0) {
            break;
        }
        ++result.passes;
    }

    if (result.maxDistance > 0) {
        result.settleTime = cfg.dropDuration * static_cast<float>(result.maxDistance) + cfg.settleMargin;
    }
    return result;
}

bool DropResolver::isSolidObstruction(Occupant occupant) const {
    if (occupant.empty()) return false;
    if (occupant.isGarbage()) return true;

    const Tile* other = grid_.tile(occupant.id);
    if (other == nullptr) return false;
    if (!other->isFalling()) return true;

    // A faller only blocks once it has been redirected to land where it is stored.
    const Animation* anim = grid_.animations().find(other->id());
    return anim != nullptr && anim->retargeted;
}

bool DropResolver::checkObstruction(Tile& tile, Animation& anim) {
    const float remaining = tile.visualY() - static_cast<float>(anim.target.y);
    if (remaining <= 0.5f) return false;
    if (grid_.isRetargetClaimed(tile.id())) return false;

    Board& board = grid_.board();
    const int x = anim.target.x;
    const int currentY = std::min(static_cast<int>(std::lround(tile.visualY())), board.height());

    for (int y = currentY - 1; y > anim.target.y; --y) {
        const Occupant occ = board.cell(x, y);
        if (occ.empty() || occ == Occupant::tile(tile.id())) continue;
        if (!isSolidObstruction(occ)) continue;

        const GridPos newTarget{x, y + 1};
        if (newTarget.y >= board.height() || newTarget == anim.target) return false;
        const Occupant landing = board.cell(newTarget);
        if (!landing.empty() && landing != Occupant::tile(tile.id())) return false;

        if (!grid_.claimRetarget(tile.id())) return false;

        if (board.cell(anim.target) == Occupant::tile(tile.id())) {
            board.clearCell(anim.target);
        }
        board.setCell(newTarget, Occupant::tile(tile.id()));

        grid_.startFall(tile, newTarget, true);
        Animation* restarted = grid_.animations().find(tile.id());
        if (restarted != nullptr) {
            restarted->retargeted = true;
        }
        return true;
    }
    return false;
}

} // namespace panelrise::core
