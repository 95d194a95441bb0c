#include "core/MatchDetector.hpp"
#include "core/Grid.hpp"
#include <deque>
#include <utility>

namespace panelrise::core {

MatchDetector::MatchDetector(const Grid& grid)
    : grid_{grid}
{
}

TileType MatchDetector::matchableType(int x, int y) const {
    const Tile* tile = grid_.tileAt(GridPos{x, y});
    if (tile == nullptr) return -1;
    if (!tile->isIdle() || !tile->canMatch()) return -1;
    if (grid_.isTileProcessing(tile->id())) return -1;
    return tile->type();
}

std::set<GridPos> MatchDetector::findMatchedCells() const {
    std::set<GridPos> matched;
    const int width = grid_.width();
    const int height = grid_.height();

    // Horizontal triples
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x + 2 < width; ++x) {
            const TileType t = matchableType(x, y);
            if (t < 0) continue;
            if (matchableType(x + 1, y) == t && matchableType(x + 2, y) == t) {
                matched.insert(GridPos{x, y});
                matched.insert(GridPos{x + 1, y});
                matched.insert(GridPos{x + 2, y});
            }
        }
    }

    // Vertical triples
    for (int x = 0; x < width; ++x) {
        for (int y = 0; y + 2 < height; ++y) {
            const TileType t = matchableType(x, y);
            if (t < 0) continue;
            if (matchableType(x, y + 1) == t && matchableType(x, y + 2) == t) {
                matched.insert(GridPos{x, y});
                matched.insert(GridPos{x, y + 1});
                matched.insert(GridPos{x, y + 2});
            }
        }
    }

    return matched;
}

std::vector<MatchGroup> MatchDetector::findMatchGroups() const {
    std::vector<MatchGroup> groups;
    std::set<GridPos> remaining = findMatchedCells();

    while (!remaining.empty()) {
        MatchGroup group;
        std::deque<GridPos> frontier;
        const GridPos seed = *remaining.begin();
        const TileType groupType = matchableType(seed.x, seed.y);
        frontier.push_back(seed);
        remaining.erase(remaining.begin());

        while (!frontier.empty()) {
            const GridPos current = frontier.front();
            frontier.pop_front();

            const Tile* tile = grid_.tileAt(current);
            if (tile != nullptr) {
                group.tiles.push_back(tile->id());
                group.cells.push_back(current);
            }

            for (const GridPos& next : adjacentCells(current)) {
                auto it = remaining.find(next);
                if (it != remaining.end() && matchableType(next.x, next.y) == groupType) {
                    frontier.push_back(next);
                    remaining.erase(it);
                }
            }
        }

        if (group.size() >= 3) {
            groups.push_back(std::move(group));
        }
    }

    return groups;
}

std::vector<GridPos> MatchDetector::adjacentCells(GridPos pos) const {
    std::vector<GridPos> result;
    const GridPos candidates[] = {
        {pos.x - 1, pos.y}, {pos.x + 1, pos.y}, {pos.x, pos.y - 1}, {pos.x, pos.y + 1}
    };
    for (const GridPos& c : candidates) {
        if (grid_.board().isInside(c)) {
            result.push_back(c);
        }
    }
    return result;
}

} // namespace panelrise::core
