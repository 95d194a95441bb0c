#include "core/GarbageManager.hpp"
#include "core/Grid.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace panelrise::core {

GarbageManager::GarbageManager(Grid& grid)
    : grid_{grid}
{
}

bool GarbageManager::queueGarbage(int width, int height) {
    const GridConfig& cfg = grid_.config();
    if (pendingGarbageCount() >= cfg.maxPendingGarbage) {
        std::cerr << "GarbageManager: queue full (" << cfg.maxPendingGarbage
                  << "), dropping " << width << "x" << height << " request\n";
        return false;
    }

    GarbageRequest request;
    request.width = std::clamp(width, 1, cfg.width);
    request.height = std::clamp(height, 1, cfg.height);
    queue_.push_back(request);
    return true;
}

int GarbageManager::cancelGarbage(int amount) {
    int removed = 0;
    while (removed < amount && !queue_.empty()) {
        queue_.pop_front();
        ++removed;
    }
    return removed;
}

void GarbageManager::dropPendingGarbage() {
    if (queue_.empty()) return;

    releasing_ = true;
    if (grid_.config().garbageDropDelay <= 0.0f) {
        while (!queue_.empty()) {
            releaseNext();
        }
        releasing_ = false;
        return;
    }
    releaseNext();
}

void GarbageManager::releaseNext() {
    if (queue_.empty()) return;

    const GarbageRequest request = queue_.front();
    queue_.pop_front();
    spawnGarbage(request.width, request.height);
    releaseTimer_ = grid_.config().garbageDropDelay;
}

std::optional<int> GarbageManager::findSpawnColumn(int width) const {
    const Board& board = grid_.board();
    if (width <= 0 || width > board.width()) return std::nullopt;

    const int top = board.height() - 1;
    auto topRowClear = [&](int startX) {
        for (int x = startX; x < startX + width; ++x) {
            if (!board.isEmpty(x, top)) return false;
        }
        return true;
    };

    const int centerX = (board.width() - width) / 2;
    if (topRowClear(centerX)) return centerX;

    for (int x = 0; x + width <= board.width(); ++x) {
        if (topRowClear(x)) return x;
    }
    return std::nullopt;
}

std::optional<GarbageId> GarbageManager::spawnGarbage(int width, int height) {
    const Board& board = grid_.board();
    width = std::clamp(width, 1, board.width());
    height = std::clamp(height, 1, board.height());

    const auto column = findSpawnColumn(width);
    if (!column) {
        std::cerr << "GarbageManager: no spawn column for " << width << "x" << height
                  << " block, dropping it\n";
        return std::nullopt;
    }

    const GridPos anchor{*column, board.height() - height};
    for (int dy = 0; dy < height; ++dy) {
        for (int dx = 0; dx < width; ++dx) {
            if (!board.isEmpty(anchor.x + dx, anchor.y + dy)) {
                std::cerr << "GarbageManager: spawn area at (" << anchor.x << "," << anchor.y
                          << ") blocked, dropping block\n";
                return std::nullopt;
            }
        }
    }

    const GarbageId id = nextId_++;
    auto inserted = blocks_.emplace(id, GarbageBlock{id, anchor, width, height});
    writeCells(inserted.first->second, Occupant::garbage(id));

    applyGravity();
    grid_.requestGravity();
    return id;
}

bool GarbageManager::hasBottomSupport(const GarbageBlock& block) const {
    const GridPos anchor = block.anchor();
    if (anchor.y <= 0) return true;

    const Board& board = grid_.board();
    for (int x = anchor.x; x < anchor.x + block.width(); ++x) {
        if (!board.isEmpty(x, anchor.y - 1)) return true;
    }
    return false;
}

int GarbageManager::fallTarget(const GarbageBlock& block) const {
    const Board& board = grid_.board();
    const GridPos anchor = block.anchor();
    int targetY = anchor.y;

    while (targetY > 0) {
        bool clear = true;
        for (int x = anchor.x; x < anchor.x + block.width(); ++x) {
            if (!board.isEmpty(x, targetY - 1)) {
                clear = false;
                break;
            }
        }
        if (!clear) break;
        --targetY;
    }
    return targetY;
}

void GarbageManager::writeCells(const GarbageBlock& block, Occupant occupant) {
    Board& board = grid_.board();
    for (const GridPos& cell : block.cells()) {
        if (board.isInside(cell)) {
            board.setCell(cell, occupant);
        }
    }
}

GarbageFall GarbageManager::applyGravity() {
    GarbageFall result;
    const float dropDuration = grid_.config().dropDuration;
    const std::size_t limit = blocks_.size() * static_cast<std::size_t>(grid_.height()) + 1;

    bool moved = true;
    std::size_t rounds = 0;
    while (moved && rounds < limit) {
        moved = false;
        ++rounds;

        std::vector<GarbageBlock*> order;
        for (auto& entry : blocks_) {
            order.push_back(&entry.second);
        }
        std::sort(order.begin(), order.end(), [](const GarbageBlock* a, const GarbageBlock* b) {
            return a->anchor().y < b->anchor().y;
        });

        for (GarbageBlock* block : order) {
            if (block->isConverting() || hasBottomSupport(*block)) continue;

            const int targetY = fallTarget(*block);
            const int distance = block->anchor().y - targetY;
            if (distance <= 0) continue;

            writeCells(*block, Occupant{});
            const float visualDistance = block->visualY() - static_cast<float>(targetY);
            block->beginFall(targetY, dropDuration * visualDistance);
            writeCells(*block, Occupant::garbage(block->id()));

            ++result.blocksMoved;
            result.maxDistance = std::max(result.maxDistance, distance);
            moved = true;
        }
    }
    return result;
}

std::vector<GarbageId> GarbageManager::clusterOf(GarbageId start) const {
    std::vector<GarbageId> cluster;
    std::set<GarbageId> seen{start};
    std::vector<GarbageId> frontier{start};
    const Board& board = grid_.board();

    while (!frontier.empty()) {
        const GarbageId id = frontier.back();
        frontier.pop_back();
        cluster.push_back(id);

        const GarbageBlock* current = block(id);
        if (current == nullptr) continue;

        for (const GridPos& cell : current->cells()) {
            const GridPos around[] = {
                {cell.x - 1, cell.y}, {cell.x + 1, cell.y}, {cell.x, cell.y - 1}, {cell.x, cell.y + 1}
            };
            for (const GridPos& n : around) {
                if (!board.isInside(n)) continue;
                const Occupant occ = board.cell(n);
                if (!occ.isGarbage() || seen.count(occ.id) != 0) continue;

                const GarbageBlock* neighbour = block(occ.id);
                if (neighbour == nullptr || !neighbour->isSettled()) continue;
                seen.insert(occ.id);
                frontier.push_back(occ.id);
            }
        }
    }
    return cluster;
}

bool GarbageManager::triggerConversion(const std::vector<GridPos>& matchedCells) {
    if (isConverting()) return false;

    const Board& board = grid_.board();
    std::set<GarbageId> triggered;
    for (const GridPos& cell : matchedCells) {
        const GridPos around[] = {
            {cell.x - 1, cell.y}, {cell.x + 1, cell.y}, {cell.x, cell.y - 1}, {cell.x, cell.y + 1}
        };
        for (const GridPos& n : around) {
            if (!board.isInside(n)) continue;
            const Occupant occ = board.cell(n);
            if (!occ.isGarbage()) continue;
            const GarbageBlock* candidate = block(occ.id);
            if (candidate != nullptr && candidate->isSettled()) {
                triggered.insert(occ.id);
            }
        }
    }
    if (triggered.empty()) return false;

    std::set<GarbageId> all(triggered);
    if (grid_.config().propagateToCluster) {
        for (GarbageId id : triggered) {
            for (GarbageId member : clusterOf(id)) {
                all.insert(member);
            }
        }
    }

    for (GarbageId id : all) {
        auto it = blocks_.find(id);
        if (it == blocks_.end()) continue;
        it->second.markConverting();
        converting_.push_back(id);
    }
    conversionTimer_ = grid_.config().conversionDelay;
    return true;
}

void GarbageManager::completeConversion() {
    std::vector<GridPos> freed;
    for (GarbageId id : converting_) {
        auto it = blocks_.find(id);
        if (it == blocks_.end()) continue;

        writeCells(it->second, Occupant{});
        for (const GridPos& cell : it->second.cells()) {
            if (grid_.board().isInside(cell)) {
                freed.push_back(cell);
            }
        }
        blocks_.erase(it);
    }
    converting_.clear();

    for (const GridPos& cell : freed) {
        grid_.placeTile(cell, grid_.tileFactory().next());
    }
    grid_.requestGravity();
}

void GarbageManager::tick(float dt) {
    for (auto& entry : blocks_) {
        if (entry.second.advanceFall(dt)) {
            grid_.requestGravity();
        }
    }

    if (!converting_.empty()) {
        conversionTimer_ -= dt;
        if (conversionTimer_ <= 0.0f) {
            completeConversion();
        }
    }

    if (releasing_) {
        releaseTimer_ -= dt;
        if (releaseTimer_ <= 0.0f) {
            releaseNext();
        }
        if (queue_.empty()) {
            releasing_ = false;
        }
    }
}

void GarbageManager::shiftUp() noexcept {
    for (auto& entry : blocks_) {
        entry.second.shiftUp();
    }
}

const GarbageBlock* GarbageManager::block(GarbageId id) const {
    auto it = blocks_.find(id);
    return it == blocks_.end() ? nullptr : &it->second;
}

} // namespace panelrise::core
