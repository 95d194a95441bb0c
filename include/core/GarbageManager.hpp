#pragma once

#include "Types.hpp"
#include "GarbageBlock.hpp"
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace panelrise::core {

class Grid;

struct GarbageRequest {
    int width{1};
    int height{1};
};

struct GarbageFall {
    int blocksMoved{0};
    int maxDistance{0};
};

// Incoming garbage of one grid: the pending queue, spawned blocks, their
// falls and their conversion back into tiles.
class GarbageManager {
public:
    explicit GarbageManager(Grid& grid);

    /// Queue a block. Width is clamped to [1, grid width], height to
    /// [1, grid height]. Returns false (and warns) if the queue is full.
    bool queueGarbage(int width, int height);

    /// Remove up to `amount` pending requests, oldest first.
    int cancelGarbage(int amount);

    int pendingGarbageCount() const noexcept { return static_cast<int>(queue_.size()); }
    const std::deque<GarbageRequest>& pending() const noexcept { return queue_; }

    /// Start releasing the queue: one block now, the rest one per drop delay.
    void dropPendingGarbage();

    /// Place a block at the top of the grid right away.
    std::optional<GarbageId> spawnGarbage(int width, int height);

    /// Centered column first, then the first window from the left whose top
    /// row is empty.
    std::optional<int> findSpawnColumn(int width) const;

    /// Moves every unsupported block down as a whole, until stable.
    GarbageFall applyGravity();

    /// Starts converting settled blocks next to the matched cells (and their
    /// cluster when propagation is on). Ignored while a conversion runs.
    bool triggerConversion(const std::vector<GridPos>& matchedCells);

    bool isConverting() const noexcept { return !converting_.empty(); }

    void tick(float dt);
    void shiftUp() noexcept;

    const GarbageBlock* block(GarbageId id) const;
    const std::map<GarbageId, GarbageBlock>& blocks() const noexcept { return blocks_; }

private:
    Grid& grid_;
    std::map<GarbageId, GarbageBlock> blocks_;
    std::deque<GarbageRequest> queue_;
    GarbageId nextId_{1};

    bool releasing_{false};
    float releaseTimer_{0.0f};

    std::vector<GarbageId> converting_;
    float conversionTimer_{0.0f};

    void releaseNext();
    bool hasBottomSupport(const GarbageBlock& block) const;
    int fallTarget(const GarbageBlock& block) const;
    void writeCells(const GarbageBlock& block, Occupant occupant);
    std::vector<GarbageId> clusterOf(GarbageId start) const;
    void completeConversion();
};

} // namespace panelrise::core
