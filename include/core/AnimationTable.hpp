#pragma once

#include "Types.hpp"
#include "Tile.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace panelrise::core {

enum class AnimationKind : std::uint8_t {
    Swap,  // horizontal exchange, fixed duration
    Fall,  // vertical drop, duration proportional to distance
    Nudge  // short vertical push after a slip or interception
};

// One in-flight movement. The record is only valid while its version equals
// the tile's animation version; anything else is a stale leftover.
struct Animation {
    TileId tile{};
    AnimationKind kind{AnimationKind::Fall};
    std::uint32_t version{};
    float startX{};
    float startY{};
    GridPos target{};
    float elapsed{};
    float duration{};
    bool checkObstructions{false};
    bool retargeted{false};

    float progress() const noexcept {
        if (duration <= 0.0f) return 1.0f;
        const float t = elapsed / duration;
        return t > 1.0f ? 1.0f : t;
    }

    bool finished() const noexcept { return elapsed >= duration; }
};

class AnimationTable {
public:
    // Replaces any running animation of the tile: bumps the tile's version,
    // commits its movement state and starts from its current visual position.
    Animation& start(Tile& tile, AnimationKind kind, GridPos target, float duration,
                     bool checkObstructions = false);

    // Drops the record and bumps the version so late completions are no-ops.
    bool cancel(Tile& tile);

    void erase(TileId id) { records_.erase(id); }

    Animation* find(TileId id);
    const Animation* find(TileId id) const;

    bool contains(TileId id) const { return records_.count(id) != 0; }
    bool isFalling(TileId id) const;

    bool empty() const noexcept { return records_.empty(); }
    std::size_t size() const noexcept { return records_.size(); }

    // Snapshot of ids, safe to iterate while records are added or removed.
    std::vector<TileId> ids() const;

    // Keeps start and target rows in step with a row injection.
    void shiftUp() noexcept;

    void clear() noexcept { records_.clear(); }

private:
    std::map<TileId, Animation> records_;
};

} // namespace panelrise::core
