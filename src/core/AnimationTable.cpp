#include "core/AnimationTable.hpp"

namespace panelrise::core {

Animation& AnimationTable::start(Tile& tile, AnimationKind kind, GridPos target, float duration,
                                 bool checkObstructions) {
    Animation anim;
    anim.tile = tile.id();
    anim.kind = kind;
    anim.version = tile.bumpVersion();
    anim.startX = tile.visualX();
    anim.startY = tile.visualY();
    anim.target = target;
    anim.elapsed = 0.0f;
    anim.duration = duration;
    anim.checkObstructions = checkObstructions;

    if (kind == AnimationKind::Fall) {
        tile.beginFall(target);
    } else {
        tile.beginSwap(target);
    }

    Animation& slot = records_[tile.id()];
    slot = anim;
    return slot;
}

bool AnimationTable::cancel(Tile& tile) {
    tile.bumpVersion();
    return records_.erase(tile.id()) != 0;
}

Animation* AnimationTable::find(TileId id) {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

const Animation* AnimationTable::find(TileId id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

bool AnimationTable::isFalling(TileId id) const {
    const Animation* anim = find(id);
    return anim != nullptr && anim->kind == AnimationKind::Fall;
}

std::vector<TileId> AnimationTable::ids() const {
    std::vector<TileId> result;
    result.reserve(records_.size());
    for (const auto& entry : records_) {
        result.push_back(entry.first);
    }
    return result;
}

void AnimationTable::shiftUp() noexcept {
    for (auto& entry : records_) {
        entry.second.startY += 1.0f;
        entry.second.target.y += 1;
    }
}

} // namespace panelrise::core
