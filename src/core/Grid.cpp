#include "core/Grid.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace panelrise::core {

namespace {

GridConfig validated(GridConfig config) {
    if (!config.isValid()) {
        throw std::invalid_argument("Grid: invalid configuration");
    }
    return config;
}

} // namespace

Grid::Grid(GridConfig config)
    : config_{validated(config)}
    , board_{config_.width, config_.height, config_.preloadRows}
    , factory_{config_.tileTypes, config_.seed}
    , cursor_{config_.width, config_.height}
    , dropResolver_{*this}
    , matchResolver_{*this}
    , slipResolver_{*this}
    , rise_{*this}
    , garbage_{*this}
{
    fillInitialRows();
    for (int depth = 0; depth < config_.preloadRows; ++depth) {
        spawnPreloadRow(depth);
    }
}

// ---------------------------------------------------------------------------
// Tiles

const Tile* Grid::tile(TileId id) const {
    auto it = tiles_.find(id);
    return it == tiles_.end() ? nullptr : &it->second;
}

Tile* Grid::tile(TileId id) {
    auto it = tiles_.find(id);
    return it == tiles_.end() ? nullptr : &it->second;
}

const Tile* Grid::tileAt(GridPos pos) const {
    Occupant occ;
    if (board_.isInside(pos)) {
        occ = board_.cell(pos);
    } else if (pos.y < 0 && -pos.y <= board_.preloadRows() && pos.x >= 0 && pos.x < board_.width()) {
        occ = board_.preloadCell(pos.x, -pos.y - 1);
    }
    return occ.isTile() ? tile(occ.id) : nullptr;
}

Tile* Grid::tileAt(GridPos pos) {
    return const_cast<Tile*>(static_cast<const Grid&>(*this).tileAt(pos));
}

TileId Grid::createTile(GridPos pos, TileType type) {
    const TileId id = nextTileId_++;
    tiles_.emplace(id, Tile{id, type, pos});
    return id;
}

TileId Grid::placeTile(GridPos pos, TileType type) {
    if (!board_.isInside(pos)) {
        throw std::out_of_range("Grid::placeTile out of range");
    }
    if (type < 0 || type >= config_.tileTypes) {
        throw std::invalid_argument("Grid::placeTile unknown tile type");
    }
    if (!board_.isEmpty(pos)) {
        throw std::invalid_argument("Grid::placeTile cell is occupied");
    }

    const TileId id = createTile(pos, type);
    board_.setCell(pos, Occupant::tile(id));
    return id;
}

void Grid::popTile(TileId id) {
    auto it = tiles_.find(id);
    if (it == tiles_.end()) return;

    const GridPos pos = it->second.pos();
    const TileType type = it->second.type();
    if (board_.isInside(pos) && board_.cell(pos) == Occupant::tile(id)) {
        board_.clearCell(pos);
    }
    animations_.cancel(it->second);
    tiles_.erase(it);

    notify([id, pos, type](GridListener& l) { l.onTilePopped(id, pos, type); });
}

void Grid::fillInitialRows() {
    for (int y = 0; y < config_.initialFillRows; ++y) {
        for (int x = 0; x < config_.width; ++x) {
            // Never start with a ready-made match.
            TileType left = -1;
            TileType below = -1;
            const Tile* l1 = tileAt(GridPos{x - 1, y});
            const Tile* l2 = tileAt(GridPos{x - 2, y});
            if (x >= 2 && l1 != nullptr && l2 != nullptr && l1->type() == l2->type()) {
                left = l1->type();
            }
            const Tile* b1 = tileAt(GridPos{x, y - 1});
            const Tile* b2 = tileAt(GridPos{x, y - 2});
            if (y >= 2 && b1 != nullptr && b2 != nullptr && b1->type() == b2->type()) {
                below = b1->type();
            }
            placeTile(GridPos{x, y}, factory_.nextExcluding({left, below}));
        }
    }
}

void Grid::spawnPreloadRow(int depth) {
    for (int x = 0; x < config_.width; ++x) {
        const TileId id = createTile(GridPos{x, -depth - 1}, factory_.next());
        board_.setPreloadCell(x, depth, Occupant::tile(id));
    }
}

// ---------------------------------------------------------------------------
// Queries

bool Grid::isRowActive(int y) const noexcept {
    if (y < 0 || y >= config_.height) return false;
    return static_cast<float>(y) + rise_.offset() >= 0.0f;
}

bool Grid::checkInvariants() const {
    std::map<TileId, int> seen;
    for (int y = 0; y < board_.height(); ++y) {
        for (int x = 0; x < board_.width(); ++x) {
            const Occupant occ = board_.cell(x, y);
            if (occ.isTile()) {
                const Tile* t = tile(occ.id);
                if (t == nullptr || t->pos() != GridPos{x, y}) return false;
                if (++seen[occ.id] > 1) return false;
            } else if (occ.isGarbage()) {
                const GarbageBlock* block = garbage_.block(occ.id);
                if (block == nullptr || !block->covers(GridPos{x, y})) return false;
            }
        }
    }

    for (const auto& entry : tiles_) {
        const GridPos pos = entry.second.pos();
        if (pos.y >= 0) {
            if (!board_.isInside(pos) || board_.cell(pos) != Occupant::tile(entry.first)) return false;
        } else if (tileAt(pos) != &entry.second) {
            return false;
        }
    }

    for (const auto& entry : garbage_.blocks()) {
        for (const GridPos& cell : entry.second.cells()) {
            if (!board_.isInside(cell) || board_.cell(cell) != Occupant::garbage(entry.first)) return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Input

bool Grid::moveCursor(int dx, int dy) {
    const GridPos next = cursor_.clampedMove(dx, dy);
    if (!isRowActive(next.y)) return false;
    if (next == cursor_.position()) return false;
    cursor_.setPosition(next);
    return true;
}

bool Grid::canTakePart(const Tile& tile) const {
    if (!tile.canSwap()) return false;
    if (tile.isSwapping()) return false;
    return !isTileProcessing(tile.id());
}

bool Grid::requestSwap() {
    if (isGameOver()) return false;
    if (swapRoutine_.phase != SwapRoutine::Phase::Idle || slipResolver_.isActive()) return false;

    const GridPos left = cursor_.left();
    const GridPos right = cursor_.right();
    if (!isRowActive(left.y)) return false;
    if (board_.cell(left).isGarbage() || board_.cell(right).isGarbage()) return false;

    Tile* lt = tileAt(left);
    Tile* rt = tileAt(right);
    if (lt == nullptr && rt == nullptr) return false;
    if (lt != nullptr && !canTakePart(*lt)) return false;
    if (rt != nullptr && !canTakePart(*rt)) return false;

    // Too late once a falling participant is halfway into its cell.
    if (lt != nullptr && BlockSlipResolver::isPastHalfway(*lt)) return false;
    if (rt != nullptr && BlockSlipResolver::isPastHalfway(*rt)) return false;

    const bool leftFalling = lt != nullptr && lt->isFalling();
    const bool rightFalling = rt != nullptr && rt->isFalling();
    if (leftFalling && rightFalling) return false;
    if (leftFalling || rightFalling) {
        return slipResolver_.tryKickUnder(left, right) == BlockSlipResolver::Outcome::Started;
    }

    switch (slipResolver_.trySlip(left, right)) {
    case BlockSlipResolver::Outcome::Started:
        return true;
    case BlockSlipResolver::Outcome::Rejected:
        return false;
    case BlockSlipResolver::Outcome::NotApplicable:
        break;
    }

    beginSwap(left, right);
    return true;
}

void Grid::beginSwap(GridPos left, GridPos right) {
    Tile* lt = tileAt(left);
    Tile* rt = tileAt(right);

    board_.setCell(left, rt != nullptr ? Occupant::tile(rt->id()) : Occupant{});
    board_.setCell(right, lt != nullptr ? Occupant::tile(lt->id()) : Occupant{});

    swapRoutine_.tiles.clear();
    if (lt != nullptr) {
        startSlide(*lt, right);
        swapRoutine_.tiles.push_back(lt->id());
    }
    if (rt != nullptr) {
        startSlide(*rt, left);
        swapRoutine_.tiles.push_back(rt->id());
    }

    swapping_ = true;
    swapRoutine_.phase = SwapRoutine::Phase::Swapping;
    swapRoutine_.timer = config_.swapDuration;
}

void Grid::updateSwapRoutine(float dt) {
    switch (swapRoutine_.phase) {
    case SwapRoutine::Phase::Idle:
        return;

    case SwapRoutine::Phase::Swapping: {
        swapRoutine_.timer -= dt;
        if (swapRoutine_.timer > 0.0f) return;

        swapping_ = false;
        float wait = 0.0f;
        for (TileId id : swapRoutine_.tiles) {
            if (const Tile* t = tile(id)) {
                wait = std::max(wait, slipResolver_.interceptFallingAbove(*t));
            }
        }
        if (wait > 0.0f) {
            swapRoutine_.phase = SwapRoutine::Phase::Intercepting;
            swapRoutine_.timer = wait;
            return;
        }
        finishSwapRoutine();
        return;
    }

    case SwapRoutine::Phase::Intercepting:
        swapRoutine_.timer -= dt;
        if (swapRoutine_.timer <= 0.0f) {
            finishSwapRoutine();
        }
        return;
    }
}

void Grid::finishSwapRoutine() {
    swapRoutine_.phase = SwapRoutine::Phase::Idle;
    swapRoutine_.tiles.clear();
    dropResolver_.resolve();
    matchResolver_.checkForMatches();
}

// ---------------------------------------------------------------------------
// Movement

float Grid::startFall(Tile& tile, GridPos target, bool checkObstructions) {
    const float distance = std::fabs(tile.visualY() - static_cast<float>(target.y));
    const float duration = config_.dropDuration * distance;
    animations_.start(tile, AnimationKind::Fall, target, duration, checkObstructions);
    return duration;
}

float Grid::startSlide(Tile& tile, GridPos target) {
    animations_.start(tile, AnimationKind::Swap, target, config_.swapDuration);
    return config_.swapDuration;
}

float Grid::startNudge(Tile& tile, GridPos target) {
    const float distance = std::fabs(tile.visualY() - static_cast<float>(target.y));
    const float duration = config_.dropDuration * distance * config_.nudgeFactor;
    animations_.start(tile, AnimationKind::Nudge, target, duration);
    return duration;
}

void Grid::advanceAnimations(float dt) {
    for (TileId id : animations_.ids()) {
        Animation* anim = animations_.find(id);
        if (anim == nullptr) continue;

        Tile* t = tile(id);
        if (t == nullptr || t->animationVersion() != anim->version) {
            animations_.erase(id);
            continue;
        }

        if (anim->kind == AnimationKind::Fall && anim->checkObstructions) {
            dropResolver_.checkObstruction(*t, *anim);
        }

        anim->elapsed += dt;
        const float p = anim->progress();
        t->setVisual(anim->startX + (static_cast<float>(anim->target.x) - anim->startX) * p,
                     anim->startY + (static_cast<float>(anim->target.y) - anim->startY) * p);

        if (anim->finished()) {
            finishAnimation(*t, *anim);
        }
    }
}

void Grid::finishAnimation(Tile& tile, Animation anim) {
    animations_.erase(tile.id());
    tile.finishMovement();

    switch (anim.kind) {
    case AnimationKind::Fall: {
        const TileId id = tile.id();
        const GridPos pos = tile.pos();
        notify([id, pos](GridListener& l) { l.onTileLanded(id, pos); });
        break;
    }
    case AnimationKind::Swap: {
        if (!tile.hasMomentum()) break;

        const float dx = static_cast<float>(anim.target.x) - anim.startX;
        const int dir = dx > 0.0f ? 1 : (dx < 0.0f ? -1 : 0);
        const GridPos next{tile.pos().x + dir, tile.pos().y};
        if (dir != 0 && board_.isInside(next) && board_.isEmpty(next)) {
            board_.clearCell(tile.pos());
            board_.setCell(next, Occupant::tile(tile.id()));
            startSlide(tile, next);
        }
        break;
    }
    case AnimationKind::Nudge:
        break;
    }
    requestGravity();
}

// ---------------------------------------------------------------------------
// Simulation

void Grid::tick(float dt) {
    if (isGameOver()) return;

    for (auto& entry : tiles_) {
        entry.second.tickStatus(dt);
    }

    advanceAnimations(dt);
    garbage_.tick(dt);
    updateSwapRoutine(dt);
    slipResolver_.tick(dt);
    matchResolver_.tick(dt);
    rise_.tick(dt);
    processPendingGravity();
    retargetLocks_.clear();

    if (rise_.isGameOver() && !gameOverReported_) {
        gameOverReported_ = true;
        notify([](GridListener& l) { l.onGameOver(); });
    }
}

void Grid::processPendingGravity() {
    if (!gravityRequested_) return;
    if (swapRoutine_.phase != SwapRoutine::Phase::Idle || slipResolver_.isActive()) return;
    if (matchResolver_.isProcessing() || garbage_.isConverting()) return;

    gravityRequested_ = false;
    dropResolver_.resolve();
    matchResolver_.checkForMatches();
}

bool Grid::injectRow() {
    if (!board_.shiftUp()) return false;

    for (auto& entry : tiles_) {
        entry.second.shiftUp();
    }
    animations_.shiftUp();
    garbage_.shiftUp();
    spawnPreloadRow(config_.preloadRows - 1);
    cursor_.shiftUp();

    notify([](GridListener& l) { l.onRowInjected(); });
    matchResolver_.checkForMatches();
    return true;
}

// ---------------------------------------------------------------------------
// Listeners

void Grid::addListener(GridListener* listener) {
    if (listener == nullptr) return;
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void Grid::removeListener(GridListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

} // namespace panelrise::core
