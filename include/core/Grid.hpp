#pragma once

#include "Types.hpp"
#include "GridConfig.hpp"
#include "Board.hpp"
#include "Tile.hpp"
#include "TileFactory.hpp"
#include "AnimationTable.hpp"
#include "Cursor.hpp"
#include "ScoreManager.hpp"
#include "GridListener.hpp"
#include "MatchDetector.hpp"
#include "DropResolver.hpp"
#include "MatchResolver.hpp"
#include "BlockSlipResolver.hpp"
#include "RiseController.hpp"
#include "GarbageManager.hpp"

#include <cstdint>
#include <map>
#include <unordered_set>
#include <vector>

namespace panelrise::core {

// One player's grid. Owns the board, every tile, the in-flight animations
// and the garbage on it; the resolvers only hold a reference back here.
class Grid {
public:
    explicit Grid(GridConfig config);

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    const GridConfig& config() const noexcept { return config_; }
    int width() const noexcept { return config_.width; }
    int height() const noexcept { return config_.height; }

    const Board& board() const noexcept { return board_; }
    Board& board() noexcept { return board_; }

    // Tiles (visible rows and preload rows)
    const Tile* tile(TileId id) const;
    Tile* tile(TileId id);
    const Tile* tileAt(GridPos pos) const;
    Tile* tileAt(GridPos pos);
    const std::map<TileId, Tile>& tiles() const noexcept { return tiles_; }

    /// Creates an idle tile in an empty visible cell.
    /// Throws std::out_of_range / std::invalid_argument on bad input.
    TileId placeTile(GridPos pos, TileType type);

    /// Removes a tile from the board and reports it as popped.
    void popTile(TileId id);

    // State queries
    bool isTileProcessing(TileId id) const { return matchResolver_.isTileProcessing(id); }
    bool isSwapping() const noexcept { return swapping_; }
    void setSwapping(bool swapping) noexcept { swapping_ = swapping; }
    bool isRowActive(int y) const noexcept;
    float riseOffset() const noexcept { return rise_.offset(); }
    bool isGameOver() const noexcept { return rise_.isGameOver(); }
    std::uint64_t score() const noexcept { return score_.score(); }
    int stackHeight() const noexcept { return board_.stackHeight(); }

    /// True when every occupant is stored exactly once, under its own coordinate.
    bool checkInvariants() const;

    // Input
    const Cursor& cursor() const noexcept { return cursor_; }
    bool moveCursor(int dx, int dy);
    void setCursor(GridPos pos) noexcept { cursor_.setPosition(pos); }
    bool requestSwap();
    void requestFastRise() noexcept { rise_.requestFastRise(); }
    void stopFastRise() noexcept { rise_.stopFastRise(); }

    // Simulation
    void tick(float dt);
    bool injectRow();
    void requestGravity() noexcept { gravityRequested_ = true; }
    bool checkForMatches() { return matchResolver_.checkForMatches(); }

    // Movement primitives; each commits the movement and returns its duration.
    float startFall(Tile& tile, GridPos target, bool checkObstructions);
    float startSlide(Tile& tile, GridPos target);
    float startNudge(Tile& tile, GridPos target);

    // Per-tick retarget ownership, shared by slips and obstruction checks.
    bool claimRetarget(TileId id) { return retargetLocks_.insert(id).second; }
    bool isRetargetClaimed(TileId id) const { return retargetLocks_.count(id) != 0; }

    // Components
    TileFactory& tileFactory() noexcept { return factory_; }
    AnimationTable& animations() noexcept { return animations_; }
    const AnimationTable& animations() const noexcept { return animations_; }
    ScoreManager& scoreManager() noexcept { return score_; }
    const ScoreManager& scoreManager() const noexcept { return score_; }
    MatchDetector detector() const { return MatchDetector{*this}; }
    DropResolver& dropResolver() noexcept { return dropResolver_; }
    MatchResolver& matchResolver() noexcept { return matchResolver_; }
    const MatchResolver& matchResolver() const noexcept { return matchResolver_; }
    BlockSlipResolver& blockSlip() noexcept { return slipResolver_; }
    RiseController& rise() noexcept { return rise_; }
    const RiseController& rise() const noexcept { return rise_; }
    GarbageManager& garbage() noexcept { return garbage_; }
    const GarbageManager& garbage() const noexcept { return garbage_; }

    // Listeners are not owned.
    void addListener(GridListener* listener);
    void removeListener(GridListener* listener);

    template <typename Fn>
    void notify(Fn&& fn) {
        for (GridListener* listener : listeners_) {
            fn(*listener);
        }
    }

private:
    struct SwapRoutine {
        enum class Phase { Idle, Swapping, Intercepting };
        Phase phase{Phase::Idle};
        float timer{0.0f};
        std::vector<TileId> tiles;
    };

    GridConfig config_;
    Board board_;
    TileFactory factory_;
    std::map<TileId, Tile> tiles_;
    TileId nextTileId_{1};
    AnimationTable animations_;
    Cursor cursor_;
    ScoreManager score_;
    std::vector<GridListener*> listeners_;
    std::unordered_set<TileId> retargetLocks_;
    SwapRoutine swapRoutine_;
    bool swapping_{false};
    bool gravityRequested_{false};
    bool gameOverReported_{false};

    DropResolver dropResolver_;
    MatchResolver matchResolver_;
    BlockSlipResolver slipResolver_;
    RiseController rise_;
    GarbageManager garbage_;

    TileId createTile(GridPos pos, TileType type);
    void fillInitialRows();
    void spawnPreloadRow(int depth);
    bool canTakePart(const Tile& tile) const;
    void beginSwap(GridPos left, GridPos right);
    void updateSwapRoutine(float dt);
    void finishSwapRoutine();
    void advanceAnimations(float dt);
    void finishAnimation(Tile& tile, Animation anim);
    void processPendingGravity();
};

} // namespace panelrise::core
