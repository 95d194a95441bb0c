#pragma once

#include "Types.hpp"
#include "MatchDetector.hpp"
#include <cstdint>
#include <unordered_set>
#include <vector>

namespace panelrise::core {

class Grid;

// The cascade loop of one grid:
// Scanning -> Highlighting -> Scoring -> Popping -> Settling -> Scanning ...
// It ends (and the combo resets) on the first scan that finds nothing.
class MatchResolver {
public:
    enum class Phase : std::uint8_t {
        Idle,
        Highlighting,
        Popping,
        PostPop,
        WaitingConversion,
        Settling
    };

    explicit MatchResolver(Grid& grid);

    /// Starts a new loop if the grid holds matches and no loop is running.
    bool checkForMatches();

    void tick(float dt);

    bool isProcessing() const noexcept { return phase_ != Phase::Idle; }
    bool isTileProcessing(TileId id) const { return processing_.count(id) != 0; }
    Phase phase() const noexcept { return phase_; }

    /// Cascade steps run by the current loop so far.
    int steps() const noexcept { return steps_; }

private:
    struct PopCursor {
        std::size_t next{0};
        float timer{0.0f};
    };

    Grid& grid_;
    Phase phase_{Phase::Idle};
    float timer_{0.0f};
    int steps_{0};
    std::vector<MatchGroup> groups_;
    std::vector<PopCursor> pops_;
    std::unordered_set<TileId> processing_;

    void beginStep(std::vector<MatchGroup> groups);
    void scoreStep();
    void advancePops(float dt);
    void settle();
    void scan();
    void endLoop();
};

} // namespace panelrise::core
