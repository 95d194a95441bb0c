#pragma once

#include <cstdint>

#include "core/GridConfig.hpp"
#include "core/GarbageEconomy.hpp"

namespace panelrise::session {

// How an attack picks its receivers among the other grids.
enum class TargetingMode {
    Sequential,   // round robin, skipping the sender
    SplitEvenly,  // score divided, remainder to the first targets
    AllOpponents, // full score to everyone else
    Random,
    LowestStack,
    HighestStack
};

enum class MatchOutcome {
    Win,
    Lose,
    Draw
};

struct MatchResult {
    int player{};
    MatchOutcome outcome{};
    std::uint64_t finalScore{};
};

struct SessionConfig {
    int playerCount{2};
    core::GridConfig grid;          // copied per player, seed offset by the player index
    core::GarbageTables garbage;
    TargetingMode targeting{TargetingMode::Sequential};
    float garbageSendDelay{0.5f};   // 0 sends as soon as the combo ends
    std::uint32_t seed{0};

    bool isValid() const noexcept {
        return playerCount >= 1 && garbageSendDelay >= 0.0f && grid.isValid();
    }
};

} // namespace panelrise::session
