#pragma once

#include <cstdint>
#include <vector>

namespace panelrise::core {

// Per-grid score plus the combo state of the running cascade loop.
class ScoreManager {
public:
    // Starts the next cascade step and returns its combo number.
    int beginStep();

    // Scores one match group of the current step, returns the points added.
    std::uint64_t addMatch(int tiles);

    // Ends the loop: combo, chain and match sizes go back to zero.
    void endCombo() noexcept;

    static std::uint64_t pointsFor(int tiles, int combo, int chain) noexcept;

    std::uint64_t score() const noexcept { return score_; }
    int combo() const noexcept { return combo_; }
    int chain() const noexcept { return chain_; }
    int maxChain() const noexcept { return maxChain_; }
    bool inCombo() const noexcept { return combo_ > 0; }
    const std::vector<int>& matchSizes() const noexcept { return matchSizes_; }

    void reset() noexcept;

private:
    std::uint64_t score_{0};
    int combo_{0};
    int chain_{0};
    int maxChain_{0};
    std::vector<int> matchSizes_;
};

} // namespace panelrise::core
