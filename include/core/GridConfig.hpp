#pragma once

#include <cstdint>

namespace panelrise::core {

// Everything a grid needs to know about its session. Passed by value at
// construction; there is no global state.
struct GridConfig {
    // Dimensions
    int width{6};
    int height{14};
    int preloadRows{2};
    int initialFillRows{4};
    int tileTypes{6};

    std::uint32_t seed{0};

    // Timings (seconds). Fall and nudge durations are per row of distance.
    float swapDuration{0.15f};
    float dropDuration{0.15f};
    float nudgeFactor{0.5f};
    float settleMargin{0.05f};
    float highlightDuration{0.5f};
    float popStagger{0.1f};
    float postPopDelay{0.1f};

    // Rise (grid rows per second)
    float baseRiseSpeed{0.1f};
    float fastRiseMultiplier{4.0f};
    float speedLevelInterval{60.0f};
    int startingSpeedLevel{1};
    int maxSpeedLevel{99};
    float catchUpMultiplier{1.5f};
    float gracePeriod{2.0f};

    // Breathing room
    bool breathingRoomEnabled{true};
    float breathingRoomPerTile{0.2f};
    float maxBreathingRoom{5.0f};

    // Garbage
    int maxPendingGarbage{12};
    float garbageDropDelay{0.3f};
    float conversionDelay{0.5f};
    bool propagateToCluster{true};

    // Gravity passes per resolve and cascade steps per loop; 0 means width * height.
    int iterationCeiling{0};

    int iterationLimit() const noexcept {
        return iterationCeiling > 0 ? iterationCeiling : width * height;
    }

    bool isValid() const noexcept {
        return width >= 2 && height >= 3 && preloadRows >= 1
            && initialFillRows >= 0 && initialFillRows <= height
            && tileTypes >= 3
            && swapDuration > 0.0f && dropDuration > 0.0f
            && nudgeFactor > 0.0f && settleMargin >= 0.0f
            && highlightDuration >= 0.0f && popStagger >= 0.0f && postPopDelay >= 0.0f
            && baseRiseSpeed >= 0.0f && fastRiseMultiplier >= 1.0f
            && speedLevelInterval > 0.0f
            && maxSpeedLevel >= 1
            && startingSpeedLevel >= 1 && startingSpeedLevel <= maxSpeedLevel
            && catchUpMultiplier >= 1.0f && gracePeriod >= 0.0f
            && breathingRoomPerTile >= 0.0f && maxBreathingRoom >= 0.0f
            && maxPendingGarbage >= 1 && garbageDropDelay >= 0.0f
            && conversionDelay >= 0.0f
            && iterationCeiling >= 0;
    }
};

} // namespace panelrise::core
