#pragma once

#include "Types.hpp"
#include <cstdint>
#include <initializer_list>
#include <random>

namespace panelrise::core {

class TileFactory {
public:
    // Deterministic for a given seed.
    TileFactory(int tileTypes, std::uint32_t seed);

    int tileTypes() const noexcept { return tileTypes_; }

    // Uniformly random tile type
    TileType next();

    // Random type different from every entry in `excluded` (negative
    // entries are ignored). Falls back to next() if nothing is left.
    TileType nextExcluding(std::initializer_list<TileType> excluded);

private:
    int tileTypes_;
    std::mt19937 rng_;
};

} // namespace panelrise::core
