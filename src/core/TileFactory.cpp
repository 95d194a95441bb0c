#include "core/TileFactory.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace panelrise::core {

TileFactory::TileFactory(int tileTypes, std::uint32_t seed)
    : tileTypes_{tileTypes}
    , rng_{seed}
{
    if (tileTypes <= 0) {
        throw std::invalid_argument("TileFactory needs at least one tile type");
    }
}

TileType TileFactory::next() {
    std::uniform_int_distribution<int> dist(0, tileTypes_ - 1);
    return dist(rng_);
}

TileType TileFactory::nextExcluding(std::initializer_list<TileType> excluded) {
    std::vector<TileType> allowed;
    allowed.reserve(static_cast<std::size_t>(tileTypes_));
    for (TileType t = 0; t < tileTypes_; ++t) {
        if (std::find(excluded.begin(), excluded.end(), t) == excluded.end()) {
            allowed.push_back(t);
        }
    }
    if (allowed.empty()) {
        return next();
    }
    std::uniform_int_distribution<std::size_t> dist(0, allowed.size() - 1);
    return allowed[dist(rng_)];
}

} // namespace panelrise::core
