#pragma once

#include "Types.hpp"

namespace panelrise::core {

/// Discrete events a grid reports to presentation and session code.
/// All callbacks run synchronously inside Grid::tick() or an input call.
class GridListener {
public:
    virtual ~GridListener() = default;

    virtual void onTilePopped(TileId /*tile*/, GridPos /*pos*/, TileType /*type*/) {}
    virtual void onTileLanded(TileId /*tile*/, GridPos /*pos*/) {}
    virtual void onComboStarted() {}
    virtual void onComboEnded(int /*combo*/, int /*maxChain*/) {}
    virtual void onMatchScored(int /*tiles*/, int /*combo*/, int /*chain*/) {}
    virtual void onRowInjected() {}
    virtual void onGameOver() {}
};

} // namespace panelrise::core
