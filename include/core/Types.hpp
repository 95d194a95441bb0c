#pragma once // Include guard

#include <cstdint>

// Namespace for the grid simulation core
namespace panelrise::core {

using TileId = std::uint32_t;
using GarbageId = std::uint32_t;
using TileType = int;

// Cell coordinate in the grid: x = column (0 = left), y = row (0 = bottom).
// Rows below 0 belong to the hidden preload area.
struct GridPos {
    int x{};
    int y{};
};

inline bool operator==(GridPos a, GridPos b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(GridPos a, GridPos b) noexcept {
    return !(a == b);
}

// Strict ordering so positions can be kept in ordered containers
inline bool operator<(GridPos a, GridPos b) noexcept {
    return a.y != b.y ? a.y < b.y : a.x < b.x;
}

// Movement state of a tile
enum class MovementState : std::uint8_t {
    Idle,
    Swapping,
    Falling
};

// What a grid cell currently holds
enum class OccupantKind : std::uint8_t {
    Empty,
    Tile,
    Garbage
};

// A single cell value. Garbage cells store the id of the block they belong to,
// so every covered cell refers back to the same anchor.
struct Occupant {
    OccupantKind kind{OccupantKind::Empty};
    std::uint32_t id{0};

    bool empty() const noexcept { return kind == OccupantKind::Empty; }
    bool isTile() const noexcept { return kind == OccupantKind::Tile; }
    bool isGarbage() const noexcept { return kind == OccupantKind::Garbage; }

    static Occupant tile(TileId tileId) noexcept { return {OccupantKind::Tile, tileId}; }
    static Occupant garbage(GarbageId blockId) noexcept { return {OccupantKind::Garbage, blockId}; }
};

inline bool operator==(Occupant a, Occupant b) noexcept {
    return a.kind == b.kind && (a.kind == OccupantKind::Empty || a.id == b.id);
}

inline bool operator!=(Occupant a, Occupant b) noexcept {
    return !(a == b);
}

} // namespace panelrise::core
