#pragma once

/// @file world_types.hpp
/// @brief Tile coordinates, tiles and world bounds.

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_set>

namespace tsim::sim {

/// Stable integer id of a content definition (need, buff, terrain,
/// building). Ids start at 1; 0 means "none".
using ContentId = int32_t;

inline constexpr ContentId kNoContent = 0;

/// Simulation tick counter.
using Tick = int64_t;

/// Integer tile coordinate.
struct TileCoord {
    int32_t x = 0;
    int32_t y = 0;

    constexpr auto operator<=>(const TileCoord&) const = default;
};

/// Manhattan (4-neighbour) distance between two tiles.
[[nodiscard]] constexpr int32_t ManhattanDistance(TileCoord a, TileCoord b) noexcept {
    const int32_t dx = a.x > b.x ? a.x - b.x : b.x - a.x;
    const int32_t dy = a.y > b.y ? a.y - b.y : b.y - a.y;
    return dx + dy;
}

/// "(x, y)"
[[nodiscard]] inline std::string ToString(TileCoord c) {
    return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
}

} // namespace tsim::sim

template <>
struct std::hash<tsim::sim::TileCoord> {
    std::size_t operator()(const tsim::sim::TileCoord& c) const noexcept {
        const auto packed = (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) |
                            static_cast<uint32_t>(c.y);
        return std::hash<uint64_t>{}(packed);
    }
};

namespace tsim::sim {

/// Set of tiles, used for dynamic pathfinding obstacles.
using TileSet = std::unordered_set<TileCoord>;

/// Edge length of a storage chunk, in tiles.
inline constexpr int32_t kChunkSize = 32;

/// Inclusive rectangle of playable tiles.
struct WorldBounds {
    int32_t minX = 0;
    int32_t maxX = 19;
    int32_t minY = 0;
    int32_t maxY = 10;

    [[nodiscard]] constexpr bool Contains(TileCoord c) const noexcept {
        return c.x >= minX && c.x <= maxX && c.y >= minY && c.y <= maxY;
    }

    [[nodiscard]] constexpr int32_t Width() const noexcept { return maxX - minX + 1; }
    [[nodiscard]] constexpr int32_t Height() const noexcept { return maxY - minY + 1; }

    /// True when the rectangle covers at least one tile.
    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return maxX >= minX && maxY >= minY;
    }

    constexpr bool operator==(const WorldBounds&) const = default;
};

/// A single grid cell.
///
/// Terrain flags mirror the painted terrain definition. Placed buildings
/// do not rewrite them; they add to `blockingOccupants`, and a tile is
/// walkable only while that count is zero.
struct Tile {
    ContentId terrainId = kNoContent;
    int32_t colorIndex = 0;
    bool terrainWalkable = true;
    bool buildable = true;
    bool blocksLight = false;
    uint16_t blockingOccupants = 0;

    [[nodiscard]] bool IsWalkable() const noexcept {
        return terrainWalkable && blockingOccupants == 0;
    }
};

} // namespace tsim::sim
