#pragma once

/// @file world_grid.hpp
/// @brief Chunked, lazily allocated tile grid.
///
/// WorldGrid stores tiles in fixed 32x32 chunks keyed by chunk coordinate.
/// A chunk is allocated on first mutable access, so a fresh world costs
/// nothing until it is touched. Reads through `FindTile()` never allocate.

#include "tsim/sim/world_types.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace tsim::sim {

struct TerrainDef;

/// Bounded 2D tile grid with occupancy-based walkability.
class WorldGrid {
public:
    /// @param bounds       Inclusive playable rectangle.
    /// @param defaultTile  Template used for lazily created tiles.
    /// @param paletteSize  Number of colors; indices are clamped into it.
    WorldGrid(WorldBounds bounds, Tile defaultTile, int32_t paletteSize);

    // Non-copyable, movable.
    WorldGrid(const WorldGrid&) = delete;
    WorldGrid& operator=(const WorldGrid&) = delete;
    WorldGrid(WorldGrid&&) noexcept = default;
    WorldGrid& operator=(WorldGrid&&) noexcept = default;

    // ── Tile access ─────────────────────────────────────────────────

    /// Return the tile at @p coord, creating its chunk if needed.
    Tile& GetTile(TileCoord coord);

    /// Return the tile at @p coord, or nullptr if its chunk was never
    /// allocated.
    [[nodiscard]] const Tile* FindTile(TileCoord coord) const;

    /// Return the tile at @p coord, or the default tile when untouched.
    [[nodiscard]] const Tile& TileAt(TileCoord coord) const;

    // ── Queries ─────────────────────────────────────────────────────

    [[nodiscard]] bool IsInBounds(TileCoord coord) const noexcept {
        return bounds_.Contains(coord);
    }

    /// In bounds, terrain walkable and no blocking occupant.
    [[nodiscard]] bool IsWalkable(TileCoord coord) const;

    /// In bounds and the terrain allows construction.
    [[nodiscard]] bool IsBuildable(TileCoord coord) const;

    [[nodiscard]] const WorldBounds& Bounds() const noexcept { return bounds_; }
    [[nodiscard]] int32_t PaletteSize() const noexcept { return paletteSize_; }
    [[nodiscard]] const Tile& DefaultTile() const noexcept { return defaultTile_; }

    /// Number of allocated chunks.
    [[nodiscard]] std::size_t ChunkCount() const noexcept { return chunks_.size(); }

    /// Counter bumped on every terrain or occupancy change.
    [[nodiscard]] uint64_t Revision() const noexcept { return revision_; }

    // ── Mutation ────────────────────────────────────────────────────

    /// Rewrite terrain id, flags and color of @p coord from @p terrain.
    /// The occupant count is kept. Out-of-bounds coordinates are ignored.
    void PaintTerrain(TileCoord coord, const TerrainDef& terrain, int32_t colorIndex);

    /// Register a blocking occupant (building footprint tile).
    void AddOccupant(TileCoord coord);

    /// Release a blocking occupant. Walkability returns only when the
    /// last occupant is gone.
    void RemoveOccupant(TileCoord coord);

    /// Clamp a palette index: negative values map to 0, others wrap.
    [[nodiscard]] int32_t ClampColorIndex(int32_t index) const noexcept;

private:
    using Chunk = std::array<Tile, static_cast<std::size_t>(kChunkSize * kChunkSize)>;

    [[nodiscard]] static int64_t chunkKey(TileCoord coord) noexcept;
    [[nodiscard]] static std::size_t localIndex(TileCoord coord) noexcept;

    WorldBounds bounds_;
    Tile defaultTile_;
    int32_t paletteSize_;
    std::unordered_map<int64_t, std::unique_ptr<Chunk>> chunks_;
    uint64_t revision_ = 0;
};

} // namespace tsim::sim
