/// @file world_grid.cpp
/// @brief WorldGrid implementation.

#include "tsim/sim/world_grid.hpp"

#include "tsim/sim/content_types.hpp"

namespace tsim::sim {

namespace {

/// Floor division that rounds toward negative infinity.
constexpr int32_t floorDiv(int32_t value, int32_t divisor) noexcept {
    const int32_t q = value / divisor;
    return (value % divisor != 0 && (value < 0) != (divisor < 0)) ? q - 1 : q;
}

constexpr int32_t floorMod(int32_t value, int32_t divisor) noexcept {
    return value - floorDiv(value, divisor) * divisor;
}

} // namespace

WorldGrid::WorldGrid(WorldBounds bounds, Tile defaultTile, int32_t paletteSize)
    : bounds_(bounds),
      defaultTile_(defaultTile),
      paletteSize_(paletteSize > 0 ? paletteSize : 1) {}

// ── Chunk addressing ────────────────────────────────────────────────────

int64_t WorldGrid::chunkKey(TileCoord coord) noexcept {
    const auto cx = static_cast<int64_t>(floorDiv(coord.x, kChunkSize));
    const auto cy = static_cast<int64_t>(floorDiv(coord.y, kChunkSize));
    return (cx << 32) ^ (cy & 0xFFFFFFFF);
}

std::size_t WorldGrid::localIndex(TileCoord coord) noexcept {
    const auto lx = floorMod(coord.x, kChunkSize);
    const auto ly = floorMod(coord.y, kChunkSize);
    return static_cast<std::size_t>(ly * kChunkSize + lx);
}

// ── Tile access ─────────────────────────────────────────────────────────

Tile& WorldGrid::GetTile(TileCoord coord) {
    auto& chunk = chunks_[chunkKey(coord)];
    if (!chunk) {
        chunk = std::make_unique<Chunk>();
        chunk->fill(defaultTile_);
    }
    return (*chunk)[localIndex(coord)];
}

const Tile* WorldGrid::FindTile(TileCoord coord) const {
    auto it = chunks_.find(chunkKey(coord));
    if (it == chunks_.end()) {
        return nullptr;
    }
    return &(*it->second)[localIndex(coord)];
}

const Tile& WorldGrid::TileAt(TileCoord coord) const {
    const auto* tile = FindTile(coord);
    return tile != nullptr ? *tile : defaultTile_;
}

// ── Queries ─────────────────────────────────────────────────────────────

bool WorldGrid::IsWalkable(TileCoord coord) const {
    return IsInBounds(coord) && TileAt(coord).IsWalkable();
}

bool WorldGrid::IsBuildable(TileCoord coord) const {
    return IsInBounds(coord) && TileAt(coord).buildable;
}

int32_t WorldGrid::ClampColorIndex(int32_t index) const noexcept {
    if (index < 0) {
        return 0;
    }
    return index % paletteSize_;
}

// ── Mutation ────────────────────────────────────────────────────────────

void WorldGrid::PaintTerrain(TileCoord coord, const TerrainDef& terrain, int32_t colorIndex) {
    if (!IsInBounds(coord)) {
        return;
    }

    auto& tile = GetTile(coord);
    tile.terrainId = terrain.id;
    tile.colorIndex = ClampColorIndex(colorIndex);
    tile.terrainWalkable = terrain.walkable;
    tile.buildable = terrain.buildable;
    tile.blocksLight = terrain.blocksLight;
    ++revision_;
}

void WorldGrid::AddOccupant(TileCoord coord) {
    auto& tile = GetTile(coord);
    ++tile.blockingOccupants;
    ++revision_;
}

void WorldGrid::RemoveOccupant(TileCoord coord) {
    auto& tile = GetTile(coord);
    if (tile.blockingOccupants > 0) {
        --tile.blockingOccupants;
        ++revision_;
    }
}

} // namespace tsim::sim
