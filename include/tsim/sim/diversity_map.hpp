#pragma once

/// @file diversity_map.hpp
/// @brief Per-tile visual novelty score used to bias wandering.

#include "tsim/sim/world_grid.hpp"
#include "tsim/sim/world_types.hpp"

#include <cstdint>
#include <vector>

namespace tsim::sim {

/// Number of distinct (terrain, color) signatures in each tile's 3x3
/// neighbourhood, minus one. A uniform world scores zero everywhere.
class DiversityMap {
public:
    /// Recompute every in-bounds tile from @p world.
    void Rebuild(const WorldGrid& world);

    /// Rebuild only when the world changed since the last rebuild.
    /// @return true if a rebuild happened.
    bool RefreshIfStale(const WorldGrid& world);

    /// Score at @p coord; 0 outside the mapped bounds.
    [[nodiscard]] int32_t ValueAt(TileCoord coord) const noexcept;

private:
    WorldBounds bounds_{0, -1, 0, -1};
    std::vector<int32_t> values_;
    uint64_t builtRevision_ = 0;
    bool built_ = false;
};

} // namespace tsim::sim
