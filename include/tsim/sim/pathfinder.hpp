#pragma once

/// @file pathfinder.hpp
/// @brief Deterministic 4-neighbour A* over a WorldGrid.

#include "tsim/sim/world_grid.hpp"
#include "tsim/sim/world_types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace tsim::sim {

/// Default bound on node expansions per search.
inline constexpr std::size_t kDefaultMaxExpanded = 4096;

/// Find the shortest 4-directional path from @p start to @p goal.
///
/// Unit edge cost, Manhattan heuristic. A neighbour is rejected when it is
/// out of bounds, not walkable, or listed in @p blocked; the goal is never
/// treated as blocked but must still be walkable. Ties on f are broken by
/// discovery order and neighbours are expanded in the order +x, -x, +y,
/// -y, so identical inputs always return the identical path.
///
/// @return The path including both endpoints, `{start}` when start equals
///         goal, or std::nullopt when the goal is unreachable within
///         @p maxExpanded expansions.
[[nodiscard]] std::optional<std::vector<TileCoord>> FindPath(
    const WorldGrid& world,
    TileCoord start,
    TileCoord goal,
    const TileSet& blocked,
    std::size_t maxExpanded = kDefaultMaxExpanded);

} // namespace tsim::sim
