#pragma once

/// @file building_queries.hpp
/// @brief Footprint, use-area and availability helpers shared by the
///        action and AI systems.

#include "tsim/ecs/entity.hpp"
#include "tsim/sim/components.hpp"
#include "tsim/sim/content_types.hpp"
#include "tsim/sim/entity_store.hpp"
#include "tsim/sim/world_grid.hpp"
#include "tsim/sim/world_types.hpp"

#include <optional>
#include <vector>

namespace tsim::sim {

/// Tiles covered by a square footprint anchored at its top-left tile.
[[nodiscard]] std::vector<TileCoord> FootprintTiles(TileCoord anchor, int32_t tileSize);

/// Absolute use-area tiles of a building, in definition order. When the
/// definition lists none, the ring of tiles Manhattan-adjacent to the
/// footprint is used (top edge, bottom edge, left edge, right edge).
[[nodiscard]] std::vector<TileCoord> UseAreaTiles(TileCoord anchor, const BuildingDef& def);

/// True if @p coord is one of the building's use-area tiles.
[[nodiscard]] bool IsInUseArea(TileCoord coord, TileCoord anchor, const BuildingDef& def);

/// A reachable use-area tile and the path that leads there.
struct UseAreaRoute {
    TileCoord tile;
    std::vector<TileCoord> path;
};

/// Nearest (Manhattan from @p from, ties in use-area order) use-area tile
/// that is in bounds, walkable, free of other pawns and reachable.
[[nodiscard]] std::optional<UseAreaRoute> FindUseAreaRoute(const WorldGrid& world,
                                                           const EntityStore& entities,
                                                           tsim::ecs::Entity pawn,
                                                           TileCoord from,
                                                           TileCoord anchor,
                                                           const BuildingDef& def);

/// Whether a use would find enough stock. Buildings without a store,
/// and stores with a zero depletion multiplier, are always available.
[[nodiscard]] bool IsResourceAvailable(const Resource* resource, const BuildingDef& def);

/// Stock one consumer use removes.
[[nodiscard]] float ResourceCostPerUse(const Resource& resource, const BuildingDef& def);

/// Number of pawns other than @p pawn whose current or queued action
/// targets @p building.
[[nodiscard]] int32_t CountConvergingPawns(const EntityStore& entities,
                                           tsim::ecs::Entity building,
                                           tsim::ecs::Entity pawn);

} // namespace tsim::sim
