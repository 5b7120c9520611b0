/// @file building_queries.cpp
/// @brief Building footprint and use-area helpers.

#include "tsim/sim/building_queries.hpp"

#include "tsim/sim/pathfinder.hpp"

#include <algorithm>

namespace tsim::sim {

using tsim::ecs::Entity;

std::vector<TileCoord> FootprintTiles(TileCoord anchor, int32_t tileSize) {
    std::vector<TileCoord> tiles;
    if (tileSize <= 0) {
        return tiles;
    }
    tiles.reserve(static_cast<std::size_t>(tileSize) * tileSize);
    for (int32_t dy = 0; dy < tileSize; ++dy) {
        for (int32_t dx = 0; dx < tileSize; ++dx) {
            tiles.push_back({anchor.x + dx, anchor.y + dy});
        }
    }
    return tiles;
}

std::vector<TileCoord> UseAreaTiles(TileCoord anchor, const BuildingDef& def) {
    std::vector<TileCoord> tiles;
    if (!def.useAreas.empty()) {
        tiles.reserve(def.useAreas.size());
        for (const auto& offset : def.useAreas) {
            tiles.push_back({anchor.x + offset.dx, anchor.y + offset.dy});
        }
        return tiles;
    }

    const int32_t size = std::max(def.tileSize, 1);
    tiles.reserve(static_cast<std::size_t>(size) * 4);
    for (int32_t dx = 0; dx < size; ++dx) {
        tiles.push_back({anchor.x + dx, anchor.y - 1});
    }
    for (int32_t dx = 0; dx < size; ++dx) {
        tiles.push_back({anchor.x + dx, anchor.y + size});
    }
    for (int32_t dy = 0; dy < size; ++dy) {
        tiles.push_back({anchor.x - 1, anchor.y + dy});
    }
    for (int32_t dy = 0; dy < size; ++dy) {
        tiles.push_back({anchor.x + size, anchor.y + dy});
    }
    return tiles;
}

bool IsInUseArea(TileCoord coord, TileCoord anchor, const BuildingDef& def) {
    const auto tiles = UseAreaTiles(anchor, def);
    return std::find(tiles.begin(), tiles.end(), coord) != tiles.end();
}

std::optional<UseAreaRoute> FindUseAreaRoute(const WorldGrid& world,
                                             const EntityStore& entities,
                                             Entity pawn,
                                             TileCoord from,
                                             TileCoord anchor,
                                             const BuildingDef& def) {
    auto candidates = UseAreaTiles(anchor, def);
    std::stable_sort(candidates.begin(), candidates.end(),
                     [from](const TileCoord& a, const TileCoord& b) {
                         return ManhattanDistance(from, a) < ManhattanDistance(from, b);
                     });

    const auto blocked = entities.OccupiedTiles(pawn);
    for (const auto& tile : candidates) {
        if (!world.IsWalkable(tile) || blocked.contains(tile)) {
            continue;
        }
        if (auto path = FindPath(world, from, tile, blocked)) {
            return UseAreaRoute{tile, std::move(*path)};
        }
    }
    return std::nullopt;
}

bool IsResourceAvailable(const Resource* resource, const BuildingDef& def) {
    if (resource == nullptr || resource->depletionMult == 0.0f) {
        return true;
    }
    return resource->current >= ResourceCostPerUse(*resource, def);
}

float ResourceCostPerUse(const Resource& resource, const BuildingDef& def) {
    return def.resourcePerUse * resource.depletionMult;
}

int32_t CountConvergingPawns(const EntityStore& entities, Entity building, Entity pawn) {
    int32_t count = 0;
    const auto& actions = entities.Storage<ActionComponent>();
    for (std::size_t i = 0; i < actions.Size(); ++i) {
        const auto other = actions.EntityAt(i);
        if (other == pawn) {
            continue;
        }
        const auto& comp = actions.Get(other);
        bool targets = comp.current && comp.current->TargetBuilding() == building;
        for (const auto& queued : comp.queue) {
            if (targets) {
                break;
            }
            targets = queued.TargetBuilding() == building;
        }
        if (targets) {
            ++count;
        }
    }
    return count;
}

} // namespace tsim::sim
