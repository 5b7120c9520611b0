/// @file entity_store.cpp
/// @brief EntityStore factories and spatial queries.

#include "tsim/sim/entity_store.hpp"

namespace tsim::sim {

using tsim::ecs::Entity;

EntityStore::EntityStore() {
    std::apply([this](auto&... storage) { (manager_.RegisterStorage(&storage), ...); },
               storages_);
}

// ── Factories ───────────────────────────────────────────────────────────

Entity EntityStore::CreatePawn(const PawnSpec& spec) {
    const auto entity = manager_.Create();

    Storage<Position>().Add(entity, spec.position);
    Storage<Pawn>().Add(entity, spec.name, spec.age);

    auto& needs = Storage<Needs>().Add(entity);
    for (const auto& [needId, value] : spec.needs) {
        needs.values[needId] = ClampNeed(value);
    }

    Storage<Mood>().Add(entity);
    Storage<Buffs>().Add(entity);
    Storage<ActionComponent>().Add(entity);
    Storage<Gold>().Add(entity, spec.gold);
    Storage<Inventory>().Add(entity);
    return entity;
}

Entity EntityStore::CreateBuilding(const BuildingDef& def, TileCoord anchor, int32_t colorIndex) {
    const auto entity = manager_.Create();

    Storage<Position>().Add(entity, anchor);

    auto& building = Storage<Building>().Add(entity);
    building.defId = def.id;
    building.tileSize = def.tileSize;
    building.colorIndex = colorIndex;

    Storage<Attachment>().Add(entity);
    Storage<Gold>().Add(entity, def.initialGold);

    if (def.resourceType) {
        auto& resource = Storage<Resource>().Add(entity);
        resource.type = *def.resourceType;
        resource.max = def.maxResourceAmount;
        resource.current = def.maxResourceAmount;
        resource.depletionMult = def.depletionMult;
    }
    return entity;
}

void EntityStore::Destroy(Entity entity) {
    manager_.Destroy(entity);
}

// ── Queries ─────────────────────────────────────────────────────────────

std::vector<Entity> EntityStore::AllPawns() const {
    return Storage<Pawn>().SortedEntities();
}

std::vector<Entity> EntityStore::AllBuildings() const {
    return Storage<Building>().SortedEntities();
}

std::optional<Entity> EntityStore::PawnAt(TileCoord coord, Entity exclude) const {
    const auto& positions = Storage<Position>();
    for (auto pawn : AllPawns()) {
        if (pawn == exclude) {
            continue;
        }
        if (const auto* pos = positions.TryGet(pawn); pos != nullptr && pos->coord == coord) {
            return pawn;
        }
    }
    return std::nullopt;
}

TileSet EntityStore::OccupiedTiles(Entity exclude) const {
    TileSet tiles;
    const auto& positions = Storage<Position>();
    const auto& pawns = Storage<Pawn>();
    for (std::size_t i = 0; i < pawns.Size(); ++i) {
        const auto pawn = pawns.EntityAt(i);
        if (pawn == exclude) {
            continue;
        }
        if (const auto* pos = positions.TryGet(pawn)) {
            tiles.insert(pos->coord);
        }
    }
    return tiles;
}

bool EntityStore::IsTileOccupiedByPawn(TileCoord coord, Entity exclude) const {
    return PawnAt(coord, exclude).has_value();
}

std::optional<Entity> EntityStore::BuildingAt(TileCoord coord) const {
    const auto& positions = Storage<Position>();
    const auto& buildings = Storage<Building>();
    for (auto entity : AllBuildings()) {
        const auto* pos = positions.TryGet(entity);
        if (pos == nullptr) {
            continue;
        }
        const auto size = buildings.Get(entity).tileSize;
        if (coord.x >= pos->coord.x && coord.x < pos->coord.x + size &&
            coord.y >= pos->coord.y && coord.y < pos->coord.y + size) {
            return entity;
        }
    }
    return std::nullopt;
}

} // namespace tsim::sim
