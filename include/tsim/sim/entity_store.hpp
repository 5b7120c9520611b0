#pragma once

/// @file entity_store.hpp
/// @brief Component tables for pawns and buildings plus their factories.
///
/// EntityStore owns the EntityManager and one ComponentStorage per
/// simulation component type. Every storage is registered with the
/// manager, so destroying an entity removes it from every table.

#include "tsim/ecs/component_storage.hpp"
#include "tsim/ecs/entity.hpp"
#include "tsim/ecs/entity_manager.hpp"
#include "tsim/sim/action_types.hpp"
#include "tsim/sim/components.hpp"
#include "tsim/sim/content_types.hpp"
#include "tsim/sim/world_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace tsim::sim {

/// Everything needed to spawn a pawn.
struct PawnSpec {
    std::string name;
    int32_t age = 25;
    TileCoord position;
    std::map<ContentId, float> needs;
    int32_t gold = 100;
};

class EntityStore {
public:
    EntityStore();

    // Storages are registered with the manager by address.
    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;
    EntityStore(EntityStore&&) = delete;
    EntityStore& operator=(EntityStore&&) = delete;

    // ── Factories ───────────────────────────────────────────────────

    /// Create a pawn with Position, Pawn, Needs, Mood, Buffs,
    /// ActionComponent, Gold and Inventory. Need values are clamped.
    tsim::ecs::Entity CreatePawn(const PawnSpec& spec);

    /// Create a building with Position, Building, Attachment, Gold and,
    /// when @p def has a resource type, a full Resource store.
    /// Tile occupancy is the caller's concern.
    tsim::ecs::Entity CreateBuilding(const BuildingDef& def, TileCoord anchor, int32_t colorIndex);

    /// Remove @p entity from every table. Idempotent.
    void Destroy(tsim::ecs::Entity entity);

    [[nodiscard]] bool IsAlive(tsim::ecs::Entity entity) const noexcept {
        return manager_.IsAlive(entity);
    }

    // ── Queries ─────────────────────────────────────────────────────

    /// Ids of every entity with a Pawn component, ascending.
    [[nodiscard]] std::vector<tsim::ecs::Entity> AllPawns() const;

    /// Ids of every entity with a Building component, ascending.
    [[nodiscard]] std::vector<tsim::ecs::Entity> AllBuildings() const;

    /// The lowest-id pawn other than @p exclude standing on @p coord.
    [[nodiscard]] std::optional<tsim::ecs::Entity> PawnAt(
        TileCoord coord, tsim::ecs::Entity exclude = tsim::ecs::Entity::invalid()) const;

    /// Tiles of every pawn other than @p exclude.
    [[nodiscard]] TileSet OccupiedTiles(
        tsim::ecs::Entity exclude = tsim::ecs::Entity::invalid()) const;

    [[nodiscard]] bool IsTileOccupiedByPawn(
        TileCoord coord, tsim::ecs::Entity exclude = tsim::ecs::Entity::invalid()) const;

    /// The building whose footprint covers @p coord.
    [[nodiscard]] std::optional<tsim::ecs::Entity> BuildingAt(TileCoord coord) const;

    // ── Tables ──────────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] tsim::ecs::ComponentStorage<T>& Storage() noexcept {
        return std::get<tsim::ecs::ComponentStorage<T>>(storages_);
    }

    template <typename T>
    [[nodiscard]] const tsim::ecs::ComponentStorage<T>& Storage() const noexcept {
        return std::get<tsim::ecs::ComponentStorage<T>>(storages_);
    }

    /// Component of @p entity, or nullptr.
    template <typename T>
    [[nodiscard]] T* TryGet(tsim::ecs::Entity entity) noexcept {
        return Storage<T>().TryGet(entity);
    }

    template <typename T>
    [[nodiscard]] const T* TryGet(tsim::ecs::Entity entity) const noexcept {
        return Storage<T>().TryGet(entity);
    }

    [[nodiscard]] const tsim::ecs::EntityManager& Manager() const noexcept { return manager_; }

    /// Number of alive entities.
    [[nodiscard]] std::size_t Count() const noexcept { return manager_.Count(); }

private:
    tsim::ecs::EntityManager manager_;
    std::tuple<tsim::ecs::ComponentStorage<Position>,
               tsim::ecs::ComponentStorage<Pawn>,
               tsim::ecs::ComponentStorage<Needs>,
               tsim::ecs::ComponentStorage<Mood>,
               tsim::ecs::ComponentStorage<Buffs>,
               tsim::ecs::ComponentStorage<ActionComponent>,
               tsim::ecs::ComponentStorage<Building>,
               tsim::ecs::ComponentStorage<Resource>,
               tsim::ecs::ComponentStorage<Attachment>,
               tsim::ecs::ComponentStorage<Gold>,
               tsim::ecs::ComponentStorage<Inventory>>
        storages_;
};

} // namespace tsim::sim
