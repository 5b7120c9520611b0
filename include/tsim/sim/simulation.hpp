#pragma once

/// @file simulation.hpp
/// @brief Simulation: owns the world, entities, clock, RNG and systems.
///
/// Construction validates everything that can be wrong up front and
/// reports it as a GameError. Once built, Tick() cannot fail.
///
/// Per tick, in order:
///   1. Rebuild the diversity map if the world changed.
///   2. Run the scheduler: Needs, Social (PreUpdate); Buffs, Mood,
///      Actions (Update); AI and, when enabled, themes (PostUpdate).
///   3. Advance the clock by one tick.
///
/// Not thread-safe. One simulation is driven by one thread.

#include "tsim/ecs/entity.hpp"
#include "tsim/ecs/system_scheduler.hpp"
#include "tsim/foundation/game_result.hpp"
#include "tsim/sim/content_registry.hpp"
#include "tsim/sim/diversity_map.hpp"
#include "tsim/sim/entity_store.hpp"
#include "tsim/sim/render_snapshot.hpp"
#include "tsim/sim/sim_config.hpp"
#include "tsim/sim/sim_context.hpp"
#include "tsim/sim/time_service.hpp"
#include "tsim/sim/world_grid.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string_view>

namespace tsim::sim {

class Simulation {
    /// Restricts construction to Create().
    struct ConstructToken {
        explicit ConstructToken() = default;
    };

public:
    /// Validate @p config against @p content and build a simulation.
    ///
    /// Fails with InvalidWorldBounds, InvalidConfig (start hour, palette),
    /// any ContentRegistry::Validate() error, UnknownTerrain without a
    /// default terrain, UnknownNeed when the stock
    /// pawns need a missing need, CyclicDependency if the system graph
    /// cannot be ordered, or the first error placing a configured
    /// building or pawn.
    [[nodiscard]] static tsim::foundation::GameResult<std::unique_ptr<Simulation>> Create(
        const ContentRegistry& content, SimulationConfig config = {});

    Simulation(ConstructToken token, const ContentRegistry& content, uint32_t seed,
               TimeService time, WorldGrid world);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;
    ~Simulation() = default;

    /// Advance the simulation by one tick.
    void Tick();

    // ── Mutation ────────────────────────────────────────────────────

    /// Spawn a pawn. UnknownNeed for need ids outside the content,
    /// OutOfBounds for a position outside the world (the error carries
    /// the rejected TileCoord as context).
    tsim::foundation::GameResult<tsim::ecs::Entity> CreatePawn(const PawnConfig& config);

    /// Place a building anchored at @p anchor (top-left of the footprint).
    ///
    /// UnknownBuilding, OutOfBounds, TileOccupied (another building) or
    /// TileNotBuildable for any footprint tile. Tile errors carry the
    /// offending TileCoord as context.
    tsim::foundation::GameResult<tsim::ecs::Entity> CreateBuilding(ContentId defId,
                                                                   TileCoord anchor,
                                                                   int32_t colorIndex = 0);

    /// Destroy an entity and undo its world effects. Idempotent.
    void DestroyEntity(tsim::ecs::Entity entity);

    /// Repaint one tile. UnknownTerrain for a bad id; out of bounds is a
    /// silent no-op.
    tsim::foundation::GameResult<void> PaintTerrain(TileCoord coord, ContentId terrainId,
                                                    int32_t colorIndex = 0);

    /// Destroy the building covering @p coord, if any.
    bool TryDeleteBuildingAt(TileCoord coord);

    // ── Views ───────────────────────────────────────────────────────

    [[nodiscard]] RenderSnapshot CreateRenderSnapshot() const;

    [[nodiscard]] EntityStore& Entities() noexcept { return entities_; }
    [[nodiscard]] const EntityStore& Entities() const noexcept { return entities_; }
    [[nodiscard]] const WorldGrid& World() const noexcept { return world_; }
    [[nodiscard]] const TimeService& Time() const noexcept { return time_; }
    [[nodiscard]] const ContentRegistry& Content() const noexcept { return content_; }
    [[nodiscard]] const DiversityMap& Diversity() const noexcept { return diversity_; }
    [[nodiscard]] const tsim::ecs::SystemScheduler& Scheduler() const noexcept {
        return scheduler_;
    }
    [[nodiscard]] uint32_t Seed() const noexcept { return seed_; }

    /// Name of the active theme; empty when themes are disabled.
    [[nodiscard]] std::string_view CurrentThemeName() const;

private:
    [[nodiscard]] tsim::foundation::GameResult<void> registerSystems(bool enableThemes);
    [[nodiscard]] tsim::foundation::GameResult<void> bootstrapPawns();

    [[nodiscard]] SimContext makeContext();

    ContentRegistry content_;
    uint32_t seed_;
    std::mt19937 random_;
    TimeService time_;
    WorldGrid world_;
    EntityStore entities_;
    DiversityMap diversity_;
    tsim::ecs::SystemScheduler scheduler_;
};

} // namespace tsim::sim
