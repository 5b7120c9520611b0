/// @file simulation.cpp
/// @brief Simulation construction, tick loop and world mutation.

#include "tsim/sim/simulation.hpp"

#include "tsim/foundation/game_logger.hpp"
#include "tsim/sim/action_system.hpp"
#include "tsim/sim/ai_system.hpp"
#include "tsim/sim/building_queries.hpp"
#include "tsim/sim/need_systems.hpp"
#include "tsim/sim/theme_system.hpp"

#include <array>
#include <string>
#include <utility>

namespace tsim::sim {

using tsim::ecs::Entity;
using tsim::foundation::ErrorCode;
using tsim::foundation::GameError;
using tsim::foundation::GameResult;
using tsim::foundation::LogCategory;

namespace {

struct StockPawn {
    const char* name;
    int32_t age;
    TileCoord position;
    // Hunger, Energy, Fun, Social, Hygiene
    std::array<float, 5> needs;
};

constexpr std::array<const char*, 5> kStockNeedNames = {"Hunger", "Energy", "Fun", "Social",
                                                        "Hygiene"};

const std::array<StockPawn, 4> kStockPawns = {{
    {"Alex", 25, {5, 5}, {70.0f, 60.0f, 50.0f, 80.0f, 65.0f}},
    {"Jordan", 32, {3, 7}, {55.0f, 75.0f, 40.0f, 60.0f, 70.0f}},
    {"Sam", 28, {9, 3}, {80.0f, 45.0f, 65.0f, 50.0f, 85.0f}},
    {"Riley", 22, {7, 9}, {60.0f, 55.0f, 75.0f, 70.0f, 50.0f}},
}};

} // namespace

// ── Construction ────────────────────────────────────────────────────────

GameResult<std::unique_ptr<Simulation>> Simulation::Create(const ContentRegistry& content,
                                                           SimulationConfig config) {
    using ResultT = GameResult<std::unique_ptr<Simulation>>;

    auto fail = [](GameError error) {
        TSIM_LOG_ERROR(LogCategory::Core,
                       "simulation construction failed: " + std::string(error.message()));
        return ResultT::err(std::move(error));
    };

    if (!config.bounds.IsValid()) {
        return fail(GameError(ErrorCode::InvalidWorldBounds,
                              "world bounds are empty: x " + std::to_string(config.bounds.minX) +
                                  ".." + std::to_string(config.bounds.maxX) + ", y " +
                                  std::to_string(config.bounds.minY) + ".." +
                                  std::to_string(config.bounds.maxY)));
    }
    if (config.paletteSize < 1) {
        return fail(GameError(ErrorCode::InvalidConfig,
                              "palette size must be positive, got " +
                                  std::to_string(config.paletteSize)));
    }

    auto time = TimeService::Create(config.startHour);
    if (time.hasError()) {
        return fail(time.error());
    }

    if (auto valid = content.Validate(); valid.hasError()) {
        return fail(valid.error());
    }

    const auto* terrain = content.Terrains().Find(content.DefaultTerrainId());
    if (terrain == nullptr) {
        return fail(GameError(ErrorCode::UnknownTerrain, "content names no default terrain"));
    }
    Tile defaultTile;
    defaultTile.terrainId = terrain->id;
    defaultTile.terrainWalkable = terrain->walkable;
    defaultTile.buildable = terrain->buildable;
    defaultTile.blocksLight = terrain->blocksLight;

    auto sim = std::make_unique<Simulation>(
        ConstructToken{}, content, config.seed, std::move(time).value(),
        WorldGrid(config.bounds, defaultTile, config.paletteSize));

    if (auto registered = sim->registerSystems(config.enableThemes); registered.hasError()) {
        return fail(registered.error());
    }

    if (!config.skipDefaultBootstrap) {
        if (auto bootstrapped = sim->bootstrapPawns(); bootstrapped.hasError()) {
            return fail(bootstrapped.error());
        }
    }

    for (const auto& placement : config.buildings) {
        auto building = sim->CreateBuilding(placement.defId, placement.anchor, placement.colorIndex);
        if (building.hasError()) {
            return fail(building.error());
        }
    }

    for (const auto& pawn : config.pawns) {
        auto created = sim->CreatePawn(pawn);
        if (created.hasError()) {
            return fail(created.error());
        }
    }

    TSIM_LOG_INFO(LogCategory::Core,
                  "simulation created: seed " + std::to_string(config.seed) + ", " +
                      std::to_string(sim->entities_.AllPawns().size()) + " pawns, " +
                      std::to_string(sim->entities_.AllBuildings().size()) + " buildings, " +
                      sim->time_.TimeString());

    return ResultT::ok(std::move(sim));
}

Simulation::Simulation(ConstructToken /*token*/, const ContentRegistry& content, uint32_t seed,
                       TimeService time, WorldGrid world)
    : content_(content),
      seed_(seed),
      random_(seed),
      time_(std::move(time)),
      world_(std::move(world)) {
    diversity_.Rebuild(world_);
}

GameResult<void> Simulation::registerSystems(bool enableThemes) {
    scheduler_.Register<NeedsSystem>();
    scheduler_.Register<SocialSystem>();
    scheduler_.Register<BuffSystem>();
    scheduler_.Register<MoodSystem>();
    scheduler_.Register<ActionSystem>();
    scheduler_.Register<AISystem>();
    if (enableThemes) {
        scheduler_.Register<ThemeSystem>();
    }

    bool linked = scheduler_.AddDependency<NeedsSystem, SocialSystem>() &&
                  scheduler_.AddDependency<BuffSystem, MoodSystem>() &&
                  scheduler_.AddDependency<MoodSystem, ActionSystem>();
    if (enableThemes) {
        linked = linked && scheduler_.AddDependency<AISystem, ThemeSystem>();
    }
    if (!linked) {
        return GameResult<void>::err(
            GameError(ErrorCode::SystemError, "failed to declare system dependencies"));
    }

    if (!scheduler_.Build()) {
        return GameResult<void>::err(
            GameError(ErrorCode::CyclicDependency, scheduler_.GetLastError()));
    }
    return GameResult<void>::ok();
}

GameResult<void> Simulation::bootstrapPawns() {
    std::array<ContentId, kStockNeedNames.size()> needIds{};
    for (std::size_t i = 0; i < kStockNeedNames.size(); ++i) {
        const auto id = content_.Needs().IdOf(kStockNeedNames[i]);
        if (!id) {
            return GameResult<void>::err(
                GameError(ErrorCode::UnknownNeed,
                          std::string("stock pawns require need '") + kStockNeedNames[i] + "'"));
        }
        needIds[i] = *id;
    }

    for (const auto& stock : kStockPawns) {
        PawnConfig pawn;
        pawn.name = stock.name;
        pawn.age = stock.age;
        pawn.position = stock.position;
        for (std::size_t i = 0; i < needIds.size(); ++i) {
            pawn.needs[needIds[i]] = stock.needs[i];
        }
        auto created = CreatePawn(pawn);
        if (created.hasError()) {
            return GameResult<void>::err(created.error());
        }
    }
    return GameResult<void>::ok();
}

// ── Tick ────────────────────────────────────────────────────────────────

SimContext Simulation::makeContext() {
    return SimContext{entities_, world_, content_, time_, diversity_, random_};
}

void Simulation::Tick() {
    diversity_.RefreshIfStale(world_);

    auto ctx = makeContext();
    scheduler_.Execute(ctx);

    time_.Advance();
}

// ── Mutation ────────────────────────────────────────────────────────────

GameResult<Entity> Simulation::CreatePawn(const PawnConfig& config) {
    for (const auto& [needId, value] : config.needs) {
        if (!content_.Needs().Contains(needId)) {
            return GameResult<Entity>::err(GameError(
                ErrorCode::UnknownNeed, "unknown need id " + std::to_string(needId) +
                                            " for pawn " + config.name));
        }
    }
    if (!world_.IsInBounds(config.position)) {
        return GameResult<Entity>::err(GameError(
            ErrorCode::OutOfBounds,
            "pawn " + config.name + " placed outside the world at " + ToString(config.position),
            config.position));
    }

    return GameResult<Entity>::ok(entities_.CreatePawn(config));
}

GameResult<Entity> Simulation::CreateBuilding(ContentId defId, TileCoord anchor,
                                              int32_t colorIndex) {
    const auto* def = content_.Buildings().Find(defId);
    if (def == nullptr) {
        return GameResult<Entity>::err(
            GameError(ErrorCode::UnknownBuilding, "unknown building id " + std::to_string(defId)));
    }

    const auto footprint = FootprintTiles(anchor, def->tileSize);
    for (const auto& tile : footprint) {
        if (!world_.IsInBounds(tile)) {
            return GameResult<Entity>::err(GameError(
                ErrorCode::OutOfBounds,
                def->name + " at " + ToString(anchor) + " does not fit: " + ToString(tile) +
                    " is outside",
                tile));
        }
        const auto& state = world_.TileAt(tile);
        if (state.blockingOccupants > 0) {
            return GameResult<Entity>::err(GameError(
                ErrorCode::TileOccupied,
                def->name + " at " + ToString(anchor) + " overlaps " + ToString(tile), tile));
        }
        if (!state.buildable || !state.terrainWalkable) {
            return GameResult<Entity>::err(GameError(
                ErrorCode::TileNotBuildable,
                def->name + " cannot be built on " + ToString(tile), tile));
        }
    }

    const auto entity = entities_.CreateBuilding(*def, anchor, world_.ClampColorIndex(colorIndex));
    for (const auto& tile : footprint) {
        world_.AddOccupant(tile);
    }
    return GameResult<Entity>::ok(entity);
}

void Simulation::DestroyEntity(Entity entity) {
    if (!entities_.IsAlive(entity)) {
        return;
    }

    if (const auto* building = entities_.TryGet<Building>(entity)) {
        if (const auto* pos = entities_.TryGet<Position>(entity)) {
            for (const auto& tile : FootprintTiles(pos->coord, building->tileSize)) {
                world_.RemoveOccupant(tile);
            }
        }

        for (auto pawn : entities_.AllPawns()) {
            auto* comp = entities_.TryGet<ActionComponent>(pawn);
            if (comp == nullptr) {
                continue;
            }
            bool targets = comp->current && comp->current->TargetBuilding() == entity;
            for (const auto& queued : comp->queue) {
                targets = targets || queued.TargetBuilding() == entity;
            }
            if (targets) {
                comp->Abort();
            }
        }
    }

    if (entities_.TryGet<Pawn>(entity) != nullptr) {
        for (auto& building : entities_.Storage<Building>()) {
            if (building.usedBy == entity) {
                building.inUse = false;
                building.usedBy = Entity::invalid();
            }
        }
    }

    entities_.Destroy(entity);
}

GameResult<void> Simulation::PaintTerrain(TileCoord coord, ContentId terrainId,
                                          int32_t colorIndex) {
    const auto* terrain = content_.Terrains().Find(terrainId);
    if (terrain == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::UnknownTerrain, "unknown terrain id " + std::to_string(terrainId)));
    }
    world_.PaintTerrain(coord, *terrain, colorIndex);
    return GameResult<void>::ok();
}

bool Simulation::TryDeleteBuildingAt(TileCoord coord) {
    const auto building = entities_.BuildingAt(coord);
    if (!building) {
        return false;
    }
    DestroyEntity(*building);
    return true;
}

// ── Views ───────────────────────────────────────────────────────────────

std::string_view Simulation::CurrentThemeName() const {
    const auto* themes = scheduler_.GetSystem<ThemeSystem>();
    return themes != nullptr ? themes->CurrentName() : std::string_view{};
}

RenderSnapshot Simulation::CreateRenderSnapshot() const {
    RenderSnapshot snapshot;

    for (auto pawn : entities_.AllPawns()) {
        RenderPawn view;
        view.id = pawn.id();
        if (const auto* pos = entities_.TryGet<Position>(pawn)) {
            view.x = pos->coord.x;
            view.y = pos->coord.y;
        }
        if (const auto* info = entities_.TryGet<Pawn>(pawn)) {
            view.name = info->name;
        }
        if (const auto* mood = entities_.TryGet<Mood>(pawn)) {
            view.mood = mood->value;
        }
        if (const auto* comp = entities_.TryGet<ActionComponent>(pawn); comp && comp->current) {
            const auto& action = *comp->current;
            view.currentAction = action.Label();
            view.animation = action.Animation();
            view.expression = action.Expression();
            view.expressionIconDefId = action.ExpressionIconDefId();
            view.targetTile = action.TargetCoord();
            if (!view.targetTile) {
                if (const auto target = action.TargetBuilding()) {
                    if (const auto* targetPos = entities_.TryGet<Position>(*target)) {
                        view.targetTile = targetPos->coord;
                    }
                }
            }
            if (comp->path) {
                view.currentPath = *comp->path;
                view.pathIndex = comp->pathIndex;
            }
        }
        if (const auto* gold = entities_.TryGet<Gold>(pawn)) {
            view.gold = gold->amount;
        }
        if (const auto* inventory = entities_.TryGet<Inventory>(pawn)) {
            view.carriedResource = inventory->resourceType;
            view.carriedAmount = inventory->amount;
        }
        snapshot.pawns.push_back(std::move(view));
    }

    for (auto entity : entities_.AllBuildings()) {
        const auto& building = entities_.Storage<Building>().Get(entity);
        RenderBuilding view;
        view.id = entity.id();
        if (const auto* pos = entities_.TryGet<Position>(entity)) {
            view.x = pos->coord.x;
            view.y = pos->coord.y;
        }
        view.defId = building.defId;
        if (const auto* def = content_.Buildings().Find(building.defId)) {
            view.name = def->name;
        }
        view.tileSize = building.tileSize;
        view.inUse = building.inUse;
        if (building.inUse) {
            if (const auto* user = entities_.TryGet<Pawn>(building.usedBy)) {
                view.usedByName = user->name;
            }
        }
        if (const auto* resource = entities_.TryGet<Resource>(entity)) {
            view.resourceAmount = resource->current;
        }
        if (const auto* gold = entities_.TryGet<Gold>(entity)) {
            view.gold = gold->amount;
        }
        view.colorIndex = building.colorIndex;
        snapshot.buildings.push_back(std::move(view));
    }

    snapshot.time.tick = time_.CurrentTick();
    snapshot.time.hour = time_.Hour();
    snapshot.time.minute = time_.Minute();
    snapshot.time.day = time_.Day();
    snapshot.time.isNight = time_.IsNight();
    snapshot.time.timeString = time_.TimeString();
    snapshot.time.dayFraction = time_.DayFraction();
    snapshot.themeName = std::string(CurrentThemeName());

    return snapshot;
}

} // namespace tsim::sim
