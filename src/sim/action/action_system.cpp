/// @file action_system.cpp
/// @brief ActionSystem implementation.
///
/// Movement is time based: the expected path index is the elapsed action
/// time divided by kMoveTicksPerTile, and the pawn steps one tile whenever
/// it lags behind. A pawn blocked by another pawn waits a random number of
/// ticks before repathing so that two pawns blocking each other do not
/// retry in lockstep.

#include "tsim/sim/action_system.hpp"

#include "tsim/foundation/game_logger.hpp"
#include "tsim/sim/building_queries.hpp"
#include "tsim/sim/economy.hpp"
#include "tsim/sim/pathfinder.hpp"
#include "tsim/sim/sim_context.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tsim::sim {

using tsim::ecs::Entity;
using tsim::foundation::LogCategory;
using tsim::foundation::LogContext;
using tsim::foundation::LogLevel;

namespace {

LogContext actionLogContext(const SimContext& ctx, Entity pawn) {
    LogContext logCtx;
    logCtx.entityId = pawn.id();
    logCtx.tick = ctx.Now();
    logCtx.system = "ActionSystem";
    return logCtx;
}

bool isWandering(const ActionComponent* comp) {
    return comp != nullptr && comp->current && comp->current->Priority() == ActionPriority::Wander;
}

} // namespace

// ── Dispatch ────────────────────────────────────────────────────────────

void ActionSystem::Execute(SimContext& ctx) {
    const auto now = ctx.Now();

    for (auto pawn : ctx.entities.AllPawns()) {
        auto* comp = ctx.entities.TryGet<ActionComponent>(pawn);
        auto* pos = ctx.entities.TryGet<Position>(pawn);
        if (comp == nullptr || pos == nullptr) {
            continue;
        }

        if (!comp->current) {
            if (comp->queue.empty()) {
                continue;
            }
            auto next = std::move(comp->queue.front());
            comp->queue.pop_front();
            comp->Begin(std::move(next), now);
        }

        // Handlers may replace the current slot, so work on a copy.
        const ActionDef action = *comp->current;

        if (const auto* move = action.As<MoveToAction>()) {
            executeMoveTo(ctx, pawn, *comp, *pos, *move);
        } else if (action.Is<IdleAction>()) {
            executeIdle(ctx, *comp);
        } else if (const auto* use = action.As<UseBuildingAction>()) {
            executeUseBuilding(ctx, pawn, *comp, *pos, *use);
        } else if (const auto* work = action.As<WorkAction>()) {
            executeWork(ctx, pawn, *comp, *pos, *work);
        } else if (const auto* pick = action.As<PickUpAction>()) {
            executePickUp(ctx, pawn, *comp, *pos, *pick);
        } else if (const auto* drop = action.As<DropOffAction>()) {
            executeDropOff(ctx, pawn, *comp, *pos, *drop);
        }
    }
}

// ── MoveTo ──────────────────────────────────────────────────────────────

void ActionSystem::executeMoveTo(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                 Position& pos, const MoveToAction& move) {
    const auto now = ctx.Now();
    const auto target = move.target;

    if (pos.coord == target) {
        comp.Cancel();
        return;
    }

    if (!comp.path) {
        auto path = FindPath(ctx.world, pos.coord, target, ctx.entities.OccupiedTiles(pawn));
        if (!path) {
            fail(ctx, pawn, comp, "no path to " + ToString(target));
            return;
        }
        comp.path = std::move(*path);
        comp.pathIndex = 0;
    }

    const auto& path = *comp.path;
    const auto elapsed = static_cast<std::size_t>(std::max<Tick>(0, now - comp.startTick));
    const auto expected = std::min(elapsed / kMoveTicksPerTile, path.size() - 1);

    if (expected > comp.pathIndex) {
        const auto next = path[comp.pathIndex + 1];

        // The world changed under the path (terrain painted, building placed).
        if (!ctx.world.IsWalkable(next)) {
            auto repath = FindPath(ctx.world, pos.coord, target, ctx.entities.OccupiedTiles(pawn));
            if (!repath) {
                fail(ctx, pawn, comp, "path to " + ToString(target) + " no longer exists");
                return;
            }
            comp.path = std::move(*repath);
            comp.pathIndex = 0;
            comp.startTick = now;
            comp.blockedSinceTick = -1;
            comp.waitUntilTick = -1;
            return;
        }

        if (const auto blocker = ctx.entities.PawnAt(next, pawn)) {
            if (comp.blockedSinceTick < 0) {
                comp.blockedSinceTick = now;
            }
            if (now - comp.blockedSinceTick >= kMaxBlockedTicks) {
                fail(ctx, pawn, comp, "blocked for too long");
                return;
            }

            if (isWandering(&comp) && !isWandering(ctx.entities.TryGet<ActionComponent>(*blocker))) {
                auto logCtx = actionLogContext(ctx, pawn);
                logCtx.extra["blocker"] = std::to_string(blocker->id());
                TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Actions, "wandering pawn yields",
                             logCtx);
                comp.Cancel();
                return;
            }

            if (comp.waitUntilTick < 0) {
                comp.waitUntilTick =
                    now + ctx.RandomInt(kMinBlockedWaitTicks, kMaxBlockedWaitTicks);
                return;
            }
            if (now < comp.waitUntilTick) {
                return;
            }

            comp.waitUntilTick = -1;
            if (auto detour = FindPath(ctx.world, pos.coord, target,
                                       ctx.entities.OccupiedTiles(pawn))) {
                comp.path = std::move(*detour);
                comp.pathIndex = 0;
                comp.startTick = now;
                comp.blockedSinceTick = -1;
            }
            return;
        }

        comp.blockedSinceTick = -1;
        comp.waitUntilTick = -1;
        ++comp.pathIndex;
        pos.coord = path[comp.pathIndex];
    }

    if (pos.coord == target) {
        comp.Cancel();
    }
}

// ── Idle ────────────────────────────────────────────────────────────────

void ActionSystem::executeIdle(SimContext& ctx, ActionComponent& comp) {
    if (ctx.Now() - comp.startTick >= comp.current->DurationTicks()) {
        comp.Cancel();
    }
}

// ── UseBuilding ─────────────────────────────────────────────────────────

void ActionSystem::executeUseBuilding(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                      const Position& pos, const UseBuildingAction& use) {
    BuildingTarget target;
    if (!resolveTarget(ctx, pawn, comp, use.building, target) ||
        !ensurePositioned(ctx, pawn, comp, pos, target) ||
        !claim(ctx, pawn, comp, target, "Using")) {
        return;
    }

    const ActionDef action = *comp.current;
    if (ctx.Now() - comp.startTick < action.DurationTicks()) {
        return;
    }

    const auto& def = *target.def;
    auto* resource = ctx.entities.TryGet<Resource>(target.entity);
    const bool available = IsResourceAvailable(resource, def);
    const int32_t cost = def.Cost(target.building->level);
    const bool fundsOk = CanAfford(ctx.entities, pawn, cost);
    const bool success = available && fundsOk;

    if (success) {
        if (resource != nullptr && resource->depletionMult != 0.0f) {
            resource->current = std::max(0.0f, resource->current - ResourceCostPerUse(*resource, def));
        }
        // Affordability was checked above; the transfer cannot fail.
        [[maybe_unused]] const bool paid = TransferGold(ctx.entities, pawn, target.entity, cost);
        grantBenefits(ctx, pawn, action, target, BuffSource::Building, def.grantsBuffId);
    } else {
        auto logCtx = actionLogContext(ctx, pawn);
        logCtx.extra["building"] = def.name;
        TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Economy,
                     available ? "use denied: cannot afford" : "use denied: out of stock", logCtx);
    }

    finishInteraction(ctx, pawn, comp, target, success);
}

// ── Work ────────────────────────────────────────────────────────────────

void ActionSystem::executeWork(SimContext& ctx, Entity pawn, ActionComponent& comp,
                               const Position& pos, const WorkAction& work) {
    BuildingTarget target;
    if (!resolveTarget(ctx, pawn, comp, work.building, target) ||
        !ensurePositioned(ctx, pawn, comp, pos, target) ||
        !claim(ctx, pawn, comp, target, "Working at")) {
        return;
    }

    const ActionDef action = *comp.current;
    if (ctx.Now() - comp.startTick < action.DurationTicks()) {
        return;
    }

    const auto& def = *target.def;
    const auto level = target.building->level;
    const int32_t buyIn = def.WorkBuyIn(level);
    const int32_t payout = def.Payout(level);

    const bool fundsOk = CanAfford(ctx.entities, pawn, buyIn) &&
                         GoldOf(ctx.entities, target.entity) + std::max(buyIn, 0) >= payout;

    if (fundsOk) {
        [[maybe_unused]] const bool paidIn = TransferGold(ctx.entities, pawn, target.entity, buyIn);
        [[maybe_unused]] const bool paidOut =
            TransferGold(ctx.entities, target.entity, pawn, payout);

        if (auto* resource = ctx.entities.TryGet<Resource>(target.entity)) {
            resource->current = std::min(resource->max, resource->current + def.workProductionAmount);
        }
        grantBenefits(ctx, pawn, action, target, BuffSource::Work, def.workBuffId);
    } else {
        auto logCtx = actionLogContext(ctx, pawn);
        logCtx.extra["building"] = def.name;
        logCtx.extra["buy_in"] = std::to_string(buyIn);
        logCtx.extra["payout"] = std::to_string(payout);
        TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Economy, "work denied: insufficient gold",
                     logCtx);
    }

    finishInteraction(ctx, pawn, comp, target, fundsOk);
}

// ── PickUp ──────────────────────────────────────────────────────────────

void ActionSystem::executePickUp(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                 const Position& pos, const PickUpAction& pick) {
    BuildingTarget source;
    const auto* sourceEntity = std::get_if<Entity>(&pick.source);
    const auto* sourceTile = std::get_if<TileCoord>(&pick.source);

    if (sourceEntity != nullptr) {
        if (!resolveTarget(ctx, pawn, comp, *sourceEntity, source) ||
            !ensurePositioned(ctx, pawn, comp, pos, source)) {
            return;
        }
    } else if (!ensureNearTile(ctx, pawn, comp, pos, *sourceTile)) {
        return;
    }

    if (ctx.Now() - comp.startTick < comp.current->DurationTicks()) {
        return;
    }

    auto* inventory = ctx.entities.TryGet<Inventory>(pawn);
    Resource* store = sourceEntity != nullptr ? ctx.entities.TryGet<Resource>(*sourceEntity) : nullptr;

    float available = std::numeric_limits<float>::infinity();
    if (sourceEntity != nullptr) {
        available = (store != nullptr && store->type == pick.resourceType) ? store->current : 0.0f;
    }

    float transferred = 0.0f;
    if (inventory != nullptr && inventory->Accepts(pick.resourceType)) {
        transferred = std::max(0.0f, std::min({pick.amount, available, inventory->Headroom()}));
    }

    if (transferred <= 0.0f) {
        std::optional<ContentId> icon;
        if (source.def != nullptr) {
            icon = source.def->id;
        } else if (sourceTile != nullptr) {
            icon = ctx.world.TileAt(*sourceTile).terrainId;
        }
        fail(ctx, pawn, comp, "nothing to pick up", icon);
        return;
    }

    if (store != nullptr) {
        store->current -= transferred;
    }
    inventory->resourceType = pick.resourceType;
    inventory->amount += transferred;
    comp.Cancel();
}

// ── DropOff ─────────────────────────────────────────────────────────────

void ActionSystem::executeDropOff(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                  const Position& pos, const DropOffAction& drop) {
    BuildingTarget target;
    if (!resolveTarget(ctx, pawn, comp, drop.building, target) ||
        !ensurePositioned(ctx, pawn, comp, pos, target) ||
        !claim(ctx, pawn, comp, target, "Delivering to")) {
        return;
    }

    const ActionDef action = *comp.current;
    if (ctx.Now() - comp.startTick < action.DurationTicks()) {
        return;
    }

    const auto& def = *target.def;
    auto* inventory = ctx.entities.TryGet<Inventory>(pawn);
    auto* store = ctx.entities.TryGet<Resource>(target.entity);

    float transferred = 0.0f;
    if (inventory != nullptr && store != nullptr && inventory->resourceType == drop.resourceType &&
        store->type == drop.resourceType) {
        transferred = std::max(0.0f, std::min({drop.amount, inventory->amount, store->Headroom()}));
    }

    bool payoutOk = false;
    if (transferred > 0.0f) {
        store->current += transferred;
        inventory->amount -= transferred;
        if (inventory->amount <= 0.0f) {
            inventory->amount = 0.0f;
            inventory->resourceType.reset();
        }

        const auto wholesale =
            static_cast<int32_t>(std::floor(transferred * def.wholesalePricePerUnit));
        if (drop.source.isValid() && ctx.entities.IsAlive(drop.source) &&
            !TransferGold(ctx.entities, target.entity, drop.source, wholesale)) {
            auto logCtx = actionLogContext(ctx, pawn);
            logCtx.extra["building"] = def.name;
            logCtx.extra["wholesale"] = std::to_string(wholesale);
            TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Economy, "wholesale payment skipped",
                         logCtx);
        }

        payoutOk = TransferGold(ctx.entities, target.entity, pawn,
                                def.Payout(target.building->level));
    }

    const bool success = transferred > 0.0f && payoutOk;
    if (success) {
        grantBenefits(ctx, pawn, action, target, BuffSource::Work, def.workBuffId);
    }

    finishInteraction(ctx, pawn, comp, target, success);
}

// ── Shared steps ────────────────────────────────────────────────────────

bool ActionSystem::resolveTarget(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                 Entity entity, BuildingTarget& out) {
    auto* building = ctx.entities.IsAlive(entity) ? ctx.entities.TryGet<Building>(entity) : nullptr;
    const auto* pos = ctx.entities.TryGet<Position>(entity);
    const auto* def = building != nullptr ? ctx.content.Buildings().Find(building->defId) : nullptr;

    if (building == nullptr || pos == nullptr || def == nullptr) {
        fail(ctx, pawn, comp, "target building is gone");
        return false;
    }

    out.entity = entity;
    out.building = building;
    out.anchor = pos->coord;
    out.def = def;
    return true;
}

bool ActionSystem::ensurePositioned(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                    const Position& pos, const BuildingTarget& target) {
    if (IsInUseArea(pos.coord, target.anchor, *target.def)) {
        return true;
    }

    auto route = FindUseAreaRoute(ctx.world, ctx.entities, pawn, pos.coord, target.anchor,
                                  *target.def);
    if (!route) {
        fail(ctx, pawn, comp, "no reachable use area at " + target.def->name);
        return false;
    }

    comp.queue.push_front(*comp.current);
    comp.Begin(ActionDef::MoveTo(route->tile, "Going to " + target.def->name), ctx.Now());
    comp.path = std::move(route->path);
    return false;
}

bool ActionSystem::ensureNearTile(SimContext& ctx, Entity pawn, ActionComponent& comp,
                                  const Position& pos, TileCoord coord) {
    if (ManhattanDistance(pos.coord, coord) <= 1) {
        return true;
    }

    const auto blocked = ctx.entities.OccupiedTiles(pawn);
    std::optional<std::vector<TileCoord>> route;
    TileCoord destination = coord;

    if (ctx.world.IsWalkable(coord) && !blocked.contains(coord)) {
        route = FindPath(ctx.world, pos.coord, coord, blocked);
    } else {
        std::vector<TileCoord> adjacent = {
            {coord.x + 1, coord.y}, {coord.x - 1, coord.y},
            {coord.x, coord.y + 1}, {coord.x, coord.y - 1}};
        std::stable_sort(adjacent.begin(), adjacent.end(),
                         [&pos](const TileCoord& a, const TileCoord& b) {
                             return ManhattanDistance(pos.coord, a) < ManhattanDistance(pos.coord, b);
                         });
        for (const auto& tile : adjacent) {
            if (!ctx.world.IsWalkable(tile) || blocked.contains(tile)) {
                continue;
            }
            if ((route = FindPath(ctx.world, pos.coord, tile, blocked))) {
                destination = tile;
                break;
            }
        }
    }

    if (!route) {
        fail(ctx, pawn, comp, "harvest tile " + ToString(coord) + " is unreachable");
        return false;
    }

    comp.queue.push_front(*comp.current);
    comp.Begin(ActionDef::MoveTo(destination, comp.current->Label()), ctx.Now());
    comp.path = std::move(*route);
    return false;
}

bool ActionSystem::claim(SimContext& ctx, Entity pawn, ActionComponent& comp,
                         const BuildingTarget& target, std::string_view verb) {
    auto& building = *target.building;
    if (building.inUse && building.usedBy == pawn) {
        return true;
    }
    if (building.inUse) {
        fail(ctx, pawn, comp, target.def->name + " is in use", target.def->id);
        return false;
    }

    building.inUse = true;
    building.usedBy = pawn;
    comp.current = comp.current->WithLabel(std::string(verb) + " " + target.def->name);
    return true;
}

void ActionSystem::grantBenefits(SimContext& ctx, Entity pawn, const ActionDef& action,
                                 const BuildingTarget& target, BuffSource buffSource,
                                 std::optional<ContentId> buffId) {
    if (const auto needId = action.SatisfiesNeedId()) {
        if (auto* needs = ctx.entities.TryGet<Needs>(pawn)) {
            if (auto it = needs->values.find(*needId); it != needs->values.end()) {
                it->second = ClampNeed(it->second + action.NeedSatisfactionAmount());
            }
        }
    }

    if (buffId) {
        const auto* buffDef = ctx.content.Buffs().Find(*buffId);
        auto* buffs = ctx.entities.TryGet<Buffs>(pawn);
        if (buffDef != nullptr && buffs != nullptr) {
            const auto now = ctx.Now();
            BuffInstance instance;
            instance.source = buffSource;
            instance.sourceId = target.def->id;
            instance.buffDefId = buffDef->id;
            instance.moodOffset = buffDef->moodOffset;
            instance.startTick = now;
            instance.endTick = buffDef->durationTicks > 0 ? now + buffDef->durationTicks : -1;
            buffs->Apply(instance);
        }
    }

    if (auto* attachment = ctx.entities.TryGet<Attachment>(target.entity)) {
        attachment->Increment(pawn);
    }
}

void ActionSystem::finishInteraction(SimContext& /*ctx*/, Entity pawn, ActionComponent& comp,
                                     const BuildingTarget& target, bool success) {
    auto& building = *target.building;
    if (building.usedBy == pawn) {
        building.inUse = false;
        building.usedBy = Entity::invalid();
    }

    comp.Cancel();
    comp.queue.push_front(
        ActionDef::Idle(kTerminalIdleTicks, success ? "Satisfied" : "Disappointed")
            .WithExpression(success ? ExpressionType::Happy : ExpressionType::Complaint,
                            target.def->id));
}

void ActionSystem::fail(SimContext& ctx, Entity pawn, ActionComponent& comp,
                        std::string_view reason, std::optional<ContentId> complaintIcon) {
    auto logCtx = actionLogContext(ctx, pawn);
    if (comp.current) {
        logCtx.extra["action"] = comp.current->Label();
    }
    TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Actions,
                 "action aborted: " + std::string(reason), logCtx);

    comp.Abort();
    if (complaintIcon) {
        comp.queue.push_back(ActionDef::Idle(kTerminalIdleTicks, "Annoyed")
                                 .WithExpression(ExpressionType::Complaint, complaintIcon));
    }
}

} // namespace tsim::sim
