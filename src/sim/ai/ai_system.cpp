/// @file ai_system.cpp
/// @brief AISystem implementation.

#include "tsim/sim/ai_system.hpp"

#include "tsim/foundation/game_logger.hpp"
#include "tsim/sim/building_queries.hpp"
#include "tsim/sim/economy.hpp"
#include "tsim/sim/sim_context.hpp"
#include "tsim/sim/world_grid.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>
#include <vector>

namespace tsim::sim {

using tsim::ecs::Entity;
using tsim::foundation::LogCategory;
using tsim::foundation::LogContext;
using tsim::foundation::LogLevel;

namespace {

struct NeedCandidate {
    ContentId needId;
    float urgency;
};

struct ScoredBuilding {
    Entity entity;
    float score;
};

/// Highest score first, lower id on ties.
void sortByScore(std::vector<ScoredBuilding>& scored) {
    std::sort(scored.begin(), scored.end(), [](const ScoredBuilding& a, const ScoredBuilding& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.entity < b.entity;
    });
}

void logDecision(const SimContext& ctx, Entity pawn, const std::string& message) {
    LogContext logCtx;
    logCtx.entityId = pawn.id();
    logCtx.tick = ctx.Now();
    logCtx.system = "AISystem";
    TSIM_LOG_CTX(LogLevel::Trace, LogCategory::AI, message, logCtx);
}

/// Nearest other building that stocks @p type, ties by id.
std::optional<Entity> findHaulSourceBuilding(const SimContext& ctx, Entity destination,
                                             TileCoord from, const std::string& type) {
    std::optional<Entity> best;
    int32_t bestDistance = std::numeric_limits<int32_t>::max();

    for (auto building : ctx.entities.AllBuildings()) {
        if (building == destination) {
            continue;
        }
        const auto* resource = ctx.entities.TryGet<Resource>(building);
        const auto* pos = ctx.entities.TryGet<Position>(building);
        if (resource == nullptr || pos == nullptr || resource->type != type ||
            resource->current <= 0.0f) {
            continue;
        }
        const auto distance = ManhattanDistance(from, pos->coord);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = building;
        }
    }
    return best;
}

/// Nearest of @p tiles to @p from; the first one wins ties.
std::optional<TileCoord> nearestTile(const std::vector<TileCoord>& tiles, TileCoord from) {
    std::optional<TileCoord> best;
    int32_t bestDistance = std::numeric_limits<int32_t>::max();

    for (const auto& coord : tiles) {
        const auto distance = ManhattanDistance(from, coord);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = coord;
        }
    }
    return best;
}

} // namespace

// ── Decision loop ───────────────────────────────────────────────────────

void AISystem::Execute(SimContext& ctx) {
    for (auto pawn : ctx.entities.AllPawns()) {
        const auto* needs = ctx.entities.TryGet<Needs>(pawn);
        auto* comp = ctx.entities.TryGet<ActionComponent>(pawn);
        const auto* pos = ctx.entities.TryGet<Position>(pawn);
        if (needs == nullptr || comp == nullptr || pos == nullptr || !comp->IsIdle()) {
            continue;
        }

        std::vector<NeedCandidate> candidates;
        for (const auto& [needId, value] : needs->values) {
            const auto* def = ctx.content.Needs().Find(needId);
            if (def == nullptr || value >= kNeedSatisfiedThreshold) {
                continue;
            }
            float urgency = value;
            if (value < def->criticalThreshold) {
                urgency -= kCriticalUrgencyBonus;
            } else if (value < def->lowThreshold) {
                urgency -= kLowUrgencyBonus;
            }
            candidates.push_back({needId, urgency});
        }
        std::sort(candidates.begin(), candidates.end(),
                  [](const NeedCandidate& a, const NeedCandidate& b) {
                      if (a.urgency != b.urgency) {
                          return a.urgency < b.urgency;
                      }
                      return a.needId < b.needId;
                  });

        bool queued = false;
        for (const auto& candidate : candidates) {
            const auto& need = *ctx.content.Needs().Find(candidate.needId);
            queued = need.isWorkNeed ? tryWork(ctx, pawn, *comp, pos->coord, need)
                                     : tryConsume(ctx, pawn, *comp, pos->coord, need);
            if (queued) {
                break;
            }
        }

        if (!queued) {
            wander(ctx, pawn, *comp, pos->coord);
        }
    }
}

// ── Scoring ─────────────────────────────────────────────────────────────

float AISystem::placementScore(const SimContext& ctx, Entity pawn, Entity building,
                               TileCoord from, TileCoord anchor) {
    float score = -static_cast<float>(ManhattanDistance(from, anchor)) * kDistanceWeight;

    if (const auto* attachment = ctx.entities.TryGet<Attachment>(building)) {
        score += static_cast<float>(attachment->Of(pawn)) * kOwnAttachmentWeight;
        score -= static_cast<float>(attachment->OthersThan(pawn)) * kOthersAttachmentWeight;
    }

    score -= static_cast<float>(CountConvergingPawns(ctx.entities, building, pawn)) *
             kConvergingPenalty;
    return score;
}

// ── Consumer needs ──────────────────────────────────────────────────────

bool AISystem::tryConsume(SimContext& ctx, Entity pawn, ActionComponent& comp, TileCoord from,
                          const NeedDef& need) {
    std::vector<ScoredBuilding> scored;

    for (auto entity : ctx.entities.AllBuildings()) {
        const auto* building = ctx.entities.TryGet<Building>(entity);
        const auto* pos = ctx.entities.TryGet<Position>(entity);
        const auto* def = building != nullptr ? ctx.content.Buildings().Find(building->defId)
                                              : nullptr;
        if (def == nullptr || pos == nullptr || def->satisfiesNeedId != need.id ||
            !def->canSellToConsumers || building->inUse) {
            continue;
        }
        if (!IsResourceAvailable(ctx.entities.TryGet<Resource>(entity), *def)) {
            continue;
        }
        if (!CanAfford(ctx.entities, pawn, def->Cost(building->level))) {
            continue;
        }
        scored.push_back({entity, placementScore(ctx, pawn, entity, from, pos->coord)});
    }

    sortByScore(scored);

    for (const auto& candidate : scored) {
        const auto& anchor = ctx.entities.TryGet<Position>(candidate.entity)->coord;
        const auto& def =
            *ctx.content.Buildings().Find(ctx.entities.TryGet<Building>(candidate.entity)->defId);
        if (!FindUseAreaRoute(ctx.world, ctx.entities, pawn, from, anchor, def)) {
            continue;
        }

        comp.queue.push_back(ActionDef::UseBuilding(candidate.entity, def));
        logDecision(ctx, pawn, need.name + " -> " + def.name + " #" +
                                   std::to_string(candidate.entity.id()));
        return true;
    }
    return false;
}

// ── Work needs ──────────────────────────────────────────────────────────

bool AISystem::tryWork(SimContext& ctx, Entity pawn, ActionComponent& comp, TileCoord from,
                       const NeedDef& need) {
    if (tryDeliverCargo(ctx, pawn, comp, from, need)) {
        return true;
    }

    std::vector<ScoredBuilding> scored;

    for (auto entity : ctx.entities.AllBuildings()) {
        const auto* building = ctx.entities.TryGet<Building>(entity);
        const auto* pos = ctx.entities.TryGet<Position>(entity);
        const auto* resource = ctx.entities.TryGet<Resource>(entity);
        const auto* def = building != nullptr ? ctx.content.Buildings().Find(building->defId)
                                              : nullptr;
        if (def == nullptr || pos == nullptr || resource == nullptr || !def->canBeWorkedAt) {
            continue;
        }
        const float fill = resource->Fill();
        if (fill >= kWorkFillThreshold) {
            continue;
        }
        if (CountConvergingPawns(ctx.entities, entity, pawn) >= kMaxConvergingWorkers) {
            continue;
        }
        if (!CanAfford(ctx.entities, pawn, def->WorkBuyIn(building->level))) {
            continue;
        }
        const float score =
            (1.0f - fill) * kWorkUrgencyWeight + placementScore(ctx, pawn, entity, from, pos->coord);
        scored.push_back({entity, score});
    }

    sortByScore(scored);

    for (const auto& candidate : scored) {
        const auto& anchor = ctx.entities.TryGet<Position>(candidate.entity)->coord;
        const auto& def =
            *ctx.content.Buildings().Find(ctx.entities.TryGet<Building>(candidate.entity)->defId);
        if (!FindUseAreaRoute(ctx.world, ctx.entities, pawn, from, anchor, def)) {
            continue;
        }

        if (def.workType == WorkType::Direct) {
            comp.queue.push_back(ActionDef::Work(candidate.entity, def, need.id));
            logDecision(ctx, pawn, "work at " + def.name + " #" +
                                       std::to_string(candidate.entity.id()));
            return true;
        }

        const auto* destination = ctx.entities.TryGet<Resource>(candidate.entity);
        const auto* inventory = ctx.entities.TryGet<Inventory>(pawn);
        if (inventory == nullptr || !inventory->Accepts(destination->type)) {
            continue;
        }
        const float amount = std::min(inventory->capacity, destination->Headroom());
        if (amount <= 0.0f) {
            continue;
        }

        if (def.workType == WorkType::HaulFromBuilding) {
            if (!def.haulSourceResourceType) {
                continue;
            }
            const auto source =
                findHaulSourceBuilding(ctx, candidate.entity, from, *def.haulSourceResourceType);
            if (!source) {
                continue;
            }
            const auto* sourceDef = ctx.content.Buildings().Find(
                ctx.entities.TryGet<Building>(*source)->defId);
            comp.queue.push_back(ActionDef::PickUp(*source, destination->type, amount,
                                                   "Collecting at " + sourceDef->name));
            comp.queue.push_back(ActionDef::DropOff(candidate.entity, def, destination->type,
                                                    amount, *source, need.id));
            logDecision(ctx, pawn, "haul " + destination->type + " from #" +
                                       std::to_string(source->id()) + " to " + def.name);
            return true;
        }

        if (!def.haulSourceTerrainId) {
            continue;
        }
        const auto tile = nearestTile(terrainTiles(ctx.world, *def.haulSourceTerrainId), from);
        if (!tile) {
            continue;
        }
        comp.queue.push_back(
            ActionDef::PickUp(*tile, destination->type, amount, "Gathering " + destination->type));
        comp.queue.push_back(ActionDef::DropOff(candidate.entity, def, destination->type, amount,
                                                Entity::invalid(), need.id));
        logDecision(ctx, pawn, "gather " + destination->type + " at " + ToString(*tile) +
                                   " for " + def.name);
        return true;
    }
    return false;
}

bool AISystem::tryDeliverCargo(SimContext& ctx, Entity pawn, ActionComponent& comp,
                               TileCoord from, const NeedDef& need) {
    const auto* inventory = ctx.entities.TryGet<Inventory>(pawn);
    if (inventory == nullptr || inventory->IsEmpty() || inventory->amount <= 0.0f) {
        return false;
    }
    const auto& type = *inventory->resourceType;

    std::vector<ScoredBuilding> scored;
    for (auto entity : ctx.entities.AllBuildings()) {
        const auto* building = ctx.entities.TryGet<Building>(entity);
        const auto* pos = ctx.entities.TryGet<Position>(entity);
        const auto* resource = ctx.entities.TryGet<Resource>(entity);
        const auto* def = building != nullptr ? ctx.content.Buildings().Find(building->defId)
                                              : nullptr;
        if (def == nullptr || pos == nullptr || resource == nullptr || !def->canBeWorkedAt ||
            def->workType == WorkType::Direct || building->inUse) {
            continue;
        }
        if (resource->type != type || resource->Headroom() <= 0.0f) {
            continue;
        }
        if (CountConvergingPawns(ctx.entities, entity, pawn) >= kMaxConvergingWorkers) {
            continue;
        }
        scored.push_back({entity, placementScore(ctx, pawn, entity, from, pos->coord)});
    }

    sortByScore(scored);

    for (const auto& candidate : scored) {
        const auto& anchor = ctx.entities.TryGet<Position>(candidate.entity)->coord;
        const auto& def =
            *ctx.content.Buildings().Find(ctx.entities.TryGet<Building>(candidate.entity)->defId);
        if (!FindUseAreaRoute(ctx.world, ctx.entities, pawn, from, anchor, def)) {
            continue;
        }

        const auto* store = ctx.entities.TryGet<Resource>(candidate.entity);
        const float amount = std::min(inventory->amount, store->Headroom());
        comp.queue.push_back(ActionDef::DropOff(candidate.entity, def, type, amount,
                                                Entity::invalid(), need.id));
        logDecision(ctx, pawn, "deliver leftover " + type + " to " + def.name + " #" +
                                   std::to_string(candidate.entity.id()));
        return true;
    }
    return false;
}

const std::vector<TileCoord>& AISystem::terrainTiles(const WorldGrid& world, ContentId terrainId) {
    if (!terrainCached_ || terrainRevision_ != world.Revision()) {
        terrainTiles_.clear();
        terrainRevision_ = world.Revision();
        terrainCached_ = true;
    }

    auto [it, inserted] = terrainTiles_.try_emplace(terrainId);
    if (inserted) {
        const auto& bounds = world.Bounds();
        for (int32_t y = bounds.minY; y <= bounds.maxY; ++y) {
            for (int32_t x = bounds.minX; x <= bounds.maxX; ++x) {
                const TileCoord coord{x, y};
                if (world.TileAt(coord).terrainId == terrainId) {
                    it->second.push_back(coord);
                }
            }
        }
    }
    return it->second;
}

// ── Wander ──────────────────────────────────────────────────────────────

void AISystem::wander(SimContext& ctx, Entity pawn, ActionComponent& comp, TileCoord from) {
    static constexpr TileOffset kDirections[] = {
        {0, -1}, {1, -1}, {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}};

    const auto& bounds = ctx.world.Bounds();
    std::vector<TileCoord> samples;
    samples.reserve(kWanderRandomSamples + std::size(kDirections));

    for (int32_t i = 0; i < kWanderRandomSamples; ++i) {
        const auto x = ctx.RandomInt(bounds.minX, bounds.maxX);
        const auto y = ctx.RandomInt(bounds.minY, bounds.maxY);
        samples.push_back({x, y});
    }
    for (const auto& dir : kDirections) {
        const auto distance = ctx.RandomInt(kWanderMinDistance, kWanderMaxDistance);
        samples.push_back({from.x + dir.dx * distance, from.y + dir.dy * distance});
    }

    const auto occupied = ctx.entities.OccupiedTiles(pawn);
    std::vector<TileCoord> best;
    int32_t bestDiversity = -1;
    for (const auto& tile : samples) {
        if (tile == from || !ctx.world.IsWalkable(tile) || occupied.contains(tile)) {
            continue;
        }
        const auto diversity = ctx.diversity.ValueAt(tile);
        if (diversity > bestDiversity) {
            bestDiversity = diversity;
            best.clear();
        }
        if (diversity == bestDiversity) {
            best.push_back(tile);
        }
    }

    if (best.empty()) {
        return;
    }

    const auto target = best[static_cast<std::size_t>(
        ctx.RandomInt(0, static_cast<int32_t>(best.size()) - 1))];
    const auto idleTicks = std::min(
        kWanderBaseIdleTicks + kWanderIdleTicksPerDiversity * bestDiversity, kWanderMaxIdleTicks);

    auto idle = ActionDef::Idle(idleTicks);

    const BuffInstance* strongest = nullptr;
    if (const auto* buffs = ctx.entities.TryGet<Buffs>(pawn)) {
        for (const auto& instance : buffs->active) {
            if (strongest == nullptr ||
                std::abs(instance.moodOffset) > std::abs(strongest->moodOffset)) {
                strongest = &instance;
            }
        }
    }

    if (strongest != nullptr && strongest->moodOffset > 0.0f) {
        idle = idle.WithExpression(ExpressionType::Happy, strongest->buffDefId);
    } else if (strongest != nullptr && strongest->moodOffset < 0.0f) {
        idle = idle.WithExpression(ExpressionType::Complaint, strongest->buffDefId);
    } else if (const auto* needs = ctx.entities.TryGet<Needs>(pawn)) {
        std::optional<ContentId> lowest;
        float lowestValue = std::numeric_limits<float>::max();
        for (const auto& [needId, value] : needs->values) {
            const auto* def = ctx.content.Needs().Find(needId);
            if (def != nullptr && value < def->lowThreshold && value < lowestValue) {
                lowestValue = value;
                lowest = needId;
            }
        }
        if (lowest) {
            idle = idle.WithExpression(ExpressionType::Thought, lowest);
        }
    }

    comp.queue.push_back(
        ActionDef::MoveTo(target, "Wandering").WithPriority(ActionPriority::Wander));
    comp.queue.push_back(std::move(idle));
    logDecision(ctx, pawn, "wander to " + ToString(target) + " (diversity " +
                               std::to_string(bestDiversity) + ")");
}

} // namespace tsim::sim
