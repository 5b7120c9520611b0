#pragma once

/// @file ai_system.hpp
/// @brief AISystem: utility-scored decisions for idle pawns.
///
/// A pawn with nothing current and nothing queued walks its unsatisfied
/// needs from most to least urgent. Consumer needs look for a building
/// that sells the need; work needs look for a building that wants
/// labor. The first need with a reachable target queues its actions.
/// With no target at all the pawn wanders toward visually varied
/// ground and idles there for a while.

#include "tsim/ecs/entity.hpp"
#include "tsim/ecs/system_scheduler.hpp"
#include "tsim/sim/action_types.hpp"
#include "tsim/sim/components.hpp"
#include "tsim/sim/content_types.hpp"

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsim::sim {

struct SimContext;
class WorldGrid;

/// Needs at or above this value are not acted on.
inline constexpr float kNeedSatisfiedThreshold = 80.0f;

/// Urgency bonus for needs below their critical and low thresholds.
inline constexpr float kCriticalUrgencyBonus = 50.0f;
inline constexpr float kLowUrgencyBonus = 20.0f;

// ── Scoring weights ─────────────────────────────────────────────────────

inline constexpr float kDistanceWeight = 1.0f;
inline constexpr float kOwnAttachmentWeight = 2.0f;
inline constexpr float kOthersAttachmentWeight = 0.5f;
inline constexpr float kConvergingPenalty = 5.0f;
inline constexpr float kWorkUrgencyWeight = 20.0f;

/// Buildings fuller than this do not ask for work.
inline constexpr float kWorkFillThreshold = 0.8f;

/// Workers that may already be heading to a building before it is
/// considered taken.
inline constexpr int32_t kMaxConvergingWorkers = 1;

// ── Wander ──────────────────────────────────────────────────────────────

inline constexpr int32_t kWanderRandomSamples = 5;
inline constexpr int32_t kWanderMinDistance = 1;
inline constexpr int32_t kWanderMaxDistance = 3;
inline constexpr int32_t kWanderBaseIdleTicks = 30;
inline constexpr int32_t kWanderIdleTicksPerDiversity = 5;
inline constexpr int32_t kWanderMaxIdleTicks = 60;

class AISystem final : public tsim::ecs::ISystem {
public:
    void Execute(SimContext& ctx) override;

    [[nodiscard]] tsim::ecs::SystemStage GetStage() const override {
        return tsim::ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "AISystem"; }

private:
    /// Queue a consumer building for @p need. @return true if queued.
    bool tryConsume(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                    TileCoord from, const NeedDef& need);

    /// Queue a work job for @p need. @return true if queued.
    bool tryWork(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                 TileCoord from, const NeedDef& need);

    /// Queue a delivery of leftover cargo to a store that takes it.
    /// @return true if queued.
    bool tryDeliverCargo(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                         TileCoord from, const NeedDef& need);

    /// Queue a wander move and a diversity-scaled idle.
    void wander(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp, TileCoord from);

    /// Distance, attachment and convergence terms shared by both scores.
    [[nodiscard]] static float placementScore(const SimContext& ctx, tsim::ecs::Entity pawn,
                                              tsim::ecs::Entity building, TileCoord from,
                                              TileCoord anchor);

    /// Tiles of @p terrainId in row-major order. The cache is dropped
    /// whenever the world revision moves.
    const std::vector<TileCoord>& terrainTiles(const WorldGrid& world, ContentId terrainId);

    std::unordered_map<ContentId, std::vector<TileCoord>> terrainTiles_;
    uint64_t terrainRevision_ = 0;
    bool terrainCached_ = false;
};

} // namespace tsim::sim
