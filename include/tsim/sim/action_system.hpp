#pragma once

/// @file action_system.hpp
/// @brief ActionSystem: per-pawn action state machine.
///
/// Each tick, for every pawn in ascending id order:
///   1. If the pawn has no current action, dequeue the next one.
///   2. Advance the current action by its kind: movement along a path
///      with blocking and deadlock handling, building use, work, and the
///      two hauling legs (PickUp, DropOff).
///
/// Unreachable targets abort the action and its queue. Resource and gold
/// shortfalls deny the benefit but still spend the interaction time and
/// release the building.

#include "tsim/ecs/entity.hpp"
#include "tsim/ecs/system_scheduler.hpp"
#include "tsim/sim/action_types.hpp"
#include "tsim/sim/components.hpp"
#include "tsim/sim/content_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tsim::sim {

struct SimContext;

/// Ticks a pawn spends per path step.
inline constexpr int32_t kMoveTicksPerTile = 10;

/// Blocked movement is abandoned after this many ticks.
inline constexpr Tick kMaxBlockedTicks = 50;

/// Range of the randomized wait before repathing around a blocker.
inline constexpr int32_t kMinBlockedWaitTicks = 5;
inline constexpr int32_t kMaxBlockedWaitTicks = 20;

/// Length of the expression idle that closes an interaction.
inline constexpr int32_t kTerminalIdleTicks = 20;

class ActionSystem final : public tsim::ecs::ISystem {
public:
    void Execute(SimContext& ctx) override;

    [[nodiscard]] tsim::ecs::SystemStage GetStage() const override {
        return tsim::ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override { return "ActionSystem"; }

private:
    /// Resolved target of a building interaction.
    struct BuildingTarget {
        tsim::ecs::Entity entity;
        Building* building = nullptr;
        TileCoord anchor;
        const BuildingDef* def = nullptr;
    };

    void executeMoveTo(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                       Position& pos, const MoveToAction& move);
    void executeIdle(SimContext& ctx, ActionComponent& comp);
    void executeUseBuilding(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                            const Position& pos, const UseBuildingAction& use);
    void executeWork(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                     const Position& pos, const WorkAction& work);
    void executePickUp(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                       const Position& pos, const PickUpAction& pick);
    void executeDropOff(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                        const Position& pos, const DropOffAction& drop);

    /// Look up a live building target; aborts the pawn's actions on a miss.
    [[nodiscard]] bool resolveTarget(SimContext& ctx, tsim::ecs::Entity pawn,
                                     ActionComponent& comp, tsim::ecs::Entity entity,
                                     BuildingTarget& out);

    /// True when the pawn stands in a use area. Otherwise pushes the
    /// current action back and starts a move there, or aborts.
    [[nodiscard]] bool ensurePositioned(SimContext& ctx, tsim::ecs::Entity pawn,
                                        ActionComponent& comp, const Position& pos,
                                        const BuildingTarget& target);

    /// Same for terrain PickUp: within one tile of @p coord.
    [[nodiscard]] bool ensureNearTile(SimContext& ctx, tsim::ecs::Entity pawn,
                                      ActionComponent& comp, const Position& pos,
                                      TileCoord coord);

    /// Mark the building in use by @p pawn and relabel the action once.
    /// A building held by another pawn aborts with a complaint.
    [[nodiscard]] bool claim(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                             const BuildingTarget& target, std::string_view verb);

    /// Satisfy a need, apply a buff and bump attachment.
    void grantBenefits(SimContext& ctx, tsim::ecs::Entity pawn, const ActionDef& action,
                       const BuildingTarget& target, BuffSource buffSource,
                       std::optional<ContentId> buffId);

    /// Release the building, end the action and queue the expression idle.
    void finishInteraction(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
                           const BuildingTarget& target, bool success);

    /// Abort the action and queue, optionally leaving a complaint.
    void fail(SimContext& ctx, tsim::ecs::Entity pawn, ActionComponent& comp,
              std::string_view reason, std::optional<ContentId> complaintIcon = std::nullopt);
};

} // namespace tsim::sim
