#pragma once

/// @file action_types.hpp
/// @brief Immutable action definitions and the per-pawn action state.
///
/// An ActionDef is a value: relabeling or re-prioritizing an action
/// produces a new ActionDef that replaces the pawn's current slot.

#include "tsim/ecs/entity.hpp"
#include "tsim/sim/world_types.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tsim::sim {

struct BuildingDef;

// ── Presentation hints ──────────────────────────────────────────────────

enum class AnimationType : uint8_t { Idle, Walk, Pickaxe, Axe, LookUp, LookDown };

/// Speech-bubble style shown above a pawn.
enum class ExpressionType : uint8_t { Happy, Complaint, Thought, Question, Heart };

/// Movement priority used when two pawns block each other.
enum class ActionPriority : uint8_t {
    Normal,
    Wander  ///< Yields to any blocker that is not itself wandering.
};

[[nodiscard]] std::string_view AnimationName(AnimationType animation);
[[nodiscard]] std::string_view ExpressionName(ExpressionType expression);

/// Ticks spent loading or unloading one haul.
inline constexpr int32_t kHaulTransferTicks = 30;

// ── Action kinds ────────────────────────────────────────────────────────

struct IdleAction {};

struct MoveToAction {
    TileCoord target;
};

struct UseBuildingAction {
    tsim::ecs::Entity building;
};

struct WorkAction {
    tsim::ecs::Entity building;
};

/// A building's resource store or a terrain harvest tile.
using PickUpSource = std::variant<tsim::ecs::Entity, TileCoord>;

struct PickUpAction {
    PickUpSource source;
    std::string resourceType;
    float amount = 0.0f;
};

struct DropOffAction {
    tsim::ecs::Entity building;
    std::string resourceType;
    float amount = 0.0f;

    /// Building the load was taken from; pays nothing when invalid.
    tsim::ecs::Entity source;
};

using ActionKind = std::variant<IdleAction, MoveToAction, UseBuildingAction,
                                WorkAction, PickUpAction, DropOffAction>;

// ── ActionDef ───────────────────────────────────────────────────────────

/// Immutable description of one step a pawn performs.
class ActionDef {
public:
    // ── Factories ───────────────────────────────────────────────────

    [[nodiscard]] static ActionDef Idle(int32_t durationTicks, std::string label = "Idle");
    [[nodiscard]] static ActionDef MoveTo(TileCoord target, std::string label);

    /// "Going to {name}", duration and need taken from @p def.
    [[nodiscard]] static ActionDef UseBuilding(tsim::ecs::Entity building, const BuildingDef& def);

    /// "Going to work at {name}", satisfies the work need on completion.
    [[nodiscard]] static ActionDef Work(tsim::ecs::Entity building, const BuildingDef& def,
                                        std::optional<ContentId> workNeedId);

    [[nodiscard]] static ActionDef PickUp(PickUpSource source, std::string resourceType,
                                          float amount, std::string label);

    [[nodiscard]] static ActionDef DropOff(tsim::ecs::Entity building, const BuildingDef& def,
                                           std::string resourceType, float amount,
                                           tsim::ecs::Entity source,
                                           std::optional<ContentId> workNeedId);

    // ── Derivation ──────────────────────────────────────────────────

    [[nodiscard]] ActionDef WithLabel(std::string label) const;
    [[nodiscard]] ActionDef WithPriority(ActionPriority priority) const;
    [[nodiscard]] ActionDef WithAnimation(AnimationType animation) const;
    [[nodiscard]] ActionDef WithExpression(ExpressionType expression,
                                           std::optional<ContentId> iconDefId) const;

    // ── Accessors ───────────────────────────────────────────────────

    [[nodiscard]] const ActionKind& Kind() const noexcept { return kind_; }

    template <typename T>
    [[nodiscard]] const T* As() const noexcept {
        return std::get_if<T>(&kind_);
    }

    template <typename T>
    [[nodiscard]] bool Is() const noexcept {
        return std::holds_alternative<T>(kind_);
    }

    [[nodiscard]] const std::string& Label() const noexcept { return label_; }
    [[nodiscard]] int32_t DurationTicks() const noexcept { return durationTicks_; }
    [[nodiscard]] std::optional<ContentId> SatisfiesNeedId() const noexcept {
        return satisfiesNeedId_;
    }
    [[nodiscard]] float NeedSatisfactionAmount() const noexcept { return needSatisfactionAmount_; }
    [[nodiscard]] ActionPriority Priority() const noexcept { return priority_; }
    [[nodiscard]] AnimationType Animation() const noexcept { return animation_; }
    [[nodiscard]] std::optional<ExpressionType> Expression() const noexcept { return expression_; }
    [[nodiscard]] std::optional<ContentId> ExpressionIconDefId() const noexcept {
        return expressionIconDefId_;
    }

    /// Building this action interacts with, if any.
    [[nodiscard]] std::optional<tsim::ecs::Entity> TargetBuilding() const;

    /// Destination tile for MoveTo and terrain PickUp.
    [[nodiscard]] std::optional<TileCoord> TargetCoord() const;

private:
    explicit ActionDef(ActionKind kind) : kind_(std::move(kind)) {}

    ActionKind kind_;
    std::string label_;
    int32_t durationTicks_ = 0;
    std::optional<ContentId> satisfiesNeedId_;
    float needSatisfactionAmount_ = 0.0f;
    ActionPriority priority_ = ActionPriority::Normal;
    AnimationType animation_ = AnimationType::Idle;
    std::optional<ExpressionType> expression_;
    std::optional<ContentId> expressionIconDefId_;
};

// ── ActionComponent ─────────────────────────────────────────────────────

/// Per-pawn action state: the current action, a FIFO of pending actions
/// and movement/blocking bookkeeping for the current action.
struct ActionComponent {
    std::optional<ActionDef> current;
    std::deque<ActionDef> queue;
    Tick startTick = 0;
    std::optional<std::vector<TileCoord>> path;
    std::size_t pathIndex = 0;
    Tick blockedSinceTick = -1;
    Tick waitUntilTick = -1;

    /// No current action and nothing queued.
    [[nodiscard]] bool IsIdle() const noexcept { return !current && queue.empty(); }

    /// Make @p action current, starting at @p now.
    void Begin(ActionDef action, Tick now) {
        current = std::move(action);
        startTick = now;
        ResetMovement();
    }

    /// Drop the current action only.
    void Cancel() {
        current.reset();
        ResetMovement();
    }

    /// Drop the current action and every queued follow-up.
    void Abort() {
        Cancel();
        queue.clear();
    }

    void ResetMovement() {
        path.reset();
        pathIndex = 0;
        blockedSinceTick = -1;
        waitUntilTick = -1;
    }
};

} // namespace tsim::sim
