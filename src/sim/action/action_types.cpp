/// @file action_types.cpp
/// @brief ActionDef factories and derivations.

#include "tsim/sim/action_types.hpp"

#include "tsim/sim/content_types.hpp"

namespace tsim::sim {

std::string_view AnimationName(AnimationType animation) {
    switch (animation) {
        case AnimationType::Idle:     return "Idle";
        case AnimationType::Walk:     return "Walk";
        case AnimationType::Pickaxe:  return "Pickaxe";
        case AnimationType::Axe:      return "Axe";
        case AnimationType::LookUp:   return "LookUp";
        case AnimationType::LookDown: return "LookDown";
    }
    return "Unknown";
}

std::string_view ExpressionName(ExpressionType expression) {
    switch (expression) {
        case ExpressionType::Happy:     return "Happy";
        case ExpressionType::Complaint: return "Complaint";
        case ExpressionType::Thought:   return "Thought";
        case ExpressionType::Question:  return "Question";
        case ExpressionType::Heart:     return "Heart";
    }
    return "Unknown";
}

// ── Factories ───────────────────────────────────────────────────────────

ActionDef ActionDef::Idle(int32_t durationTicks, std::string label) {
    ActionDef action(IdleAction{});
    action.label_ = std::move(label);
    action.durationTicks_ = durationTicks;
    return action;
}

ActionDef ActionDef::MoveTo(TileCoord target, std::string label) {
    ActionDef action(MoveToAction{target});
    action.label_ = std::move(label);
    action.animation_ = AnimationType::Walk;
    return action;
}

ActionDef ActionDef::UseBuilding(tsim::ecs::Entity building, const BuildingDef& def) {
    ActionDef action(UseBuildingAction{building});
    action.label_ = "Going to " + def.name;
    action.durationTicks_ = def.interactionDurationTicks;
    action.satisfiesNeedId_ = def.satisfiesNeedId;
    action.needSatisfactionAmount_ = def.needSatisfactionAmount;
    return action;
}

ActionDef ActionDef::Work(tsim::ecs::Entity building, const BuildingDef& def,
                          std::optional<ContentId> workNeedId) {
    ActionDef action(WorkAction{building});
    action.label_ = "Going to work at " + def.name;
    action.durationTicks_ = def.interactionDurationTicks;
    action.satisfiesNeedId_ = workNeedId;
    action.needSatisfactionAmount_ = def.workSatisfactionAmount;
    action.animation_ = AnimationType::Pickaxe;
    return action;
}

ActionDef ActionDef::PickUp(PickUpSource source, std::string resourceType, float amount,
                            std::string label) {
    const bool fromTerrain = std::holds_alternative<TileCoord>(source);
    ActionDef action(PickUpAction{std::move(source), std::move(resourceType), amount});
    action.label_ = std::move(label);
    action.durationTicks_ = kHaulTransferTicks;
    action.animation_ = fromTerrain ? AnimationType::Axe : AnimationType::LookDown;
    return action;
}

ActionDef ActionDef::DropOff(tsim::ecs::Entity building, const BuildingDef& def,
                             std::string resourceType, float amount, tsim::ecs::Entity source,
                             std::optional<ContentId> workNeedId) {
    ActionDef action(DropOffAction{building, std::move(resourceType), amount, source});
    action.label_ = "Hauling to " + def.name;
    action.durationTicks_ = kHaulTransferTicks;
    action.satisfiesNeedId_ = workNeedId;
    action.needSatisfactionAmount_ = def.workSatisfactionAmount;
    action.animation_ = AnimationType::LookDown;
    return action;
}

// ── Derivation ──────────────────────────────────────────────────────────

ActionDef ActionDef::WithLabel(std::string label) const {
    ActionDef copy = *this;
    copy.label_ = std::move(label);
    return copy;
}

ActionDef ActionDef::WithPriority(ActionPriority priority) const {
    ActionDef copy = *this;
    copy.priority_ = priority;
    return copy;
}

ActionDef ActionDef::WithAnimation(AnimationType animation) const {
    ActionDef copy = *this;
    copy.animation_ = animation;
    return copy;
}

ActionDef ActionDef::WithExpression(ExpressionType expression,
                                    std::optional<ContentId> iconDefId) const {
    ActionDef copy = *this;
    copy.expression_ = expression;
    copy.expressionIconDefId_ = iconDefId;
    return copy;
}

// ── Targets ─────────────────────────────────────────────────────────────

std::optional<tsim::ecs::Entity> ActionDef::TargetBuilding() const {
    if (const auto* use = As<UseBuildingAction>()) {
        return use->building;
    }
    if (const auto* work = As<WorkAction>()) {
        return work->building;
    }
    if (const auto* drop = As<DropOffAction>()) {
        return drop->building;
    }
    if (const auto* pick = As<PickUpAction>()) {
        if (const auto* entity = std::get_if<tsim::ecs::Entity>(&pick->source)) {
            return *entity;
        }
    }
    return std::nullopt;
}

std::optional<TileCoord> ActionDef::TargetCoord() const {
    if (const auto* move = As<MoveToAction>()) {
        return move->target;
    }
    if (const auto* pick = As<PickUpAction>()) {
        if (const auto* coord = std::get_if<TileCoord>(&pick->source)) {
            return *coord;
        }
    }
    return std::nullopt;
}

} // namespace tsim::sim
