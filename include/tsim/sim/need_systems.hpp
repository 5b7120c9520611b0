#pragma once

/// @file need_systems.hpp
/// @brief Need decay, proximity social gain, buff expiry and mood.
///
/// Per tick the scheduler runs NeedsSystem and SocialSystem in
/// PreUpdate, then BuffSystem and MoodSystem in Update ahead of the
/// ActionSystem.

#include "tsim/ecs/system_scheduler.hpp"
#include "tsim/sim/components.hpp"
#include "tsim/sim/content_registry.hpp"

#include <string_view>

namespace tsim::sim {

struct SimContext;

/// Radius (Manhattan) within which pawns count as company.
inline constexpr int32_t kSocialRadius = 2;

/// Social need gained per nearby pawn per tick.
inline constexpr float kSocialGainPerNeighbor = 0.05f;

/// Name of the need the SocialSystem feeds.
inline constexpr std::string_view kSocialNeedName = "Social";

/// Bring the need-sourced debuffs of one need in line with @p value.
///
/// At most one of the critical or low debuff stays active. Re-applying
/// the debuff that is already active keeps its start tick.
void ReconcileNeedDebuffs(Buffs& buffs, const NeedDef& need, float value, Tick now,
                          const ContentRegistry& content);

/// Decays every need of every pawn and reconciles need debuffs.
class NeedsSystem final : public tsim::ecs::ISystem {
public:
    void Execute(SimContext& ctx) override;

    [[nodiscard]] tsim::ecs::SystemStage GetStage() const override {
        return tsim::ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "NeedsSystem"; }
};

/// Raises the Social need of pawns with company nearby.
class SocialSystem final : public tsim::ecs::ISystem {
public:
    void Execute(SimContext& ctx) override;

    [[nodiscard]] tsim::ecs::SystemStage GetStage() const override {
        return tsim::ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "SocialSystem"; }
};

/// Drops timed buffs whose end tick has passed.
class BuffSystem final : public tsim::ecs::ISystem {
public:
    void Execute(SimContext& ctx) override;

    [[nodiscard]] std::string_view GetName() const override { return "BuffSystem"; }
};

/// Recomputes mood from active buffs.
class MoodSystem final : public tsim::ecs::ISystem {
public:
    void Execute(SimContext& ctx) override;

    [[nodiscard]] std::string_view GetName() const override { return "MoodSystem"; }
};

} // namespace tsim::sim
