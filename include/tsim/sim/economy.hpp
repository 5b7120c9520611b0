#pragma once

/// @file economy.hpp
/// @brief Integer gold transfers between entities.

#include "tsim/ecs/entity.hpp"
#include "tsim/sim/entity_store.hpp"

#include <cstdint>

namespace tsim::sim {

/// Gold held by @p entity; 0 without a Gold component.
[[nodiscard]] int32_t GoldOf(const EntityStore& entities, tsim::ecs::Entity entity);

/// True if @p entity holds at least @p amount gold. Amounts <= 0 are
/// always affordable.
[[nodiscard]] bool CanAfford(const EntityStore& entities, tsim::ecs::Entity entity, int32_t amount);

/// Move exactly @p amount gold from @p payer to @p payee, or nothing.
///
/// Fails (returns false, no change) when either side lacks a Gold
/// component or the payer cannot afford it. Amounts <= 0 succeed without
/// touching any balance.
bool TransferGold(EntityStore& entities, tsim::ecs::Entity payer, tsim::ecs::Entity payee,
                  int32_t amount);

} // namespace tsim::sim
