/// @file economy.cpp
/// @brief Gold transfer implementation.

#include "tsim/sim/economy.hpp"

#include "tsim/foundation/game_logger.hpp"

namespace tsim::sim {

using tsim::ecs::Entity;
using tsim::foundation::LogCategory;

int32_t GoldOf(const EntityStore& entities, Entity entity) {
    const auto* gold = entities.TryGet<Gold>(entity);
    return gold != nullptr ? gold->amount : 0;
}

bool CanAfford(const EntityStore& entities, Entity entity, int32_t amount) {
    if (amount <= 0) {
        return true;
    }
    return GoldOf(entities, entity) >= amount;
}

bool TransferGold(EntityStore& entities, Entity payer, Entity payee, int32_t amount) {
    if (amount <= 0) {
        return true;
    }

    auto* from = entities.TryGet<Gold>(payer);
    auto* to = entities.TryGet<Gold>(payee);
    if (from == nullptr || to == nullptr) {
        return false;
    }
    if (from->amount < amount) {
        TSIM_LOG_DEBUG(LogCategory::Economy,
                       "entity " + std::to_string(payer.id()) + " cannot pay " +
                           std::to_string(amount) + " gold (has " +
                           std::to_string(from->amount) + ")");
        return false;
    }

    from->amount -= amount;
    to->amount += amount;
    return true;
}

} // namespace tsim::sim
