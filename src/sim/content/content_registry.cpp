/// @file content_registry.cpp
/// @brief ContentRegistry cross-reference validation.

#include "tsim/sim/content_registry.hpp"

#include "tsim/foundation/game_logger.hpp"

namespace tsim::sim {

using tsim::foundation::ErrorCode;
using tsim::foundation::GameError;
using tsim::foundation::GameResult;
using tsim::foundation::LogCategory;

namespace {

GameResult<void> fail(ErrorCode code, std::string message) {
    TSIM_LOG_ERROR(LogCategory::Content, message);
    return GameResult<void>::err(GameError(code, std::move(message)));
}

bool inPercentRange(float value) {
    return value >= 0.0f && value <= 100.0f;
}

} // namespace

GameResult<void> ContentRegistry::Validate() const {
    if (defaultTerrainId_ != kNoContent && !terrains_.Contains(defaultTerrainId_)) {
        return fail(ErrorCode::UnknownTerrain,
                    "default terrain id " + std::to_string(defaultTerrainId_) +
                        " is not registered");
    }

    // ── Needs ───────────────────────────────────────────────────────
    for (const auto& need : needs_) {
        if (!inPercentRange(need.criticalThreshold) || !inPercentRange(need.lowThreshold)) {
            return fail(ErrorCode::InvalidContentReference,
                        "need '" + need.name + "' has a threshold outside [0, 100]");
        }
        if (need.criticalDebuffId && !buffs_.Contains(*need.criticalDebuffId)) {
            return fail(ErrorCode::UnknownBuff,
                        "need '" + need.name + "' references unknown critical debuff " +
                            std::to_string(*need.criticalDebuffId));
        }
        if (need.lowDebuffId && !buffs_.Contains(*need.lowDebuffId)) {
            return fail(ErrorCode::UnknownBuff,
                        "need '" + need.name + "' references unknown low debuff " +
                            std::to_string(*need.lowDebuffId));
        }
    }

    // ── Buildings ───────────────────────────────────────────────────
    for (const auto& building : buildings_) {
        const std::string prefix = "building '" + building.name + "' ";

        if (building.tileSize <= 0) {
            return fail(ErrorCode::InvalidContentReference, prefix + "has a non-positive tile size");
        }
        if (building.satisfiesNeedId && !needs_.Contains(*building.satisfiesNeedId)) {
            return fail(ErrorCode::UnknownNeed,
                        prefix + "satisfies unknown need " +
                            std::to_string(*building.satisfiesNeedId));
        }
        if (building.grantsBuffId && !buffs_.Contains(*building.grantsBuffId)) {
            return fail(ErrorCode::UnknownBuff,
                        prefix + "grants unknown buff " + std::to_string(*building.grantsBuffId));
        }
        if (building.workBuffId && !buffs_.Contains(*building.workBuffId)) {
            return fail(ErrorCode::UnknownBuff,
                        prefix + "grants unknown work buff " +
                            std::to_string(*building.workBuffId));
        }
        if (building.haulSourceTerrainId && !terrains_.Contains(*building.haulSourceTerrainId)) {
            return fail(ErrorCode::UnknownTerrain,
                        prefix + "hauls from unknown terrain " +
                            std::to_string(*building.haulSourceTerrainId));
        }
        if (building.maxResourceAmount < 0.0f || building.depletionMult < 0.0f) {
            return fail(ErrorCode::InvalidContentReference,
                        prefix + "has a negative resource setting");
        }

        if (!building.canBeWorkedAt) {
            continue;
        }
        if (!building.resourceType) {
            return fail(ErrorCode::InvalidContentReference,
                        prefix + "is workable but has no resource store");
        }
        if (building.workType == WorkType::HaulFromBuilding && !building.haulSourceResourceType) {
            return fail(ErrorCode::InvalidContentReference,
                        prefix + "hauls from buildings but names no source resource");
        }
        if (building.workType == WorkType::HaulFromTerrain && !building.haulSourceTerrainId) {
            return fail(ErrorCode::InvalidContentReference,
                        prefix + "hauls from terrain but names no source terrain");
        }
    }

    return GameResult<void>::ok();
}

} // namespace tsim::sim
