#pragma once

/// @file content_types.hpp
/// @brief Read-only content definitions: needs, buffs, terrains, buildings.
///
/// Definitions are plain data owned by a ContentRegistry. Every id field
/// is assigned by the registry's ContentStore on insertion; cross
/// references (need -> debuff, building -> need/buff/terrain) are checked
/// by ContentRegistry::Validate() before a simulation is constructed.

#include "tsim/sim/world_types.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsim::sim {

// ── Need ────────────────────────────────────────────────────────────────

/// A decaying pawn attribute in [0, 100].
struct NeedDef {
    ContentId id = kNoContent;
    std::string name;
    float decayPerTick = 0.05f;
    float criticalThreshold = 20.0f;
    float lowThreshold = 40.0f;
    std::optional<ContentId> criticalDebuffId;
    std::optional<ContentId> lowDebuffId;

    /// Decay is scaled by TimeService::EnergyDecayMultiplier().
    bool usesTimeOfDayDecay = false;

    /// Satisfied by working rather than by consuming a building.
    bool isWorkNeed = false;
};

// ── Buff ────────────────────────────────────────────────────────────────

/// A mood modifier. `durationTicks == 0` means permanent until removed.
struct BuffDef {
    ContentId id = kNoContent;
    std::string name;
    float moodOffset = 0.0f;
    int32_t durationTicks = 0;
    bool isFromNeed = false;
};

// ── Terrain ─────────────────────────────────────────────────────────────

struct TerrainDef {
    ContentId id = kNoContent;
    std::string name;
    bool walkable = true;
    bool buildable = true;
    bool blocksLight = false;
};

// ── Building ────────────────────────────────────────────────────────────

/// How a pawn produces resources at a workable building.
enum class WorkType : uint8_t {
    Direct,            ///< Work on site; production goes into the store.
    HaulFromBuilding,  ///< Carry resources from another building.
    HaulFromTerrain    ///< Harvest from a terrain tile and carry here.
};

/// A use-area offset relative to the building anchor.
struct TileOffset {
    int32_t dx = 0;
    int32_t dy = 0;
};

/// Cost multiplier applied per building level.
inline constexpr double kCostGrowthPerLevel = 1.15;

/// A stationary, possibly multi-tile entity pawns interact with.
struct BuildingDef {
    ContentId id = kNoContent;
    std::string name;

    // Consumer interaction
    std::optional<ContentId> satisfiesNeedId;
    float needSatisfactionAmount = 30.0f;
    int32_t interactionDurationTicks = 100;
    std::optional<ContentId> grantsBuffId;

    // Footprint; anchor is the top-left tile.
    int32_t tileSize = 1;

    /// Empty means "every tile Manhattan-adjacent to the footprint".
    std::vector<TileOffset> useAreas;

    // Resource store
    std::optional<std::string> resourceType;
    float maxResourceAmount = 100.0f;
    float depletionMult = 1.0f;
    float resourcePerUse = 10.0f;

    // Work
    bool canBeWorkedAt = false;
    WorkType workType = WorkType::Direct;
    std::optional<std::string> haulSourceResourceType;
    std::optional<ContentId> haulSourceTerrainId;
    float workProductionAmount = 25.0f;
    float workSatisfactionAmount = 40.0f;
    std::optional<ContentId> workBuffId;

    // Economy
    bool canSellToConsumers = true;
    int32_t baseCost = 10;
    float baseProduction = 1.0f;
    float wholesalePricePerUnit = 0.5f;
    int32_t initialGold = 0;

    /// Price a consumer pays per use at @p level.
    [[nodiscard]] int32_t Cost(int32_t level) const {
        return static_cast<int32_t>(baseCost * std::pow(kCostGrowthPerLevel, level));
    }

    /// Wage the building pays a worker per completed job at @p level.
    [[nodiscard]] int32_t Payout(int32_t level) const {
        return static_cast<int32_t>(static_cast<float>(Cost(level)) * baseProduction);
    }

    /// Amount a worker pays up front to start a job at @p level.
    [[nodiscard]] int32_t WorkBuyIn(int32_t level) const {
        const auto payout = Payout(level);
        return payout > 10 ? payout / 2 : 0;
    }
};

} // namespace tsim::sim
