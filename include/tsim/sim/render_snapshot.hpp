#pragma once

/// @file render_snapshot.hpp
/// @brief Read-only view of the simulation for presentation layers.
///
/// A snapshot is a plain value detached from the simulation: it holds
/// copies, never references, so it stays valid after further ticks.

#include "tsim/sim/action_types.hpp"
#include "tsim/sim/content_types.hpp"
#include "tsim/sim/world_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsim::sim {

struct RenderPawn {
    uint32_t id = 0;
    int32_t x = 0;
    int32_t y = 0;
    float mood = 0.0f;
    std::string name;
    std::optional<std::string> currentAction;
    AnimationType animation = AnimationType::Idle;
    std::optional<ExpressionType> expression;
    std::optional<ContentId> expressionIconDefId;
    std::optional<TileCoord> targetTile;
    std::vector<TileCoord> currentPath;
    std::size_t pathIndex = 0;
    int32_t gold = 0;
    std::optional<std::string> carriedResource;
    float carriedAmount = 0.0f;
};

struct RenderBuilding {
    uint32_t id = 0;
    int32_t x = 0;
    int32_t y = 0;
    ContentId defId = kNoContent;
    std::string name;
    int32_t tileSize = 1;
    bool inUse = false;
    std::optional<std::string> usedByName;
    std::optional<float> resourceAmount;
    int32_t gold = 0;
    int32_t colorIndex = 0;
};

struct RenderTime {
    Tick tick = 0;
    int32_t hour = 0;
    int32_t minute = 0;
    int64_t day = 1;
    bool isNight = false;
    std::string timeString;
    double dayFraction = 0.0;
};

struct RenderSnapshot {
    std::vector<RenderPawn> pawns;
    std::vector<RenderBuilding> buildings;
    RenderTime time;

    /// Name of the active theme, empty when themes are off.
    std::string themeName;
};

} // namespace tsim::sim
