#pragma once

/// @file sim_config.hpp
/// @brief Simulation construction parameters and their YAML loader.

#include "tsim/foundation/config_manager.hpp"
#include "tsim/foundation/game_result.hpp"
#include "tsim/sim/content_registry.hpp"
#include "tsim/sim/entity_store.hpp"
#include "tsim/sim/time_service.hpp"
#include "tsim/sim/world_types.hpp"

#include <cstdint>
#include <vector>

namespace tsim::sim {

/// Default number of colors in the tile palette.
inline constexpr int32_t kDefaultPaletteSize = 16;

/// A pawn to spawn at construction or through Simulation::CreatePawn().
using PawnConfig = PawnSpec;

/// A building to place at construction.
struct BuildingPlacement {
    ContentId defId = kNoContent;
    TileCoord anchor;
    int32_t colorIndex = 0;
};

struct SimulationConfig {
    uint32_t seed = 0;
    int32_t startHour = TimeService::kDefaultStartHour;
    WorldBounds bounds;
    int32_t paletteSize = kDefaultPaletteSize;

    /// Skip the four stock pawns.
    bool skipDefaultBootstrap = false;

    /// Register the ThemeSystem with the day and night themes.
    bool enableThemes = false;

    std::vector<BuildingPlacement> buildings;
    std::vector<PawnConfig> pawns;
};

/// Build a SimulationConfig from a loaded configuration.
///
/// Recognized keys (all optional):
/// @code
///   simulation:
///     seed: 42
///     start_hour: 8
///     skip_default_bootstrap: false
///     palette_size: 16
///     enable_themes: true
///   world: { min_x: 0, max_x: 19, min_y: 0, max_y: 10 }
///   buildings:
///     - { def: Farm, x: 2, y: 2, color: 3 }
///   pawns:
///     - { name: Casey, age: 30, x: 4, y: 4, gold: 100,
///         needs: { Hunger: 60, Purpose: 40 } }
/// @endcode
///
/// Buildings and needs are referenced by name. An unknown name fails with
/// UnknownBuilding or UnknownNeed; malformed values with InvalidConfig.
[[nodiscard]] tsim::foundation::GameResult<SimulationConfig> loadSimulationConfig(
    const tsim::foundation::ConfigManager& config, const ContentRegistry& content);

} // namespace tsim::sim
