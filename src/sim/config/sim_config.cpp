/// @file sim_config.cpp
/// @brief SimulationConfig loading from ConfigManager.

#include "tsim/sim/sim_config.hpp"

#include "tsim/foundation/game_logger.hpp"

#include <string>
#include <utility>

namespace tsim::sim {

using tsim::foundation::ConfigManager;
using tsim::foundation::ErrorCode;
using tsim::foundation::GameError;
using tsim::foundation::GameResult;
using tsim::foundation::LogCategory;

namespace {

/// Overwrite @p target with the value at @p key when present.
template <typename T>
GameResult<void> readOptional(const ConfigManager& config, std::string_view key, T& target) {
    auto value = config.getOr<T>(key, target);
    if (value.hasError()) {
        return GameResult<void>::err(value.error());
    }
    target = std::move(value).value();
    return GameResult<void>::ok();
}

GameError invalid(const std::string& message) {
    return GameError(ErrorCode::InvalidConfig, message);
}

GameResult<BuildingPlacement> parseBuilding(const YAML::Node& node, std::size_t index,
                                            const ContentRegistry& content) {
    const auto where = "buildings[" + std::to_string(index) + "]";
    if (!node.IsMap() || !node["def"] || !node["x"] || !node["y"]) {
        return GameResult<BuildingPlacement>::err(invalid(where + " needs def, x and y"));
    }

    try {
        const auto name = node["def"].as<std::string>();
        const auto defId = content.Buildings().IdOf(name);
        if (!defId) {
            return GameResult<BuildingPlacement>::err(
                GameError(ErrorCode::UnknownBuilding, where + ": unknown building '" + name + "'"));
        }

        BuildingPlacement placement;
        placement.defId = *defId;
        placement.anchor = {node["x"].as<int32_t>(), node["y"].as<int32_t>()};
        if (node["color"]) {
            placement.colorIndex = node["color"].as<int32_t>();
        }
        return GameResult<BuildingPlacement>::ok(placement);
    } catch (const YAML::Exception& e) {
        return GameResult<BuildingPlacement>::err(invalid(where + ": " + e.what()));
    }
}

GameResult<PawnConfig> parsePawn(const YAML::Node& node, std::size_t index,
                                 const ContentRegistry& content) {
    const auto where = "pawns[" + std::to_string(index) + "]";
    if (!node.IsMap() || !node["name"] || !node["x"] || !node["y"]) {
        return GameResult<PawnConfig>::err(invalid(where + " needs name, x and y"));
    }

    try {
        PawnConfig pawn;
        pawn.name = node["name"].as<std::string>();
        pawn.position = {node["x"].as<int32_t>(), node["y"].as<int32_t>()};
        if (node["age"]) {
            pawn.age = node["age"].as<int32_t>();
        }
        if (node["gold"]) {
            pawn.gold = node["gold"].as<int32_t>();
        }

        if (const auto needs = node["needs"]) {
            if (!needs.IsMap()) {
                return GameResult<PawnConfig>::err(invalid(where + ".needs must be a map"));
            }
            for (auto it = needs.begin(); it != needs.end(); ++it) {
                const auto needName = it->first.as<std::string>();
                const auto needId = content.Needs().IdOf(needName);
                if (!needId) {
                    return GameResult<PawnConfig>::err(GameError(
                        ErrorCode::UnknownNeed, where + ": unknown need '" + needName + "'"));
                }
                pawn.needs[*needId] = it->second.as<float>();
            }
        }
        return GameResult<PawnConfig>::ok(std::move(pawn));
    } catch (const YAML::Exception& e) {
        return GameResult<PawnConfig>::err(invalid(where + ": " + e.what()));
    }
}

GameResult<SimulationConfig> loadImpl(const ConfigManager& config,
                                      const ContentRegistry& content) {
    SimulationConfig result;

    for (auto step : {readOptional(config, "simulation.seed", result.seed),
                      readOptional(config, "simulation.start_hour", result.startHour),
                      readOptional(config, "simulation.skip_default_bootstrap",
                                   result.skipDefaultBootstrap),
                      readOptional(config, "simulation.palette_size", result.paletteSize),
                      readOptional(config, "simulation.enable_themes", result.enableThemes),
                      readOptional(config, "world.min_x", result.bounds.minX),
                      readOptional(config, "world.max_x", result.bounds.maxX),
                      readOptional(config, "world.min_y", result.bounds.minY),
                      readOptional(config, "world.max_y", result.bounds.maxY)}) {
        if (step.hasError()) {
            return GameResult<SimulationConfig>::err(step.error());
        }
    }

    if (config.hasKey("buildings")) {
        const auto buildings = config.node("buildings").value();
        if (!buildings.IsSequence()) {
            return GameResult<SimulationConfig>::err(invalid("buildings must be a sequence"));
        }
        for (std::size_t i = 0; i < buildings.size(); ++i) {
            auto placement = parseBuilding(buildings[i], i, content);
            if (placement.hasError()) {
                return GameResult<SimulationConfig>::err(placement.error());
            }
            result.buildings.push_back(placement.value());
        }
    }

    if (config.hasKey("pawns")) {
        const auto pawns = config.node("pawns").value();
        if (!pawns.IsSequence()) {
            return GameResult<SimulationConfig>::err(invalid("pawns must be a sequence"));
        }
        for (std::size_t i = 0; i < pawns.size(); ++i) {
            auto pawn = parsePawn(pawns[i], i, content);
            if (pawn.hasError()) {
                return GameResult<SimulationConfig>::err(pawn.error());
            }
            result.pawns.push_back(std::move(pawn).value());
        }
    }

    return GameResult<SimulationConfig>::ok(std::move(result));
}

} // namespace

GameResult<SimulationConfig> loadSimulationConfig(const ConfigManager& config,
                                                  const ContentRegistry& content) {
    auto result = loadImpl(config, content);
    if (result.hasError()) {
        TSIM_LOG_ERROR(LogCategory::Config,
                       "invalid simulation config: " + std::string(result.error().message()));
    }
    return result;
}

} // namespace tsim::sim
