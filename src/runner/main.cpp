/// @file main.cpp
/// @brief Headless simulation runner.
///
/// Loads a YAML configuration, builds a simulation on the stock content
/// and runs it for a fixed number of ticks, printing one summary line per
/// in-game hour and a pawn table at the end.
///
/// Usage: tilesim_runner [--config <path>] [--ticks <n>] [--version]

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include "tsim/foundation/config_manager.hpp"
#include "tsim/foundation/game_logger.hpp"
#include "tsim/sim/components.hpp"
#include "tsim/sim/content_registry.hpp"
#include "tsim/sim/sim_config.hpp"
#include "tsim/sim/simulation.hpp"
#include "tsim/sim/time_service.hpp"
#include "tsim/version.hpp"

namespace {

/// One in-game day.
constexpr int64_t kDefaultTicks = tsim::sim::TimeService::kTicksPerDay;

struct RunnerArgs {
    std::filesystem::path configPath;
    int64_t ticks = kDefaultTicks;
    bool valid = true;
    bool showVersion = false;
};

RunnerArgs parseArgs(int argc, char* argv[]) {
    RunnerArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue) {
            args.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--ticks" && hasValue) {
            char* end = nullptr;
            const char* text = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            args.ticks = std::strtoll(text, &end, 10);
            if (end == text || *end != '\0' || args.ticks < 0) {
                std::cerr << "Invalid --ticks value: " << text << "\n";
                args.valid = false;
            }
        } else if (arg == "--version") {
            args.showVersion = true;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            args.valid = false;
        }
    }

    // Environment variable override, same as the config file flag.
    if (args.configPath.empty()) {
        if (const char* envPath = std::getenv("TSIM_CONFIG_PATH")) {
            args.configPath = envPath;
        }
    }
    return args;
}

/// Apply `logging.level` (trace, debug, info, warning, error, off).
bool applyLogLevel(const tsim::foundation::ConfigManager& config) {
    auto level = config.getOr<std::string>("logging.level", "info");
    if (!level) {
        return false;
    }

    const auto parsed = tsim::foundation::parseLogLevel(level.value());
    if (!parsed) {
        return false;
    }

    tsim::foundation::GameLogger::instance().setAllCategoryLevels(*parsed);
    return true;
}

float averageMood(const tsim::sim::Simulation& sim) {
    const auto pawns = sim.Entities().AllPawns();
    if (pawns.empty()) {
        return 0.0f;
    }
    float total = 0.0f;
    for (auto pawn : pawns) {
        if (const auto* mood = sim.Entities().TryGet<tsim::sim::Mood>(pawn)) {
            total += mood->value;
        }
    }
    return total / static_cast<float>(pawns.size());
}

void printPawnTable(const tsim::sim::Simulation& sim) {
    const auto snapshot = sim.CreateRenderSnapshot();

    std::printf("%-4s %-10s %-10s %6s %6s  %s\n", "id", "name", "tile", "mood", "gold", "action");
    for (const auto& pawn : snapshot.pawns) {
        const auto tile = tsim::sim::ToString(tsim::sim::TileCoord{pawn.x, pawn.y});
        std::printf("%-4u %-10s %-10s %6.1f %6d  %s\n", pawn.id, pawn.name.c_str(), tile.c_str(),
                    static_cast<double>(pawn.mood), pawn.gold,
                    pawn.currentAction.value_or("-").c_str());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const auto args = parseArgs(argc, argv);
    if (!args.valid) {
        std::cerr << "Usage: tilesim_runner [--config <path>] [--ticks <n>] [--version]\n";
        return EXIT_FAILURE;
    }
    if (args.showVersion) {
        std::cout << "tilesim_runner " << tsim::Version::string << "\n";
        return EXIT_SUCCESS;
    }

    tsim::foundation::ConfigManager config;
    if (!args.configPath.empty()) {
        auto loadResult = config.load(args.configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    if (!applyLogLevel(config)) {
        std::cerr << "Invalid logging.level in config\n";
        return EXIT_FAILURE;
    }

    auto content = tsim::sim::MakeDefaultContent();
    if (!content) {
        std::cerr << "Failed to build content: " << content.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto simConfig = tsim::sim::loadSimulationConfig(config, content.value());
    if (!simConfig) {
        std::cerr << "Invalid simulation config: " << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto created = tsim::sim::Simulation::Create(content.value(), std::move(simConfig).value());
    if (!created) {
        std::cerr << "Failed to create simulation: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto& sim = *created.value();

    std::cout << "tilesim " << tsim::Version::string << " started (seed: " << sim.Seed()
              << ", ticks: " << args.ticks << ", pawns: " << sim.Entities().AllPawns().size() << ")\n";

    for (int64_t i = 0; i < args.ticks; ++i) {
        sim.Tick();
        if (sim.Time().CurrentTick() % tsim::sim::TimeService::kTicksPerHour == 0) {
            std::printf("%s  avg mood %6.1f\n", sim.Time().TimeString().c_str(),
                        static_cast<double>(averageMood(sim)));
        }
    }

    std::cout << "\nFinal state at " << sim.Time().TimeString() << "\n";
    printPawnTable(sim);

    if (auto flushed = tsim::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
