#pragma once

/// @file sim_context.hpp
/// @brief Per-tick context passed to every system.

#include "tsim/sim/content_registry.hpp"
#include "tsim/sim/diversity_map.hpp"
#include "tsim/sim/entity_store.hpp"
#include "tsim/sim/time_service.hpp"
#include "tsim/sim/world_grid.hpp"

#include <cstdint>
#include <random>

namespace tsim::sim {

/// References to the state of one simulation. Systems receive it by
/// reference in Execute() and keep nothing from it between ticks.
struct SimContext {
    EntityStore& entities;
    WorldGrid& world;
    const ContentRegistry& content;
    const TimeService& time;
    const DiversityMap& diversity;

    /// The simulation's only random source.
    std::mt19937& random;

    [[nodiscard]] Tick Now() const noexcept { return time.CurrentTick(); }

    /// Uniform integer in [lo, hi].
    [[nodiscard]] int32_t RandomInt(int32_t lo, int32_t hi) {
        std::uniform_int_distribution<int32_t> dist(lo, hi);
        return dist(random);
    }
};

} // namespace tsim::sim
