/// @file diversity_map.cpp
/// @brief DiversityMap implementation.

#include "tsim/sim/diversity_map.hpp"

#include <algorithm>
#include <utility>

namespace tsim::sim {

void DiversityMap::Rebuild(const WorldGrid& world) {
    bounds_ = world.Bounds();
    values_.assign(static_cast<std::size_t>(bounds_.Width()) * bounds_.Height(), 0);

    std::vector<std::pair<ContentId, int32_t>> signatures;
    signatures.reserve(9);

    for (int32_t y = bounds_.minY; y <= bounds_.maxY; ++y) {
        for (int32_t x = bounds_.minX; x <= bounds_.maxX; ++x) {
            signatures.clear();
            for (int32_t dy = -1; dy <= 1; ++dy) {
                for (int32_t dx = -1; dx <= 1; ++dx) {
                    const TileCoord n{x + dx, y + dy};
                    if (!bounds_.Contains(n)) {
                        continue;
                    }
                    const auto& tile = world.TileAt(n);
                    const std::pair<ContentId, int32_t> sig{tile.terrainId, tile.colorIndex};
                    if (std::find(signatures.begin(), signatures.end(), sig) == signatures.end()) {
                        signatures.push_back(sig);
                    }
                }
            }
            const auto idx = static_cast<std::size_t>(y - bounds_.minY) * bounds_.Width() +
                             static_cast<std::size_t>(x - bounds_.minX);
            values_[idx] = static_cast<int32_t>(signatures.size()) - 1;
        }
    }

    builtRevision_ = world.Revision();
    built_ = true;
}

bool DiversityMap::RefreshIfStale(const WorldGrid& world) {
    if (built_ && builtRevision_ == world.Revision() && bounds_ == world.Bounds()) {
        return false;
    }
    Rebuild(world);
    return true;
}

int32_t DiversityMap::ValueAt(TileCoord coord) const noexcept {
    if (!built_ || !bounds_.Contains(coord)) {
        return 0;
    }
    const auto idx = static_cast<std::size_t>(coord.y - bounds_.minY) * bounds_.Width() +
                     static_cast<std::size_t>(coord.x - bounds_.minX);
    return values_[idx];
}

} // namespace tsim::sim
