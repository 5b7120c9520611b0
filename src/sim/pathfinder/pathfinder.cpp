/// @file pathfinder.cpp
/// @brief A* search with a stable (f, discovery sequence) frontier.

#include "tsim/sim/pathfinder.hpp"

#include <algorithm>
#include <cstdint>
#include <queue>
#include <unordered_map>

namespace tsim::sim {

namespace {

struct NodeRec {
    TileCoord coord;
    int32_t g = 0;
    int32_t f = 0;
    uint64_t seq = 0;
};

/// Min-heap order: lowest f first, then earliest discovery.
struct FrontierOrder {
    bool operator()(const NodeRec& a, const NodeRec& b) const noexcept {
        if (a.f != b.f) {
            return a.f > b.f;
        }
        return a.seq > b.seq;
    }
};

constexpr TileCoord kSteps[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

std::vector<TileCoord> reconstruct(TileCoord start, TileCoord goal,
                                   const std::unordered_map<TileCoord, TileCoord>& parent) {
    std::vector<TileCoord> path;
    TileCoord cur = goal;
    while (cur != start) {
        path.push_back(cur);
        cur = parent.at(cur);
    }
    path.push_back(start);
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

std::optional<std::vector<TileCoord>> FindPath(const WorldGrid& world,
                                               TileCoord start,
                                               TileCoord goal,
                                               const TileSet& blocked,
                                               std::size_t maxExpanded) {
    if (start == goal) {
        return std::vector<TileCoord>{start};
    }
    if (!world.IsWalkable(goal)) {
        return std::nullopt;
    }

    std::priority_queue<NodeRec, std::vector<NodeRec>, FrontierOrder> open;
    std::unordered_map<TileCoord, int32_t> gScore;
    std::unordered_map<TileCoord, TileCoord> parent;
    uint64_t nextSeq = 0;

    gScore[start] = 0;
    open.push({start, 0, ManhattanDistance(start, goal), nextSeq++});

    std::size_t expanded = 0;
    while (!open.empty()) {
        const NodeRec cur = open.top();
        open.pop();

        // Stale entry superseded by a cheaper discovery.
        if (cur.g > gScore[cur.coord]) {
            continue;
        }
        if (cur.coord == goal) {
            return reconstruct(start, goal, parent);
        }
        if (++expanded > maxExpanded) {
            break;
        }

        for (const auto& step : kSteps) {
            const TileCoord next{cur.coord.x + step.x, cur.coord.y + step.y};
            if (!world.IsWalkable(next)) {
                continue;
            }
            if (next != goal && blocked.contains(next)) {
                continue;
            }

            const int32_t tentative = cur.g + 1;
            auto it = gScore.find(next);
            if (it == gScore.end() || tentative < it->second) {
                gScore[next] = tentative;
                parent[next] = cur.coord;
                open.push({next, tentative, tentative + ManhattanDistance(next, goal), nextSeq++});
            }
        }
    }

    return std::nullopt;
}

} // namespace tsim::sim
