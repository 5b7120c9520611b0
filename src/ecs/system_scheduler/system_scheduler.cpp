/// @file system_scheduler.cpp
/// @brief System scheduling implementation.
///
/// Provides staged execution with topological ordering via Kahn's
/// algorithm for dependency resolution.  Circular dependencies are
/// detected and reported with the names of the involved systems.

#include "tsim/ecs/system_scheduler.hpp"

#include <algorithm>
#include <queue>
#include <sstream>
#include <unordered_set>

namespace tsim::ecs {

namespace {

const std::vector<SystemTypeId> kEmptyOrder;

constexpr SystemStage kStages[] = {
    SystemStage::PreUpdate,
    SystemStage::Update,
    SystemStage::PostUpdate,
};

} // namespace

// ── Registration ────────────────────────────────────────────────────────

std::size_t SystemScheduler::SystemCount() const noexcept {
    return systems_.size();
}

// ── Dependencies ────────────────────────────────────────────────────────

bool SystemScheduler::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto itBefore = systems_.find(before);
    auto itAfter = systems_.find(after);

    if (itBefore == systems_.end() || itAfter == systems_.end()) {
        return false;
    }

    // Dependencies across different stages are meaningless (stage
    // ordering is implicit), so reject them.
    if (itBefore->second.stage != itAfter->second.stage) {
        return false;
    }

    auto& successors = dependencies_[before];
    if (std::find(successors.begin(), successors.end(), after) != successors.end()) {
        return true;
    }
    successors.push_back(after);
    reverseDeps_[after].push_back(before);

    built_ = false;
    return true;
}

// ── Enable / disable ────────────────────────────────────────────────────

void SystemScheduler::SetEnabled(SystemTypeId system, bool enabled) {
    if (auto it = systems_.find(system); it != systems_.end()) {
        it->second.enabled = enabled;
    }
}

bool SystemScheduler::IsEnabled(SystemTypeId system) const {
    if (auto it = systems_.find(system); it != systems_.end()) {
        return it->second.enabled;
    }
    return false;
}

// ── Build ───────────────────────────────────────────────────────────────

bool SystemScheduler::Build() {
    lastError_.clear();

    for (auto stage : kStages) {
        const auto idx = static_cast<std::size_t>(stage);
        std::vector<SystemTypeId> sorted;
        if (!topologicalSort(stageGroups_[idx], sorted)) {
            built_ = false;
            return false;
        }
        executionOrder_[idx] = std::move(sorted);
    }

    built_ = true;
    return true;
}

bool SystemScheduler::topologicalSort(const std::vector<SystemTypeId>& ids,
                                      std::vector<SystemTypeId>& sorted) {
    std::unordered_set<SystemTypeId> stageSet(ids.begin(), ids.end());

    std::unordered_map<SystemTypeId, uint32_t> inDegree;
    for (auto id : ids) {
        inDegree[id] = 0;
    }
    for (auto id : ids) {
        if (auto it = reverseDeps_.find(id); it != reverseDeps_.end()) {
            for (auto dep : it->second) {
                if (stageSet.contains(dep)) {
                    ++inDegree[id];
                }
            }
        }
    }

    // Kahn's algorithm; the ready queue is seeded in registration order.
    std::queue<SystemTypeId> ready;
    for (auto id : ids) {
        if (inDegree[id] == 0) {
            ready.push(id);
        }
    }

    sorted.clear();
    sorted.reserve(ids.size());

    while (!ready.empty()) {
        auto current = ready.front();
        ready.pop();
        sorted.push_back(current);

        if (auto it = dependencies_.find(current); it != dependencies_.end()) {
            for (auto successor : it->second) {
                if (!stageSet.contains(successor)) {
                    continue;
                }
                if (--inDegree[successor] == 0) {
                    ready.push(successor);
                }
            }
        }
    }

    if (sorted.size() != ids.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected among systems: [";
        bool first = true;
        for (auto id : ids) {
            if (inDegree[id] != 0) {
                if (!first) {
                    oss << ", ";
                }
                oss << systems_.at(id).instance->GetName();
                first = false;
            }
        }
        oss << "]";
        lastError_ = oss.str();
        return false;
    }

    return true;
}

// ── Execution ───────────────────────────────────────────────────────────

void SystemScheduler::Execute(tsim::sim::SimContext& ctx) {
    assert(built_ && "SystemScheduler::Build() must be called before Execute()");

    for (auto stage : kStages) {
        for (auto typeId : executionOrder_[static_cast<std::size_t>(stage)]) {
            auto& entry = systems_.at(typeId);
            if (entry.enabled) {
                entry.instance->Execute(ctx);
            }
        }
    }
}

// ── Error reporting ─────────────────────────────────────────────────────

const std::string& SystemScheduler::GetLastError() const noexcept {
    return lastError_;
}

// ── Queries ─────────────────────────────────────────────────────────────

const std::vector<SystemTypeId>& SystemScheduler::GetExecutionOrder(SystemStage stage) const {
    const auto idx = static_cast<std::size_t>(stage);
    if (idx < kSystemStageCount) {
        return executionOrder_[idx];
    }
    return kEmptyOrder;
}

std::vector<std::string_view> SystemScheduler::GetExecutionNames() const {
    std::vector<std::string_view> names;
    for (const auto& order : executionOrder_) {
        for (auto typeId : order) {
            names.push_back(systems_.at(typeId).instance->GetName());
        }
    }
    return names;
}

} // namespace tsim::ecs
