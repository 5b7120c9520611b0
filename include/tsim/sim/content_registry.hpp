#pragma once

/// @file content_registry.hpp
/// @brief Id-keyed stores for content definitions.
///
/// The registry is built once (in code, see MakeDefaultContent()) and is
/// then passed by const reference to every simulation it backs. There is
/// no global content database.

#include "tsim/foundation/game_result.hpp"
#include "tsim/sim/content_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsim::sim {

/// Ordered store of one kind of definition.
///
/// `Add()` assigns sequential ids starting at 1. Iteration visits
/// definitions in id order.
template <typename Def>
class ContentStore {
public:
    using const_iterator = typename std::vector<Def>::const_iterator;

    /// Insert @p def, overwriting its id.
    /// @return The assigned id, or DuplicateDefinition for a reused name.
    tsim::foundation::GameResult<ContentId> Add(Def def) {
        using tsim::foundation::ErrorCode;
        using tsim::foundation::GameError;
        using tsim::foundation::GameResult;

        if (def.name.empty()) {
            return GameResult<ContentId>::err(
                GameError(ErrorCode::InvalidArgument, "definition name must not be empty"));
        }
        if (byName_.contains(def.name)) {
            return GameResult<ContentId>::err(
                GameError(ErrorCode::DuplicateDefinition,
                          "duplicate definition name: " + def.name));
        }

        const auto id = static_cast<ContentId>(defs_.size() + 1);
        def.id = id;
        byName_.emplace(def.name, id);
        defs_.push_back(std::move(def));
        return GameResult<ContentId>::ok(id);
    }

    /// Return the definition with @p id, or nullptr.
    [[nodiscard]] const Def* Find(ContentId id) const noexcept {
        if (id <= kNoContent || static_cast<std::size_t>(id) > defs_.size()) {
            return nullptr;
        }
        return &defs_[static_cast<std::size_t>(id - 1)];
    }

    /// Mutable access, used while wiring cross references.
    [[nodiscard]] Def* FindMutable(ContentId id) noexcept {
        if (id <= kNoContent || static_cast<std::size_t>(id) > defs_.size()) {
            return nullptr;
        }
        return &defs_[static_cast<std::size_t>(id - 1)];
    }

    /// Look up an id by definition name.
    [[nodiscard]] std::optional<ContentId> IdOf(std::string_view name) const {
        if (auto it = byName_.find(std::string(name)); it != byName_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool Contains(ContentId id) const noexcept { return Find(id) != nullptr; }
    [[nodiscard]] std::size_t Size() const noexcept { return defs_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return defs_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return defs_.end(); }

private:
    std::vector<Def> defs_;
    std::unordered_map<std::string, ContentId> byName_;
};

/// Read-only content consumed by a simulation.
class ContentRegistry {
public:
    ContentStore<NeedDef>& Needs() noexcept { return needs_; }
    [[nodiscard]] const ContentStore<NeedDef>& Needs() const noexcept { return needs_; }

    ContentStore<BuffDef>& Buffs() noexcept { return buffs_; }
    [[nodiscard]] const ContentStore<BuffDef>& Buffs() const noexcept { return buffs_; }

    ContentStore<TerrainDef>& Terrains() noexcept { return terrains_; }
    [[nodiscard]] const ContentStore<TerrainDef>& Terrains() const noexcept { return terrains_; }

    ContentStore<BuildingDef>& Buildings() noexcept { return buildings_; }
    [[nodiscard]] const ContentStore<BuildingDef>& Buildings() const noexcept {
        return buildings_;
    }

    /// Terrain used for untouched tiles.
    [[nodiscard]] ContentId DefaultTerrainId() const noexcept { return defaultTerrainId_; }
    void SetDefaultTerrainId(ContentId id) noexcept { defaultTerrainId_ = id; }

    /// Check every cross reference.
    ///
    /// Fails with UnknownBuff / UnknownNeed / UnknownTerrain for dangling
    /// ids, and InvalidContentReference for out-of-range values (need
    /// thresholds outside [0, 100], non-positive tile size, a hauling
    /// building without a source).
    [[nodiscard]] tsim::foundation::GameResult<void> Validate() const;

private:
    ContentStore<NeedDef> needs_;
    ContentStore<BuffDef> buffs_;
    ContentStore<TerrainDef> terrains_;
    ContentStore<BuildingDef> buildings_;
    ContentId defaultTerrainId_ = kNoContent;
};

/// Build the stock content pack: terrains Grass, Dirt, Path, Water and
/// Forest; needs Hunger, Energy, Fun, Social, Hygiene and Purpose with
/// their debuffs; buildings Home, Farm, Market, Well and Tavern.
[[nodiscard]] tsim::foundation::GameResult<ContentRegistry> MakeDefaultContent();

} // namespace tsim::sim
