#pragma once

/// @file components.hpp
/// @brief Simulation ECS components for pawns and buildings.
///
/// Each struct is a plain data component designed for sparse-set storage
/// via ComponentStorage<T>. An entity is a pawn or a building purely by
/// which storages hold an entry for it.

#include "tsim/ecs/entity.hpp"
#include "tsim/sim/world_types.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsim::sim {

// -- Position ----------------------------------------------------------------

/// Tile an entity stands on. For buildings this is the footprint anchor
/// (top-left tile).
struct Position {
    TileCoord coord;
};

// -- Pawn --------------------------------------------------------------------

/// Identity of an autonomous agent.
struct Pawn {
    std::string name;
    int32_t age = 0;
};

// -- Needs -------------------------------------------------------------------

/// Need values in [0, 100], keyed by need definition id.
struct Needs {
    std::map<ContentId, float> values;
};

/// Clamp a need value into [0, 100].
[[nodiscard]] inline float ClampNeed(float value) noexcept {
    return std::clamp(value, 0.0f, 100.0f);
}

// -- Mood --------------------------------------------------------------------

/// Sum of active buff offsets, clamped to [-100, 100].
struct Mood {
    float value = 0.0f;
};

// -- Buffs -------------------------------------------------------------------

/// Origin of a buff instance.
enum class BuffSource : uint8_t {
    NeedCritical,  ///< sourceId is a need def id
    NeedLow,       ///< sourceId is a need def id
    Building,      ///< sourceId is a building def id
    Work           ///< sourceId is a building def id
};

/// An applied mood modifier. `endTick <= 0` means permanent until removed.
struct BuffInstance {
    BuffSource source = BuffSource::Building;
    ContentId sourceId = kNoContent;
    ContentId buffDefId = kNoContent;
    float moodOffset = 0.0f;
    Tick startTick = 0;
    Tick endTick = -1;
};

/// Active buffs of a pawn, at most one per (source, sourceId).
struct Buffs {
    std::vector<BuffInstance> active;

    /// Insert @p instance, replacing any instance with the same source.
    void Apply(const BuffInstance& instance) {
        for (auto& existing : active) {
            if (existing.source == instance.source && existing.sourceId == instance.sourceId) {
                existing = instance;
                return;
            }
        }
        active.push_back(instance);
    }

    /// Remove the instance attributed to (@p source, @p sourceId).
    /// @return true if an instance was removed.
    bool RemoveFrom(BuffSource source, ContentId sourceId) {
        const auto before = active.size();
        std::erase_if(active, [source, sourceId](const BuffInstance& b) {
            return b.source == source && b.sourceId == sourceId;
        });
        return active.size() != before;
    }

    [[nodiscard]] const BuffInstance* Find(BuffSource source, ContentId sourceId) const {
        for (const auto& b : active) {
            if (b.source == source && b.sourceId == sourceId) {
                return &b;
            }
        }
        return nullptr;
    }
};

// -- Building ----------------------------------------------------------------

/// A placed building instance.
struct Building {
    ContentId defId = kNoContent;
    int32_t tileSize = 1;
    int32_t level = 0;
    int32_t colorIndex = 0;
    bool inUse = false;
    tsim::ecs::Entity usedBy;
};

// -- Resource ----------------------------------------------------------------

/// Depletable store held by a building.
struct Resource {
    std::string type;
    float current = 100.0f;
    float max = 100.0f;

    /// 0 means the store never depletes.
    float depletionMult = 1.0f;

    [[nodiscard]] float Headroom() const noexcept { return std::max(0.0f, max - current); }
    [[nodiscard]] float Fill() const noexcept { return max > 0.0f ? current / max : 1.0f; }
};

// -- Attachment --------------------------------------------------------------

/// Maximum attachment a pawn can build toward one building.
inline constexpr int32_t kMaxAttachment = 10;

/// Per-pawn affinity toward a building.
struct Attachment {
    std::map<tsim::ecs::Entity, int32_t> byPawn;

    [[nodiscard]] int32_t Of(tsim::ecs::Entity pawn) const {
        auto it = byPawn.find(pawn);
        return it != byPawn.end() ? it->second : 0;
    }

    /// Sum of every other pawn's attachment.
    [[nodiscard]] int32_t OthersThan(tsim::ecs::Entity pawn) const {
        int32_t total = 0;
        for (const auto& [owner, value] : byPawn) {
            if (owner != pawn) {
                total += value;
            }
        }
        return total;
    }

    void Increment(tsim::ecs::Entity pawn) {
        auto& value = byPawn[pawn];
        value = std::min(value + 1, kMaxAttachment);
    }
};

// -- Gold --------------------------------------------------------------------

struct Gold {
    int32_t amount = 0;
};

// -- Inventory ---------------------------------------------------------------

/// Default carrying capacity of a pawn.
inline constexpr float kDefaultInventoryCapacity = 50.0f;

/// Single-slot carried resource.
struct Inventory {
    std::optional<std::string> resourceType;
    float amount = 0.0f;
    float capacity = kDefaultInventoryCapacity;

    [[nodiscard]] bool IsEmpty() const noexcept { return !resourceType.has_value(); }
    [[nodiscard]] float Headroom() const noexcept { return std::max(0.0f, capacity - amount); }

    /// True if @p type may be added to this slot.
    [[nodiscard]] bool Accepts(const std::string& type) const {
        return !resourceType || *resourceType == type;
    }
};

} // namespace tsim::sim
