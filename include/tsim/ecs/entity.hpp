#pragma once

/// @file entity.hpp
/// @brief Entity handle for the ECS layer.
///
/// An entity is a 32-bit id assigned monotonically by EntityManager.
/// Ids are never recycled within a process lifetime, so a stale handle
/// can always be compared safely against live ones (buff sources,
/// attachment keys and action targets keep referring to the same
/// entity even after it has been destroyed).

#include <cstdint>
#include <functional>
#include <limits>

namespace tsim::ecs {

/// Entity handle; id 0 is reserved as the invalid sentinel.
struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kInvalidRaw = 0;
    static constexpr uint32_t kMaxId = std::numeric_limits<uint32_t>::max() - 1;

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    constexpr explicit Entity(uint32_t id) : raw(id) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw; }

    /// True when this handle was issued by an EntityManager. It does not
    /// imply the entity is still alive.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    /// Return the canonical invalid entity.
    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace tsim::ecs

// Hash support for unordered containers.
template <>
struct std::hash<tsim::ecs::Entity> {
    std::size_t operator()(const tsim::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
