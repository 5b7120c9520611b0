#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle management for the ECS.
///
/// EntityManager owns the canonical entity state: append-only id
/// allocation, destruction and alive-ness checks. It also holds references
/// to all registered component storages so that components are removed
/// automatically when an entity is destroyed.

#include "tsim/ecs/component_storage.hpp"
#include "tsim/ecs/entity.hpp"

#include <cassert>
#include <cstdint>
#include <vector>

namespace tsim::ecs {

/// Manages the full lifecycle of entities.
///
/// Ids start at 1 and grow monotonically; a destroyed id is never issued
/// again. Component storages registered with the manager are notified on
/// `Destroy()` so that no component outlives its entity.
class EntityManager {
public:
    EntityManager() = default;

    // Non-copyable, movable.
    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Create a new entity with an id that has never been issued before.
    [[nodiscard]] Entity Create();

    /// Destroy @p entity and remove all its components.
    ///
    /// Idempotent: destroying a dead, never-issued or invalid entity is a
    /// no-op. Other entities' ids are unaffected.
    void Destroy(Entity entity);

    // ── Queries ──────────────────────────────────────────────────────

    /// Check whether @p entity is currently alive.
    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// Return the number of currently alive entities.
    [[nodiscard]] std::size_t Count() const noexcept;

    /// Return the number of ids issued so far (alive or destroyed).
    [[nodiscard]] std::size_t IssuedCount() const noexcept;

    /// The id the next `Create()` call will return.
    [[nodiscard]] uint32_t PeekNextId() const noexcept { return nextId_; }

    // ── Component storage registration ───────────────────────────────

    /// Register a component storage so that entity destruction
    /// automatically calls `storage->Remove(entity)`.
    ///
    /// The manager does **not** take ownership of the storage; the
    /// caller must ensure the storage outlives the manager.
    void RegisterStorage(IComponentStorage* storage);

private:
    /// Alive flag per id; index 0 is the unused invalid slot.
    std::vector<bool> alive_{false};

    /// Registered component storages for automatic cleanup.
    std::vector<IComponentStorage*> storages_;

    uint32_t nextId_ = 1;

    /// Number of currently alive entities (cached for O(1) Count()).
    std::size_t count_ = 0;
};

}  // namespace tsim::ecs
