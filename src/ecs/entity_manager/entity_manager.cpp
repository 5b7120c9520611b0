/// @file entity_manager.cpp
/// @brief Entity lifecycle management implementation.

#include "tsim/ecs/entity_manager.hpp"

namespace tsim::ecs {

// ── Entity lifecycle ─────────────────────────────────────────────────

Entity EntityManager::Create() {
    assert(nextId_ <= Entity::kMaxId && "Entity id space exhausted");

    const uint32_t id = nextId_++;
    alive_.push_back(true);
    ++count_;
    return Entity(id);
}

void EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }

    // Remove all components belonging to this entity.
    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    alive_[entity.id()] = false;
    --count_;
}

// ── Queries ──────────────────────────────────────────────────────────

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }
    const auto idx = entity.id();
    return idx < alive_.size() && alive_[idx];
}

std::size_t EntityManager::Count() const noexcept {
    return count_;
}

std::size_t EntityManager::IssuedCount() const noexcept {
    return nextId_ - 1;
}

// ── Component storage registration ───────────────────────────────────

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

} // namespace tsim::ecs
