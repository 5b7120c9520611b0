#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set based component storage for the ECS.
///
/// ComponentStorage<T> provides O(1) add / get / has / remove and
/// cache-friendly dense iteration over all components of type T.

#include "tsim/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsim::ecs {

/// Type-erased base for component pools, allowing EntityManager to
/// call Remove / Has / Clear without knowing the component type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Return the entity stored at dense @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;
};

/// Sparse-set component storage.
///
/// Memory layout:
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   entities_[index]     -> entity.id that owns dense_[index]
/// @endcode
///
/// Dense order is insertion order until a removal swaps the last element
/// into the freed slot. Callers that need a stable order (the simulation
/// systems do) sort entity ids instead of relying on dense order.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    /// Number of stored components.
    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }

    /// True when no components are stored.
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Add a component for @p entity, constructed from @p args.
    /// @pre `!Has(entity)`. Adding a duplicate is undefined behavior.
    /// @return Mutable reference to the newly stored component.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        const auto idx = static_cast<uint32_t>(dense_.size());

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;

        if constexpr (std::is_aggregate_v<T>) {
            dense_.push_back(T{std::forward<Args>(args)...});
        } else {
            dense_.emplace_back(std::forward<Args>(args)...);
        }
        entities_.push_back(entity.id());

        return dense_.back();
    }

    /// Get a mutable reference to the component owned by @p entity.
    /// @pre `Has(entity)`. Accessing a missing component is undefined.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Get a const reference to the component owned by @p entity.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Return a pointer to the component owned by @p entity, or nullptr.
    [[nodiscard]] T* TryGet(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* TryGet(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    /// Check whether @p entity has a component in this storage.
    [[nodiscard]] bool Has(Entity entity) const override {
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex;
    }

    /// Remove the component owned by @p entity.
    /// Safe to call even if the entity has no component (no-op).
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            // Swap the removed element with the last element.
            dense_[idx] = std::move(dense_[lastIdx]);
            entities_[idx] = entities_[lastIdx];

            // Update the sparse entry for the moved entity.
            sparse_[entities_[idx]] = idx;
        }

        dense_.pop_back();
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    /// Get or add: return the existing component or default-construct one.
    T& GetOrAdd(Entity entity) {
        if (Has(entity)) {
            return Get(entity);
        }
        return Add(entity);
    }

    /// Remove all components.
    void Clear() override {
        dense_.clear();
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    /// Return the entity that owns the component at @p index.
    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        assert(index < entities_.size());
        return Entity(entities_[index]);
    }

    /// Return every owning entity sorted by ascending id.
    [[nodiscard]] std::vector<Entity> SortedEntities() const {
        std::vector<Entity> result;
        result.reserve(entities_.size());
        for (auto id : entities_) {
            result.emplace_back(id);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;            ///< Packed component data.
    std::vector<uint32_t> entities_;  ///< dense index -> entity id.
    std::vector<uint32_t> sparse_;    ///< entity id  -> dense index.
};

}  // namespace tsim::ecs
