#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "tsim/ecs/component_storage.hpp"
#include "tsim/ecs/entity.hpp"

using namespace tsim::ecs;

// ── Test component types ────────────────────────────────────────────────────

struct Tile {
    int32_t x = 0;
    int32_t y = 0;
};

struct Label {
    std::string value;
};

// Move-only component.
struct UniqueResource {
    int id = 0;
    UniqueResource() = default;
    explicit UniqueResource(int i) : id(i) {}
    UniqueResource(const UniqueResource&) = delete;
    UniqueResource& operator=(const UniqueResource&) = delete;
    UniqueResource(UniqueResource&& o) noexcept : id(o.id) { o.id = -1; }
    UniqueResource& operator=(UniqueResource&& o) noexcept {
        id = o.id;
        o.id = -1;
        return *this;
    }
};

// Tag component (zero-size).
struct SleepingTag {};

// ===========================================================================
// ComponentStorage: Add / Get
// ===========================================================================

TEST(ComponentStorageTest, AddAndGet) {
    ComponentStorage<Tile> storage;
    Entity e(1);

    auto& tile = storage.Add(e, 4, 9);
    EXPECT_EQ(tile.x, 4);
    EXPECT_EQ(tile.y, 9);

    EXPECT_TRUE(storage.Has(e));
    EXPECT_EQ(storage.Get(e).x, 4);
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, AddDefaultConstructed) {
    ComponentStorage<Tile> storage;
    auto& tile = storage.Add(Entity(3));
    EXPECT_EQ(tile.x, 0);
    EXPECT_EQ(tile.y, 0);
}

TEST(ComponentStorageTest, HasReturnsFalseForAbsent) {
    ComponentStorage<Tile> storage;
    EXPECT_FALSE(storage.Has(Entity(1)));
    EXPECT_FALSE(storage.Has(Entity::invalid()));
}

TEST(ComponentStorageTest, TryGetReturnsNullForAbsent) {
    ComponentStorage<Tile> storage;
    storage.Add(Entity(2), 1, 1);

    EXPECT_EQ(storage.TryGet(Entity(1)), nullptr);
    ASSERT_NE(storage.TryGet(Entity(2)), nullptr);
    EXPECT_EQ(storage.TryGet(Entity(2))->x, 1);
}

TEST(ComponentStorageTest, MutateViaGet) {
    ComponentStorage<Tile> storage;
    Entity e(1);
    storage.Add(e, 0, 0);

    storage.Get(e).x = 12;
    EXPECT_EQ(storage.Get(e).x, 12);
}

// ===========================================================================
// ComponentStorage: Remove
// ===========================================================================

TEST(ComponentStorageTest, RemoveSingle) {
    ComponentStorage<Tile> storage;
    Entity e(1);
    storage.Add(e, 1, 2);

    storage.Remove(e);
    EXPECT_FALSE(storage.Has(e));
    EXPECT_TRUE(storage.Empty());
}

TEST(ComponentStorageTest, RemoveSwapsWithLast) {
    ComponentStorage<Tile> storage;
    Entity a(1);
    Entity b(2);
    Entity c(3);
    storage.Add(a, 1, 0);
    storage.Add(b, 2, 0);
    storage.Add(c, 3, 0);

    storage.Remove(a);

    EXPECT_EQ(storage.Size(), 2u);
    EXPECT_EQ(storage.Get(b).x, 2);
    EXPECT_EQ(storage.Get(c).x, 3);
    EXPECT_EQ(storage.EntityAt(0), c);
}

TEST(ComponentStorageTest, RemoveNonexistentIsNoop) {
    ComponentStorage<Tile> storage;
    storage.Add(Entity(1), 1, 1);
    storage.Remove(Entity(42));
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, AddAfterRemove) {
    ComponentStorage<Tile> storage;
    Entity e(5);
    storage.Add(e, 1, 1);
    storage.Remove(e);
    storage.Add(e, 8, 8);

    EXPECT_EQ(storage.Get(e).x, 8);
    EXPECT_EQ(storage.Size(), 1u);
}

// ===========================================================================
// ComponentStorage: GetOrAdd / Clear
// ===========================================================================

TEST(ComponentStorageTest, GetOrAddExisting) {
    ComponentStorage<Tile> storage;
    Entity e(1);
    storage.Add(e, 6, 6);

    EXPECT_EQ(storage.GetOrAdd(e).x, 6);
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, GetOrAddNew) {
    ComponentStorage<Tile> storage;
    auto& tile = storage.GetOrAdd(Entity(1));
    EXPECT_EQ(tile.x, 0);
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, ClearRemovesAll) {
    ComponentStorage<Tile> storage;
    for (uint32_t i = 1; i <= 5; ++i) {
        storage.Add(Entity(i));
    }

    storage.Clear();
    EXPECT_TRUE(storage.Empty());
    for (uint32_t i = 1; i <= 5; ++i) {
        EXPECT_FALSE(storage.Has(Entity(i)));
    }
}

// ===========================================================================
// ComponentStorage: Iteration
// ===========================================================================

TEST(ComponentStorageTest, IterateAll) {
    ComponentStorage<Tile> storage;
    storage.Add(Entity(1), 1, 0);
    storage.Add(Entity(2), 2, 0);
    storage.Add(Entity(3), 3, 0);

    int32_t sum = 0;
    for (const auto& tile : storage) {
        sum += tile.x;
    }
    EXPECT_EQ(sum, 6);
}

TEST(ComponentStorageTest, SortedEntitiesAreAscending) {
    ComponentStorage<Tile> storage;
    storage.Add(Entity(7));
    storage.Add(Entity(2));
    storage.Add(Entity(9));
    storage.Add(Entity(4));
    storage.Remove(Entity(2));

    const auto sorted = storage.SortedEntities();
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0], Entity(4));
    EXPECT_EQ(sorted[1], Entity(7));
    EXPECT_EQ(sorted[2], Entity(9));
}

TEST(ComponentStorageTest, SparseGrowsForLargeEntityId) {
    ComponentStorage<Tile> storage;
    Entity far(10000);
    storage.Add(far, 1, 2);
    EXPECT_TRUE(storage.Has(far));
    EXPECT_FALSE(storage.Has(Entity(9999)));
}

// ===========================================================================
// ComponentStorage: Component kinds
// ===========================================================================

TEST(ComponentStorageTest, MoveOnlyRemoveSwap) {
    ComponentStorage<UniqueResource> storage;
    storage.Add(Entity(1), 10);
    storage.Add(Entity(2), 20);
    storage.Add(Entity(3), 30);

    storage.Remove(Entity(1));

    EXPECT_EQ(storage.Get(Entity(2)).id, 20);
    EXPECT_EQ(storage.Get(Entity(3)).id, 30);
}

TEST(ComponentStorageTest, TagComponent) {
    ComponentStorage<SleepingTag> storage;
    storage.Add(Entity(1));
    EXPECT_TRUE(storage.Has(Entity(1)));
    EXPECT_FALSE(storage.Has(Entity(2)));
}

TEST(ComponentStorageTest, StringComponent) {
    ComponentStorage<Label> storage;
    storage.Add(Entity(1), std::string("Alex"));
    storage.Add(Entity(2), std::string("Jordan"));
    storage.Remove(Entity(1));

    EXPECT_EQ(storage.Get(Entity(2)).value, "Jordan");
}

TEST(IComponentStorageTest, PolymorphicAccess) {
    ComponentStorage<Tile> concrete;
    concrete.Add(Entity(1));
    concrete.Add(Entity(2));

    IComponentStorage& storage = concrete;
    EXPECT_EQ(storage.Size(), 2u);
    EXPECT_TRUE(storage.Has(Entity(1)));

    storage.Remove(Entity(1));
    EXPECT_FALSE(concrete.Has(Entity(1)));

    storage.Clear();
    EXPECT_EQ(concrete.Size(), 0u);
}
