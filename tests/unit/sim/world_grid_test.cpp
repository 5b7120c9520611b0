#include <gtest/gtest.h>

#include "tsim/sim/content_registry.hpp"
#include "tsim/sim/diversity_map.hpp"
#include "tsim/sim/world_grid.hpp"

using namespace tsim::sim;

namespace {

TerrainDef makeTerrain(ContentId id, bool walkable, bool buildable) {
    TerrainDef def;
    def.id = id;
    def.name = "T" + std::to_string(id);
    def.walkable = walkable;
    def.buildable = buildable;
    return def;
}

Tile grassTile() {
    Tile tile;
    tile.terrainId = 1;
    return tile;
}

} // namespace

// ===========================================================================
// WorldGrid: chunk storage
// ===========================================================================

TEST(WorldGridTest, FreshWorldAllocatesNothing) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    EXPECT_EQ(world.ChunkCount(), 0u);
    EXPECT_EQ(world.FindTile({3, 3}), nullptr);
    EXPECT_EQ(world.TileAt({3, 3}).terrainId, 1);
    EXPECT_TRUE(world.IsWalkable({3, 3}));
    EXPECT_EQ(world.ChunkCount(), 0u);
}

TEST(WorldGridTest, GetTileAllocatesOneChunk) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    world.GetTile({0, 0}).colorIndex = 4;
    world.GetTile({31, 31}).colorIndex = 5;
    EXPECT_EQ(world.ChunkCount(), 1u);

    ASSERT_NE(world.FindTile({31, 31}), nullptr);
    EXPECT_EQ(world.FindTile({31, 31})->colorIndex, 5);
    EXPECT_EQ(world.TileAt({0, 0}).colorIndex, 4);
    EXPECT_EQ(world.TileAt({1, 0}).colorIndex, 0);

    world.GetTile({32, 0});
    EXPECT_EQ(world.ChunkCount(), 2u);
}

TEST(WorldGridTest, NegativeCoordinatesUseTheirOwnChunk) {
    WorldGrid world(WorldBounds{-40, 40, -40, 40}, grassTile(), 16);
    world.GetTile({-1, -1}).colorIndex = 7;
    world.GetTile({0, 0}).colorIndex = 2;

    EXPECT_EQ(world.ChunkCount(), 2u);
    EXPECT_EQ(world.TileAt({-1, -1}).colorIndex, 7);
    EXPECT_EQ(world.TileAt({0, 0}).colorIndex, 2);
    EXPECT_EQ(world.TileAt({-32, -32}).colorIndex, 0);
    EXPECT_EQ(world.ChunkCount(), 2u);
}

// ===========================================================================
// WorldGrid: walkability
// ===========================================================================

TEST(WorldGridTest, OutOfBoundsIsNeverWalkable) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    EXPECT_TRUE(world.IsWalkable({19, 10}));
    EXPECT_FALSE(world.IsWalkable({20, 10}));
    EXPECT_FALSE(world.IsWalkable({0, -1}));
    EXPECT_FALSE(world.IsBuildable({-1, 0}));
}

TEST(WorldGridTest, PaintTerrainRewritesFlags) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    const auto water = makeTerrain(4, false, false);

    const auto before = world.Revision();
    world.PaintTerrain({2, 2}, water, 3);

    EXPECT_EQ(world.TileAt({2, 2}).terrainId, 4);
    EXPECT_EQ(world.TileAt({2, 2}).colorIndex, 3);
    EXPECT_FALSE(world.IsWalkable({2, 2}));
    EXPECT_FALSE(world.IsBuildable({2, 2}));
    EXPECT_GT(world.Revision(), before);
}

TEST(WorldGridTest, PaintOutsideBoundsIsIgnored) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    world.PaintTerrain({50, 50}, makeTerrain(4, false, false), 0);
    EXPECT_EQ(world.ChunkCount(), 0u);
    EXPECT_EQ(world.Revision(), 0u);
}

TEST(WorldGridTest, OccupantsBlockUntilLastOneLeaves) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    world.AddOccupant({5, 5});
    world.AddOccupant({5, 5});
    EXPECT_FALSE(world.IsWalkable({5, 5}));

    world.RemoveOccupant({5, 5});
    EXPECT_FALSE(world.IsWalkable({5, 5}));

    world.RemoveOccupant({5, 5});
    EXPECT_TRUE(world.IsWalkable({5, 5}));

    // Extra removals do not underflow.
    world.RemoveOccupant({5, 5});
    EXPECT_EQ(world.TileAt({5, 5}).blockingOccupants, 0);
}

TEST(WorldGridTest, PaintKeepsOccupants) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    world.AddOccupant({1, 1});
    world.PaintTerrain({1, 1}, makeTerrain(2, true, true), 0);
    EXPECT_EQ(world.TileAt({1, 1}).blockingOccupants, 1);
    EXPECT_FALSE(world.IsWalkable({1, 1}));
}

TEST(WorldGridTest, ClampColorIndex) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    EXPECT_EQ(world.ClampColorIndex(-3), 0);
    EXPECT_EQ(world.ClampColorIndex(5), 5);
    EXPECT_EQ(world.ClampColorIndex(18), 2);
}

// ===========================================================================
// DiversityMap
// ===========================================================================

TEST(DiversityMapTest, UniformWorldScoresZero) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    DiversityMap diversity;
    diversity.Rebuild(world);
    EXPECT_EQ(diversity.ValueAt({5, 5}), 0);
    EXPECT_EQ(diversity.ValueAt({0, 0}), 0);
}

TEST(DiversityMapTest, CountsDistinctNeighbourSignatures) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    const auto dirt = makeTerrain(2, true, true);
    world.PaintTerrain({5, 5}, dirt, 0);
    world.PaintTerrain({6, 5}, dirt, 3);

    DiversityMap diversity;
    diversity.Rebuild(world);

    // (5,5) sees grass, dirt/0 and dirt/3.
    EXPECT_EQ(diversity.ValueAt({5, 5}), 2);
    // (4,5) sees grass and dirt/0 only.
    EXPECT_EQ(diversity.ValueAt({4, 5}), 1);
    EXPECT_EQ(diversity.ValueAt({10, 10}), 0);
    EXPECT_EQ(diversity.ValueAt({-5, 0}), 0);
}

TEST(DiversityMapTest, RefreshOnlyWhenWorldChanged) {
    WorldGrid world(WorldBounds{}, grassTile(), 16);
    DiversityMap diversity;
    EXPECT_TRUE(diversity.RefreshIfStale(world));
    EXPECT_FALSE(diversity.RefreshIfStale(world));

    world.PaintTerrain({3, 3}, makeTerrain(2, true, true), 0);
    EXPECT_TRUE(diversity.RefreshIfStale(world));
    EXPECT_EQ(diversity.ValueAt({3, 4}), 1);
}
