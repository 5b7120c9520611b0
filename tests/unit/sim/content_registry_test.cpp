#include <gtest/gtest.h>

#include "tsim/sim/content_registry.hpp"

using namespace tsim::sim;
using tsim::foundation::ErrorCode;

// ===========================================================================
// ContentStore
// ===========================================================================

TEST(ContentStoreTest, AssignsSequentialIds) {
    ContentStore<NeedDef> store;
    NeedDef hunger;
    hunger.name = "Hunger";
    NeedDef energy;
    energy.name = "Energy";

    EXPECT_EQ(store.Add(hunger).value(), 1);
    EXPECT_EQ(store.Add(energy).value(), 2);
    EXPECT_EQ(store.Size(), 2u);
    EXPECT_EQ(store.Find(2)->name, "Energy");
    EXPECT_EQ(store.Find(2)->id, 2);
    EXPECT_EQ(*store.IdOf("Hunger"), 1);
}

TEST(ContentStoreTest, UnknownIdsAndNames) {
    ContentStore<BuffDef> store;
    EXPECT_EQ(store.Find(kNoContent), nullptr);
    EXPECT_EQ(store.Find(1), nullptr);
    EXPECT_FALSE(store.IdOf("GoodMeal").has_value());
    EXPECT_FALSE(store.Contains(-4));
}

TEST(ContentStoreTest, RejectsDuplicateName) {
    ContentStore<TerrainDef> store;
    TerrainDef grass;
    grass.name = "Grass";
    ASSERT_TRUE(store.Add(grass).hasValue());

    auto again = store.Add(grass);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::DuplicateDefinition);
    EXPECT_EQ(store.Size(), 1u);
}

TEST(ContentStoreTest, RejectsEmptyName) {
    ContentStore<BuildingDef> store;
    auto result = store.Add(BuildingDef{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(ContentStoreTest, IteratesInIdOrder) {
    ContentStore<BuffDef> store;
    for (const char* name : {"A", "B", "C"}) {
        BuffDef def;
        def.name = name;
        ASSERT_TRUE(store.Add(def).hasValue());
    }
    ContentId expected = 1;
    for (const auto& def : store) {
        EXPECT_EQ(def.id, expected++);
    }
}

// ===========================================================================
// Stock content
// ===========================================================================

TEST(DefaultContentTest, Sizes) {
    auto content = MakeDefaultContent();
    ASSERT_TRUE(content.hasValue());
    const auto& registry = content.value();

    EXPECT_EQ(registry.Needs().Size(), 6u);
    EXPECT_EQ(registry.Buffs().Size(), 17u);
    EXPECT_EQ(registry.Terrains().Size(), 5u);
    EXPECT_EQ(registry.Buildings().Size(), 5u);
    EXPECT_TRUE(registry.Validate().hasValue());
}

TEST(DefaultContentTest, GrassIsTheDefaultTerrain) {
    auto registry = MakeDefaultContent().value();
    const auto* grass = registry.Terrains().Find(registry.DefaultTerrainId());
    ASSERT_NE(grass, nullptr);
    EXPECT_EQ(grass->name, "Grass");

    const auto* water = registry.Terrains().Find(*registry.Terrains().IdOf("Water"));
    EXPECT_FALSE(water->walkable);
    EXPECT_FALSE(water->buildable);
}

TEST(DefaultContentTest, NeedsLinkTheirDebuffs) {
    auto registry = MakeDefaultContent().value();
    const auto* hunger = registry.Needs().Find(*registry.Needs().IdOf("Hunger"));
    ASSERT_NE(hunger, nullptr);
    EXPECT_FLOAT_EQ(hunger->decayPerTick, 0.02f);
    EXPECT_EQ(registry.Buffs().Find(*hunger->criticalDebuffId)->name, "Starving");
    EXPECT_EQ(registry.Buffs().Find(*hunger->lowDebuffId)->name, "Hungry");

    const auto* energy = registry.Needs().Find(*registry.Needs().IdOf("Energy"));
    EXPECT_TRUE(energy->usesTimeOfDayDecay);

    const auto* purpose = registry.Needs().Find(*registry.Needs().IdOf("Purpose"));
    EXPECT_TRUE(purpose->isWorkNeed);
}

TEST(DefaultContentTest, BuildingEconomy) {
    auto registry = MakeDefaultContent().value();
    const auto* market = registry.Buildings().Find(*registry.Buildings().IdOf("Market"));
    ASSERT_NE(market, nullptr);
    EXPECT_EQ(market->Cost(0), 10);
    EXPECT_EQ(market->Cost(1), 11);
    EXPECT_EQ(market->Payout(0), 10);
    EXPECT_EQ(market->WorkBuyIn(0), 0);
    EXPECT_EQ(market->WorkBuyIn(5), 10);

    const auto* farm = registry.Buildings().Find(*registry.Buildings().IdOf("Farm"));
    EXPECT_FALSE(farm->canSellToConsumers);
    EXPECT_EQ(farm->initialGold, 50);
}

// ===========================================================================
// Validation
// ===========================================================================

class ContentValidationTest : public ::testing::Test {
protected:
    void SetUp() override { registry_ = MakeDefaultContent().value(); }

    ContentRegistry registry_;
};

TEST_F(ContentValidationTest, UnknownDebuff) {
    NeedDef need;
    need.name = "Curiosity";
    need.lowDebuffId = 99;
    ASSERT_TRUE(registry_.Needs().Add(need).hasValue());

    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::UnknownBuff);
}

TEST_F(ContentValidationTest, ThresholdOutOfRange) {
    NeedDef need;
    need.name = "Curiosity";
    need.criticalThreshold = 120.0f;
    ASSERT_TRUE(registry_.Needs().Add(need).hasValue());

    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::InvalidContentReference);
}

TEST_F(ContentValidationTest, UnknownSatisfiedNeed) {
    BuildingDef building;
    building.name = "Library";
    building.satisfiesNeedId = 42;
    ASSERT_TRUE(registry_.Buildings().Add(building).hasValue());

    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::UnknownNeed);
}

TEST_F(ContentValidationTest, NonPositiveTileSize) {
    BuildingDef building;
    building.name = "Statue";
    building.tileSize = 0;
    ASSERT_TRUE(registry_.Buildings().Add(building).hasValue());

    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::InvalidContentReference);
}

TEST_F(ContentValidationTest, HaulFromTerrainNeedsSource) {
    BuildingDef lumberYard;
    lumberYard.name = "LumberYard";
    lumberYard.resourceType = "wood";
    lumberYard.canBeWorkedAt = true;
    lumberYard.workType = WorkType::HaulFromTerrain;
    ASSERT_TRUE(registry_.Buildings().Add(lumberYard).hasValue());

    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::InvalidContentReference);

    registry_.Buildings().FindMutable(*registry_.Buildings().IdOf("LumberYard"))
        ->haulSourceTerrainId = 77;
    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::UnknownTerrain);

    registry_.Buildings().FindMutable(*registry_.Buildings().IdOf("LumberYard"))
        ->haulSourceTerrainId = registry_.Terrains().IdOf("Forest");
    EXPECT_TRUE(registry_.Validate().hasValue());
}

TEST_F(ContentValidationTest, UnregisteredDefaultTerrain) {
    registry_.SetDefaultTerrainId(12);
    EXPECT_EQ(registry_.Validate().error().code(), ErrorCode::UnknownTerrain);
}
