#include <gtest/gtest.h>

#include "sim_fixture.hpp"
#include "tsim/sim/need_systems.hpp"

using namespace tsim::sim;
using tsim::ecs::Entity;

class NeedSystemsTest : public SimFixture {
protected:
    Buffs& buffsOf(Entity pawn) { return *entities_.TryGet<Buffs>(pawn); }

    void setNeed(Entity pawn, const std::string& need, float value) {
        entities_.TryGet<Needs>(pawn)->values[NeedId(need)] = value;
    }

    NeedsSystem needs_;
    SocialSystem social_;
    BuffSystem buffSystem_;
    MoodSystem mood_;
};

// ===========================================================================
// NeedsSystem
// ===========================================================================

TEST_F(NeedSystemsTest, NeedsDecayByTheirRate) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 50.0f}, {"Fun", 50.0f}});
    Run(needs_, 1);
    EXPECT_NEAR(NeedValue(pawn, "Hunger"), 49.98f, 1e-4f);
    EXPECT_NEAR(NeedValue(pawn, "Fun"), 49.992f, 1e-4f);
}

TEST_F(NeedSystemsTest, EnergyDecayFollowsTimeOfDay) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Energy", 50.0f}});
    Run(needs_, 1);
    EXPECT_NEAR(NeedValue(pawn, "Energy"), 49.99f, 1e-4f);

    setNeed(pawn, "Energy", 50.0f);
    time_.SetTick(23 * TimeService::kTicksPerHour);
    Run(needs_, 1);
    EXPECT_NEAR(NeedValue(pawn, "Energy"), 49.975f, 1e-4f);
}

TEST_F(NeedSystemsTest, NeedsClampAtZero) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 0.01f}});
    Run(needs_, 3);
    EXPECT_FLOAT_EQ(NeedValue(pawn, "Hunger"), 0.0f);
}

TEST_F(NeedSystemsTest, PawnWithoutAGivenNeedIsUntouched) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 50.0f}});
    Run(needs_, 10);
    const auto& values = entities_.TryGet<Needs>(pawn)->values;
    EXPECT_EQ(values.size(), 1u);
    EXPECT_FALSE(values.contains(NeedId("Energy")));
}

TEST_F(NeedSystemsTest, LowDebuffAppliedBelowLowThreshold) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 35.01f}});
    Run(needs_, 1);

    const auto* low = buffsOf(pawn).Find(BuffSource::NeedLow, NeedId("Hunger"));
    ASSERT_NE(low, nullptr);
    EXPECT_EQ(low->buffDefId, BuffId("Hungry"));
    EXPECT_FLOAT_EQ(low->moodOffset, -10.0f);
    EXPECT_EQ(low->endTick, -1);
    EXPECT_EQ(buffsOf(pawn).Find(BuffSource::NeedCritical, NeedId("Hunger")), nullptr);
}

TEST_F(NeedSystemsTest, CriticalDebuffReplacesLowDebuff) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 30.0f}});
    Run(needs_, 1);
    ASSERT_NE(buffsOf(pawn).Find(BuffSource::NeedLow, NeedId("Hunger")), nullptr);

    setNeed(pawn, "Hunger", 15.01f);
    Run(needs_, 1);

    const auto* critical = buffsOf(pawn).Find(BuffSource::NeedCritical, NeedId("Hunger"));
    ASSERT_NE(critical, nullptr);
    EXPECT_EQ(critical->buffDefId, BuffId("Starving"));
    EXPECT_EQ(buffsOf(pawn).Find(BuffSource::NeedLow, NeedId("Hunger")), nullptr);
    EXPECT_EQ(buffsOf(pawn).active.size(), 1u);
}

TEST_F(NeedSystemsTest, DebuffsClearedOnceSatisfied) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 10.0f}});
    Run(needs_, 1);
    ASSERT_FALSE(buffsOf(pawn).active.empty());

    setNeed(pawn, "Hunger", 90.0f);
    Run(needs_, 1);
    EXPECT_TRUE(buffsOf(pawn).active.empty());
}

TEST_F(NeedSystemsTest, ReappliedDebuffKeepsItsStartTick) {
    const auto pawn = SpawnPawn("Alex", {2, 2}, {{"Hunger", 30.0f}});
    const auto firstTick = time_.CurrentTick();
    Run(needs_, 5);

    const auto* low = buffsOf(pawn).Find(BuffSource::NeedLow, NeedId("Hunger"));
    ASSERT_NE(low, nullptr);
    EXPECT_EQ(low->startTick, firstTick);
}

TEST_F(NeedSystemsTest, ReconcileLeavesOtherNeedsAlone) {
    Buffs buffs;
    const auto& hunger = *content_.Needs().Find(NeedId("Hunger"));
    const auto& hygiene = *content_.Needs().Find(NeedId("Hygiene"));

    ReconcileNeedDebuffs(buffs, hunger, 10.0f, 100, content_);
    ReconcileNeedDebuffs(buffs, hygiene, 20.0f, 100, content_);
    ASSERT_EQ(buffs.active.size(), 2u);

    ReconcileNeedDebuffs(buffs, hunger, 60.0f, 110, content_);
    ASSERT_EQ(buffs.active.size(), 1u);
    EXPECT_EQ(buffs.active.front().buffDefId, BuffId("Dirty"));
}

// ===========================================================================
// SocialSystem
// ===========================================================================

TEST_F(NeedSystemsTest, CompanyRaisesSocial) {
    const auto a = SpawnPawn("Alex", {0, 0}, {{"Social", 50.0f}});
    const auto b = SpawnPawn("Jordan", {2, 0}, {{"Social", 50.0f}});
    Run(social_, 1);
    EXPECT_NEAR(NeedValue(a, "Social"), 50.05f, 1e-4f);
    EXPECT_NEAR(NeedValue(b, "Social"), 50.05f, 1e-4f);
}

TEST_F(NeedSystemsTest, GainScalesWithNeighbours) {
    const auto a = SpawnPawn("Alex", {5, 5}, {{"Social", 50.0f}});
    SpawnPawn("Jordan", {5, 6});
    SpawnPawn("Sam", {4, 5});
    Run(social_, 1);
    EXPECT_NEAR(NeedValue(a, "Social"), 50.1f, 1e-4f);
}

TEST_F(NeedSystemsTest, DistantPawnsDoNotCount) {
    const auto a = SpawnPawn("Alex", {0, 0}, {{"Social", 50.0f}});
    SpawnPawn("Jordan", {3, 0}, {{"Social", 50.0f}});
    Run(social_, 1);
    EXPECT_FLOAT_EQ(NeedValue(a, "Social"), 50.0f);
}

TEST_F(NeedSystemsTest, SocialCapsAtHundred) {
    const auto a = SpawnPawn("Alex", {0, 0}, {{"Social", 99.98f}});
    SpawnPawn("Jordan", {1, 0});
    Run(social_, 1);
    EXPECT_FLOAT_EQ(NeedValue(a, "Social"), 100.0f);
}

// ===========================================================================
// BuffSystem / MoodSystem
// ===========================================================================

TEST_F(NeedSystemsTest, ExpiredBuffsAreRemoved) {
    const auto pawn = SpawnPawn("Alex", {2, 2});
    const auto now = time_.CurrentTick();

    BuffInstance expiring;
    expiring.source = BuffSource::Building;
    expiring.sourceId = BuildingId("Market");
    expiring.endTick = now;
    buffsOf(pawn).Apply(expiring);

    BuffInstance later = expiring;
    later.sourceId = BuildingId("Well");
    later.endTick = now + 1;
    buffsOf(pawn).Apply(later);

    BuffInstance permanent = expiring;
    permanent.source = BuffSource::NeedLow;
    permanent.sourceId = NeedId("Hunger");
    permanent.endTick = -1;
    buffsOf(pawn).Apply(permanent);

    Run(buffSystem_, 1);
    EXPECT_EQ(buffsOf(pawn).active.size(), 2u);
    EXPECT_EQ(buffsOf(pawn).Find(BuffSource::Building, BuildingId("Market")), nullptr);

    Run(buffSystem_, 1);
    EXPECT_EQ(buffsOf(pawn).active.size(), 1u);
    EXPECT_NE(buffsOf(pawn).Find(BuffSource::NeedLow, NeedId("Hunger")), nullptr);
}

TEST_F(NeedSystemsTest, MoodSumsBuffOffsets) {
    const auto pawn = SpawnPawn("Alex", {2, 2});

    BuffInstance meal;
    meal.source = BuffSource::Building;
    meal.sourceId = BuildingId("Market");
    meal.moodOffset = 15.0f;
    buffsOf(pawn).Apply(meal);

    BuffInstance hungry;
    hungry.source = BuffSource::NeedLow;
    hungry.sourceId = NeedId("Hunger");
    hungry.moodOffset = -10.0f;
    buffsOf(pawn).Apply(hungry);

    Run(mood_, 1);
    EXPECT_FLOAT_EQ(entities_.TryGet<Mood>(pawn)->value, 5.0f);
}

TEST_F(NeedSystemsTest, MoodIsClamped) {
    const auto pawn = SpawnPawn("Alex", {2, 2});

    BuffInstance starving;
    starving.source = BuffSource::NeedCritical;
    starving.sourceId = NeedId("Hunger");
    starving.moodOffset = -30.0f;
    buffsOf(pawn).Apply(starving);

    BuffInstance awful;
    awful.source = BuffSource::NeedCritical;
    awful.sourceId = NeedId("Energy");
    awful.moodOffset = -80.0f;
    buffsOf(pawn).Apply(awful);

    Run(mood_, 1);
    EXPECT_FLOAT_EQ(entities_.TryGet<Mood>(pawn)->value, -100.0f);
}

TEST_F(NeedSystemsTest, MoodWithoutBuffsIsNeutral) {
    const auto pawn = SpawnPawn("Alex", {2, 2});
    entities_.TryGet<Mood>(pawn)->value = 42.0f;
    Run(mood_, 1);
    EXPECT_FLOAT_EQ(entities_.TryGet<Mood>(pawn)->value, 0.0f);
}
