/// @file default_content.cpp
/// @brief The stock content pack, built in code.

#include "tsim/sim/content_registry.hpp"

#include "tsim/foundation/game_logger.hpp"

namespace tsim::sim {

using tsim::foundation::GameError;
using tsim::foundation::GameResult;
using tsim::foundation::LogCategory;

namespace {

BuffDef needDebuff(std::string name, float moodOffset) {
    BuffDef def;
    def.name = std::move(name);
    def.moodOffset = moodOffset;
    def.isFromNeed = true;
    return def;
}

BuffDef timedBuff(std::string name, float moodOffset, int32_t durationTicks) {
    BuffDef def;
    def.name = std::move(name);
    def.moodOffset = moodOffset;
    def.durationTicks = durationTicks;
    return def;
}

TerrainDef terrain(std::string name, bool walkable, bool buildable, bool blocksLight = false) {
    TerrainDef def;
    def.name = std::move(name);
    def.walkable = walkable;
    def.buildable = buildable;
    def.blocksLight = blocksLight;
    return def;
}

} // namespace

GameResult<ContentRegistry> MakeDefaultContent() {
    ContentRegistry content;
    std::optional<GameError> firstError;

    // Records the first failure and keeps going so every definition is
    // attempted; the caller only sees the first error.
    auto add = [&firstError](auto& store, auto def) -> ContentId {
        auto result = store.Add(std::move(def));
        if (result.hasError()) {
            if (!firstError) {
                firstError = result.error();
            }
            return kNoContent;
        }
        return result.value();
    };
    auto ref = [](ContentId id) -> std::optional<ContentId> {
        return id != kNoContent ? std::optional<ContentId>(id) : std::nullopt;
    };

    // ── Terrains ────────────────────────────────────────────────────
    const auto grass = add(content.Terrains(), terrain("Grass", true, true));
    add(content.Terrains(), terrain("Dirt", true, true));
    add(content.Terrains(), terrain("Path", true, true));
    add(content.Terrains(), terrain("Water", false, false));
    add(content.Terrains(), terrain("Forest", false, false, true));
    content.SetDefaultTerrainId(grass);

    // ── Buffs ───────────────────────────────────────────────────────
    const auto starving = add(content.Buffs(), needDebuff("Starving", -30.0f));
    const auto hungry = add(content.Buffs(), needDebuff("Hungry", -10.0f));
    const auto exhausted = add(content.Buffs(), needDebuff("Exhausted", -25.0f));
    const auto tired = add(content.Buffs(), needDebuff("Tired", -8.0f));
    const auto bored = add(content.Buffs(), needDebuff("Bored", -20.0f));
    const auto understimulated = add(content.Buffs(), needDebuff("Understimulated", -7.0f));
    const auto lonely = add(content.Buffs(), needDebuff("Lonely", -25.0f));
    const auto isolated = add(content.Buffs(), needDebuff("Isolated", -8.0f));
    const auto filthy = add(content.Buffs(), needDebuff("Filthy", -20.0f));
    const auto dirty = add(content.Buffs(), needDebuff("Dirty", -8.0f));
    const auto aimless = add(content.Buffs(), needDebuff("Aimless", -22.0f));
    const auto unfulfilled = add(content.Buffs(), needDebuff("Unfulfilled", -7.0f));

    const auto goodMeal = add(content.Buffs(), timedBuff("GoodMeal", 15.0f, 2400));
    const auto wellRested = add(content.Buffs(), timedBuff("WellRested", 20.0f, 4800));
    const auto feelingFresh = add(content.Buffs(), timedBuff("FeelingFresh", 8.0f, 2000));
    const auto productive = add(content.Buffs(), timedBuff("Productive", 12.0f, 3000));
    const auto socialized = add(content.Buffs(), timedBuff("Socialized", 12.0f, 3000));

    // ── Needs ───────────────────────────────────────────────────────
    auto need = [&](std::string name, float decay, float critical, float low,
                    ContentId criticalDebuff, ContentId lowDebuff) {
        NeedDef def;
        def.name = std::move(name);
        def.decayPerTick = decay;
        def.criticalThreshold = critical;
        def.lowThreshold = low;
        def.criticalDebuffId = ref(criticalDebuff);
        def.lowDebuffId = ref(lowDebuff);
        return def;
    };

    const auto hunger = add(content.Needs(), need("Hunger", 0.02f, 15.0f, 35.0f, starving, hungry));

    auto energyDef = need("Energy", 0.01f, 10.0f, 30.0f, exhausted, tired);
    energyDef.usesTimeOfDayDecay = true;
    const auto energy = add(content.Needs(), std::move(energyDef));

    add(content.Needs(), need("Fun", 0.008f, 20.0f, 40.0f, bored, understimulated));
    const auto social = add(content.Needs(), need("Social", 0.005f, 15.0f, 35.0f, lonely, isolated));
    const auto hygiene = add(content.Needs(), need("Hygiene", 0.008f, 15.0f, 30.0f, filthy, dirty));

    auto purposeDef = need("Purpose", 0.006f, 15.0f, 35.0f, aimless, unfulfilled);
    purposeDef.isWorkNeed = true;
    add(content.Needs(), std::move(purposeDef));

    // ── Buildings ───────────────────────────────────────────────────
    {
        BuildingDef home;
        home.name = "Home";
        home.satisfiesNeedId = ref(energy);
        home.grantsBuffId = ref(wellRested);
        home.tileSize = 2;
        home.baseCost = 0;
        add(content.Buildings(), std::move(home));
    }
    {
        BuildingDef farm;
        farm.name = "Farm";
        farm.satisfiesNeedId = ref(hunger);
        farm.grantsBuffId = ref(goodMeal);
        farm.tileSize = 2;
        farm.resourceType = "food";
        farm.maxResourceAmount = 100.0f;
        farm.depletionMult = 1.0f;
        farm.canBeWorkedAt = true;
        farm.workType = WorkType::Direct;
        farm.workBuffId = ref(productive);
        farm.canSellToConsumers = false;
        farm.initialGold = 50;
        add(content.Buildings(), std::move(farm));
    }
    {
        BuildingDef market;
        market.name = "Market";
        market.satisfiesNeedId = ref(hunger);
        market.grantsBuffId = ref(goodMeal);
        market.tileSize = 2;
        market.resourceType = "food";
        market.maxResourceAmount = 100.0f;
        market.depletionMult = 1.0f;
        market.canBeWorkedAt = true;
        market.workType = WorkType::HaulFromBuilding;
        market.haulSourceResourceType = "food";
        market.workBuffId = ref(productive);
        market.initialGold = 100;
        add(content.Buildings(), std::move(market));
    }
    {
        BuildingDef well;
        well.name = "Well";
        well.satisfiesNeedId = ref(hygiene);
        well.grantsBuffId = ref(feelingFresh);
        well.resourceType = "water";
        well.maxResourceAmount = 999.0f;
        well.depletionMult = 0.0f;
        well.baseCost = 0;
        add(content.Buildings(), std::move(well));
    }
    {
        BuildingDef tavern;
        tavern.name = "Tavern";
        tavern.satisfiesNeedId = ref(social);
        tavern.grantsBuffId = ref(socialized);
        tavern.tileSize = 2;
        add(content.Buildings(), std::move(tavern));
    }

    if (firstError) {
        TSIM_LOG_ERROR(LogCategory::Content,
                       "default content failed: " + std::string(firstError->message()));
        return GameResult<ContentRegistry>::err(std::move(*firstError));
    }

    TSIM_LOG_DEBUG(LogCategory::Content,
                   "default content: " + std::to_string(content.Needs().Size()) + " needs, " +
                       std::to_string(content.Buffs().Size()) + " buffs, " +
                       std::to_string(content.Buildings().Size()) + " buildings");
    return GameResult<ContentRegistry>::ok(std::move(content));
}

} // namespace tsim::sim
