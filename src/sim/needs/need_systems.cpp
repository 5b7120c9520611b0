/// @file need_systems.cpp
/// @brief NeedsSystem, SocialSystem, BuffSystem and MoodSystem.

#include "tsim/sim/need_systems.hpp"

#include "tsim/foundation/game_logger.hpp"
#include "tsim/sim/sim_context.hpp"

#include <algorithm>
#include <optional>

namespace tsim::sim {

using tsim::foundation::LogCategory;
using tsim::foundation::LogContext;
using tsim::foundation::LogLevel;

namespace {

struct WantedDebuff {
    BuffSource source;
    ContentId buffDefId;
};

std::optional<WantedDebuff> wantedDebuff(const NeedDef& need, float value) {
    if (value < need.criticalThreshold && need.criticalDebuffId) {
        return WantedDebuff{BuffSource::NeedCritical, *need.criticalDebuffId};
    }
    if (value < need.lowThreshold && need.lowDebuffId) {
        return WantedDebuff{BuffSource::NeedLow, *need.lowDebuffId};
    }
    return std::nullopt;
}

} // namespace

void ReconcileNeedDebuffs(Buffs& buffs, const NeedDef& need, float value, Tick now,
                          const ContentRegistry& content) {
    const auto wanted = wantedDebuff(need, value);

    if (wanted) {
        const auto* existing = buffs.Find(wanted->source, need.id);
        if (existing != nullptr && existing->buffDefId == wanted->buffDefId) {
            const auto other = wanted->source == BuffSource::NeedCritical ? BuffSource::NeedLow
                                                                          : BuffSource::NeedCritical;
            buffs.RemoveFrom(other, need.id);
            return;
        }
    }

    buffs.RemoveFrom(BuffSource::NeedCritical, need.id);
    buffs.RemoveFrom(BuffSource::NeedLow, need.id);

    if (!wanted) {
        return;
    }

    const auto* def = content.Buffs().Find(wanted->buffDefId);
    if (def == nullptr) {
        return;
    }

    BuffInstance instance;
    instance.source = wanted->source;
    instance.sourceId = need.id;
    instance.buffDefId = def->id;
    instance.moodOffset = def->moodOffset;
    instance.startTick = now;
    instance.endTick = -1;
    buffs.Apply(instance);
}

// ── NeedsSystem ─────────────────────────────────────────────────────────

void NeedsSystem::Execute(SimContext& ctx) {
    const float timeOfDay = ctx.time.EnergyDecayMultiplier();
    const auto now = ctx.Now();

    for (auto pawn : ctx.entities.AllPawns()) {
        auto* needs = ctx.entities.TryGet<Needs>(pawn);
        auto* buffs = ctx.entities.TryGet<Buffs>(pawn);
        if (needs == nullptr || buffs == nullptr) {
            continue;
        }

        for (auto& [needId, value] : needs->values) {
            const auto* def = ctx.content.Needs().Find(needId);
            if (def == nullptr) {
                continue;
            }

            const float decay = def->decayPerTick * (def->usesTimeOfDayDecay ? timeOfDay : 1.0f);
            const float before = value;
            value = ClampNeed(value - decay);

            if (before >= def->criticalThreshold && value < def->criticalThreshold) {
                LogContext logCtx;
                logCtx.entityId = pawn.id();
                logCtx.tick = now;
                logCtx.system = "NeedsSystem";
                TSIM_LOG_CTX(LogLevel::Debug, LogCategory::Needs,
                             def->name + " became critical", logCtx);
            }

            ReconcileNeedDebuffs(*buffs, *def, value, now, ctx.content);
        }
    }
}

// ── SocialSystem ────────────────────────────────────────────────────────

void SocialSystem::Execute(SimContext& ctx) {
    const auto socialId = ctx.content.Needs().IdOf(kSocialNeedName);
    if (!socialId) {
        return;
    }

    const auto pawns = ctx.entities.AllPawns();
    const auto& positions = ctx.entities.Storage<Position>();

    for (auto pawn : pawns) {
        auto* needs = ctx.entities.TryGet<Needs>(pawn);
        const auto* pos = positions.TryGet(pawn);
        if (needs == nullptr || pos == nullptr) {
            continue;
        }
        auto it = needs->values.find(*socialId);
        if (it == needs->values.end()) {
            continue;
        }

        int32_t neighbors = 0;
        for (auto other : pawns) {
            if (other == pawn) {
                continue;
            }
            const auto* otherPos = positions.TryGet(other);
            if (otherPos != nullptr && ManhattanDistance(pos->coord, otherPos->coord) <= kSocialRadius) {
                ++neighbors;
            }
        }

        if (neighbors > 0) {
            it->second = std::min(100.0f, it->second + kSocialGainPerNeighbor * neighbors);
        }
    }
}

// ── BuffSystem ──────────────────────────────────────────────────────────

void BuffSystem::Execute(SimContext& ctx) {
    const auto now = ctx.Now();
    for (auto& buffs : ctx.entities.Storage<Buffs>()) {
        std::erase_if(buffs.active, [now](const BuffInstance& b) {
            return b.endTick > 0 && b.endTick <= now;
        });
    }
}

// ── MoodSystem ──────────────────────────────────────────────────────────

void MoodSystem::Execute(SimContext& ctx) {
    for (auto pawn : ctx.entities.AllPawns()) {
        auto* mood = ctx.entities.TryGet<Mood>(pawn);
        const auto* buffs = ctx.entities.TryGet<Buffs>(pawn);
        if (mood == nullptr || buffs == nullptr) {
            continue;
        }

        float total = 0.0f;
        for (const auto& instance : buffs->active) {
            total += instance.moodOffset;
        }
        mood->value = std::clamp(total, -100.0f, 100.0f);
    }
}

} // namespace tsim::sim
