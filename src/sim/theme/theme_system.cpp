/// @file theme_system.cpp
/// @brief Theme arbitration and the default day/night themes.

#include "tsim/sim/theme_system.hpp"

#include "tsim/foundation/game_logger.hpp"
#include "tsim/sim/sim_context.hpp"

#include <string>

namespace tsim::sim {

using tsim::foundation::LogCategory;

namespace {

constexpr std::string_view kEnergyNeedName = "Energy";

} // namespace

// ── DayTheme ────────────────────────────────────────────────────────────

bool DayTheme::WantsToPlay(const SimContext& ctx) const {
    return !ctx.time.IsNight();
}

void DayTheme::OnStart(SimContext& /*ctx*/) {}

// ── NightTheme ──────────────────────────────────────────────────────────

bool NightTheme::WantsToPlay(const SimContext& ctx) const {
    return ctx.time.IsNight();
}

void NightTheme::OnStart(SimContext& ctx) {
    const auto day = ctx.time.Day();
    if (day == lastDayStarted_) {
        return;
    }
    lastDayStarted_ = day;

    const auto energyId = ctx.content.Needs().IdOf(kEnergyNeedName);
    if (!energyId) {
        return;
    }

    for (auto pawn : ctx.entities.AllPawns()) {
        auto* needs = ctx.entities.TryGet<Needs>(pawn);
        if (needs == nullptr) {
            continue;
        }
        if (auto it = needs->values.find(*energyId); it != needs->values.end()) {
            it->second = 0.0f;
        }
    }
}

// ── ThemeSystem ─────────────────────────────────────────────────────────

ThemeSystem::ThemeSystem() {
    AddTheme(std::make_unique<DayTheme>());
    AddTheme(std::make_unique<NightTheme>());
}

void ThemeSystem::AddTheme(std::unique_ptr<ITheme> theme) {
    themes_.push_back(std::move(theme));
}

void ThemeSystem::Execute(SimContext& ctx) {
    ITheme* best = nullptr;
    for (auto& theme : themes_) {
        if (!theme->WantsToPlay(ctx)) {
            continue;
        }
        if (best == nullptr || theme->Priority() > best->Priority()) {
            best = theme.get();
        }
    }

    if (best == nullptr || best == current_) {
        return;
    }

    current_ = best;
    TSIM_LOG_DEBUG(LogCategory::Core,
                   "theme changed to " + std::string(best->Name()) + " at " + ctx.time.TimeString());
    current_->OnStart(ctx);
}

} // namespace tsim::sim
