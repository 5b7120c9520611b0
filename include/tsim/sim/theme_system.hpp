#pragma once

/// @file theme_system.hpp
/// @brief Day/night themes and the system that arbitrates between them.

#include "tsim/ecs/system_scheduler.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace tsim::sim {

struct SimContext;

/// A mode the simulation can be in. The highest-priority theme that
/// wants to play is the active one.
class ITheme {
public:
    virtual ~ITheme() = default;

    [[nodiscard]] virtual int32_t Priority() const noexcept = 0;
    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    [[nodiscard]] virtual bool WantsToPlay(const SimContext& ctx) const = 0;

    /// Called when the theme becomes active.
    virtual void OnStart(SimContext& ctx) = 0;
};

class DayTheme final : public ITheme {
public:
    [[nodiscard]] int32_t Priority() const noexcept override { return 1; }
    [[nodiscard]] std::string_view Name() const noexcept override { return "Day"; }
    [[nodiscard]] bool WantsToPlay(const SimContext& ctx) const override;
    void OnStart(SimContext& ctx) override;
};

/// Drains every pawn's Energy the first time it starts on a given day.
class NightTheme final : public ITheme {
public:
    [[nodiscard]] int32_t Priority() const noexcept override { return 2; }
    [[nodiscard]] std::string_view Name() const noexcept override { return "Night"; }
    [[nodiscard]] bool WantsToPlay(const SimContext& ctx) const override;
    void OnStart(SimContext& ctx) override;

private:
    int64_t lastDayStarted_ = -1;
};

class ThemeSystem final : public tsim::ecs::ISystem {
public:
    /// Registers the default DayTheme and NightTheme.
    ThemeSystem();

    void AddTheme(std::unique_ptr<ITheme> theme);

    void Execute(SimContext& ctx) override;

    [[nodiscard]] tsim::ecs::SystemStage GetStage() const override {
        return tsim::ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "ThemeSystem"; }

    /// The active theme, or nullptr before the first tick.
    [[nodiscard]] const ITheme* Current() const noexcept { return current_; }

    /// Name of the active theme, or an empty view.
    [[nodiscard]] std::string_view CurrentName() const noexcept {
        return current_ != nullptr ? current_->Name() : std::string_view{};
    }

private:
    std::vector<std::unique_ptr<ITheme>> themes_;
    ITheme* current_ = nullptr;
};

} // namespace tsim::sim
