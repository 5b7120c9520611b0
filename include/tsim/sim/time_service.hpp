#pragma once

/// @file time_service.hpp
/// @brief In-game clock derived from the tick counter.

#include "tsim/foundation/game_result.hpp"
#include "tsim/sim/world_types.hpp"

#include <cstdint>
#include <string>

namespace tsim::sim {

/// Simulation clock. One tick is 1/10 of an in-game minute.
class TimeService {
public:
    static constexpr int32_t kTicksPerMinute = 10;
    static constexpr int32_t kMinutesPerHour = 60;
    static constexpr int32_t kHoursPerDay = 24;
    static constexpr int32_t kTicksPerHour = kTicksPerMinute * kMinutesPerHour;
    static constexpr int32_t kTicksPerDay = kTicksPerHour * kHoursPerDay;
    static constexpr int32_t kDefaultStartHour = 8;

    /// Clock starting at 08:00 on day 1.
    TimeService() = default;

    /// Clock starting at @p startHour on day 1.
    /// @return InvalidConfig when the hour is outside 0..23.
    [[nodiscard]] static tsim::foundation::GameResult<TimeService> Create(int32_t startHour);

    [[nodiscard]] Tick CurrentTick() const noexcept { return tick_; }
    [[nodiscard]] int64_t TotalMinutes() const noexcept { return tick_ / kTicksPerMinute; }
    [[nodiscard]] int32_t Minute() const noexcept;
    [[nodiscard]] int32_t Hour() const noexcept;

    /// 1-based day number.
    [[nodiscard]] int64_t Day() const noexcept { return tick_ / kTicksPerDay + 1; }

    /// 22:00 - 06:00.
    [[nodiscard]] bool IsNight() const noexcept;

    /// 23:00 - 06:00.
    [[nodiscard]] bool IsSleepTime() const noexcept;

    /// Energy decays 2.5x during sleep time, 1.5x during the rest of the
    /// night and normally by day.
    [[nodiscard]] float EnergyDecayMultiplier() const noexcept;

    /// Fraction of the current day elapsed, in [0, 1).
    [[nodiscard]] double DayFraction() const noexcept;

    /// "Day D, HH:MM"
    [[nodiscard]] std::string TimeString() const;

    void Advance() noexcept { ++tick_; }

    /// Restore the clock to an externally saved tick.
    void SetTick(Tick tick) noexcept { tick_ = tick; }

private:
    Tick tick_ = static_cast<Tick>(kDefaultStartHour) * kTicksPerHour;
};

} // namespace tsim::sim
