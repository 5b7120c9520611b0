/// @file time_service.cpp
/// @brief TimeService implementation.

#include "tsim/sim/time_service.hpp"

#include <cstdio>

namespace tsim::sim {

using tsim::foundation::ErrorCode;
using tsim::foundation::GameError;
using tsim::foundation::GameResult;

GameResult<TimeService> TimeService::Create(int32_t startHour) {
    if (startHour < 0 || startHour >= kHoursPerDay) {
        return GameResult<TimeService>::err(
            GameError(ErrorCode::InvalidConfig,
                      "start hour must be in 0..23, got " + std::to_string(startHour)));
    }
    TimeService time;
    time.tick_ = static_cast<Tick>(startHour) * kTicksPerHour;
    return GameResult<TimeService>::ok(time);
}

int32_t TimeService::Minute() const noexcept {
    return static_cast<int32_t>(TotalMinutes() % kMinutesPerHour);
}

int32_t TimeService::Hour() const noexcept {
    return static_cast<int32_t>((tick_ / kTicksPerHour) % kHoursPerDay);
}

bool TimeService::IsNight() const noexcept {
    const auto hour = Hour();
    return hour < 6 || hour >= 22;
}

bool TimeService::IsSleepTime() const noexcept {
    const auto hour = Hour();
    return hour < 6 || hour >= 23;
}

float TimeService::EnergyDecayMultiplier() const noexcept {
    if (IsSleepTime()) {
        return 2.5f;
    }
    if (IsNight()) {
        return 1.5f;
    }
    return 1.0f;
}

double TimeService::DayFraction() const noexcept {
    return static_cast<double>(tick_ % kTicksPerDay) / static_cast<double>(kTicksPerDay);
}

std::string TimeService::TimeString() const {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "Day %lld, %02d:%02d",
                  static_cast<long long>(Day()), Hour(), Minute());
    return buffer;
}

} // namespace tsim::sim
