#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for simulation error handling.

#include "tsim/core/result.hpp"
#include "tsim/foundation/game_error.hpp"

namespace tsim::foundation {

/// Result type specialized with GameError.
///
/// Factories and configuration loaders that can fail return GameResult<T>
/// instead of throwing exceptions.
///
/// Example:
/// @code
///   GameResult<int> parseHour(int hour) {
///       if (hour < 0 || hour > 23) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidConfig, "start hour out of range"));
///       }
///       return GameResult<int>::ok(hour);
///   }
/// @endcode
template <typename T>
using GameResult = tsim::Result<T, GameError>;

}  // namespace tsim::foundation
