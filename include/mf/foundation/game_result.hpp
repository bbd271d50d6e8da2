#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "mf/core/result.hpp"
#include "mf/foundation/game_error.hpp"

namespace mf::foundation {

/// Result type specialized with GameError for engine operations.
///
/// Example:
/// @code
///   GameResult<Catalyst> makeRuby(int tier) {
///       if (tier < 1 || tier > 5) {
///           return GameResult<Catalyst>::err(
///               GameError(ErrorCode::InvalidCatalyst, "tier out of range"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using GameResult = mf::Result<T, GameError>;

}  // namespace mf::foundation
