#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible core operation.

#include "tcc/core/result.hpp"
#include "tcc/foundation/game_error.hpp"

namespace tcc::foundation {

/// Result specialized with GameError.
///
/// Example:
/// @code
///   GameResult<void> TargetRegistry::Register(CombatTarget& target) {
///       if (!target.Id().isValid()) {
///           return GameResult<void>::err(
///               GameError(ErrorCode::InvalidArgument, "target has no id"));
///       }
///       ...
///       return GameResult<void>::ok();
///   }
/// @endcode
template <typename T>
using GameResult = tcc::Result<T, GameError>;

} // namespace tcc::foundation
