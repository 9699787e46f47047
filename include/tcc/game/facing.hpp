#pragma once

/// @file facing.hpp
/// @brief Facing direction from a movement or attack vector.

#include <cmath>

#include "tcc/game/combat_types.hpp"
#include "tcc/game/math_types.hpp"

namespace tcc::game {

/// Facing along the dominant axis of @p delta (y grows upward).
/// Ties go to the vertical axis; a zero vector faces Down.
[[nodiscard]] inline FacingDirection FacingFromDelta(const Vector2& delta) noexcept {
    if (std::fabs(delta.x) > std::fabs(delta.y)) {
        return delta.x < 0.0f ? FacingDirection::Left : FacingDirection::Right;
    }
    return delta.y > 0.0f ? FacingDirection::Up : FacingDirection::Down;
}

/// Facing of an agent at @p from looking at @p to.
[[nodiscard]] inline FacingDirection FacingToward(const Vector2& from, const Vector2& to) noexcept {
    return FacingFromDelta(to - from);
}

} // namespace tcc::game
