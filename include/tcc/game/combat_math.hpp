#pragma once

/// @file combat_math.hpp
/// @brief Closed-form accuracy and damage formulas.
///
/// All functions are pure. The only randomness is RollDamage(), which draws
/// from the RandomSource passed in by the caller.

#include <cstdint>

#include "tcc/foundation/random_source.hpp"
#include "tcc/game/combat_types.hpp"

namespace tcc::game {

/// Static utility class for combat formulas.
///
/// Inputs are clamped instead of rejected: effective levels are at least 1
/// and equipment bonuses below zero count as zero, so no formula produces a
/// negative roll, a division by zero or NaN.
///
///   attackRoll  = effectiveAttack  * (bonus + 64)
///   defenceRoll = effectiveDefence * (bonus + 64)
///   maxHit      = floor(0.5 + effectiveStrength * (bonus + 64) / 640)
class CombatMath {
public:
    CombatMath() = delete;

    /// Attack level plus the style's attack bonus, at least 1.
    [[nodiscard]] static int32_t EffectiveAttack(int32_t level, CombatStyle style) noexcept;

    /// Strength level plus the style's strength bonus, at least 1.
    [[nodiscard]] static int32_t EffectiveStrength(int32_t level, CombatStyle style) noexcept;

    /// Defence level plus the style's defence bonus, at least 1.
    [[nodiscard]] static int32_t EffectiveDefence(int32_t level, CombatStyle style) noexcept;

    [[nodiscard]] static int32_t AttackRoll(int32_t effectiveAttack, int32_t attackBonus) noexcept;

    [[nodiscard]] static int32_t DefenceRoll(int32_t effectiveDefence, int32_t defenceBonus) noexcept;

    /// Probability in [0,1] that an attack roll beats a defence roll.
    ///
    ///   attackRoll > defenceRoll: 1 - (defenceRoll + 2) / (2 * (attackRoll + 1))
    ///   otherwise:                attackRoll / (2 * (defenceRoll + 1))
    [[nodiscard]] static float ChanceToHit(int32_t attackRoll, int32_t defenceRoll) noexcept;

    [[nodiscard]] static int32_t MaxHit(int32_t effectiveStrength, int32_t strengthBonus) noexcept;

    /// Uniform damage in [0, maxHit]; 0 when maxHit <= 0.
    [[nodiscard]] static int32_t RollDamage(int32_t maxHit, foundation::RandomSource& rng);

    /// Real-time length of an attack cadence of @p ticks.
    [[nodiscard]] static float AttackIntervalSeconds(int32_t ticks,
                                                     float tickSeconds = kTickSeconds) noexcept;
};

} // namespace tcc::game
