/// @file combat_math.cpp
/// @brief CombatMath formula implementations.

#include "tcc/game/combat_math.hpp"

#include <algorithm>
#include <cstdint>

namespace tcc::game {

namespace {

int32_t StyleAttackBonus(CombatStyle style) {
    switch (style) {
        case CombatStyle::Accurate:   return kStyleBonus;
        case CombatStyle::Controlled: return kControlledStyleBonus;
        default:                      return 0;
    }
}

int32_t StyleStrengthBonus(CombatStyle style) {
    switch (style) {
        case CombatStyle::Aggressive: return kStyleBonus;
        case CombatStyle::Controlled: return kControlledStyleBonus;
        default:                      return 0;
    }
}

int32_t StyleDefenceBonus(CombatStyle style) {
    switch (style) {
        case CombatStyle::Defensive:  return kStyleBonus;
        case CombatStyle::Controlled: return kControlledStyleBonus;
        default:                      return 0;
    }
}

int32_t Roll(int32_t effective, int32_t bonus) {
    const int64_t roll = static_cast<int64_t>(std::max(effective, 1)) *
                         (static_cast<int64_t>(std::max(bonus, 0)) + kRollBonusOffset);
    return static_cast<int32_t>(std::min<int64_t>(roll, INT32_MAX));
}

} // namespace

int32_t CombatMath::EffectiveAttack(int32_t level, CombatStyle style) noexcept {
    return std::max(level + StyleAttackBonus(style), 1);
}

int32_t CombatMath::EffectiveStrength(int32_t level, CombatStyle style) noexcept {
    return std::max(level + StyleStrengthBonus(style), 1);
}

int32_t CombatMath::EffectiveDefence(int32_t level, CombatStyle style) noexcept {
    return std::max(level + StyleDefenceBonus(style), 1);
}

int32_t CombatMath::AttackRoll(int32_t effectiveAttack, int32_t attackBonus) noexcept {
    return Roll(effectiveAttack, attackBonus);
}

int32_t CombatMath::DefenceRoll(int32_t effectiveDefence, int32_t defenceBonus) noexcept {
    return Roll(effectiveDefence, defenceBonus);
}

float CombatMath::ChanceToHit(int32_t attackRoll, int32_t defenceRoll) noexcept {
    const double a = std::max(attackRoll, 0);
    const double d = std::max(defenceRoll, 0);

    double chance = 0.0;
    if (a > d) {
        chance = 1.0 - (d + 2.0) / (2.0 * (a + 1.0));
    } else {
        chance = a / (2.0 * (d + 1.0));
    }
    return static_cast<float>(std::clamp(chance, 0.0, 1.0));
}

int32_t CombatMath::MaxHit(int32_t effectiveStrength, int32_t strengthBonus) noexcept {
    // floor(0.5 + s*(b+64)/640) computed in integers: (s*(b+64) + 320) / 640
    const int64_t scaled = static_cast<int64_t>(std::max(effectiveStrength, 1)) *
                           (static_cast<int64_t>(std::max(strengthBonus, 0)) + kRollBonusOffset);
    return static_cast<int32_t>(
        std::min<int64_t>((scaled + kMaxHitDivisor / 2) / kMaxHitDivisor, INT32_MAX));
}

int32_t CombatMath::RollDamage(int32_t maxHit, foundation::RandomSource& rng) {
    if (maxHit <= 0) {
        return 0;
    }
    return std::clamp(rng.NextInt(0, maxHit), 0, maxHit);
}

float CombatMath::AttackIntervalSeconds(int32_t ticks, float tickSeconds) noexcept {
    return static_cast<float>(std::max(ticks, 1)) * std::max(tickSeconds, 0.0f);
}

} // namespace tcc::game
