/// @file combat_resolver.cpp
/// @brief CombatResolver implementation.

#include "tcc/game/combat_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "tcc/game/combat_math.hpp"

namespace tcc::game {

CombatResolver::CombatResolver(foundation::RandomSource& rng, float minHitChance)
    : rng_(rng), minHitChance_(std::clamp(minHitChance, 0.0f, 1.0f)) {}

AttackOutcome CombatResolver::Resolve(const CombatantStats& attacker,
                                      const CombatantStats& defender) {
    const DamageType incoming = attacker.damageType;

    AttackOutcome outcome;
    outcome.attackRoll = CombatMath::AttackRoll(
        CombatMath::EffectiveAttack(attacker.attackLevel, attacker.style),
        attacker.equipment.AccuracyBonusFor(incoming));
    outcome.defenceRoll = CombatMath::DefenceRoll(
        CombatMath::EffectiveDefence(defender.defenceLevel, defender.style),
        defender.equipment.DefenceBonusFor(incoming));
    outcome.hitChance = std::max(
        CombatMath::ChanceToHit(outcome.attackRoll, outcome.defenceRoll), minHitChance_);

    const int32_t baseMaxHit = CombatMath::MaxHit(
        CombatMath::EffectiveStrength(attacker.strengthLevel, attacker.style),
        attacker.equipment.strength);
    const double scaledMaxHit =
        static_cast<double>(baseMaxHit) * std::max(attacker.maxHitMultiplier, 0.0f);
    outcome.maxHit = static_cast<int32_t>(
        std::lround(std::min(scaledMaxHit, static_cast<double>(INT32_MAX))));

    outcome.hit = rng_.NextFloat(0.0f, 1.0f) < outcome.hitChance;
    outcome.damage = outcome.hit ? CombatMath::RollDamage(outcome.maxHit, rng_) : 0;
    return outcome;
}

} // namespace tcc::game
