#pragma once

/// @file combat_resolver.hpp
/// @brief Resolves one attack from two stat snapshots.

#include <cstdint>

#include "tcc/foundation/random_source.hpp"
#include "tcc/game/combatant_stats.hpp"

namespace tcc::game {

/// Everything computed while resolving one attack.
struct AttackOutcome {
    bool hit = false;
    int32_t damage = 0;
    int32_t maxHit = 0;
    float hitChance = 0.0f;
    int32_t attackRoll = 0;
    int32_t defenceRoll = 0;
};

/// Turns attacker/defender snapshots into an AttackOutcome.
///
/// Accuracy uses the attacker's bonus for its own damage type; defence uses
/// the defender's bonus against that same incoming type. The hit chance is
/// raised to the configured floor before the roll.
class CombatResolver {
public:
    explicit CombatResolver(foundation::RandomSource& rng, float minHitChance = 0.0f);

    [[nodiscard]] AttackOutcome Resolve(const CombatantStats& attacker,
                                        const CombatantStats& defender);

    [[nodiscard]] float MinHitChance() const noexcept { return minHitChance_; }

private:
    foundation::RandomSource& rng_;
    float minHitChance_;
};

} // namespace tcc::game
