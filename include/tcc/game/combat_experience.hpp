#pragma once

/// @file combat_experience.hpp
/// @brief Experience awarded for damage dealt in combat.

#include <cstdint>

#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_types.hpp"
#include "tcc/game/skills.hpp"

namespace tcc::game {

class PetProgression;

/// Experience rates per point of damage.
struct ExperienceRates {
    float hitpointsPerDamage = 1.33f;
    float stylePerDamage = 4.0f;
    float petPerDamage = 12.0f;
    float beastmasterPerDamage = 4.0f;
};

/// Converts damage into experience for the attacker's skills.
///
/// Player hits train Hitpoints plus the style's skill (Accurate: Attack,
/// Aggressive: Strength, Defensive: Defence, Controlled: all three in equal
/// integer shares with the remainder to Defence). Magic damage trains Magic
/// and Ranged damage trains Ranged regardless of style.
class CombatExperience {
public:
    explicit CombatExperience(ExperienceRates rates = {}) : rates_(rates) {}

    void AwardPlayerHit(IExperienceSink& sink, foundation::AgentId player, int32_t damage,
                        CombatStyle style, DamageType damageType) const;

    /// Beastmaster experience for the owner and pet experience for the pet.
    /// Either target may be absent.
    void AwardPetHit(IExperienceSink* ownerSink, foundation::AgentId owner,
                     PetProgression* pet, int32_t damage) const;

    [[nodiscard]] const ExperienceRates& Rates() const noexcept { return rates_; }

private:
    ExperienceRates rates_;
};

} // namespace tcc::game
