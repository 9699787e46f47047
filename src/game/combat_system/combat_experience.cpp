#include "tcc/game/combat_experience.hpp"

#include "tcc/game/pet_progression.hpp"

namespace tcc::game {

void CombatExperience::AwardPlayerHit(IExperienceSink& sink, foundation::AgentId player,
                                      int32_t damage, CombatStyle style,
                                      DamageType damageType) const {
    if (damage <= 0) {
        return;
    }

    const float dmg = static_cast<float>(damage);
    sink.AddExperience(player, SkillType::Hitpoints, dmg * rates_.hitpointsPerDamage);

    const float styleXp = dmg * rates_.stylePerDamage;
    if (damageType == DamageType::Magic) {
        sink.AddExperience(player, SkillType::Magic, styleXp);
        return;
    }
    if (damageType == DamageType::Ranged) {
        sink.AddExperience(player, SkillType::Ranged, styleXp);
        return;
    }

    switch (style) {
        case CombatStyle::Accurate:
            sink.AddExperience(player, SkillType::Attack, styleXp);
            break;
        case CombatStyle::Aggressive:
            sink.AddExperience(player, SkillType::Strength, styleXp);
            break;
        case CombatStyle::Defensive:
            sink.AddExperience(player, SkillType::Defence, styleXp);
            break;
        case CombatStyle::Controlled: {
            const auto total = static_cast<int32_t>(styleXp);
            const int32_t share = total / 3;
            sink.AddExperience(player, SkillType::Attack, static_cast<float>(share));
            sink.AddExperience(player, SkillType::Strength, static_cast<float>(share));
            sink.AddExperience(player, SkillType::Defence,
                               static_cast<float>(total - 2 * share));
            break;
        }
    }
}

void CombatExperience::AwardPetHit(IExperienceSink* ownerSink, foundation::AgentId owner,
                                   PetProgression* pet, int32_t damage) const {
    if (damage <= 0) {
        return;
    }
    const float dmg = static_cast<float>(damage);
    if (pet != nullptr) {
        pet->AddExperience(static_cast<double>(dmg * rates_.petPerDamage));
    }
    if (ownerSink != nullptr && owner.isValid()) {
        ownerSink->AddExperience(owner, SkillType::Beastmaster, dmg * rates_.beastmasterPerDamage);
    }
}

} // namespace tcc::game
