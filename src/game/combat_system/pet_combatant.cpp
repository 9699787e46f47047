#include "tcc/game/pet_combatant.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tcc/game/pet_progression.hpp"

namespace tcc::game {

foundation::GameResult<void> PetDefinition::Validate() const {
    auto invalid = [this](const char* field) {
        return foundation::GameResult<void>::err(foundation::GameError(
            foundation::ErrorCode::InvalidPetDefinition,
            "pet definition '" + name + "': invalid " + field, std::string(field)));
    };

    if (attackLevel < 1) return invalid("attackLevel");
    if (strengthLevel < 1) return invalid("strengthLevel");
    if (attackSpeedTicks < 1) return invalid("attackSpeedTicks");
    if (hitpoints < 1) return invalid("hitpoints");
    if (attackLevelPerBeastmasterLevel < 0.0f) return invalid("attackLevelPerBeastmasterLevel");
    if (strengthLevelPerBeastmasterLevel < 0.0f) return invalid("strengthLevelPerBeastmasterLevel");
    if (accuracyBonusPerBeastmasterLevel < 0.0f) return invalid("accuracyBonusPerBeastmasterLevel");
    if (damageBonusPerBeastmasterLevel < 0.0f) return invalid("damageBonusPerBeastmasterLevel");
    if (maxHitPerBeastmasterLevel < 0.0f) return invalid("maxHitPerBeastmasterLevel");
    return foundation::GameResult<void>::ok();
}

PetCombatant::PetCombatant(foundation::AgentId id,
                           foundation::AgentId owner,
                           PetDefinition definition,
                           const ISkillSource* ownerSkills,
                           const PetProgression* progression)
    : id_(id),
      owner_(owner),
      definition_(std::move(definition)),
      ownerSkills_(ownerSkills),
      progression_(progression),
      health_(id, std::max(definition_.hitpoints, 1)) {}

bool PetCombatant::IsAlive() const {
    return definition_.invulnerable || health_.IsAlive();
}

CombatantStats PetCombatant::AttackerStats() const {
    const float tier = progression_ != nullptr ? progression_->StatMultiplier() : 1.0f;
    const int32_t beastmaster =
        ownerSkills_ != nullptr ? ownerSkills_->GetLevel(SkillType::Beastmaster) : 0;
    return CombatantStats::ForPet(definition_, tier, beastmaster);
}

CombatantStats PetCombatant::DefenderStats(DamageType incoming) const {
    auto stats = AttackerStats();
    stats.damageType = incoming;
    return stats;
}

int32_t PetCombatant::ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) {
    if (definition_.invulnerable) {
        return 0;
    }
    return health_.ApplyDamage(amount, type, source);
}

} // namespace tcc::game
