/// @file combatant_stats.cpp
/// @brief CombatantStats construction paths.

#include "tcc/game/combatant_stats.hpp"

#include <algorithm>
#include <cmath>

#include "tcc/game/npc_profile.hpp"
#include "tcc/game/pet_definition.hpp"
#include "tcc/game/skills.hpp"

namespace tcc::game {

namespace {

int32_t Scale(int32_t value, float factor) {
    return static_cast<int32_t>(std::lround(static_cast<double>(value) * factor));
}

float BeastmasterFactor(float perLevel, int32_t beastmasterLevel) {
    return 1.0f + std::max(perLevel, 0.0f) * static_cast<float>(std::max(beastmasterLevel, 0));
}

} // namespace

CombatantStats CombatantStats::ForPlayer(const ISkillSource* skills,
                                         const IEquipmentSource* equipment,
                                         CombatStyle style,
                                         DamageType damageType) {
    CombatantStats stats;
    if (skills != nullptr) {
        stats.attackLevel = std::max(skills->GetLevel(SkillType::Attack), 1);
        stats.strengthLevel = std::max(skills->GetLevel(SkillType::Strength), 1);
        stats.defenceLevel = std::max(skills->GetLevel(SkillType::Defence), 1);
    }
    if (equipment != nullptr) {
        stats.equipment = equipment->CombinedStats();
        stats.equipment.attackSpeedTicks = std::max(stats.equipment.attackSpeedTicks, 1);
    }
    stats.style = style;
    stats.damageType = damageType;
    return stats;
}

CombatantStats CombatantStats::ForNpc(const NpcCombatProfile& profile) {
    CombatantStats stats;
    stats.attackLevel = std::max(profile.attackLevel, 1);
    stats.strengthLevel = std::max(profile.strengthLevel, 1);
    stats.defenceLevel = std::max(profile.defenceLevel, 1);
    stats.equipment.attack = profile.attackBonus;
    stats.equipment.strength = profile.strengthBonus;
    stats.equipment.meleeDefence = profile.meleeDefence;
    stats.equipment.rangeDefence = profile.rangeDefence;
    stats.equipment.magicDefence = profile.magicDefence;
    stats.equipment.attackSpeedTicks = std::max(profile.attackSpeedTicks, 1);
    stats.style = profile.style;
    stats.damageType = profile.attackType;
    return stats;
}

CombatantStats CombatantStats::ForPet(const PetDefinition& definition,
                                      float petStatMultiplier,
                                      int32_t beastmasterLevel) {
    const float mult = std::max(petStatMultiplier, 0.0f);

    CombatantStats stats;
    stats.attackLevel = Scale(definition.attackLevel, mult);
    stats.strengthLevel = Scale(definition.strengthLevel, mult);
    stats.equipment.attack = Scale(definition.accuracyBonus, mult);
    stats.equipment.strength = Scale(definition.damageBonus, mult);

    stats.attackLevel = Scale(stats.attackLevel,
        BeastmasterFactor(definition.attackLevelPerBeastmasterLevel, beastmasterLevel));
    stats.strengthLevel = Scale(stats.strengthLevel,
        BeastmasterFactor(definition.strengthLevelPerBeastmasterLevel, beastmasterLevel));
    stats.equipment.attack = Scale(stats.equipment.attack,
        BeastmasterFactor(definition.accuracyBonusPerBeastmasterLevel, beastmasterLevel));
    stats.equipment.strength = Scale(stats.equipment.strength,
        BeastmasterFactor(definition.damageBonusPerBeastmasterLevel, beastmasterLevel));
    stats.maxHitMultiplier =
        BeastmasterFactor(definition.maxHitPerBeastmasterLevel, beastmasterLevel);

    stats.attackLevel = std::max(stats.attackLevel, 1);
    stats.strengthLevel = std::max(stats.strengthLevel, 1);
    stats.defenceLevel = 1;
    stats.equipment.attackSpeedTicks = std::max(definition.attackSpeedTicks, 1);
    stats.style = CombatStyle::Accurate;
    stats.damageType = DamageType::Melee;
    return stats;
}

CombatantStats CombatantStats::Fallback(DamageType preferredDefenceType) {
    CombatantStats stats;
    stats.style = CombatStyle::Defensive;
    stats.damageType = preferredDefenceType;
    return stats;
}

} // namespace tcc::game
