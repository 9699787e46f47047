#pragma once

/// @file combatant_stats.hpp
/// @brief Per-resolution stat snapshot of an attacker or defender.

#include <cstdint>

#include "tcc/game/combat_types.hpp"

namespace tcc::game {

class ISkillSource;
class IEquipmentSource;
struct NpcCombatProfile;
struct PetDefinition;

/// Levels, bonuses, style and damage type captured at the moment an attack
/// is resolved. Built fresh for each resolution and never cached.
struct CombatantStats {
    int32_t attackLevel = 1;
    int32_t strengthLevel = 1;
    int32_t defenceLevel = 1;
    EquipmentBonus equipment;
    CombatStyle style = CombatStyle::Accurate;
    DamageType damageType = DamageType::Melee;

    /// Scales the computed max hit (pet Beastmaster scaling).
    float maxHitMultiplier = 1.0f;

    /// Snapshot from live skills and equipment. Null sources read as
    /// level 1 and no bonuses.
    [[nodiscard]] static CombatantStats ForPlayer(const ISkillSource* skills,
                                                  const IEquipmentSource* equipment,
                                                  CombatStyle style,
                                                  DamageType damageType);

    /// Snapshot from a static NPC profile.
    [[nodiscard]] static CombatantStats ForNpc(const NpcCombatProfile& profile);

    /// Snapshot of a pet.
    ///
    /// Levels and bonuses are first scaled by @p petStatMultiplier (the pet
    /// level tier), then by the owner's Beastmaster level using the
    /// definition's per-level fractions. Values are rounded half away from
    /// zero after each step.
    [[nodiscard]] static CombatantStats ForPet(const PetDefinition& definition,
                                               float petStatMultiplier,
                                               int32_t beastmasterLevel);

    /// Minimal defender used when a target offers nothing richer.
    [[nodiscard]] static CombatantStats Fallback(DamageType preferredDefenceType);
};

} // namespace tcc::game
