#pragma once

/// @file npc_profile.hpp
/// @brief Static combat profile of an NPC type.

#include <cstdint>
#include <string>

#include "tcc/foundation/game_result.hpp"
#include "tcc/game/combat_types.hpp"
#include "tcc/game/faction.hpp"

namespace tcc::game {

/// Levels, bonuses and engagement rules shared by every NPC of a type.
struct NpcCombatProfile {
    std::string name = "npc";

    int32_t attackLevel = 1;
    int32_t strengthLevel = 1;
    int32_t defenceLevel = 1;
    int32_t hitpoints = 10;

    int32_t attackBonus = 0;
    int32_t strengthBonus = 0;
    int32_t meleeDefence = 0;
    int32_t rangeDefence = 0;
    int32_t magicDefence = 0;

    int32_t attackSpeedTicks = kDefaultAttackSpeedTicks;

    /// Ticks between death and respawn; 0 disables respawn.
    int32_t respawnTicks = 0;

    DamageType attackType = DamageType::Melee;
    CombatStyle style = CombatStyle::Accurate;

    /// Engage targets that come within aggro range without being attacked.
    bool aggressive = false;

    /// Fight back when damaged while idle.
    bool retaliates = true;

    /// Aggro radius around spawn; 0 derives it from the wander bounds.
    float aggroRange = 0.0f;

    FactionId faction = kNeutralFaction;

    /// Check that levels, hitpoints and cadence are usable.
    /// @return Success or InvalidCombatProfile naming the first bad field.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

} // namespace tcc::game
