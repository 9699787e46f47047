#pragma once

/// @file pet_definition.hpp
/// @brief Static combat definition of a pet species.

#include <cstdint>
#include <string>

#include "tcc/foundation/game_result.hpp"
#include "tcc/game/combat_types.hpp"

namespace tcc::game {

/// Base stats of a pet and how its owner's Beastmaster level scales them.
///
/// Each *PerBeastmasterLevel value is a fraction added per owner level,
/// applied as a factor of (1 + perLevel * beastmasterLevel).
struct PetDefinition {
    std::string name = "pet";

    bool canFight = true;

    int32_t attackLevel = 1;
    int32_t strengthLevel = 1;
    int32_t accuracyBonus = 0;
    int32_t damageBonus = 0;
    int32_t attackSpeedTicks = kDefaultAttackSpeedTicks;

    int32_t hitpoints = 1;

    /// Invulnerable pets ignore damage and never die.
    bool invulnerable = true;

    float attackLevelPerBeastmasterLevel = 0.0f;
    float strengthLevelPerBeastmasterLevel = 0.0f;
    float accuracyBonusPerBeastmasterLevel = 0.0f;
    float damageBonusPerBeastmasterLevel = 0.0f;
    float maxHitPerBeastmasterLevel = 0.0f;

    /// @return Success or InvalidPetDefinition naming the first bad field.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

} // namespace tcc::game
