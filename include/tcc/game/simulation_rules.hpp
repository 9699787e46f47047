#pragma once

/// @file simulation_rules.hpp
/// @brief Tunables shared by every agent of one simulation.

#include "tcc/game/ai_types.hpp"
#include "tcc/game/combat_experience.hpp"
#include "tcc/game/combat_types.hpp"

namespace tcc::game {

/// Default pet movement speed (tiles per second).
constexpr float kDefaultPetMoveSpeed = 5.0f;

/// Default distance a following pet keeps from its owner.
constexpr float kDefaultPetFollowDistance = 1.0f;

struct SimulationRules {
    float tickSeconds = kTickSeconds;
    float meleeRange = kMeleeRange;
    /// Lower bound applied to every resolved hit chance.
    float minHitChance = 0.0f;
    float petLeashMultiplier = kDefaultPetLeashMultiplier;
    WanderSettings wander;
    float petMoveSpeed = kDefaultPetMoveSpeed;
    float petFollowDistance = kDefaultPetFollowDistance;
    ExperienceRates experience;
};

} // namespace tcc::game
