#pragma once

/// @file ai_types.hpp
/// @brief Behavior states, movement settings and defaults.

#include <cstdint>
#include <string_view>

namespace tcc::game {

/// Default wander movement speed (tiles per second).
constexpr float kDefaultWanderSpeed = 2.0f;

/// Default distance at which a movement target counts as reached.
constexpr float kDefaultArriveDistance = 0.05f;

/// Default idle pause range between wander legs (seconds).
constexpr float kDefaultMinIdleSeconds = 0.5f;
constexpr float kDefaultMaxIdleSeconds = 2.0f;

/// Default half-extent of the wander rectangle around spawn (tiles).
constexpr float kDefaultWanderExtent = 5.0f;

/// Pets drop a target farther than this many melee ranges away.
constexpr float kDefaultPetLeashMultiplier = 5.0f;

/// Smallest waypoint speed multiplier honoured.
constexpr float kMinWaypointSpeedMultiplier = 0.0001f;

/// Per-agent engagement state.
enum class BehaviorState : uint8_t {
    Idle,        ///< Waiting out the idle timer.
    Wandering,   ///< Walking to a random point inside the bounds.
    Approaching, ///< Chasing a target that is out of melee range.
    Attacking,   ///< Within melee range of the target.
    Returning    ///< Walking back to spawn after leaving combat.
};

constexpr std::string_view behaviorStateName(BehaviorState state) {
    switch (state) {
        case BehaviorState::Idle:        return "Idle";
        case BehaviorState::Wandering:   return "Wandering";
        case BehaviorState::Approaching: return "Approaching";
        case BehaviorState::Attacking:   return "Attacking";
        case BehaviorState::Returning:   return "Returning";
    }
    return "Unknown";
}

/// True while the state belongs to an engagement.
constexpr bool IsCombatState(BehaviorState state) noexcept {
    return state == BehaviorState::Approaching || state == BehaviorState::Attacking;
}

/// Tuning of bounded wandering.
struct WanderSettings {
    float moveSpeed = kDefaultWanderSpeed;
    float arriveDistance = kDefaultArriveDistance;
    float minIdleSeconds = kDefaultMinIdleSeconds;
    float maxIdleSeconds = kDefaultMaxIdleSeconds;
};

} // namespace tcc::game
