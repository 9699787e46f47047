#pragma once

/// @file wanderer.hpp
/// @brief Bounded wander, chase and return movement of an NPC.

#include <optional>

#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/random_source.hpp"
#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/ai_types.hpp"
#include "tcc/game/math_types.hpp"
#include "tcc/game/tick_interpolator.hpp"

namespace tcc::game {

/// Area an NPC may wander in, relative to its spawn.
///
/// Either an offset rectangle (minOffset..maxOffset) or, with useAreaSize,
/// a rectangle of areaSize centred on spawn.
struct WanderBounds {
    bool useAreaSize = false;
    Vector2 areaSize{2.0f * kDefaultWanderExtent, 2.0f * kDefaultWanderExtent};
    Vector2 minOffset{-kDefaultWanderExtent, -kDefaultWanderExtent};
    Vector2 maxOffset{kDefaultWanderExtent, kDefaultWanderExtent};

    /// World-space rectangle for an agent spawned at @p origin.
    [[nodiscard]] Rect WorldRect(const Vector2& origin) const noexcept;

    /// Aggro radius implied by the geometry: the half-diagonal of the area,
    /// or the distance to the farthest offset corner.
    [[nodiscard]] float DerivedAggroRadius() const noexcept;

    /// @return Success or InvalidWanderBounds for inverted or negative extents.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

/// Spawn origin and the radius within which an NPC engages and stays engaged.
struct AggroState {
    Vector2 origin;
    float radius = 0.0f;

    [[nodiscard]] bool Contains(const Vector2& point) const noexcept {
        return Distance(origin, point) <= radius;
    }
};

/// Movement state machine of a wandering NPC.
///
/// OnTick() plans the (from, to) pair of the next tick window from the
/// current state; Update() only interpolates inside that window. Combat
/// entry and exit are driven by the owner (EnterCombat/ExitCombat); while in
/// combat the owner passes the target position to every OnTick().
class Wanderer {
public:
    /// @param aggroRange  Aggro radius; non-positive derives it from @p bounds.
    Wanderer(foundation::AgentId owner,
             const Vector2& origin,
             const WanderBounds& bounds,
             const WanderSettings& settings,
             foundation::RandomSource& rng,
             float tickSeconds = kTickSeconds,
             float meleeRange = kMeleeRange,
             float aggroRange = 0.0f);

    /// Plan the next tick window.
    /// @param chaseTarget  Live target position while engaged.
    void OnTick(const std::optional<Vector2>& chaseTarget);

    /// Advance render interpolation by @p deltaSeconds.
    Vector2 Update(float deltaSeconds) noexcept { return window_.Advance(deltaSeconds); }

    /// Switch to Approaching; the next OnTick() decides Attacking.
    void EnterCombat();

    /// Leave combat, walking home when @p returnHome, otherwise idling in place.
    void ExitCombat(bool returnHome);

    /// Head back to spawn regardless of state.
    void ForceReturnToOrigin();

    /// Jump to spawn and idle (respawn).
    void ResetToOrigin();

    /// Logical position: the end of the current tick window.
    [[nodiscard]] Vector2 Position() const noexcept { return window_.To(); }
    [[nodiscard]] Vector2 RenderPosition() const noexcept { return window_.Sample(); }
    [[nodiscard]] const TickInterpolator& Window() const noexcept { return window_; }

    [[nodiscard]] BehaviorState State() const noexcept { return state_; }
    [[nodiscard]] const AggroState& Aggro() const noexcept { return aggro_; }
    [[nodiscard]] const Rect& Bounds() const noexcept { return rect_; }
    [[nodiscard]] Vector2 WanderTarget() const noexcept { return wanderTarget_; }
    [[nodiscard]] float IdleRemaining() const noexcept { return idleRemaining_; }

    /// Fires (previous, next) on every state change.
    [[nodiscard]] foundation::Signal<BehaviorState, BehaviorState>& OnStateChanged() noexcept {
        return stateChanged_;
    }

private:
    void BeginIdle();
    void ChooseWanderTarget();
    void SetState(BehaviorState next);
    [[nodiscard]] Vector2 Step(const Vector2& from, const Vector2& target) const noexcept;

    foundation::AgentId owner_;
    Rect rect_;
    WanderSettings settings_;
    foundation::RandomSource& rng_;
    float tickSeconds_;
    float meleeRange_;
    AggroState aggro_;

    BehaviorState state_ = BehaviorState::Idle;
    Vector2 wanderTarget_;
    float idleRemaining_ = 0.0f;
    TickInterpolator window_;

    foundation::Signal<BehaviorState, BehaviorState> stateChanged_;
};

} // namespace tcc::game
