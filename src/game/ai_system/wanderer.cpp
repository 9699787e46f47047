/// @file wanderer.cpp
/// @brief Wanderer movement state machine.

#include "tcc/game/wanderer.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── WanderBounds ────────────────────────────────────────────────────────────

Rect WanderBounds::WorldRect(const Vector2& origin) const noexcept {
    if (useAreaSize) {
        const Vector2 half = areaSize * 0.5f;
        return {origin - half, origin + half};
    }
    return {origin + minOffset, origin + maxOffset};
}

float WanderBounds::DerivedAggroRadius() const noexcept {
    if (useAreaSize) {
        return (areaSize * 0.5f).Length();
    }
    const std::array<Vector2, 4> corners = {
        minOffset,
        maxOffset,
        Vector2{minOffset.x, maxOffset.y},
        Vector2{maxOffset.x, minOffset.y},
    };
    float radius = 0.0f;
    for (const auto& corner : corners) {
        radius = std::max(radius, corner.Length());
    }
    return radius;
}

foundation::GameResult<void> WanderBounds::Validate() const {
    if (useAreaSize) {
        if (areaSize.x < 0.0f || areaSize.y < 0.0f) {
            return foundation::GameResult<void>::err(foundation::GameError(
                foundation::ErrorCode::InvalidWanderBounds, "wander area size is negative"));
        }
        return foundation::GameResult<void>::ok();
    }
    if (minOffset.x > maxOffset.x || minOffset.y > maxOffset.y) {
        return foundation::GameResult<void>::err(foundation::GameError(
            foundation::ErrorCode::InvalidWanderBounds, "wander min offset exceeds max offset"));
    }
    return foundation::GameResult<void>::ok();
}

// ── Wanderer ────────────────────────────────────────────────────────────────

Wanderer::Wanderer(foundation::AgentId owner,
                   const Vector2& origin,
                   const WanderBounds& bounds,
                   const WanderSettings& settings,
                   foundation::RandomSource& rng,
                   float tickSeconds,
                   float meleeRange,
                   float aggroRange)
    : owner_(owner),
      rect_(bounds.WorldRect(origin)),
      settings_(settings),
      rng_(rng),
      tickSeconds_(tickSeconds > 0.0f ? tickSeconds : kTickSeconds),
      meleeRange_(std::max(meleeRange, 0.0f)),
      aggro_{origin, aggroRange > 0.0f ? aggroRange : bounds.DerivedAggroRadius()},
      wanderTarget_(origin),
      window_(origin, tickSeconds_) {
    BeginIdle();
}

void Wanderer::OnTick(const std::optional<Vector2>& chaseTarget) {
    const Vector2 from = window_.To();
    Vector2 to = from;

    switch (state_) {
        case BehaviorState::Idle:
            idleRemaining_ -= tickSeconds_;
            if (idleRemaining_ <= 0.0f) {
                ChooseWanderTarget();
                SetState(BehaviorState::Wandering);
                to = Step(from, wanderTarget_);
            }
            break;

        case BehaviorState::Wandering:
            to = Step(from, wanderTarget_);
            if (Distance(to, wanderTarget_) <= settings_.arriveDistance) {
                BeginIdle();
            }
            break;

        case BehaviorState::Approaching:
        case BehaviorState::Attacking: {
            if (!chaseTarget) {
                break;
            }
            const Vector2 target = *chaseTarget;
            if (Distance(from, target) > meleeRange_) {
                // Stop a little inside melee range so the attack check passes.
                const float stopDistance = std::max(meleeRange_ - settings_.arriveDistance, 0.0f);
                const Vector2 desired = target - (target - from).Normalized() * stopDistance;
                to = rect_.Clamp(Step(from, desired));
            }
            SetState(Distance(to, target) <= meleeRange_ ? BehaviorState::Attacking
                                                         : BehaviorState::Approaching);
            break;
        }

        case BehaviorState::Returning:
            to = Step(from, aggro_.origin);
            if (Distance(to, aggro_.origin) <= settings_.arriveDistance) {
                to = aggro_.origin;
                BeginIdle();
            }
            break;
    }

    window_.BeginWindow(from, to);
}

void Wanderer::EnterCombat() {
    SetState(BehaviorState::Approaching);
}

void Wanderer::ExitCombat(bool returnHome) {
    if (returnHome) {
        SetState(BehaviorState::Returning);
    } else {
        BeginIdle();
    }
}

void Wanderer::ForceReturnToOrigin() {
    SetState(BehaviorState::Returning);
}

void Wanderer::ResetToOrigin() {
    window_.Snap(aggro_.origin);
    wanderTarget_ = aggro_.origin;
    BeginIdle();
}

void Wanderer::BeginIdle() {
    idleRemaining_ = rng_.NextFloat(settings_.minIdleSeconds,
                                    std::max(settings_.minIdleSeconds, settings_.maxIdleSeconds));
    SetState(BehaviorState::Idle);
}

void Wanderer::ChooseWanderTarget() {
    wanderTarget_ = {rng_.NextFloat(rect_.min.x, rect_.max.x),
                     rng_.NextFloat(rect_.min.y, rect_.max.y)};
}

void Wanderer::SetState(BehaviorState next) {
    if (next == state_) {
        return;
    }
    const BehaviorState previous = state_;
    state_ = next;

    LogContext ctx;
    ctx.agentId = owner_;
    ctx.extra["from"] = std::string(behaviorStateName(previous));
    ctx.extra["to"] = std::string(behaviorStateName(next));
    TCC_LOG_CTX(LogLevel::Trace, LogCategory::AI, "behavior state changed", ctx);

    stateChanged_.emit(previous, next);
}

Vector2 Wanderer::Step(const Vector2& from, const Vector2& target) const noexcept {
    return MoveTowards(from, target, settings_.moveSpeed * tickSeconds_);
}

} // namespace tcc::game
