/// @file attack_controller.cpp
/// @brief AttackController session state machine.

#include "tcc/game/attack_controller.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tcc/foundation/game_logger.hpp"
#include "tcc/game/facing.hpp"

namespace tcc::game {

using foundation::AgentId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

AttackController::AttackController(CombatTarget& self,
                                   StatsProvider stats,
                                   const TargetRegistry& registry,
                                   CombatResolver& resolver,
                                   AttackControllerSettings settings)
    : self_(self),
      stats_(std::move(stats)),
      registry_(registry),
      resolver_(resolver),
      settings_(settings) {}

EngageResult AttackController::BeginAttacking(AgentId target) {
    if (!self_.IsAlive() || target == self_.Id()) {
        return EngageResult::Declined;
    }
    const CombatTarget* resolved = registry_.Find(target);
    if (resolved == nullptr || !resolved->IsAlive()) {
        return EngageResult::Declined;
    }
    if (session_ && session_->target == target) {
        return EngageResult::AlreadyEngaged;
    }
    if (session_) {
        EndSession(SessionEndReason::Superseded);
    }

    session_ = AttackSession{};
    session_->target = target;

    LogContext ctx;
    ctx.agentId = self_.Id();
    ctx.targetId = target;
    TCC_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "attack session started", ctx);

    targetChanged_.emit(target);
    return EngageResult::Started;
}

void AttackController::Cancel(SessionEndReason reason) {
    if (session_) {
        EndSession(reason);
    }
}

void AttackController::OnTick() {
    if (!session_) {
        return;
    }
    if (!self_.IsAlive()) {
        EndSession(SessionEndReason::AttackerDied);
        return;
    }

    CombatTarget* target = registry_.Find(session_->target);
    if (target == nullptr) {
        EndSession(SessionEndReason::TargetLost);
        return;
    }
    if (!target->IsAlive()) {
        EndSession(SessionEndReason::TargetDied);
        return;
    }

    const float distance = Distance(self_.Position(), target->Position());
    if (settings_.leashRange > 0.0f && distance > settings_.leashRange) {
        EndSession(SessionEndReason::OutOfRange);
        return;
    }

    if (session_->cooldownRemainingTicks > 0) {
        --session_->cooldownRemainingTicks;
        if (session_->cooldownRemainingTicks > 0) {
            return;
        }
    }

    if (distance > settings_.meleeRange) {
        return;
    }
    Resolve(*target);
}

void AttackController::Resolve(CombatTarget& target) {
    const AgentId targetId = target.Id();
    const CombatantStats attacker = stats_();
    const CombatantStats defender = target.DefenderStats(attacker.damageType);
    const AttackOutcome outcome = resolver_.Resolve(attacker, defender);

    facing_ = FacingToward(self_.Position(), target.Position());
    session_->cooldownRemainingTicks = std::max(attacker.equipment.attackSpeedTicks, 1);
    ++session_->attacksResolved;

    int32_t applied = 0;
    if (outcome.damage > 0) {
        applied = target.ApplyDamage(outcome.damage, attacker.damageType,
                                     DamageSource{self_.Id(), self_.Kind()});
    }

    // Guard retaliation: first landed hit of this engagement alerts the
    // target's guard, once.
    if (outcome.hit && !session_->guardNotified) {
        session_->guardNotified = true;
        if (IGuardResponder* guard = target.GuardResponder()) {
            guard->RequestGuardAssist(self_.Id());
        }
    }

    AttackEvent event;
    event.attacker = self_.Id();
    event.target = targetId;
    event.outcome = outcome;
    event.applied = applied;
    event.damageType = attacker.damageType;
    event.facing = facing_;
    event.killedTarget = !target.IsAlive();

    if (outcome.hit && onHit_) {
        onHit_(event);
    }

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        LogContext ctx;
        ctx.agentId = self_.Id();
        ctx.targetId = targetId;
        ctx.extra["hit"] = outcome.hit ? "true" : "false";
        ctx.extra["damage"] = std::to_string(applied);
        ctx.extra["max_hit"] = std::to_string(outcome.maxHit);
        ctx.extra["chance"] = std::to_string(outcome.hitChance);
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Combat, "attack resolved", ctx);
    }

    attack_.emit(event);

    // A slot may have cancelled or retargeted this controller.
    if (!session_ || session_->target != targetId) {
        return;
    }
    if (event.killedTarget) {
        targetKilled_.emit(targetId);
        if (session_ && session_->target == targetId) {
            EndSession(SessionEndReason::TargetDied);
        }
    }
}

void AttackController::EndSession(SessionEndReason reason) {
    const AgentId target = session_->target;
    session_.reset();

    LogContext ctx;
    ctx.agentId = self_.Id();
    ctx.targetId = target;
    ctx.extra["reason"] = std::string(sessionEndReasonName(reason));
    TCC_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "attack session ended", ctx);

    sessionEnded_.emit(target, reason);
    if (reason != SessionEndReason::Superseded) {
        targetChanged_.emit(AgentId{});
    }
}

} // namespace tcc::game
