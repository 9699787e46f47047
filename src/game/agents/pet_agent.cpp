/// @file pet_agent.cpp
/// @brief PetAgent command handling and follow/chase movement.

#include "tcc/game/pet_agent.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::game {

using foundation::AgentId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

PetAgent::PetAgent(AgentId id,
                   AgentId owner,
                   PetDefinition definition,
                   const ISkillSource* ownerSkills,
                   double experience,
                   const Vector2& position,
                   const SimulationRules& rules,
                   const TargetRegistry& registry,
                   CombatResolver& resolver)
    : progression_(experience),
      combatant_(id, owner, std::move(definition), ownerSkills, &progression_),
      attack_(combatant_, [this] { return combatant_.AttackerStats(); }, registry, resolver,
              AttackControllerSettings{rules.meleeRange,
                                       std::max(rules.petLeashMultiplier, 1.0f) * rules.meleeRange}),
      window_(position, rules.tickSeconds),
      registry_(registry),
      moveSpeed_(rules.petMoveSpeed),
      followDistance_(rules.petFollowDistance),
      arriveDistance_(rules.wander.arriveDistance) {
    combatant_.SetPosition(position);

    attackConn_ = attack_.OnAttack().connectScoped([this](const AttackEvent& event) {
        if (event.applied > 0 && hitHook_) {
            hitHook_(combatant_.Owner(), event.applied);
        }
    });

    progression_.OnLevelChanged().connect([id](int32_t previous, int32_t next) {
        LogContext ctx;
        ctx.agentId = id;
        ctx.extra["from"] = std::to_string(previous);
        ctx.extra["to"] = std::to_string(next);
        TCC_LOG_CTX(LogLevel::Info, LogCategory::Pet, "pet level changed", ctx);
    });
}

void PetAgent::OnTick() {
    if (pendingGuard_.isValid()) {
        const AgentId aggressor = std::exchange(pendingGuard_, AgentId{});
        const EngageResult result = CommandAttack(aggressor);

        LogContext ctx;
        ctx.agentId = Id();
        ctx.targetId = aggressor;
        ctx.extra["result"] = result == EngageResult::Started          ? "started"
                              : result == EngageResult::AlreadyEngaged ? "already_engaged"
                                                                       : "declined";
        TCC_LOG_CTX(LogLevel::Debug, LogCategory::Pet, "guard assist", ctx);
    }

    attack_.OnTick();

    const Vector2 from = window_.To();
    const Vector2 to = PlanMove(from);
    window_.BeginWindow(from, to);
    combatant_.SetPosition(to);
}

EngageResult PetAgent::CommandAttack(AgentId target) {
    if (!combatant_.CanFight()) {
        return EngageResult::Declined;
    }
    return attack_.BeginAttacking(target);
}

void PetAgent::RequestGuardAssist(AgentId aggressor) {
    if (aggressor.isValid()) {
        pendingGuard_ = aggressor;
    }
}

void PetAgent::Recall() {
    pendingGuard_ = AgentId{};
    attack_.Cancel(SessionEndReason::Cancelled);
}

BehaviorState PetAgent::State() const {
    if (!attack_.IsEngaged()) {
        return BehaviorState::Idle;
    }
    const CombatTarget* target = registry_.Find(attack_.CurrentTarget());
    if (target != nullptr &&
        Distance(combatant_.Position(), target->Position()) <= attack_.Settings().meleeRange) {
        return BehaviorState::Attacking;
    }
    return BehaviorState::Approaching;
}

Vector2 PetAgent::PlanMove(const Vector2& from) const {
    const float step = moveSpeed_ * window_.TickSeconds();

    if (attack_.IsEngaged()) {
        const CombatTarget* target = registry_.Find(attack_.CurrentTarget());
        if (target == nullptr) {
            return from;
        }
        const Vector2 goal = target->Position();
        const float melee = attack_.Settings().meleeRange;
        if (Distance(from, goal) <= melee) {
            return from;
        }
        const float stopDistance = std::max(melee - arriveDistance_, 0.0f);
        return MoveTowards(from, goal - (goal - from).Normalized() * stopDistance, step);
    }

    const CombatTarget* owner = registry_.Find(combatant_.Owner());
    if (owner == nullptr) {
        return from;
    }
    const Vector2 goal = owner->Position();
    if (Distance(from, goal) <= followDistance_) {
        return from;
    }
    return MoveTowards(from, goal - (goal - from).Normalized() * followDistance_, step);
}

} // namespace tcc::game
