/// @file npc_agent.cpp
/// @brief NpcAgent tick ordering, aggro scan, leash and retaliation.

#include "tcc/game/npc_agent.hpp"

#include <limits>
#include <string>
#include <utility>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::game {

using foundation::AgentId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

NpcAgent::NpcAgent(AgentId id,
                   NpcCombatProfile profile,
                   const Vector2& origin,
                   const WanderBounds& bounds,
                   const SimulationRules& rules,
                   const TargetRegistry& registry,
                   CombatResolver& resolver,
                   foundation::RandomSource& rng,
                   const FactionTable* factions)
    : combatant_(id, std::move(profile)),
      wanderer_(id, origin, bounds, rules.wander, rng, rules.tickSeconds, rules.meleeRange,
                combatant_.Profile().aggroRange),
      attack_(combatant_, [this] { return combatant_.AttackerStats(); }, registry, resolver,
              AttackControllerSettings{rules.meleeRange, 0.0f}),
      registry_(registry),
      factions_(factions) {
    combatant_.SetPosition(origin);

    sessionEndedConn_ = attack_.OnSessionEnded().connectScoped(
        [this](AgentId /*target*/, SessionEndReason reason) {
            if (reason == SessionEndReason::Superseded) {
                return;
            }
            wanderer_.ExitCombat(reason == SessionEndReason::Leashed);
        });

    healthConn_ = combatant_.Health().OnHealthChanged().connectScoped(
        [this](const HealthChangedEvent& event) {
            if (event.delta >= 0 || event.currentHp <= 0 || !event.source.attacker.isValid()) {
                return;
            }
            if (combatant_.Profile().retaliates && !attack_.IsEngaged()) {
                pendingRetaliation_ = event.source.attacker;
            }
        });

    deathConn_ = combatant_.Health().OnDeath().connectScoped([this](const DeathEvent& event) {
        pendingRetaliation_ = AgentId{};
        attack_.Cancel(SessionEndReason::AttackerDied);

        LogContext ctx;
        ctx.agentId = event.agent;
        ctx.targetId = event.killer.attacker;
        ctx.extra["life"] = std::to_string(event.life);
        TCC_LOG_CTX(LogLevel::Info, LogCategory::Combat, "npc died", ctx);
    });
}

void NpcAgent::OnTick() {
    if (!combatant_.IsAlive()) {
        if (combatant_.TickRespawn()) {
            wanderer_.ResetToOrigin();
            combatant_.SetPosition(wanderer_.Position());

            LogContext ctx;
            ctx.agentId = Id();
            TCC_LOG_CTX(LogLevel::Info, LogCategory::Combat, "npc respawned", ctx);
        }
        return;
    }

    if (pendingRetaliation_.isValid()) {
        const AgentId aggressor = std::exchange(pendingRetaliation_, AgentId{});
        if (!attack_.IsEngaged()) {
            BeginAttacking(aggressor);
        }
    }

    const BehaviorState state = wanderer_.State();
    if (combatant_.Profile().aggressive && !attack_.IsEngaged() &&
        (state == BehaviorState::Idle || state == BehaviorState::Wandering)) {
        if (auto target = FindAggroTarget()) {
            BeginAttacking(*target);
        }
    }

    CheckLeash();
    attack_.OnTick();

    std::optional<Vector2> chase;
    if (attack_.IsEngaged()) {
        if (const CombatTarget* target = registry_.Find(attack_.CurrentTarget())) {
            chase = target->Position();
        }
    }
    wanderer_.OnTick(chase);
    combatant_.SetPosition(wanderer_.Position());
}

EngageResult NpcAgent::BeginAttacking(AgentId target) {
    const EngageResult result = attack_.BeginAttacking(target);
    if (result == EngageResult::Started) {
        wanderer_.EnterCombat();
    }
    return result;
}

void NpcAgent::ExitCombat() {
    pendingRetaliation_ = AgentId{};
    attack_.Cancel(SessionEndReason::Cancelled);
}

bool NpcAgent::IsAggroCandidate(const CombatTarget& other) const {
    if (other.Id() == Id() || !other.IsAlive()) {
        return false;
    }
    switch (other.Kind()) {
        case AgentKind::Player:
            return true;
        case AgentKind::Npc:
            return factions_ != nullptr && factions_->IsHostile(combatant_.Faction(), other.Faction());
        case AgentKind::Pet:
            return false;
    }
    return false;
}

std::optional<AgentId> NpcAgent::FindAggroTarget() const {
    const AggroState& aggro = wanderer_.Aggro();
    const Vector2 self = combatant_.Position();
    if (!aggro.Contains(self)) {
        return std::nullopt;
    }

    std::optional<AgentId> best;
    float bestDistance = std::numeric_limits<float>::max();
    for (const CombatTarget* other : registry_.All()) {
        if (!IsAggroCandidate(*other) || !aggro.Contains(other->Position())) {
            continue;
        }
        const float d = Distance(self, other->Position());
        if (d < bestDistance) {
            bestDistance = d;
            best = other->Id();
        }
    }
    return best;
}

void NpcAgent::CheckLeash() {
    if (!attack_.IsEngaged()) {
        return;
    }
    const AggroState& aggro = wanderer_.Aggro();
    const CombatTarget* target = registry_.Find(attack_.CurrentTarget());
    if (!aggro.Contains(combatant_.Position()) ||
        (target != nullptr && !aggro.Contains(target->Position()))) {
        attack_.Cancel(SessionEndReason::Leashed);
    }
}

} // namespace tcc::game
