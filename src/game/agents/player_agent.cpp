/// @file player_agent.cpp
/// @brief PlayerAgent attack commands and experience wiring.

#include "tcc/game/player_agent.hpp"

namespace tcc::game {

using foundation::AgentId;

PlayerAgent::PlayerAgent(AgentId id,
                         const ISkillSource* skills,
                         const IEquipmentSource* equipment,
                         const SimulationRules& rules,
                         const TargetRegistry& registry,
                         CombatResolver& resolver,
                         IExperienceSink* experienceSink)
    : combatant_(id, skills, equipment),
      attack_(combatant_, [this] { return combatant_.AttackerStats(); }, registry, resolver,
              AttackControllerSettings{rules.meleeRange, 0.0f}),
      experience_(rules.experience),
      experienceSink_(experienceSink) {
    attackConn_ = attack_.OnAttack().connectScoped([this](const AttackEvent& event) {
        if (experienceSink_ != nullptr && event.applied > 0) {
            experience_.AwardPlayerHit(*experienceSink_, combatant_.Id(), event.applied,
                                       combatant_.Style(), event.damageType);
        }
    });
}

EngageResult PlayerAgent::TryAttackTarget(AgentId target) {
    const EngageResult result = attack_.BeginAttacking(target);
    if (result == EngageResult::Started && combatant_.GuardModeEnabled()) {
        if (IGuardResponder* pet = combatant_.GuardResponder()) {
            pet->RequestGuardAssist(target);
        }
    }
    return result;
}

} // namespace tcc::game
