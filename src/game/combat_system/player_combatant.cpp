#include "tcc/game/player_combatant.hpp"

#include <algorithm>

namespace tcc::game {

namespace {

constexpr int32_t kDefaultPlayerHitpoints = 10;

int32_t InitialHitpoints(const ISkillSource* skills) {
    if (skills == nullptr) {
        return kDefaultPlayerHitpoints;
    }
    return std::max(skills->GetLevel(SkillType::Hitpoints), 1);
}

} // namespace

PlayerCombatant::PlayerCombatant(foundation::AgentId id,
                                 const ISkillSource* skills,
                                 const IEquipmentSource* equipment)
    : id_(id),
      skills_(skills),
      equipment_(equipment),
      health_(id, InitialHitpoints(skills)) {}

CombatantStats PlayerCombatant::DefenderStats(DamageType incoming) const {
    return CombatantStats::ForPlayer(skills_, equipment_, style_, incoming);
}

CombatantStats PlayerCombatant::AttackerStats() const {
    return CombatantStats::ForPlayer(skills_, equipment_, style_, attackType_);
}

int32_t PlayerCombatant::ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) {
    return health_.ApplyDamage(amount, type, source);
}

IGuardResponder* PlayerCombatant::GuardResponder() const {
    return guardMode_ ? guardPet_ : nullptr;
}

} // namespace tcc::game
