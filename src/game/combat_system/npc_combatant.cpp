#include "tcc/game/npc_combatant.hpp"

#include <string>
#include <utility>

namespace tcc::game {

foundation::GameResult<void> NpcCombatProfile::Validate() const {
    auto invalid = [this](const char* field) {
        return foundation::GameResult<void>::err(foundation::GameError(
            foundation::ErrorCode::InvalidCombatProfile,
            "npc profile '" + name + "': invalid " + field, std::string(field)));
    };

    if (attackLevel < 1) return invalid("attackLevel");
    if (strengthLevel < 1) return invalid("strengthLevel");
    if (defenceLevel < 1) return invalid("defenceLevel");
    if (hitpoints < 1) return invalid("hitpoints");
    if (attackSpeedTicks < 1) return invalid("attackSpeedTicks");
    if (respawnTicks < 0) return invalid("respawnTicks");
    if (aggroRange < 0.0f) return invalid("aggroRange");
    return foundation::GameResult<void>::ok();
}

NpcCombatant::NpcCombatant(foundation::AgentId id, NpcCombatProfile profile)
    : id_(id),
      profile_(std::move(profile)),
      health_(id, profile_.hitpoints) {}

CombatantStats NpcCombatant::DefenderStats(DamageType incoming) const {
    auto stats = CombatantStats::ForNpc(profile_);
    stats.damageType = incoming;
    return stats;
}

CombatantStats NpcCombatant::AttackerStats() const {
    return CombatantStats::ForNpc(profile_);
}

int32_t NpcCombatant::ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) {
    // Arm the respawn timer before the death observers run; they may
    // despawn this NPC.
    if (amount > 0 && health_.IsAlive() && amount >= health_.Current()) {
        respawnRemaining_ = profile_.respawnTicks;
    }
    return health_.ApplyDamage(amount, type, source);
}

bool NpcCombatant::TickRespawn() {
    if (health_.IsAlive() || respawnRemaining_ <= 0) {
        return false;
    }
    if (--respawnRemaining_ > 0) {
        return false;
    }
    health_.Restore();
    return true;
}

} // namespace tcc::game
