#pragma once

/// @file npc_combatant.hpp
/// @brief CombatTarget adapter for NPCs, with optional respawn.

#include "tcc/game/combat_target.hpp"
#include "tcc/game/npc_profile.hpp"

namespace tcc::game {

/// Combat state of one NPC built from its profile.
class NpcCombatant final : public CombatTarget {
public:
    NpcCombatant(foundation::AgentId id, NpcCombatProfile profile);

    [[nodiscard]] foundation::AgentId Id() const override { return id_; }
    [[nodiscard]] AgentKind Kind() const override { return AgentKind::Npc; }
    [[nodiscard]] Vector2 Position() const override { return position_; }
    [[nodiscard]] bool IsAlive() const override { return health_.IsAlive(); }
    [[nodiscard]] int32_t CurrentHP() const override { return health_.Current(); }
    [[nodiscard]] int32_t MaxHP() const override { return health_.Max(); }
    [[nodiscard]] DamageType PreferredDefenceType() const override { return profile_.attackType; }
    [[nodiscard]] CombatantStats DefenderStats(DamageType incoming) const override;
    int32_t ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) override;
    [[nodiscard]] HealthPool& Health() override { return health_; }
    [[nodiscard]] FactionId Faction() const override { return profile_.faction; }

    [[nodiscard]] CombatantStats AttackerStats() const;

    [[nodiscard]] const NpcCombatProfile& Profile() const noexcept { return profile_; }

    void SetPosition(const Vector2& position) noexcept { position_ = position; }

    /// Count down the respawn timer of a dead NPC.
    /// @return true on the tick the NPC comes back to life.
    bool TickRespawn();

    [[nodiscard]] int32_t RespawnTicksRemaining() const noexcept { return respawnRemaining_; }

private:
    foundation::AgentId id_;
    NpcCombatProfile profile_;
    HealthPool health_;
    Vector2 position_;
    int32_t respawnRemaining_ = 0;
};

} // namespace tcc::game
