#pragma once

/// @file combat_target.hpp
/// @brief CombatTarget: the capability every attackable agent exposes.

#include <cstdint>

#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_types.hpp"
#include "tcc/game/combatant_stats.hpp"
#include "tcc/game/faction.hpp"
#include "tcc/game/health_pool.hpp"
#include "tcc/game/math_types.hpp"

namespace tcc::game {

/// Something that can be told to strike back at an aggressor on behalf of
/// another agent (a guard-mode pet defending its owner).
class IGuardResponder {
public:
    virtual ~IGuardResponder() = default;

    /// Schedule an attack on @p aggressor. The command runs on the
    /// responder's next tick, not inside the caller's tick.
    virtual void RequestGuardAssist(foundation::AgentId aggressor) = 0;
};

/// Uniform combat capability of players, NPCs and pets.
///
/// Attackers only ever see this interface. HP is owned by the
/// implementation and changes only through ApplyDamage().
class CombatTarget {
public:
    virtual ~CombatTarget() = default;

    [[nodiscard]] virtual foundation::AgentId Id() const = 0;
    [[nodiscard]] virtual AgentKind Kind() const = 0;

    /// Logical (tick) position, not the interpolated render position.
    [[nodiscard]] virtual Vector2 Position() const = 0;

    [[nodiscard]] virtual bool IsAlive() const = 0;
    [[nodiscard]] virtual int32_t CurrentHP() const = 0;
    [[nodiscard]] virtual int32_t MaxHP() const = 0;
    [[nodiscard]] virtual DamageType PreferredDefenceType() const = 0;

    /// Defensive snapshot against an incoming damage type.
    [[nodiscard]] virtual CombatantStats DefenderStats(DamageType incoming) const {
        return CombatantStats::Fallback(incoming);
    }

    /// Remove HP; see HealthPool::ApplyDamage for the emission contract.
    /// @return HP actually removed (>= 0).
    virtual int32_t ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) = 0;

    /// Observer access for HUD and loot collaborators.
    [[nodiscard]] virtual HealthPool& Health() = 0;

    /// Pet guarding this target, if any and if guard mode is on.
    [[nodiscard]] virtual IGuardResponder* GuardResponder() const { return nullptr; }

    [[nodiscard]] virtual FactionId Faction() const { return kNeutralFaction; }
};

} // namespace tcc::game
