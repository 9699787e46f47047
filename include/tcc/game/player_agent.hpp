#pragma once

/// @file player_agent.hpp
/// @brief Player: attack commands, cadence and combat experience.

#include "tcc/core/tickable.hpp"
#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/attack_controller.hpp"
#include "tcc/game/combat_experience.hpp"
#include "tcc/game/combat_resolver.hpp"
#include "tcc/game/player_combatant.hpp"
#include "tcc/game/simulation_rules.hpp"
#include "tcc/game/target_registry.hpp"

namespace tcc::game {

/// Player-side attack loop.
///
/// Movement belongs to the host; it pushes positions in with SetPosition().
/// Every hit that removes HP is converted into experience for the sink.
class PlayerAgent final : public ITickable {
public:
    /// @param experienceSink  Receiver of combat experience; may be null.
    PlayerAgent(foundation::AgentId id,
                const ISkillSource* skills,
                const IEquipmentSource* equipment,
                const SimulationRules& rules,
                const TargetRegistry& registry,
                CombatResolver& resolver,
                IExperienceSink* experienceSink = nullptr);

    PlayerAgent(const PlayerAgent&) = delete;
    PlayerAgent& operator=(const PlayerAgent&) = delete;

    void OnTick() override { attack_.OnTick(); }

    /// Engage @p target. With guard mode on, a new session also sends the
    /// guard pet after the same target.
    EngageResult TryAttackTarget(foundation::AgentId target);

    void CancelCombat() { attack_.Cancel(SessionEndReason::Cancelled); }

    void SetPosition(const Vector2& position) noexcept { combatant_.SetPosition(position); }

    /// Pet defending this player; must outlive the agent or be cleared.
    void SetGuardPet(IGuardResponder* pet) noexcept { combatant_.SetGuardPet(pet); }
    [[nodiscard]] IGuardResponder* GuardPet() const noexcept { return combatant_.GuardPet(); }
    void SetGuardMode(bool enabled) noexcept { combatant_.SetGuardMode(enabled); }

    [[nodiscard]] foundation::AgentId Id() const noexcept { return combatant_.Id(); }
    [[nodiscard]] Vector2 Position() const noexcept { return combatant_.Position(); }

    [[nodiscard]] PlayerCombatant& Combatant() noexcept { return combatant_; }
    [[nodiscard]] const PlayerCombatant& Combatant() const noexcept { return combatant_; }
    [[nodiscard]] AttackController& Attack() noexcept { return attack_; }
    [[nodiscard]] const AttackController& Attack() const noexcept { return attack_; }

private:
    PlayerCombatant combatant_;
    AttackController attack_;
    CombatExperience experience_;
    IExperienceSink* experienceSink_;
    foundation::ScopedConnection attackConn_;
};

} // namespace tcc::game
