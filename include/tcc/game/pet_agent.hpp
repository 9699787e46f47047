#pragma once

/// @file pet_agent.hpp
/// @brief Pet: follow-the-owner movement, commanded attacks and guard duty.

#include <cstdint>
#include <functional>

#include "tcc/core/tickable.hpp"
#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/attack_controller.hpp"
#include "tcc/game/combat_resolver.hpp"
#include "tcc/game/pet_combatant.hpp"
#include "tcc/game/pet_progression.hpp"
#include "tcc/game/simulation_rules.hpp"
#include "tcc/game/target_registry.hpp"
#include "tcc/game/tick_interpolator.hpp"

namespace tcc::game {

/// Pet agent owned by a player.
///
/// Attacks only on command: CommandAttack() from the owner, or a guard
/// request routed through RequestGuardAssist(), which is deferred to the
/// pet's next tick. Sessions break when the target is farther than the
/// leash range (petLeashMultiplier melee ranges). Out of combat the pet
/// trails its owner.
class PetAgent final : public ITickable, public IGuardResponder {
public:
    /// Called with (owner, damage) for every hit that removed HP.
    using HitHook = std::function<void(foundation::AgentId, int32_t)>;

    /// @param ownerSkills  Owner's skills for Beastmaster scaling; may be null.
    /// @param experience   Starting pet experience.
    PetAgent(foundation::AgentId id,
             foundation::AgentId owner,
             PetDefinition definition,
             const ISkillSource* ownerSkills,
             double experience,
             const Vector2& position,
             const SimulationRules& rules,
             const TargetRegistry& registry,
             CombatResolver& resolver);

    PetAgent(const PetAgent&) = delete;
    PetAgent& operator=(const PetAgent&) = delete;

    void OnTick() override;

    Vector2 Update(float deltaSeconds) noexcept { return window_.Advance(deltaSeconds); }

    /// Owner's attack order. Declined for pets that cannot fight.
    EngageResult CommandAttack(foundation::AgentId target);

    /// Queue an attack on @p aggressor for the next tick.
    void RequestGuardAssist(foundation::AgentId aggressor) override;

    /// Recall the pet from combat.
    void Recall();

    void SetHitHook(HitHook hook) { hitHook_ = std::move(hook); }

    [[nodiscard]] foundation::AgentId Id() const noexcept { return combatant_.Id(); }
    [[nodiscard]] foundation::AgentId Owner() const noexcept { return combatant_.Owner(); }
    [[nodiscard]] Vector2 Position() const noexcept { return combatant_.Position(); }
    [[nodiscard]] Vector2 RenderPosition() const noexcept { return window_.Sample(); }
    [[nodiscard]] foundation::AgentId PendingGuardTarget() const noexcept { return pendingGuard_; }

    /// Idle out of combat. In a session: Attacking within melee range of
    /// the target, Approaching while still closing in.
    [[nodiscard]] BehaviorState State() const;

    [[nodiscard]] PetCombatant& Combatant() noexcept { return combatant_; }
    [[nodiscard]] const PetCombatant& Combatant() const noexcept { return combatant_; }
    [[nodiscard]] AttackController& Attack() noexcept { return attack_; }
    [[nodiscard]] const AttackController& Attack() const noexcept { return attack_; }
    [[nodiscard]] PetProgression& Progression() noexcept { return progression_; }
    [[nodiscard]] const PetProgression& Progression() const noexcept { return progression_; }

private:
    [[nodiscard]] Vector2 PlanMove(const Vector2& from) const;

    PetProgression progression_;
    PetCombatant combatant_;
    AttackController attack_;
    TickInterpolator window_;
    const TargetRegistry& registry_;
    float moveSpeed_;
    float followDistance_;
    float arriveDistance_;

    foundation::AgentId pendingGuard_;
    HitHook hitHook_;
    foundation::ScopedConnection attackConn_;
};

} // namespace tcc::game
