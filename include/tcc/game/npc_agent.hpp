#pragma once

/// @file npc_agent.hpp
/// @brief NPC: combatant, wander/chase movement and attack loop on one tick.

#include <optional>

#include "tcc/core/tickable.hpp"
#include "tcc/foundation/random_source.hpp"
#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/attack_controller.hpp"
#include "tcc/game/combat_resolver.hpp"
#include "tcc/game/faction.hpp"
#include "tcc/game/npc_combatant.hpp"
#include "tcc/game/simulation_rules.hpp"
#include "tcc/game/target_registry.hpp"
#include "tcc/game/wanderer.hpp"

namespace tcc::game {

/// Ties an NpcCombatant to its Wanderer and AttackController.
///
/// Per tick, in order:
///   1. a dead NPC only counts down its respawn;
///   2. a pending retaliation starts a session on the aggressor;
///   3. an aggressive, idle or wandering NPC engages the closest player or
///      hostile-faction NPC inside its aggro radius;
///   4. the session is leashed when self or target leave the aggro radius;
///   5. the attack controller runs;
///   6. the wanderer plans the next window, chasing the target if engaged.
class NpcAgent final : public ITickable {
public:
    /// @param factions  Hostility table for NPC-vs-NPC aggro; may be null.
    NpcAgent(foundation::AgentId id,
             NpcCombatProfile profile,
             const Vector2& origin,
             const WanderBounds& bounds,
             const SimulationRules& rules,
             const TargetRegistry& registry,
             CombatResolver& resolver,
             foundation::RandomSource& rng,
             const FactionTable* factions = nullptr);

    NpcAgent(const NpcAgent&) = delete;
    NpcAgent& operator=(const NpcAgent&) = delete;

    void OnTick() override;

    /// Advance render interpolation.
    Vector2 Update(float deltaSeconds) noexcept { return wanderer_.Update(deltaSeconds); }

    /// External attack command (e.g. the player ordered this NPC to fight).
    EngageResult BeginAttacking(foundation::AgentId target);

    /// Drop the current session and idle in place.
    void ExitCombat();

    [[nodiscard]] foundation::AgentId Id() const noexcept { return combatant_.Id(); }
    [[nodiscard]] BehaviorState State() const noexcept { return wanderer_.State(); }
    [[nodiscard]] Vector2 Position() const noexcept { return combatant_.Position(); }
    [[nodiscard]] Vector2 RenderPosition() const noexcept { return wanderer_.RenderPosition(); }

    [[nodiscard]] NpcCombatant& Combatant() noexcept { return combatant_; }
    [[nodiscard]] const NpcCombatant& Combatant() const noexcept { return combatant_; }
    [[nodiscard]] AttackController& Attack() noexcept { return attack_; }
    [[nodiscard]] const AttackController& Attack() const noexcept { return attack_; }
    [[nodiscard]] Wanderer& Movement() noexcept { return wanderer_; }
    [[nodiscard]] const Wanderer& Movement() const noexcept { return wanderer_; }

private:
    [[nodiscard]] std::optional<foundation::AgentId> FindAggroTarget() const;
    [[nodiscard]] bool IsAggroCandidate(const CombatTarget& other) const;
    void CheckLeash();

    NpcCombatant combatant_;
    Wanderer wanderer_;
    AttackController attack_;
    const TargetRegistry& registry_;
    const FactionTable* factions_;

    foundation::AgentId pendingRetaliation_;

    foundation::ScopedConnection sessionEndedConn_;
    foundation::ScopedConnection healthConn_;
    foundation::ScopedConnection deathConn_;
};

} // namespace tcc::game
