#pragma once

/// @file combat_simulation.hpp
/// @brief Owns every collaborator of one headless combat simulation.

#include <cstdint>
#include <memory>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/random_source.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_experience.hpp"
#include "tcc/game/combat_resolver.hpp"
#include "tcc/game/faction.hpp"
#include "tcc/game/npc_agent.hpp"
#include "tcc/game/pet_agent.hpp"
#include "tcc/game/player_agent.hpp"
#include "tcc/game/target_registry.hpp"
#include "tcc/service/simulation_config.hpp"
#include "tcc/service/tick_scheduler.hpp"

namespace tcc::service {

/// Composition root for a simulation: random source, tick scheduler,
/// target registry, resolver, faction table and the agents themselves.
///
/// Spawning validates the input, registers the agent as a combat target
/// and subscribes it to the scheduler. Agents are owned here and live
/// until despawn() or destruction.
///
/// despawn() detaches an agent at once (registry and scheduler), but its
/// storage is only released at the next frame or tick boundary. Death and
/// health observers may therefore despawn the agent that is emitting.
class CombatSimulation {
public:
    explicit CombatSimulation(SimulationConfig config = {});
    ~CombatSimulation();

    CombatSimulation(const CombatSimulation&) = delete;
    CombatSimulation& operator=(const CombatSimulation&) = delete;

    /// @param sink  Receives the player's combat experience; may be null.
    /// @return The agent, or InvalidArgument / AlreadyExists.
    foundation::GameResult<game::PlayerAgent*> spawnPlayer(foundation::AgentId id,
                                                           const game::ISkillSource* skills,
                                                           const game::IEquipmentSource* equipment,
                                                           const game::Vector2& position,
                                                           game::IExperienceSink* sink = nullptr);

    /// @return The agent, or InvalidCombatProfile / InvalidWanderBounds /
    ///         InvalidArgument / AlreadyExists.
    foundation::GameResult<game::NpcAgent*> spawnNpc(foundation::AgentId id,
                                                     game::NpcCombatProfile profile,
                                                     const game::Vector2& origin,
                                                     const game::WanderBounds& bounds = {});

    /// Spawn a pet beside its owner and make it the owner's guard pet.
    /// The newest pet of an owner always takes over guard duty.
    /// @return The agent, or InvalidPetDefinition / NotFound (owner) /
    ///         InvalidArgument / AlreadyExists.
    foundation::GameResult<game::PetAgent*> spawnPet(foundation::AgentId id,
                                                     foundation::AgentId owner,
                                                     game::PetDefinition definition,
                                                     double experience = 0.0);

    /// Remove an agent of any kind. Safe to call from inside a tick or a
    /// signal emitted by the agent itself. Removing the guard pet hands
    /// guard duty to the owner's newest remaining pet, if any.
    /// @return Success or TargetNotFound.
    foundation::GameResult<void> despawn(foundation::AgentId id);

    /// Feed one rendered frame: fire due ticks, then move every agent's
    /// render interpolation.
    /// @return Number of ticks fired.
    uint32_t advanceFrame(float deltaSeconds);

    /// Fire @p count ticks back to back.
    void runTicks(uint32_t count);

    [[nodiscard]] game::PlayerAgent* findPlayer(foundation::AgentId id) const;
    [[nodiscard]] game::NpcAgent* findNpc(foundation::AgentId id) const;
    [[nodiscard]] game::PetAgent* findPet(foundation::AgentId id) const;

    [[nodiscard]] TickScheduler& scheduler() noexcept { return scheduler_; }
    [[nodiscard]] const game::TargetRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] game::FactionTable& factions() noexcept { return factions_; }
    [[nodiscard]] foundation::RandomSource& random() noexcept { return rng_; }
    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    struct PlayerSlot {
        std::unique_ptr<game::PlayerAgent> agent;
        const game::ISkillSource* skills = nullptr;
        game::IExperienceSink* sink = nullptr;
    };

    [[nodiscard]] const PlayerSlot* findPlayerSlot(foundation::AgentId id) const;

    template <typename Agent>
    foundation::GameResult<void> attach(Agent& agent, game::CombatTarget& target);

    foundation::GameResult<void> detach(ITickable& agent, foundation::AgentId id);
    void handOverGuard(const game::PetAgent& leaving);
    void releaseRetired() noexcept { retired_.clear(); }

    SimulationConfig config_;
    foundation::Mt19937RandomSource rng_;
    TickScheduler scheduler_;
    game::TargetRegistry registry_;
    game::CombatResolver resolver_;
    game::FactionTable factions_;
    game::CombatExperience experience_;

    std::vector<PlayerSlot> players_;
    std::vector<std::unique_ptr<game::NpcAgent>> npcs_;
    std::vector<std::unique_ptr<game::PetAgent>> pets_;
    /// Despawned agents waiting for the next safe point.
    std::vector<std::unique_ptr<ITickable>> retired_;
};

} // namespace tcc::service
