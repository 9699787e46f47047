/// @file combat_simulation.cpp
/// @brief CombatSimulation spawning, despawning and frame driving.

#include "tcc/service/combat_simulation.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::service {

using foundation::AgentId;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

void logSpawn(std::string_view what, AgentId id) {
    LogContext ctx;
    ctx.agentId = id;
    TCC_LOG_CTX(LogLevel::Info, LogCategory::Core, std::string(what) + " spawned", ctx);
}

} // namespace

CombatSimulation::CombatSimulation(SimulationConfig config)
    : config_(std::move(config)),
      rng_(config_.seed),
      scheduler_(config_.tickDuration),
      resolver_(rng_, config_.rules.minHitChance),
      experience_(config_.rules.experience) {
    config_.applyLogLevels(foundation::GameLogger::instance());
}

CombatSimulation::~CombatSimulation() {
    // Players hold raw guard pointers to pets, which are destroyed first.
    for (auto& slot : players_) {
        slot.agent->SetGuardPet(nullptr);
    }
}

template <typename Agent>
GameResult<void> CombatSimulation::attach(Agent& agent, game::CombatTarget& target) {
    if (auto registered = registry_.Register(target); !registered) {
        return registered;
    }
    if (auto subscribed = scheduler_.subscribe(&agent); !subscribed) {
        if (auto rolledBack = registry_.Unregister(target.Id()); !rolledBack) {
            return rolledBack;
        }
        return subscribed;
    }
    return GameResult<void>::ok();
}

GameResult<game::PlayerAgent*> CombatSimulation::spawnPlayer(AgentId id,
                                                             const game::ISkillSource* skills,
                                                             const game::IEquipmentSource* equipment,
                                                             const game::Vector2& position,
                                                             game::IExperienceSink* sink) {
    auto agent = std::make_unique<game::PlayerAgent>(id, skills, equipment, config_.rules,
                                                     registry_, resolver_, sink);
    agent->SetPosition(position);
    if (auto attached = attach(*agent, agent->Combatant()); !attached) {
        return GameResult<game::PlayerAgent*>::err(attached.error());
    }

    game::PlayerAgent* raw = agent.get();
    players_.push_back(PlayerSlot{std::move(agent), skills, sink});
    logSpawn("player", id);
    return GameResult<game::PlayerAgent*>::ok(raw);
}

GameResult<game::NpcAgent*> CombatSimulation::spawnNpc(AgentId id,
                                                       game::NpcCombatProfile profile,
                                                       const game::Vector2& origin,
                                                       const game::WanderBounds& bounds) {
    if (auto valid = profile.Validate(); !valid) {
        return GameResult<game::NpcAgent*>::err(valid.error());
    }
    if (auto valid = bounds.Validate(); !valid) {
        return GameResult<game::NpcAgent*>::err(valid.error());
    }

    auto agent = std::make_unique<game::NpcAgent>(id, std::move(profile), origin, bounds,
                                                  config_.rules, registry_, resolver_, rng_,
                                                  &factions_);
    if (auto attached = attach(*agent, agent->Combatant()); !attached) {
        return GameResult<game::NpcAgent*>::err(attached.error());
    }

    game::NpcAgent* raw = agent.get();
    npcs_.push_back(std::move(agent));
    logSpawn("npc", id);
    return GameResult<game::NpcAgent*>::ok(raw);
}

GameResult<game::PetAgent*> CombatSimulation::spawnPet(AgentId id,
                                                       AgentId owner,
                                                       game::PetDefinition definition,
                                                       double experience) {
    if (auto valid = definition.Validate(); !valid) {
        return GameResult<game::PetAgent*>::err(valid.error());
    }
    const PlayerSlot* ownerSlot = findPlayerSlot(owner);
    if (ownerSlot == nullptr) {
        return GameResult<game::PetAgent*>::err(GameError(
            ErrorCode::NotFound, "pet owner is not a spawned player", owner.value()));
    }

    auto agent = std::make_unique<game::PetAgent>(id, owner, std::move(definition),
                                                  ownerSlot->skills, experience,
                                                  ownerSlot->agent->Position(), config_.rules,
                                                  registry_, resolver_);
    if (auto attached = attach(*agent, agent->Combatant()); !attached) {
        return GameResult<game::PetAgent*>::err(attached.error());
    }

    game::PetAgent* raw = agent.get();
    game::IExperienceSink* ownerSink = ownerSlot->sink;
    raw->SetHitHook([this, raw, ownerSink](AgentId petOwner, int32_t damage) {
        experience_.AwardPetHit(ownerSink, petOwner, &raw->Progression(), damage);
    });
    ownerSlot->agent->SetGuardPet(raw);

    pets_.push_back(std::move(agent));
    logSpawn("pet", id);
    return GameResult<game::PetAgent*>::ok(raw);
}

GameResult<void> CombatSimulation::despawn(AgentId id) {
    if (auto it = std::find_if(pets_.begin(), pets_.end(),
                               [id](const auto& pet) { return pet->Id() == id; });
        it != pets_.end()) {
        handOverGuard(**it);
        auto result = detach(**it, id);
        retired_.push_back(std::move(*it));
        pets_.erase(it);
        return result;
    }

    if (auto it = std::find_if(npcs_.begin(), npcs_.end(),
                               [id](const auto& npc) { return npc->Id() == id; });
        it != npcs_.end()) {
        auto result = detach(**it, id);
        retired_.push_back(std::move(*it));
        npcs_.erase(it);
        return result;
    }

    if (auto it = std::find_if(players_.begin(), players_.end(),
                               [id](const PlayerSlot& slot) { return slot.agent->Id() == id; });
        it != players_.end()) {
        auto result = detach(*it->agent, id);
        retired_.push_back(std::move(it->agent));
        players_.erase(it);
        return result;
    }

    return GameResult<void>::err(
        GameError(ErrorCode::TargetNotFound, "no agent with this id", id.value()));
}

GameResult<void> CombatSimulation::detach(ITickable& agent, AgentId id) {
    if (auto unsubscribed = scheduler_.unsubscribe(&agent); !unsubscribed) {
        return unsubscribed;
    }
    return registry_.Unregister(id);
}

void CombatSimulation::handOverGuard(const game::PetAgent& leaving) {
    const PlayerSlot* owner = findPlayerSlot(leaving.Owner());
    if (owner == nullptr || owner->agent->GuardPet() != &leaving) {
        return;
    }

    game::PetAgent* successor = nullptr;
    for (auto it = pets_.rbegin(); it != pets_.rend(); ++it) {
        if (it->get() != &leaving && (*it)->Owner() == leaving.Owner()) {
            successor = it->get();
            break;
        }
    }
    owner->agent->SetGuardPet(successor);
}

uint32_t CombatSimulation::advanceFrame(float deltaSeconds) {
    if (scheduler_.isPaused()) {
        releaseRetired();
        return 0;
    }
    const uint32_t ticks = scheduler_.advance(deltaSeconds);
    releaseRetired();

    // A fired tick restarted every window; only the remainder has elapsed.
    const float renderDelta = ticks > 0 ? scheduler_.elapsedInTick() : deltaSeconds;
    for (auto& npc : npcs_) {
        npc->Update(renderDelta);
    }
    for (auto& pet : pets_) {
        pet->Update(renderDelta);
    }
    return ticks;
}

void CombatSimulation::runTicks(uint32_t count) {
    for (uint32_t i = 0; i < count; ++i) {
        scheduler_.step();
        releaseRetired();
    }
}

const CombatSimulation::PlayerSlot* CombatSimulation::findPlayerSlot(AgentId id) const {
    auto it = std::find_if(players_.begin(), players_.end(),
                           [id](const PlayerSlot& slot) { return slot.agent->Id() == id; });
    return it != players_.end() ? &*it : nullptr;
}

game::PlayerAgent* CombatSimulation::findPlayer(AgentId id) const {
    const PlayerSlot* slot = findPlayerSlot(id);
    return slot != nullptr ? slot->agent.get() : nullptr;
}

game::NpcAgent* CombatSimulation::findNpc(AgentId id) const {
    auto it = std::find_if(npcs_.begin(), npcs_.end(),
                           [id](const auto& npc) { return npc->Id() == id; });
    return it != npcs_.end() ? it->get() : nullptr;
}

game::PetAgent* CombatSimulation::findPet(AgentId id) const {
    auto it = std::find_if(pets_.begin(), pets_.end(),
                           [id](const auto& pet) { return pet->Id() == id; });
    return it != pets_.end() ? it->get() : nullptr;
}

} // namespace tcc::service
