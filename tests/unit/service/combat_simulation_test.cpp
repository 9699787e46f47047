/// @file combat_simulation_test.cpp
/// @brief Unit tests for CombatSimulation spawning, despawning and driving.

#include <gtest/gtest.h>

#include <chrono>
#include <utility>
#include <vector>

#include "support/test_doubles.hpp"
#include "tcc/service/combat_simulation.hpp"

using namespace tcc::service;
using namespace std::chrono_literals;
using tcc::foundation::AgentId;
using tcc::foundation::ErrorCode;
using tcc::game::AgentKind;
using tcc::game::BehaviorState;
using tcc::game::DamageSource;
using tcc::game::DamageType;
using tcc::game::EngageResult;
using tcc::game::NpcCombatProfile;
using tcc::game::PetDefinition;
using tcc::game::SessionEndReason;
using tcc::game::SkillType;
using tcc::game::Vector2;
using tcc::game::WanderBounds;
using tcc::test::RecordingExperienceSink;
using tcc::test::StubSkills;

namespace {

/// Bounds that pin an NPC to its spawn point.
WanderBounds Pinned() {
    WanderBounds bounds;
    bounds.minOffset = {0.0f, 0.0f};
    bounds.maxOffset = {0.0f, 0.0f};
    return bounds;
}

NpcCombatProfile Dummy() {
    NpcCombatProfile profile;
    profile.name = "training dummy";
    profile.hitpoints = 1000;
    profile.retaliates = false;
    return profile;
}

SimulationConfig FastConfig() {
    SimulationConfig config;
    config.tickDuration = 500ms;
    config.rules.tickSeconds = 0.5f;
    config.seed = 7;
    return config;
}

} // namespace

// ============================================================================
// Spawning
// ============================================================================

class CombatSimulationTest : public ::testing::Test {
protected:
    StubSkills skills_;
    RecordingExperienceSink sink_;
    CombatSimulation sim_{FastConfig()};
};

TEST_F(CombatSimulationTest, SpawnRegistersAndSubscribes) {
    ASSERT_TRUE(sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).hasValue());
    ASSERT_TRUE(sim_.spawnNpc(AgentId(2), Dummy(), {3.0f, 0.0f}, Pinned()).hasValue());
    ASSERT_TRUE(sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{}).hasValue());

    EXPECT_EQ(sim_.registry().Size(), 3u);
    EXPECT_EQ(sim_.scheduler().subscriberCount(), 3u);
    EXPECT_NE(sim_.findPlayer(AgentId(1)), nullptr);
    EXPECT_NE(sim_.findNpc(AgentId(2)), nullptr);
    EXPECT_NE(sim_.findPet(AgentId(3)), nullptr);
    EXPECT_EQ(sim_.findNpc(AgentId(1)), nullptr);
}

TEST_F(CombatSimulationTest, DuplicateIdIsRejected) {
    ASSERT_TRUE(sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).hasValue());

    auto result = sim_.spawnNpc(AgentId(1), Dummy(), {3.0f, 0.0f});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(sim_.scheduler().subscriberCount(), 1u);
    EXPECT_EQ(sim_.findNpc(AgentId(1)), nullptr);
}

TEST_F(CombatSimulationTest, InvalidIdIsRejected) {
    auto result = sim_.spawnPlayer(AgentId{}, &skills_, nullptr, {0.0f, 0.0f});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(sim_.registry().Size(), 0u);
}

TEST_F(CombatSimulationTest, InvalidNpcInputIsRejected) {
    auto profile = Dummy();
    profile.hitpoints = 0;
    auto badProfile = sim_.spawnNpc(AgentId(2), profile, {0.0f, 0.0f});
    ASSERT_TRUE(badProfile.hasError());
    EXPECT_EQ(badProfile.error().code(), ErrorCode::InvalidCombatProfile);

    WanderBounds inverted;
    inverted.minOffset = {1.0f, 1.0f};
    inverted.maxOffset = {-1.0f, -1.0f};
    auto badBounds = sim_.spawnNpc(AgentId(2), Dummy(), {0.0f, 0.0f}, inverted);
    ASSERT_TRUE(badBounds.hasError());
    EXPECT_EQ(badBounds.error().code(), ErrorCode::InvalidWanderBounds);

    EXPECT_EQ(sim_.registry().Size(), 0u);
}

TEST_F(CombatSimulationTest, PetNeedsSpawnedOwner) {
    auto result = sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(CombatSimulationTest, InvalidPetDefinitionIsRejected) {
    ASSERT_TRUE(sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).hasValue());
    PetDefinition def;
    def.attackSpeedTicks = 0;
    auto result = sim_.spawnPet(AgentId(3), AgentId(1), def);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidPetDefinition);
}

TEST_F(CombatSimulationTest, PetSpawnsBesideOwnerAsGuard) {
    auto player = sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {4.0f, 2.0f}).value();
    auto pet = sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{}).value();

    EXPECT_EQ(pet->Position(), (Vector2{4.0f, 2.0f}));
    EXPECT_EQ(pet->Owner(), AgentId(1));

    player->SetGuardMode(true);
    EXPECT_EQ(player->Combatant().GuardResponder(), pet);
}

// ============================================================================
// Despawning
// ============================================================================

TEST_F(CombatSimulationTest, DespawnUnknownIdFails) {
    auto result = sim_.despawn(AgentId(9));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TargetNotFound);
}

TEST_F(CombatSimulationTest, DespawnPetClearsGuard) {
    auto player = sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).value();
    ASSERT_TRUE(sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{}).hasValue());
    player->SetGuardMode(true);

    ASSERT_TRUE(sim_.despawn(AgentId(3)).hasValue());
    EXPECT_EQ(sim_.findPet(AgentId(3)), nullptr);
    EXPECT_EQ(player->Combatant().GuardResponder(), nullptr);
    EXPECT_EQ(sim_.scheduler().subscriberCount(), 1u);
}

TEST_F(CombatSimulationTest, DespawnedTargetEndsSessions) {
    auto player = sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).value();
    ASSERT_TRUE(sim_.spawnNpc(AgentId(2), Dummy(), {1.0f, 0.0f}, Pinned()).hasValue());

    std::vector<SessionEndReason> reasons;
    auto conn = player->Attack().OnSessionEnded().connectScoped(
        [&reasons](AgentId, SessionEndReason reason) { reasons.push_back(reason); });

    ASSERT_EQ(player->TryAttackTarget(AgentId(2)), EngageResult::Started);
    ASSERT_TRUE(sim_.despawn(AgentId(2)).hasValue());
    EXPECT_FALSE(sim_.registry().Contains(AgentId(2)));

    sim_.runTicks(1);
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], SessionEndReason::TargetLost);
}

TEST_F(CombatSimulationTest, DespawnOtherPetKeepsGuard) {
    auto player = sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).value();
    ASSERT_TRUE(sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{}).hasValue());
    auto guard = sim_.spawnPet(AgentId(4), AgentId(1), PetDefinition{}).value();
    player->SetGuardMode(true);
    ASSERT_EQ(player->Combatant().GuardResponder(), guard);

    ASSERT_TRUE(sim_.despawn(AgentId(3)).hasValue());
    EXPECT_EQ(player->GuardPet(), guard);
    EXPECT_EQ(player->Combatant().GuardResponder(), guard);
}

TEST_F(CombatSimulationTest, DespawnGuardHandsDutyToRemainingPet) {
    auto player = sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).value();
    auto first = sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{}).value();
    ASSERT_TRUE(sim_.spawnPet(AgentId(4), AgentId(1), PetDefinition{}).hasValue());

    ASSERT_TRUE(sim_.despawn(AgentId(4)).hasValue());
    EXPECT_EQ(player->GuardPet(), first);

    ASSERT_TRUE(sim_.despawn(AgentId(3)).hasValue());
    EXPECT_EQ(player->GuardPet(), nullptr);
}

TEST_F(CombatSimulationTest, GuardIsPerOwner) {
    StubSkills otherSkills;
    auto alice = sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).value();
    auto bob = sim_.spawnPlayer(AgentId(2), &otherSkills, nullptr, {5.0f, 0.0f}).value();
    auto alicePet = sim_.spawnPet(AgentId(3), AgentId(1), PetDefinition{}).value();
    auto bobPet = sim_.spawnPet(AgentId(4), AgentId(2), PetDefinition{}).value();

    EXPECT_EQ(alice->GuardPet(), alicePet);
    EXPECT_EQ(bob->GuardPet(), bobPet);

    ASSERT_TRUE(sim_.despawn(AgentId(4)).hasValue());
    EXPECT_EQ(alice->GuardPet(), alicePet);
    EXPECT_EQ(bob->GuardPet(), nullptr);
}

TEST_F(CombatSimulationTest, DeathObserverMayDespawnTheDeadNpc) {
    ASSERT_TRUE(sim_.spawnNpc(AgentId(2), Dummy(), {1.0f, 0.0f}, Pinned()).hasValue());
    auto* npc = sim_.findNpc(AgentId(2));

    int despawned = 0;
    npc->Combatant().Health().OnDeath().connect([this, &despawned](const auto& event) {
        if (sim_.despawn(event.agent).hasValue()) {
            ++despawned;
        }
    });

    const int32_t applied = npc->Combatant().ApplyDamage(
        5000, DamageType::Melee, DamageSource{AgentId(1), AgentKind::Player});

    EXPECT_EQ(applied, 1000);
    EXPECT_EQ(despawned, 1);
    EXPECT_EQ(sim_.findNpc(AgentId(2)), nullptr);
    EXPECT_FALSE(sim_.registry().Contains(AgentId(2)));
    EXPECT_EQ(sim_.scheduler().subscriberCount(), 0u);

    sim_.runTicks(1);
    EXPECT_EQ(sim_.scheduler().currentTick(), 1u);
}

TEST_F(CombatSimulationTest, KillingBlowMayDespawnTargetMidTick) {
    skills_.Set(SkillType::Attack, 99).Set(SkillType::Strength, 99);
    SimulationConfig config = FastConfig();
    config.rules.minHitChance = 1.0f;
    CombatSimulation sim(config);

    auto player = sim.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}).value();
    auto profile = Dummy();
    profile.hitpoints = 1;
    profile.respawnTicks = 5;
    auto npc = sim.spawnNpc(AgentId(2), profile, {1.0f, 0.0f}, Pinned()).value();

    int deaths = 0;
    npc->Combatant().Health().OnDeath().connect([&sim, &deaths](const auto& event) {
        ++deaths;
        EXPECT_TRUE(sim.despawn(event.agent).hasValue());
    });

    std::vector<SessionEndReason> reasons;
    auto conn = player->Attack().OnSessionEnded().connectScoped(
        [&reasons](AgentId, SessionEndReason reason) { reasons.push_back(reason); });

    ASSERT_EQ(player->TryAttackTarget(AgentId(2)), EngageResult::Started);
    for (int i = 0; i < 400 && sim.findNpc(AgentId(2)) != nullptr; ++i) {
        sim.runTicks(1);
    }

    EXPECT_EQ(deaths, 1);
    EXPECT_EQ(sim.findNpc(AgentId(2)), nullptr);
    EXPECT_FALSE(player->Attack().IsEngaged());
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_EQ(reasons[0], SessionEndReason::TargetDied);

    sim.runTicks(3);
    EXPECT_EQ(sim.scheduler().subscriberCount(), 1u);
}

// ============================================================================
// Driving
// ============================================================================

TEST_F(CombatSimulationTest, AdvanceFrameFiresDueTicks) {
    ASSERT_TRUE(sim_.spawnNpc(AgentId(2), Dummy(), {0.0f, 0.0f}, Pinned()).hasValue());

    EXPECT_EQ(sim_.advanceFrame(0.25f), 0u);
    EXPECT_EQ(sim_.advanceFrame(0.25f), 1u);
    EXPECT_EQ(sim_.advanceFrame(1.0f), 2u);
    EXPECT_EQ(sim_.scheduler().currentTick(), 3u);

    sim_.scheduler().pause();
    EXPECT_EQ(sim_.advanceFrame(1.0f), 0u);
}

TEST_F(CombatSimulationTest, RunTicksStepsScheduler) {
    sim_.runTicks(5);
    EXPECT_EQ(sim_.scheduler().currentTick(), 5u);
}

TEST_F(CombatSimulationTest, ConfiguredLogLevelsAreApplied) {
    auto& logger = tcc::foundation::GameLogger::instance();
    const auto previous = logger.getCategoryLevel(tcc::foundation::LogCategory::Pet);

    SimulationConfig config;
    config.logLevels[static_cast<std::size_t>(tcc::foundation::LogCategory::Pet)] =
        tcc::foundation::LogLevel::Critical;
    CombatSimulation sim(config);
    EXPECT_EQ(logger.getCategoryLevel(tcc::foundation::LogCategory::Pet),
              tcc::foundation::LogLevel::Critical);

    logger.setCategoryLevel(tcc::foundation::LogCategory::Pet, previous);
}

// ============================================================================
// Experience wiring
// ============================================================================

TEST_F(CombatSimulationTest, PetHitsTrainPetAndOwnerBeastmaster) {
    ASSERT_TRUE(
        sim_.spawnPlayer(AgentId(1), &skills_, nullptr, {0.0f, 0.0f}, &sink_).hasValue());
    ASSERT_TRUE(sim_.spawnNpc(AgentId(2), Dummy(), {1.0f, 0.0f}, Pinned()).hasValue());

    PetDefinition def;
    def.attackLevel = 60;
    def.strengthLevel = 60;
    auto pet = sim_.spawnPet(AgentId(3), AgentId(1), def).value();
    ASSERT_EQ(pet->CommandAttack(AgentId(2)), EngageResult::Started);

    sim_.runTicks(60);

    const int32_t dealt = 1000 - sim_.findNpc(AgentId(2))->Combatant().CurrentHP();
    EXPECT_GT(dealt, 0);
    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Beastmaster), 4.0f * static_cast<float>(dealt));
    EXPECT_DOUBLE_EQ(pet->Progression().Experience(), 12.0 * dealt);
    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Attack), 0.0f);
}

TEST_F(CombatSimulationTest, SameSeedReplaysIdentically) {
    auto run = [](uint32_t seed) {
        SimulationConfig config = FastConfig();
        config.seed = seed;
        config.rules.minHitChance = 0.5f;
        CombatSimulation sim(config);
        StubSkills skills;
        auto player = sim.spawnPlayer(AgentId(1), &skills, nullptr, {0.0f, 0.0f}).value();
        auto profile = Dummy();
        profile.aggressive = true;
        profile.aggroRange = 5.0f;
        profile.hitpoints = 50;
        auto npc = sim.spawnNpc(AgentId(2), profile, {2.0f, 0.0f}).value();
        player->TryAttackTarget(AgentId(2));
        sim.runTicks(40);
        return std::make_pair(player->Combatant().CurrentHP(), npc->Position());
    };

    EXPECT_EQ(run(11), run(11));
}
