#include <gtest/gtest.h>

#include <vector>

#include "support/test_doubles.hpp"
#include "tcc/game/npc_combatant.hpp"
#include "tcc/game/player_agent.hpp"

using namespace tcc::game;
using tcc::foundation::AgentId;
using tcc::test::RecordingExperienceSink;
using tcc::test::ScriptedRandomSource;
using tcc::test::StubEquipment;
using tcc::test::StubSkills;

namespace {

class RecordingGuard final : public IGuardResponder {
public:
    void RequestGuardAssist(AgentId aggressor) override { requests.push_back(aggressor); }
    std::vector<AgentId> requests;
};

StubSkills TrainedSkills() {
    StubSkills skills;
    skills.Set(SkillType::Attack, 10).Set(SkillType::Strength, 10).Set(SkillType::Hitpoints, 20);
    return skills;
}

} // namespace

class PlayerAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(registry_.Register(player_.Combatant()).hasValue());
        ASSERT_TRUE(registry_.Register(npc_).hasValue());
        npc_.SetPosition({1.0f, 0.0f});
    }

    SimulationRules rules_;
    ScriptedRandomSource rng_;
    CombatResolver resolver_{rng_};
    TargetRegistry registry_;
    StubSkills skills_ = TrainedSkills();
    StubEquipment equipment_;
    RecordingExperienceSink sink_;
    NpcCombatant npc_{AgentId(2), NpcCombatProfile{}};
    PlayerAgent player_{AgentId(1), &skills_, &equipment_, rules_, registry_, resolver_, &sink_};
};

TEST_F(PlayerAgentTest, HitpointsFollowSkillLevel) {
    EXPECT_EQ(player_.Combatant().MaxHP(), 20);
}

TEST_F(PlayerAgentTest, AttackResolvesOnFirstTick) {
    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    rng_.QueueInt(1);
    player_.OnTick();
    EXPECT_EQ(npc_.CurrentHP(), 9);
    EXPECT_EQ(player_.Attack().Facing(), FacingDirection::Right);
}

TEST_F(PlayerAgentTest, HitAwardsStyleAndHitpointsExperience) {
    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    rng_.QueueInt(1);
    player_.OnTick();

    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Hitpoints), 1.33f);
    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Attack), 4.0f);
    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Strength), 0.0f);
    for (const auto& award : sink_.awards) {
        EXPECT_EQ(award.agent, AgentId(1));
    }
}

TEST_F(PlayerAgentTest, AggressiveStyleTrainsStrength) {
    player_.Combatant().SetStyle(CombatStyle::Aggressive);
    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    rng_.QueueInt(1);
    player_.OnTick();

    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Strength), 4.0f);
    EXPECT_FLOAT_EQ(sink_.Total(SkillType::Attack), 0.0f);
}

TEST_F(PlayerAgentTest, ZeroDamageAwardsNothing) {
    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    player_.OnTick();
    EXPECT_TRUE(sink_.awards.empty());
}

TEST_F(PlayerAgentTest, TargetOutOfReachWaitsForHost) {
    npc_.SetPosition({4.0f, 0.0f});
    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    player_.OnTick();
    EXPECT_EQ(player_.Attack().Session()->attacksResolved, 0u);

    player_.SetPosition({3.0f, 0.0f});
    player_.OnTick();
    EXPECT_EQ(player_.Attack().Session()->attacksResolved, 1u);
}

TEST_F(PlayerAgentTest, GuardModeSendsPetAfterNewTarget) {
    RecordingGuard guard;
    player_.SetGuardPet(&guard);
    player_.SetGuardMode(true);

    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    ASSERT_EQ(guard.requests.size(), 1u);
    EXPECT_EQ(guard.requests[0], AgentId(2));

    EXPECT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::AlreadyEngaged);
    EXPECT_EQ(guard.requests.size(), 1u);
}

TEST_F(PlayerAgentTest, GuardModeOffKeepsPetOut) {
    RecordingGuard guard;
    player_.SetGuardPet(&guard);

    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    EXPECT_TRUE(guard.requests.empty());
}

TEST_F(PlayerAgentTest, CancelCombatEndsSession) {
    ASSERT_EQ(player_.TryAttackTarget(AgentId(2)), EngageResult::Started);
    player_.CancelCombat();
    EXPECT_FALSE(player_.Attack().IsEngaged());
    player_.OnTick();
    EXPECT_EQ(npc_.CurrentHP(), 10);
}
