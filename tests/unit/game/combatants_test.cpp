#include <gtest/gtest.h>

#include <string>

#include "support/test_doubles.hpp"
#include "tcc/game/npc_combatant.hpp"
#include "tcc/game/pet_combatant.hpp"
#include "tcc/game/pet_progression.hpp"
#include "tcc/game/player_combatant.hpp"
#include "tcc/game/target_registry.hpp"

using namespace tcc::game;
using tcc::foundation::AgentId;
using tcc::foundation::ErrorCode;
using tcc::test::StubEquipment;
using tcc::test::StubSkills;

namespace {

const DamageSource kHit{AgentId(99), AgentKind::Player};

class RecordingGuard final : public IGuardResponder {
public:
    void RequestGuardAssist(AgentId aggressor) override { last = aggressor; }
    AgentId last;
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// NpcCombatant
// ═══════════════════════════════════════════════════════════════════════════

TEST(NpcCombatantTest, ExposesProfile) {
    NpcCombatProfile profile;
    profile.hitpoints = 15;
    profile.attackType = DamageType::Magic;
    profile.faction = 3;
    NpcCombatant npc(AgentId(5), profile);

    EXPECT_EQ(npc.Id(), AgentId(5));
    EXPECT_EQ(npc.Kind(), AgentKind::Npc);
    EXPECT_EQ(npc.MaxHP(), 15);
    EXPECT_EQ(npc.CurrentHP(), 15);
    EXPECT_EQ(npc.PreferredDefenceType(), DamageType::Magic);
    EXPECT_EQ(npc.Faction(), 3);
    EXPECT_EQ(npc.GuardResponder(), nullptr);
}

TEST(NpcCombatantTest, DefenderStatsTakeIncomingType) {
    NpcCombatProfile profile;
    profile.defenceLevel = 30;
    profile.magicDefence = 8;
    NpcCombatant npc(AgentId(5), profile);

    auto stats = npc.DefenderStats(DamageType::Ranged);
    EXPECT_EQ(stats.defenceLevel, 30);
    EXPECT_EQ(stats.damageType, DamageType::Ranged);
    EXPECT_EQ(stats.equipment.magicDefence, 8);
}

TEST(NpcCombatantTest, RespawnAfterConfiguredTicks) {
    NpcCombatProfile profile;
    profile.hitpoints = 5;
    profile.respawnTicks = 2;
    NpcCombatant npc(AgentId(5), profile);

    npc.ApplyDamage(9, DamageType::Melee, kHit);
    EXPECT_FALSE(npc.IsAlive());
    EXPECT_EQ(npc.RespawnTicksRemaining(), 2);

    EXPECT_FALSE(npc.TickRespawn());
    EXPECT_FALSE(npc.IsAlive());
    EXPECT_TRUE(npc.TickRespawn());
    EXPECT_TRUE(npc.IsAlive());
    EXPECT_EQ(npc.CurrentHP(), 5);
    EXPECT_EQ(npc.Health().Life(), 2u);

    // Alive NPCs have nothing to count down.
    EXPECT_FALSE(npc.TickRespawn());
}

TEST(NpcCombatantTest, NoRespawnStaysDead) {
    NpcCombatProfile profile;
    profile.hitpoints = 1;
    NpcCombatant npc(AgentId(5), profile);

    npc.ApplyDamage(1, DamageType::Melee, kHit);
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(npc.TickRespawn());
    }
    EXPECT_FALSE(npc.IsAlive());
}

TEST(NpcCombatantTest, ProfileValidation) {
    NpcCombatProfile profile;
    EXPECT_TRUE(profile.Validate().hasValue());

    profile.hitpoints = 0;
    auto result = profile.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidCombatProfile);
    ASSERT_NE(result.error().context<std::string>(), nullptr);
    EXPECT_EQ(*result.error().context<std::string>(), "hitpoints");

    profile.hitpoints = 10;
    profile.attackSpeedTicks = 0;
    EXPECT_TRUE(profile.Validate().hasError());

    profile.attackSpeedTicks = 4;
    profile.aggroRange = -1.0f;
    EXPECT_TRUE(profile.Validate().hasError());
}

// ═══════════════════════════════════════════════════════════════════════════
// PlayerCombatant
// ═══════════════════════════════════════════════════════════════════════════

TEST(PlayerCombatantTest, MaxHpFromHitpointsLevel) {
    StubSkills skills;
    skills.Set(SkillType::Hitpoints, 25);
    PlayerCombatant player(AgentId(1), &skills, nullptr);
    EXPECT_EQ(player.MaxHP(), 25);
    EXPECT_EQ(player.Kind(), AgentKind::Player);

    PlayerCombatant bare(AgentId(2), nullptr, nullptr);
    EXPECT_EQ(bare.MaxHP(), 10);
}

TEST(PlayerCombatantTest, StyleAppliesToBothSnapshots) {
    StubSkills skills;
    skills.Set(SkillType::Defence, 20);
    StubEquipment equipment;
    equipment.bonus.meleeDefence = 7;
    PlayerCombatant player(AgentId(1), &skills, &equipment);
    player.SetStyle(CombatStyle::Defensive);
    player.SetAttackType(DamageType::Ranged);

    auto defence = player.DefenderStats(DamageType::Magic);
    EXPECT_EQ(defence.style, CombatStyle::Defensive);
    EXPECT_EQ(defence.damageType, DamageType::Magic);
    EXPECT_EQ(defence.defenceLevel, 20);
    EXPECT_EQ(defence.equipment.meleeDefence, 7);

    auto attack = player.AttackerStats();
    EXPECT_EQ(attack.style, CombatStyle::Defensive);
    EXPECT_EQ(attack.damageType, DamageType::Ranged);
}

TEST(PlayerCombatantTest, DefaultsToAccurateMelee) {
    PlayerCombatant player(AgentId(1), nullptr, nullptr);
    EXPECT_EQ(player.Style(), CombatStyle::Accurate);
    EXPECT_EQ(player.AttackType(), DamageType::Melee);
    EXPECT_EQ(player.PreferredDefenceType(), DamageType::Melee);
}

TEST(PlayerCombatantTest, GuardResponderRequiresGuardMode) {
    PlayerCombatant player(AgentId(1), nullptr, nullptr);
    RecordingGuard guard;
    player.SetGuardPet(&guard);
    EXPECT_EQ(player.GuardResponder(), nullptr);

    player.SetGuardMode(true);
    EXPECT_EQ(player.GuardResponder(), &guard);

    player.SetGuardPet(nullptr);
    EXPECT_EQ(player.GuardResponder(), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// PetCombatant
// ═══════════════════════════════════════════════════════════════════════════

TEST(PetCombatantTest, InvulnerablePetIgnoresDamage) {
    PetDefinition def;
    def.hitpoints = 5;
    PetCombatant pet(AgentId(3), AgentId(1), def, nullptr, nullptr);

    EXPECT_EQ(pet.ApplyDamage(50, DamageType::Melee, kHit), 0);
    EXPECT_TRUE(pet.IsAlive());
    EXPECT_EQ(pet.CurrentHP(), 5);
    EXPECT_EQ(pet.Kind(), AgentKind::Pet);
    EXPECT_EQ(pet.Owner(), AgentId(1));
}

TEST(PetCombatantTest, VulnerablePetCanDie) {
    PetDefinition def;
    def.hitpoints = 5;
    def.invulnerable = false;
    PetCombatant pet(AgentId(3), AgentId(1), def, nullptr, nullptr);

    EXPECT_EQ(pet.ApplyDamage(50, DamageType::Melee, kHit), 5);
    EXPECT_FALSE(pet.IsAlive());
}

TEST(PetCombatantTest, StatsUseProgressionTierAndOwnerBeastmaster) {
    PetDefinition def;
    def.attackLevel = 20;
    def.attackLevelPerBeastmasterLevel = 0.1f;

    PetProgression progression; // level 1 -> tier 0.5
    StubSkills owner;
    owner.Set(SkillType::Beastmaster, 10);

    PetCombatant pet(AgentId(3), AgentId(1), def, &owner, &progression);
    EXPECT_EQ(pet.AttackerStats().attackLevel, 20); // 20 * 0.5 * 2

    PetCombatant noScaling(AgentId(4), AgentId(1), def, nullptr, nullptr);
    EXPECT_EQ(noScaling.AttackerStats().attackLevel, 20);
}

TEST(PetCombatantTest, DefinitionValidation) {
    PetDefinition def;
    EXPECT_TRUE(def.Validate().hasValue());

    def.maxHitPerBeastmasterLevel = -0.1f;
    auto result = def.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidPetDefinition);
}

// ═══════════════════════════════════════════════════════════════════════════
// TargetRegistry
// ═══════════════════════════════════════════════════════════════════════════

TEST(TargetRegistryTest, RegisterAndFind) {
    TargetRegistry registry;
    NpcCombatant a(AgentId(1), NpcCombatProfile{});
    NpcCombatant b(AgentId(2), NpcCombatProfile{});

    ASSERT_TRUE(registry.Register(b).hasValue());
    ASSERT_TRUE(registry.Register(a).hasValue());

    EXPECT_EQ(registry.Find(AgentId(1)), &a);
    EXPECT_EQ(registry.Find(AgentId(2)), &b);
    EXPECT_EQ(registry.Find(AgentId(3)), nullptr);
    EXPECT_EQ(registry.Find(AgentId()), nullptr);

    // Registration order is preserved.
    ASSERT_EQ(registry.Size(), 2u);
    EXPECT_EQ(registry.All()[0], &b);
    EXPECT_EQ(registry.All()[1], &a);
}

TEST(TargetRegistryTest, RejectsDuplicateAndInvalidIds) {
    TargetRegistry registry;
    NpcCombatant a(AgentId(1), NpcCombatProfile{});
    NpcCombatant clash(AgentId(1), NpcCombatProfile{});
    NpcCombatant nameless(AgentId(), NpcCombatProfile{});

    ASSERT_TRUE(registry.Register(a).hasValue());

    auto dup = registry.Register(clash);
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::AlreadyExists);

    auto invalid = registry.Register(nameless);
    ASSERT_TRUE(invalid.hasError());
    EXPECT_EQ(invalid.error().code(), ErrorCode::InvalidArgument);
}

TEST(TargetRegistryTest, UnregisterRemovesTarget) {
    TargetRegistry registry;
    NpcCombatant a(AgentId(1), NpcCombatProfile{});
    ASSERT_TRUE(registry.Register(a).hasValue());

    ASSERT_TRUE(registry.Unregister(AgentId(1)).hasValue());
    EXPECT_FALSE(registry.Contains(AgentId(1)));

    auto again = registry.Unregister(AgentId(1));
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::TargetNotFound);
}
