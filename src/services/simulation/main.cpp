/// @file main.cpp
/// @brief tcc_sim entry point.
///
/// Headless combat run: loads the configuration, spawns the scenario it
/// describes (one player with a guard pet against one NPC), fires a fixed
/// number of ticks and prints a summary.

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

#include "tcc/foundation/config_manager.hpp"
#include "tcc/foundation/game_logger.hpp"
#include "tcc/service/combat_simulation.hpp"
#include "tcc/service/simulation_config.hpp"
#include "tcc/version.hpp"

namespace {

using tcc::foundation::AgentId;
using tcc::foundation::ConfigManager;
using tcc::game::SkillType;

/// Skill levels from the scenario; also collects the experience earned.
class ScenarioSkills final : public tcc::game::ISkillSource, public tcc::game::IExperienceSink {
public:
    void SetLevel(SkillType skill, int32_t level) { levels_[skill] = level; }

    [[nodiscard]] int32_t GetLevel(SkillType skill) const override {
        auto it = levels_.find(skill);
        return it != levels_.end() ? it->second : 1;
    }

    void AddExperience(AgentId /*agent*/, SkillType skill, float xp) override {
        experience_[skill] += xp;
    }

    [[nodiscard]] float Experience(SkillType skill) const {
        auto it = experience_.find(skill);
        return it != experience_.end() ? it->second : 0.0f;
    }

private:
    std::map<SkillType, int32_t> levels_;
    std::map<SkillType, float> experience_;
};

class ScenarioEquipment final : public tcc::game::IEquipmentSource {
public:
    explicit ScenarioEquipment(tcc::game::EquipmentBonus bonus) : bonus_(bonus) {}

    [[nodiscard]] tcc::game::EquipmentBonus CombinedStats() const override { return bonus_; }

private:
    tcc::game::EquipmentBonus bonus_;
};

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

/// Value of --ticks, or 0 when absent or malformed.
uint32_t parseTicksArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--ticks") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            char* end = nullptr;
            const unsigned long value = std::strtoul(argv[i + 1], &end, 10);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return (end != nullptr && *end == '\0') ? static_cast<uint32_t>(value) : 0;
        }
    }
    return 0;
}

tcc::foundation::GameResult<void> loadConfig(ConfigManager& config,
                                             const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    // Environment variable override.
    const char* envPath = std::getenv("TCC_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

tcc::game::CombatStyle parseStyle(std::string_view name) {
    if (name == "aggressive") {
        return tcc::game::CombatStyle::Aggressive;
    }
    if (name == "defensive") {
        return tcc::game::CombatStyle::Defensive;
    }
    if (name == "controlled") {
        return tcc::game::CombatStyle::Controlled;
    }
    return tcc::game::CombatStyle::Accurate;
}

tcc::game::NpcCombatProfile buildNpcProfile(const ConfigManager& config) {
    tcc::game::NpcCombatProfile profile;
    profile.name = config.getOr<std::string>("scenario.npc.name", "goblin");
    profile.attackLevel = config.getOr<int32_t>("scenario.npc.attack", 5);
    profile.strengthLevel = config.getOr<int32_t>("scenario.npc.strength", 5);
    profile.defenceLevel = config.getOr<int32_t>("scenario.npc.defence", 5);
    profile.hitpoints = config.getOr<int32_t>("scenario.npc.hitpoints", 12);
    profile.attackSpeedTicks = config.getOr<int32_t>("scenario.npc.attack_speed_ticks", 4);
    profile.respawnTicks = config.getOr<int32_t>("scenario.npc.respawn_ticks", 10);
    profile.aggressive = config.getOr<bool>("scenario.npc.aggressive", true);
    profile.aggroRange = config.getOr<float>("scenario.npc.aggro_range", 5.0f);
    return profile;
}

} // namespace

int main(int argc, char* argv[]) {
    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/combat.yaml";
    }

    ConfigManager config;
    auto loadResult = loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto simConfig = tcc::service::SimulationConfig::fromConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid config: " << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    uint32_t ticks = parseTicksArg(argc, argv);
    if (ticks == 0) {
        ticks = config.getOr<uint32_t>("scenario.ticks", 200);
    }

    ScenarioSkills skills;
    skills.SetLevel(SkillType::Attack, config.getOr<int32_t>("scenario.player.attack", 10));
    skills.SetLevel(SkillType::Strength, config.getOr<int32_t>("scenario.player.strength", 10));
    skills.SetLevel(SkillType::Defence, config.getOr<int32_t>("scenario.player.defence", 10));
    skills.SetLevel(SkillType::Hitpoints, config.getOr<int32_t>("scenario.player.hitpoints", 20));
    skills.SetLevel(SkillType::Beastmaster,
                    config.getOr<int32_t>("scenario.player.beastmaster", 1));

    tcc::game::EquipmentBonus bonus;
    bonus.attack = config.getOr<int32_t>("scenario.player.attack_bonus", 0);
    bonus.strength = config.getOr<int32_t>("scenario.player.strength_bonus", 0);
    ScenarioEquipment equipment(bonus);

    tcc::service::CombatSimulation sim(simConfig.value());

    const AgentId playerId{1};
    const AgentId npcId{2};
    const AgentId petId{3};

    auto player = sim.spawnPlayer(playerId, &skills, &equipment, {0.0f, 0.0f}, &skills);
    if (!player) {
        std::cerr << "Failed to spawn player: " << player.error().message() << "\n";
        return EXIT_FAILURE;
    }
    player.value()->Combatant().SetStyle(
        parseStyle(config.getOr<std::string>("scenario.player.style", "accurate")));

    auto npc = sim.spawnNpc(npcId, buildNpcProfile(config), {3.0f, 0.0f});
    if (!npc) {
        std::cerr << "Failed to spawn npc: " << npc.error().message() << "\n";
        return EXIT_FAILURE;
    }

    tcc::game::PetDefinition petDef;
    petDef.name = config.getOr<std::string>("scenario.pet.name", "wolf");
    petDef.attackLevel = config.getOr<int32_t>("scenario.pet.attack", 5);
    petDef.strengthLevel = config.getOr<int32_t>("scenario.pet.strength", 5);
    auto pet = sim.spawnPet(petId, playerId, petDef,
                            config.getOr<double>("scenario.pet.experience", 0.0));
    if (!pet) {
        std::cerr << "Failed to spawn pet: " << pet.error().message() << "\n";
        return EXIT_FAILURE;
    }
    player.value()->SetGuardMode(config.getOr<bool>("scenario.player.guard_mode", true));

    uint32_t kills = 0;
    auto killConn = npc.value()->Combatant().Health().OnDeath().connectScoped(
        [&kills](const tcc::game::DeathEvent&) { ++kills; });

    tcc::game::PlayerAgent& hero = *player.value();
    tcc::game::NpcAgent& foe = *npc.value();
    const float meleeRange = sim.config().rules.meleeRange;

    TCC_LOG_INFO(tcc::foundation::LogCategory::Core,
                 std::string("tcc_sim ") + tcc::Version::string + " running " +
                     std::to_string(ticks) + " ticks");

    for (uint32_t i = 0; i < ticks && hero.Combatant().IsAlive(); ++i) {
        // The player fights back whenever the NPC is in reach.
        if (!hero.Attack().IsEngaged() && foe.Combatant().IsAlive() &&
            tcc::game::Distance(hero.Position(), foe.Position()) <= meleeRange) {
            hero.TryAttackTarget(npcId);
        }
        sim.runTicks(1);
    }

    std::cout << "Ticks: " << sim.scheduler().currentTick() << "\n"
              << "NPC kills: " << kills << "\n"
              << "Player HP: " << hero.Combatant().CurrentHP() << "/"
              << hero.Combatant().MaxHP() << "\n"
              << "Pet level: " << pet.value()->Progression().Level() << "\n"
              << "XP attack/strength/defence/hitpoints/beastmaster: "
              << skills.Experience(SkillType::Attack) << "/"
              << skills.Experience(SkillType::Strength) << "/"
              << skills.Experience(SkillType::Defence) << "/"
              << skills.Experience(SkillType::Hitpoints) << "/"
              << skills.Experience(SkillType::Beastmaster) << "\n";

    if (auto flushed = tcc::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush log: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
