/// @file simulation_config.cpp
/// @brief SimulationConfig parsing and validation.

#include "tcc/service/simulation_config.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace tcc::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Copy @p key into @p out when present.
template <typename T>
GameResult<void> readIfPresent(const ConfigManager& config, const std::string& key, T& out) {
    if (!config.hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    out = value.value();
    return GameResult<void>::ok();
}

GameResult<void> invalid(const std::string& key, const std::string& why) {
    return GameResult<void>::err(
        GameError(ErrorCode::ConfigInvalidValue, key + ": " + why, key));
}

std::string lowerCase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Category whose lower-cased name is @p name.
std::optional<LogCategory> categoryFromName(std::string_view name) {
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        if (lowerCase(foundation::logCategoryName(cat)) == name) {
            return cat;
        }
    }
    return std::nullopt;
}

} // namespace

GameResult<SimulationConfig> SimulationConfig::fromConfig(const ConfigManager& config) {
    SimulationConfig cfg;
    game::SimulationRules& rules = cfg.rules;

    // Every read below shares the same propagate-on-error shape.
#define TCC_READ(key, field)                                               \
    if (auto r = readIfPresent(config, key, field); !r) {                  \
        return GameResult<SimulationConfig>::err(r.error());               \
    }
#define TCC_REQUIRE(cond, key, why)                                        \
    if (!(cond)) {                                                         \
        return GameResult<SimulationConfig>::err(invalid(key, why).error()); \
    }

    int64_t tickMs = cfg.tickDuration.count();
    TCC_READ("tick.duration_ms", tickMs)
    TCC_REQUIRE(tickMs > 0, "tick.duration_ms", "must be positive")
    cfg.tickDuration = std::chrono::milliseconds(tickMs);
    rules.tickSeconds = static_cast<float>(tickMs) / 1000.0f;

    TCC_READ("simulation.seed", cfg.seed)

    TCC_READ("combat.melee_range", rules.meleeRange)
    TCC_REQUIRE(rules.meleeRange > 0.0f, "combat.melee_range", "must be positive")
    TCC_READ("combat.min_hit_chance", rules.minHitChance)
    TCC_REQUIRE(rules.minHitChance >= 0.0f && rules.minHitChance <= 1.0f,
                "combat.min_hit_chance", "must be within [0, 1]")
    TCC_READ("combat.pet_leash_multiplier", rules.petLeashMultiplier)
    TCC_REQUIRE(rules.petLeashMultiplier >= 1.0f, "combat.pet_leash_multiplier",
                "must be at least 1")

    TCC_READ("wander.move_speed", rules.wander.moveSpeed)
    TCC_REQUIRE(rules.wander.moveSpeed > 0.0f, "wander.move_speed", "must be positive")
    TCC_READ("wander.arrive_distance", rules.wander.arriveDistance)
    TCC_REQUIRE(rules.wander.arriveDistance >= 0.0f, "wander.arrive_distance",
                "must not be negative")
    TCC_READ("wander.min_idle_seconds", rules.wander.minIdleSeconds)
    TCC_READ("wander.max_idle_seconds", rules.wander.maxIdleSeconds)
    TCC_REQUIRE(rules.wander.minIdleSeconds >= 0.0f, "wander.min_idle_seconds",
                "must not be negative")
    TCC_REQUIRE(rules.wander.maxIdleSeconds >= rules.wander.minIdleSeconds,
                "wander.max_idle_seconds", "must not be below wander.min_idle_seconds")

    TCC_READ("pet.move_speed", rules.petMoveSpeed)
    TCC_REQUIRE(rules.petMoveSpeed > 0.0f, "pet.move_speed", "must be positive")
    TCC_READ("pet.follow_distance", rules.petFollowDistance)
    TCC_REQUIRE(rules.petFollowDistance >= 0.0f, "pet.follow_distance", "must not be negative")

    TCC_READ("experience.hitpoints_per_damage", rules.experience.hitpointsPerDamage)
    TCC_READ("experience.style_per_damage", rules.experience.stylePerDamage)
    TCC_READ("experience.pet_per_damage", rules.experience.petPerDamage)
    TCC_READ("experience.beastmaster_per_damage", rules.experience.beastmasterPerDamage)
    TCC_REQUIRE(rules.experience.hitpointsPerDamage >= 0.0f &&
                    rules.experience.stylePerDamage >= 0.0f &&
                    rules.experience.petPerDamage >= 0.0f &&
                    rules.experience.beastmasterPerDamage >= 0.0f,
                "experience", "rates must not be negative")

    for (const std::string& child : config.childKeys("logging")) {
        const std::string key = "logging." + child;
        const auto category = categoryFromName(child);
        TCC_REQUIRE(category.has_value(), key, "unknown log category '" + child + "'")

        std::string levelName;
        TCC_READ(key, levelName)
        const auto level = foundation::parseLogLevel(levelName);
        TCC_REQUIRE(level.has_value(), key, "unknown log level '" + levelName + "'")
        cfg.logLevels[static_cast<std::size_t>(*category)] = level;
    }

#undef TCC_REQUIRE
#undef TCC_READ

    return GameResult<SimulationConfig>::ok(std::move(cfg));
}

void SimulationConfig::applyLogLevels(foundation::GameLogger& logger) const {
    for (std::size_t i = 0; i < logLevels.size(); ++i) {
        if (logLevels[i]) {
            logger.setCategoryLevel(static_cast<LogCategory>(i), *logLevels[i]);
        }
    }
}

} // namespace tcc::service
