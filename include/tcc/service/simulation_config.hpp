#pragma once

/// @file simulation_config.hpp
/// @brief Validated simulation settings read from ConfigManager.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>

#include "tcc/foundation/config_manager.hpp"
#include "tcc/foundation/game_logger.hpp"
#include "tcc/foundation/game_result.hpp"
#include "tcc/game/simulation_rules.hpp"
#include "tcc/service/tick_scheduler.hpp"

namespace tcc::service {

/// Everything a CombatSimulation needs from configuration.
///
/// Absent keys keep their defaults. Keys of the wrong type report
/// ConfigTypeMismatch; out-of-range values report ConfigInvalidValue with
/// the offending key as context.
struct SimulationConfig {
    std::chrono::milliseconds tickDuration = kDefaultTickDuration;
    uint32_t seed = 5489u;
    game::SimulationRules rules;

    /// Per-category minimum levels from "logging.<category>" (lower case).
    std::array<std::optional<foundation::LogLevel>, foundation::kLogCategoryCount> logLevels{};

    [[nodiscard]] static foundation::GameResult<SimulationConfig> fromConfig(
        const foundation::ConfigManager& config);

    /// Push the configured category levels into @p logger.
    void applyLogLevels(foundation::GameLogger& logger) const;
};

} // namespace tcc::service
