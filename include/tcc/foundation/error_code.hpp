#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat core.

#include <cstdint>
#include <string_view>

namespace tcc::foundation {

/// Error codes grouped by subsystem in 256-value hex ranges.
///
/// The high byte identifies the subsystem, so errorSubsystem() can name the
/// source of an error from the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Combat (0x0100 - 0x01FF)
    CombatError = 0x0100,
    TargetNotFound = 0x0101,
    InvalidCombatProfile = 0x0102,
    InvalidPetDefinition = 0x0103,

    // Behavior (0x0200 - 0x02FF)
    BehaviorError = 0x0200,
    InvalidWaypointPath = 0x0201,
    InvalidWanderBounds = 0x0202,

    // Tick (0x0300 - 0x03FF)
    TickError = 0x0300,
    TickSubscriberNotFound = 0x0301,
    InvalidTickDuration = 0x0302,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Combat";
        case 0x0200: return "Behavior";
        case 0x0300: return "Tick";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace tcc::foundation
