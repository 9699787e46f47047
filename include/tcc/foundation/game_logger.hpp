#pragma once

/// @file game_logger.hpp
/// @brief GameLogger: category-filtered structured logging over kcenon common_system.
///
/// Messages are routed to the ILogger registered in kcenon's
/// GlobalLoggerRegistry (a per-category named logger first, then the
/// default logger). Each category has its own runtime minimum level.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/types.hpp"

namespace tcc::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories of the combat core.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Simulation setup and lifecycle
    Tick     = 1, ///< Scheduler heartbeat and metrics
    Combat   = 2, ///< Sessions and attack resolution
    AI       = 3, ///< Behavior state transitions and aggro
    Movement = 4, ///< Wander, chase and waypoint movement
    Pet      = 5, ///< Pet commands and progression
    Config   = 6  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Tick", "Combat", "AI", "Movement", "Pet", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("debug", "WARNING", ...).
/// Matching is case-insensitive; "warn" is accepted for Warning.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context appended to a log line as key=value pairs.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.agentId = attacker;
///   ctx.targetId = target;
///   ctx.extra["damage"] = "3";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "attack resolved", ctx);
/// @endcode
struct LogContext {
    std::optional<AgentId> agentId;
    std::optional<AgentId> targetId;
    std::optional<uint64_t> tick;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger over kcenon's logger interfaces.
///
/// Default minimum levels:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Tick     | Info          |
/// | Combat   | Debug         |
/// | AI       | Debug         |
/// | Movement | Info          |
/// | Pet      | Debug         |
/// | Config   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GameResult<void> flush();

    /// Process-wide logger used by the TCC_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tcc::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name TCC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define TCC_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef TCC_MIN_LOG_LEVEL
    #define TCC_MIN_LOG_LEVEL 0
#endif

#define TCC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TCC_MIN_LOG_LEVEL &&                      \
            ::tcc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tcc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TCC_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= TCC_MIN_LOG_LEVEL &&                      \
            ::tcc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tcc::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define TCC_LOG_DEBUG(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Debug, (cat), (msg))

#define TCC_LOG_INFO(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Info, (cat), (msg))

#define TCC_LOG_WARN(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Warning, (cat), (msg))

#define TCC_LOG_ERROR(cat, msg) \
    TCC_LOG(::tcc::foundation::LogLevel::Error, (cat), (msg))

/// @}
