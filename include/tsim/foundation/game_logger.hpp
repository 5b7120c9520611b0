#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger interface for structured
///        simulation logging.
///
/// Provides category-based filtering, structured logging with context
/// (entity, tick, system) and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tsim/foundation/game_result.hpp"

namespace tsim::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Simulation log categories for structured filtering.
///
/// Each category can have its own minimum log level, enabling
/// fine-grained control over logging verbosity per subsystem.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Simulation construction and tick loop
    ECS     = 1, ///< Entity store and scheduler
    World   = 2, ///< Tile grid, terrain painting, placement
    Content = 3, ///< Definition registries
    Needs   = 4, ///< Need decay, buffs, mood
    Actions = 5, ///< Action state machine
    AI      = 6, ///< Utility decisions
    Economy = 7, ///< Gold and resource transfers
    Config  = 8  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 9;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "World", "Content", "Needs",
        "Actions", "AI", "Economy", "Config"
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = pawn.id();
///   ctx.tick = ctx.time.Tick();
///   ctx.extra["target"] = "(4, 7)";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Actions,
///                         "Move aborted", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<int64_t> tick;
    std::optional<std::string> system;
    std::map<std::string, std::string> extra;
};

/// Simulation logger wrapping kcenon's logging interface.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Info          |
/// | World    | Info          |
/// | Content  | Info          |
/// | Needs    | Info          |
/// | Actions  | Info          |
/// | AI       | Info          |
/// | Economy  | Info          |
/// | Config   | Info          |
///
/// Per-tick diagnostics (Debug/Trace) are therefore silent unless a
/// category is lowered explicitly:
/// @code
///   GameLogger::instance().setCategoryLevel(LogCategory::Actions,
///                                           LogLevel::Debug);
/// @endcode
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum log level for every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("trace", "debug", "info", "warning", "error",
/// "critical", "off"; case-insensitive).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace tsim::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name TSIM_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// The message expression is only evaluated when the level is enabled,
/// so callers may build strings inline.
///
/// TSIM_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef TSIM_MIN_LOG_LEVEL
    #define TSIM_MIN_LOG_LEVEL 0
#endif

#define TSIM_LOG(level, cat, msg)                                                  \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= TSIM_MIN_LOG_LEVEL &&                       \
            ::tsim::foundation::GameLogger::instance().isEnabled((level), (cat)))   \
        {                                                                          \
            ::tsim::foundation::GameLogger::instance().log((level), (cat), (msg));  \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define TSIM_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= TSIM_MIN_LOG_LEVEL &&                       \
            ::tsim::foundation::GameLogger::instance().isEnabled((level), (cat)))   \
        {                                                                          \
            ::tsim::foundation::GameLogger::instance().logWithContext(              \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define TSIM_LOG_TRACE(cat, msg) \
    TSIM_LOG(::tsim::foundation::LogLevel::Trace, (cat), (msg))

#define TSIM_LOG_DEBUG(cat, msg) \
    TSIM_LOG(::tsim::foundation::LogLevel::Debug, (cat), (msg))

#define TSIM_LOG_INFO(cat, msg) \
    TSIM_LOG(::tsim::foundation::LogLevel::Info, (cat), (msg))

#define TSIM_LOG_WARN(cat, msg) \
    TSIM_LOG(::tsim::foundation::LogLevel::Warning, (cat), (msg))

#define TSIM_LOG_ERROR(cat, msg) \
    TSIM_LOG(::tsim::foundation::LogLevel::Error, (cat), (msg))

/// @}
