#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common logger interfaces for
///        engine-specific structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/types.hpp"

namespace mf::foundation {

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

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Rule tables, model construction
    Fusion = 1, ///< Fusion pipeline and signatures
    Combat = 2, ///< Battle creation and action resolution
    Rating = 3, ///< Rating updates and decay
    Config = 4, ///< Configuration loading
    Host   = 5  ///< Repositories, battle host, tools
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Fusion", "Combat", "Rating", "Config", "Host"
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

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.battleId = battle.id;
///   ctx.extra["damage"] = "150";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<CreatureId> creatureId;
    std::optional<PlayerId> playerId;
    std::optional<BattleId> battleId;
    std::optional<std::string> fusionSeed;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Each category routes to the registry logger named `mf.<Category>` and
/// falls back to the registry's default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Fusion   | Info          |
/// | Combat   | Debug         |
/// | Rating   | Info          |
/// | Config   | Info          |
/// | Host     | Info          |
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

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default registry logger.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mf::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name MF_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// MF_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef MF_MIN_LOG_LEVEL
    #define MF_MIN_LOG_LEVEL 0
#endif

#define MF_LOG(level, cat, msg)                                                 \
    do {                                                                        \
        _Pragma("GCC diagnostic push")                                          \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                     \
        if (static_cast<int>(level) >= MF_MIN_LOG_LEVEL &&                      \
            ::mf::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                       \
            ::mf::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                       \
        _Pragma("GCC diagnostic pop")                                           \
    } while (0)

#define MF_LOG_DEBUG(cat, msg) \
    MF_LOG(::mf::foundation::LogLevel::Debug, (cat), (msg))

#define MF_LOG_INFO(cat, msg) \
    MF_LOG(::mf::foundation::LogLevel::Info, (cat), (msg))

#define MF_LOG_WARN(cat, msg) \
    MF_LOG(::mf::foundation::LogLevel::Warning, (cat), (msg))

#define MF_LOG_ERROR(cat, msg) \
    MF_LOG(::mf::foundation::LogLevel::Error, (cat), (msg))

/// @}
