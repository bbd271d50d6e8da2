/// @file game_logger.cpp
/// @brief GameLogger implementation over the kcenon logger registry.

#include "mf/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <map>
#include <sstream>
#include <string>

namespace mf::foundation {

namespace kc = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: MF -> kcenon
// ---------------------------------------------------------------------------
static kc::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kc::log_level::trace;
        case LogLevel::Debug:    return kc::log_level::debug;
        case LogLevel::Info:     return kc::log_level::info;
        case LogLevel::Warning:  return kc::log_level::warning;
        case LogLevel::Error:    return kc::log_level::error;
        case LogLevel::Critical: return kc::log_level::critical;
        case LogLevel::Off:      return kc::log_level::off;
    }
    return kc::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Fusion
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // Rating
    LogLevel::Info,   // Config
    LogLevel::Info    // Host
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.creatureId && ctx.creatureId->isValid()) {
        append("creature_id", ctx.creatureId->value());
    }
    if (ctx.playerId && ctx.playerId->isValid()) {
        append("player_id", ctx.playerId->value());
    }
    if (ctx.battleId && ctx.battleId->isValid()) {
        append("battle_id", ctx.battleId->value());
    }
    if (ctx.fusionSeed && !ctx.fusionSeed->empty()) {
        append("fusion_seed", *ctx.fusionSeed);
    }
    // Sorted so identical contexts always render identically.
    std::map<std::string, std::string> ordered(ctx.extra.begin(), ctx.extra.end());
    for (const auto& [key, val] : ordered) {
        append(key, val);
    }

    return oss.str();
}

static std::string formatLine(LogCategory cat, std::string_view msg,
                              std::string_view ctxStr) {
    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }
    return formatted;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("mf.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kc::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kc::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kc::GlobalLoggerRegistry::null_logger();
        }
        auto named = registry.get_logger(loggerNames[idx]);
        if (named && named != kc::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    logger->log(mapLevel(level), formatLine(cat, msg, {}));
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    logger->log(mapLevel(level), formatLine(cat, msg, formatContext(ctx)));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
GameResult<void> GameLogger::flush() {
    auto& registry = kc::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace mf::foundation
