#pragma once

/// @file rating_logger.hpp
/// @brief RatingLogger wrapping kcenon logger_system for engine logging.
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

#include "sre/foundation/rating_result.hpp"
#include "sre/foundation/types.hpp"

namespace sre::foundation {

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

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Host wiring, season runner
    Team   = 1, ///< Team rating updates
    Player = 2, ///< Player rating updates
    Ledger = 3, ///< History persistence and replay
    Config = 4, ///< Configuration loading
    Query  = 5  ///< Read-side queries
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Team", "Player", "Ledger", "Config", "Query"
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
///   ctx.entityId = "KC";
///   ctx.when = SeasonWeek{2024, 3};
///   ctx.extra["delta"] = "11.91";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Team,
///                         "Rating updated", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> entityId;
    std::optional<SeasonWeek> when;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Team     | Info          |
/// | Player   | Info          |
/// | Ledger   | Info          |
/// | Config   | Info          |
/// | Query    | Warning       |
class RatingLogger {
public:
    RatingLogger();
    ~RatingLogger();

    RatingLogger(const RatingLogger&) = delete;
    RatingLogger& operator=(const RatingLogger&) = delete;
    RatingLogger(RatingLogger&&) noexcept;
    RatingLogger& operator=(RatingLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    RatingResult<void> flush();

    /// Process-wide logger instance.
    static RatingLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sre::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace: macros are global)
// ---------------------------------------------------------------------------

/// SRE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef SRE_MIN_LOG_LEVEL
    #define SRE_MIN_LOG_LEVEL 0
#endif

#define SRE_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= SRE_MIN_LOG_LEVEL &&                        \
            ::sre::foundation::RatingLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::sre::foundation::RatingLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define SRE_LOG_DEBUG(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Debug, (cat), (msg))

#define SRE_LOG_INFO(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Info, (cat), (msg))

#define SRE_LOG_WARN(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Warning, (cat), (msg))

#define SRE_LOG_ERROR(cat, msg) \
    SRE_LOG(::sre::foundation::LogLevel::Error, (cat), (msg))
