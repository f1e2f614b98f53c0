#pragma once

/// @file rank_logger.hpp
/// @brief RankLogger wrapping kcenon logger_system for structured logging
///        of the ranking engine.
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

#include "mrk/foundation/rank_result.hpp"

namespace mrk::foundation {

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

/// Engine subsystems, each with its own minimum log level.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Runner and wiring
    Store        = 1, ///< Outcome archive access
    Elo          = 2, ///< ELO rating updates and persistence
    BradleyTerry = 3, ///< Bradley-Terry fitting
    Direct       = 4, ///< Direct comparison ranking
    Focus        = 5, ///< Focus ranking and transitive inference
    Analyzer     = 6, ///< Coverage / gap analysis
    Config       = 7  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Store", "Elo", "BradleyTerry", "Direct", "Focus", "Analyzer", "Config"
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

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.model = "llama3:8b";
///   ctx.opponent = "mistral:7b";
///   ctx.extra["score"] = "0.7";
///   logger.logWithContext(LogLevel::Info, LogCategory::Elo,
///                         "Registered match result", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> model;
    std::optional<std::string> opponent;
    std::optional<std::string> promptset;
    std::optional<std::string> category;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging system.
///
/// Uses PIMPL to keep kcenon headers out of the public API. Messages are
/// routed to a named logger "mrk.<Category>" in the GlobalLoggerRegistry,
/// falling back to the registry's default logger.
///
/// Default log levels per category:
/// | Category     | Default Level |
/// |--------------|---------------|
/// | Core         | Info          |
/// | Store        | Info          |
/// | Elo          | Info          |
/// | BradleyTerry | Info          |
/// | Direct       | Info          |
/// | Focus        | Info          |
/// | Analyzer     | Info          |
/// | Config       | Warning       |
class RankLogger {
public:
    RankLogger();
    ~RankLogger();

    RankLogger(const RankLogger&) = delete;
    RankLogger& operator=(const RankLogger&) = delete;
    RankLogger(RankLogger&&) noexcept;
    RankLogger& operator=(RankLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    RankResult<void> flush();

    /// Process-wide logger instance.
    static RankLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mrk::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name MRK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define MRK_MIN_LOG_LEVEL before including this header to strip calls
/// below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef MRK_MIN_LOG_LEVEL
    #define MRK_MIN_LOG_LEVEL 0
#endif

#define MRK_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= MRK_MIN_LOG_LEVEL &&                      \
            ::mrk::foundation::RankLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::mrk::foundation::RankLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define MRK_LOG_DEBUG(cat, msg) \
    MRK_LOG(::mrk::foundation::LogLevel::Debug, (cat), (msg))

#define MRK_LOG_INFO(cat, msg) \
    MRK_LOG(::mrk::foundation::LogLevel::Info, (cat), (msg))

#define MRK_LOG_WARN(cat, msg) \
    MRK_LOG(::mrk::foundation::LogLevel::Warning, (cat), (msg))

#define MRK_LOG_ERROR(cat, msg) \
    MRK_LOG(::mrk::foundation::LogLevel::Error, (cat), (msg))

/// @}
