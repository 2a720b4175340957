#pragma once

/// @file travel_logger.hpp
/// @brief TravelLogger wrapping the kcenon logger interfaces for structured,
///        per-category logging of the travel core.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ftr/foundation/travel_result.hpp"
#include "ftr/foundation/types.hpp"

namespace ftr::foundation {

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

/// Log categories, one per subsystem of the travel core.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Startup, shutdown, frame loop
    World    = 1, ///< Entity resolution and world graph access
    Physics  = 2, ///< Ground probing
    Currency = 3, ///< Ledger detection, charge, rollback, refund
    Scene    = 4, ///< Scene load requests and progress
    Travel   = 5, ///< Transition state machine
    Registry = 6, ///< Destination registry and discovery
    Config   = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "World", "Physics", "Currency", "Scene", "Travel", "Registry", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

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
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.destination = "Cierzo";
///   ctx.candidate = "named-property";
///   ctx.extra["amount"] = "200";
///   logger.logWithContext(LogLevel::Info, LogCategory::Currency,
///                         "Charged", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> destination;
    std::optional<NodeId> nodeId;
    std::optional<std::string> candidate;
    std::unordered_map<std::string, std::string> extra;
};

/// Travel logger wrapping kcenon's logging interfaces.
///
/// Provides category-based filtering, structured logging with context and
/// per-category runtime level control. Uses PIMPL to keep kcenon headers
/// out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | World    | Info          |
/// | Physics  | Info          |
/// | Currency | Info          |
/// | Scene    | Info          |
/// | Travel   | Debug         |
/// | Registry | Info          |
/// | Config   | Info          |
class TravelLogger {
public:
    TravelLogger();
    ~TravelLogger();

    TravelLogger(const TravelLogger&) = delete;
    TravelLogger& operator=(const TravelLogger&) = delete;
    TravelLogger(TravelLogger&&) noexcept;
    TravelLogger& operator=(TravelLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    TravelResult<void> flush();

    /// Global TravelLogger singleton.
    static TravelLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ftr::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace — macros are global)
// ---------------------------------------------------------------------------

/// @name FTR_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// FTR_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef FTR_MIN_LOG_LEVEL
    #define FTR_MIN_LOG_LEVEL 0
#endif

#define FTR_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= FTR_MIN_LOG_LEVEL &&                         \
            ::ftr::foundation::TravelLogger::instance().isEnabled((level), (cat)))   \
        {                                                                           \
            ::ftr::foundation::TravelLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define FTR_LOG_CTX(level, cat, msg, ctx)                                           \
    do {                                                                            \
        if (static_cast<int>(level) >= FTR_MIN_LOG_LEVEL &&                         \
            ::ftr::foundation::TravelLogger::instance().isEnabled((level), (cat)))   \
        {                                                                           \
            ::ftr::foundation::TravelLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                      \
        }                                                                           \
    } while (0)

#define FTR_LOG_DEBUG(cat, msg) \
    FTR_LOG(::ftr::foundation::LogLevel::Debug, (cat), (msg))

#define FTR_LOG_INFO(cat, msg) \
    FTR_LOG(::ftr::foundation::LogLevel::Info, (cat), (msg))

#define FTR_LOG_WARN(cat, msg) \
    FTR_LOG(::ftr::foundation::LogLevel::Warning, (cat), (msg))

#define FTR_LOG_ERROR(cat, msg) \
    FTR_LOG(::ftr::foundation::LogLevel::Error, (cat), (msg))

/// @}
