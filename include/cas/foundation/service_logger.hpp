#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger_system for structured auth logging.
///
/// Provides category-based filtering, structured logging with explicit
/// context values, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cas/foundation/service_result.hpp"
#include "cas/foundation/types.hpp"

namespace cas::foundation {

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

/// Log categories used for filtering.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Startup, wiring, shutdown
    Auth     = 1, ///< Login and token refresh
    Session  = 2, ///< Session persistence and invalidation
    Security = 3, ///< Security events and anomaly signals
    Audit    = 4, ///< Audit trail publication
    Cache    = 5, ///< Permission cache traffic
    Storage  = 6, ///< System-of-record access
    Config   = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Session", "Security", "Audit", "Cache", "Storage", "Config"
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

/// Parse a level name ("info", "WARNING", ...). Returns nullopt if unknown.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured event fields attached to a single log call.
///
/// Callers build one of these per event and pass it explicitly; the logger
/// keeps no per-thread diagnostic state.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.principalId = session.ownerId;
///   ctx.sessionId = session.id;
///   ctx.extra["reason"] = "user logout";
///   logger.logWithContext(LogLevel::Info, LogCategory::Security,
///                         "Session invalidated", ctx);
/// @endcode
struct LogContext {
    std::optional<PrincipalId> principalId;
    std::optional<SessionId> sessionId;
    std::optional<std::string> clientIp;
    std::map<std::string, std::string> extra;
};

/// Auth-service logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Auth     | Info          |
/// | Session  | Info          |
/// | Security | Info          |
/// | Audit    | Info          |
/// | Cache    | Warning       |
/// | Storage  | Info          |
/// | Config   | Info          |
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    ServiceResult<void> flush();

    /// Process-wide logger instance.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Render a token hash for logs: first 10 characters followed by "...".
[[nodiscard]] std::string redactHash(std::string_view tokenHash);

} // namespace cas::foundation

// ---------------------------------------------------------------------------
// Convenience macros (macros are global)
// ---------------------------------------------------------------------------

/// @name CAS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define CAS_MIN_LOG_LEVEL before including this header to drop calls
/// below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CAS_MIN_LOG_LEVEL
    #define CAS_MIN_LOG_LEVEL 0
#endif

#define CAS_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= CAS_MIN_LOG_LEVEL &&                         \
            ::cas::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::cas::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define CAS_LOG_CTX(level, cat, msg, ctx)                                           \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= CAS_MIN_LOG_LEVEL &&                         \
            ::cas::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::cas::foundation::ServiceLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                      \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define CAS_LOG_DEBUG(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Debug, (cat), (msg))

#define CAS_LOG_INFO(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Info, (cat), (msg))

#define CAS_LOG_WARN(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Warning, (cat), (msg))

#define CAS_LOG_ERROR(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Error, (cat), (msg))

/// @}
