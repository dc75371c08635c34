/// @file service_logger.cpp
/// @brief ServiceLogger implementation wrapping kcenon logger_system.

#include "cas/foundation/service_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace cas::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: CAS -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Auth
    LogLevel::Info,     // Session
    LogLevel::Info,     // Security
    LogLevel::Info,     // Audit
    LogLevel::Warning,  // Cache
    LogLevel::Info,     // Storage
    LogLevel::Info      // Config
};

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string redactHash(std::string_view tokenHash) {
    if (tokenHash.size() <= 10) {
        return std::string(tokenHash);
    }
    return std::string(tokenHash.substr(0, 10)) + "...";
}

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

    if (ctx.principalId && ctx.principalId->isValid()) {
        append("principal_id", ctx.principalId->value());
    }
    if (ctx.sessionId && ctx.sessionId->isValid()) {
        append("session_id", ctx.sessionId->value());
    }
    if (ctx.clientIp && !ctx.clientIp->empty()) {
        append("client_ip", *ctx.clientIp);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct ServiceLogger::Impl {
    // Atomic for lock-free reads on the hot path.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("cas.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // A NullLogger reports every level disabled; fall back to the default.
        if (!logger || !logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
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

        auto logger = getLogger(cat);
        if (logger) {
            // Logging is best-effort; a sink failure never reaches the caller.
            (void)logger->log(mapLevel(level), formatted);
        }
    }
};

ServiceLogger::ServiceLogger() : impl_(std::make_unique<Impl>()) {}

ServiceLogger::~ServiceLogger() = default;

ServiceLogger::ServiceLogger(ServiceLogger&&) noexcept = default;
ServiceLogger& ServiceLogger::operator=(ServiceLogger&&) noexcept = default;

void ServiceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void ServiceLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void ServiceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel ServiceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ServiceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

ServiceResult<void> ServiceLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ServiceResult<void>::ok();
}

ServiceLogger& ServiceLogger::instance() {
    static ServiceLogger inst;
    return inst;
}

} // namespace cas::foundation
