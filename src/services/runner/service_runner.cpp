/// @file service_runner.cpp
/// @brief Implementation of shared service entry-point utilities.

#include "cas/service/service_runner.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <thread>

namespace cas::service {

using cas::foundation::ConfigManager;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;
using cas::foundation::ServiceLogger;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
    // Restore default handlers so that a second signal terminates immediately.
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- Config loading ----------------------------------------------------------

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv("CAS_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return kDefaultConfigPath;
}

cas::foundation::ServiceResult<void>
loadConfig(ConfigManager& config, const std::filesystem::path& cliPath) {
    return config.load(resolveConfigPath(cliPath));
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Config mapping ----------------------------------------------------------

namespace {

std::chrono::seconds secondsOr(const ConfigManager& config, std::string_view key,
                               std::chrono::seconds fallback) {
    return std::chrono::seconds(config.getOr<int64_t>(key, fallback.count()));
}

std::chrono::milliseconds millisOr(const ConfigManager& config, std::string_view key,
                                   std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(config.getOr<int64_t>(key, fallback.count()));
}

std::optional<LogCategory> parseCategory(std::string_view name) {
    for (std::size_t i = 0; i < cas::foundation::kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        auto candidate = cas::foundation::logCategoryName(cat);
        if (candidate.size() == name.size() &&
            std::equal(candidate.begin(), candidate.end(), name.begin(),
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       })) {
            return cat;
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

AuthConfig buildAuthConfig(const ConfigManager& config) {
    AuthConfig cfg;

    cfg.signingKey = config.getOr<std::string>("auth.signing_key", cfg.signingKey);
    cfg.issuer = config.getOr<std::string>("auth.issuer", cfg.issuer);
    cfg.accessTokenExpiry =
        secondsOr(config, "auth.access_token_expiry_seconds", cfg.accessTokenExpiry);
    cfg.refreshTokenExpiry =
        secondsOr(config, "auth.refresh_token_expiry_seconds", cfg.refreshTokenExpiry);
    cfg.invalidationRetries =
        config.getOr<uint32_t>("auth.invalidation_retries", cfg.invalidationRetries);

    auto& anomaly = cfg.anomaly;
    anomaly.maxSessions = config.getOr<std::size_t>("anomaly.max_sessions", anomaly.maxSessions);
    anomaly.maxDistinctIps =
        config.getOr<std::size_t>("anomaly.max_distinct_ips", anomaly.maxDistinctIps);
    anomaly.maxRecentSessions =
        config.getOr<std::size_t>("anomaly.max_recent_sessions", anomaly.maxRecentSessions);
    anomaly.recentWindow = secondsOr(config, "anomaly.recent_window_seconds", anomaly.recentWindow);
    anomaly.maxDistinctUserAgents = config.getOr<std::size_t>("anomaly.max_distinct_user_agents",
                                                              anomaly.maxDistinctUserAgents);

    auto& timeouts = cfg.timeouts;
    timeouts.cache = millisOr(config, "timeouts.cache_ms", timeouts.cache);
    timeouts.geo = millisOr(config, "timeouts.geo_ms", timeouts.geo);
    timeouts.storage = millisOr(config, "timeouts.storage_ms", timeouts.storage);

    auto& cache = cfg.cache;
    cache.enabled = config.getOr<bool>("cache.enabled", cache.enabled);
    cache.maxEntries = config.getOr<std::size_t>("cache.max_entries", cache.maxEntries);
    auto& ttl = cache.ttls;
    ttl.principal = secondsOr(config, "cache.ttl.principal_seconds", ttl.principal);
    ttl.permissionSet = secondsOr(config, "cache.ttl.permission_set_seconds", ttl.permissionSet);
    ttl.permissionCheck =
        secondsOr(config, "cache.ttl.permission_check_seconds", ttl.permissionCheck);
    ttl.roleById = secondsOr(config, "cache.ttl.role_seconds", ttl.roleById);
    ttl.principalRoles = secondsOr(config, "cache.ttl.principal_roles_seconds", ttl.principalRoles);
    ttl.roleList = secondsOr(config, "cache.ttl.role_list_seconds", ttl.roleList);
    ttl.profile = secondsOr(config, "cache.ttl.profile_seconds", ttl.profile);

    cfg.requestThreads = config.getOr<std::size_t>("executor.request_threads", cfg.requestThreads);
    cfg.collaboratorThreads =
        config.getOr<std::size_t>("executor.collaborator_threads", cfg.collaboratorThreads);

    return cfg;
}

std::map<std::string, std::string> buildGeoPrefixes(const ConfigManager& config) {
    std::map<std::string, std::string> prefixes;
    for (const auto& prefix : config.keysUnder("geo.prefixes")) {
        auto country = config.get<std::string>("geo.prefixes." + prefix);
        if (country.hasValue()) {
            prefixes.emplace(prefix, std::move(country).value());
        }
    }
    return prefixes;
}

std::size_t applyLogLevels(const ConfigManager& config, ServiceLogger& logger) {
    std::size_t applied = 0;
    for (const auto& name : config.keysUnder("log.levels")) {
        auto levelName = config.getOr<std::string>("log.levels." + name, "");
        auto category = parseCategory(name);
        auto level = cas::foundation::parseLogLevel(levelName);
        if (!category || !level) {
            LogContext ctx;
            ctx.extra["category"] = name;
            ctx.extra["level"] = levelName;
            logger.logWithContext(LogLevel::Warning, LogCategory::Config,
                                  "Ignoring unknown log level setting", ctx);
            continue;
        }
        logger.setCategoryLevel(*category, *level);
        ++applied;
    }
    return applied;
}

} // namespace cas::service
