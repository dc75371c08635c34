#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities: signal handling, config loading and
///        mapping configuration keys onto service settings.

#include <atomic>
#include <filesystem>
#include <map>
#include <string>

#include "cas/foundation/config_manager.hpp"
#include "cas/foundation/service_logger.hpp"
#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"

namespace cas::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// After shutdown is requested, the original default handlers are
/// restored so that a second signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Default location of the service configuration file.
inline constexpr const char* kDefaultConfigPath = "/etc/cas/config.yaml";

/// Resolve the configuration path.
///
/// Order: @p cliPath (when non-empty), the CAS_CONFIG_PATH environment
/// variable, then kDefaultConfigPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load the YAML file at resolveConfigPath(@p cliPath) into @p config.
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] cas::foundation::ServiceResult<void>
loadConfig(cas::foundation::ConfigManager& config, const std::filesystem::path& cliPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Map auth.*, anomaly.*, timeouts.*, cache.* and executor.* keys onto an
/// AuthConfig. Absent or mistyped keys keep their defaults.
[[nodiscard]] AuthConfig buildAuthConfig(const cas::foundation::ConfigManager& config);

/// IP prefix to country code table from the geo.prefixes map.
[[nodiscard]] std::map<std::string, std::string>
buildGeoPrefixes(const cas::foundation::ConfigManager& config);

/// Apply log.levels.<category> entries to @p logger.
///
/// @return Number of category levels changed. Unknown categories or level
///         names are reported under the Config category and skipped.
std::size_t applyLogLevels(const cas::foundation::ConfigManager& config,
                           cas::foundation::ServiceLogger& logger);

} // namespace cas::service
