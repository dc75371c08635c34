/// @file main.cpp
/// @brief Auth service entry point.
///
/// Standalone executable for the auth service. Wires the engines to
/// in-memory collaborators suitable for development and testing.

#include "cas/foundation/config_manager.hpp"
#include "cas/foundation/service_logger.hpp"
#include "cas/service/audit_sink.hpp"
#include "cas/service/auth_server.hpp"
#include "cas/service/auth_types.hpp"
#include "cas/service/credential_verifier.hpp"
#include "cas/service/directory.hpp"
#include "cas/service/geo_locator.hpp"
#include "cas/service/service_runner.hpp"
#include "cas/service/session_store.hpp"
#include "cas/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

using cas::foundation::ConfigManager;
using cas::foundation::ServiceResult;

/// Create the administrator principal named by seed.admin_email.
///
/// Without seed.admin_password a temporary secret is generated and printed
/// once on stdout.
ServiceResult<void> seedAdministrator(const ConfigManager& config,
                                      cas::service::InMemoryDirectory& directory,
                                      const cas::service::ICredentialVerifier& credentials) {
    using namespace cas::service;

    auto email = config.get<std::string>("seed.admin_email");
    if (email.hasError()) {
        return ServiceResult<void>::ok();
    }

    auto secret = config.getOr<std::string>("seed.admin_password", "");
    if (secret.empty()) {
        secret = credentials.generateTemporarySecret(16);
        std::cout << "Generated administrator secret: " << secret << "\n";
    }

    const RoleId adminRole("admin");
    const std::pair<const char*, const char*> grants[] = {
        {"sessions", "manage"}, {"roles", "read"}, {"principals", "read"}};

    auto added = directory.addRole(Role{adminRole, "admin", "Service administrator", {}, false});
    if (added.hasError()) {
        return added;
    }
    for (const auto& [resource, action] : grants) {
        std::string name = std::string(resource) + ":" + action;
        PermissionId permId(name);
        added = directory.addPermission(Permission{permId, name, resource, action, ""});
        if (added.hasError()) {
            return added;
        }
        added = directory.assignPermission(adminRole, permId);
        if (added.hasError()) {
            return added;
        }
    }

    Principal admin;
    admin.id = PrincipalId("1");
    admin.username = config.getOr<std::string>("seed.admin_username", "admin");
    admin.email = email.value();
    admin.secretHash = credentials.hashSecret(secret);
    admin.createdAt = Clock::now();
    added = directory.addPrincipal(std::move(admin));
    if (added.hasError()) {
        return added;
    }
    return directory.assignRole(PrincipalId("1"), adminRole);
}

}  // namespace

int main(int argc, char* argv[]) {
    cas::service::SignalHandler signals;

    auto configPath = cas::service::resolveConfigPath(cas::service::parseConfigArg(argc, argv));

    cas::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto& logger = cas::foundation::ServiceLogger::instance();
    cas::service::applyLogLevels(config, logger);

    auto authConfig = cas::service::buildAuthConfig(config);

    // In-memory backends for standalone development mode.
    auto directory = std::make_shared<cas::service::InMemoryDirectory>();
    auto sessionStore = std::make_shared<cas::service::InMemorySessionStore>();
    auto credentials = std::make_shared<cas::service::Sha256CredentialVerifier>();

    auto seeded = seedAdministrator(config, *directory, *credentials);
    if (!seeded) {
        std::cerr << "Failed to seed administrator: " << seeded.error().message() << "\n";
        return EXIT_FAILURE;
    }

    cas::service::AuthServerDeps deps;
    deps.principals = directory;
    deps.roles = directory;
    deps.permissions = directory;
    deps.sessions = sessionStore;
    deps.credentials = credentials;
    deps.geoLocator =
        std::make_shared<cas::service::PrefixGeoLocator>(cas::service::buildGeoPrefixes(config));
    deps.auditSink = std::make_shared<cas::service::LoggingAuditSink>();

    cas::service::AuthServer server(authConfig, std::move(deps));

    std::cout << "Auth service " << cas::Version::string << " started (config: "
              << configPath.string() << ")\n";

    signals.waitForShutdown();

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    std::cout << "Auth service stopped\n";
    return EXIT_SUCCESS;
}
