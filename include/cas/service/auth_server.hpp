#pragma once

/// @file auth_server.hpp
/// @brief Asynchronous facade over the session lifecycle and permission
///        resolution engines.
///
/// Owns the request executor, the collaborator executor, a
/// SessionLifecycleManager and a PermissionResolver. Every *Async method
/// queues the synchronous operation on the request executor and returns a
/// future for its result.

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"
#include "cas/service/session.hpp"

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cas::foundation {
class TaskExecutor;
}  // namespace cas::foundation

namespace cas::service {

using cas::foundation::ServiceResult;

class IAuditSink;
class ICredentialVerifier;
class IGeoLocator;
class IPermissionCache;
class IPermissionRepository;
class IPrincipalRepository;
class IRoleRepository;
class ISessionStore;
class ITokenCodec;
class PermissionResolver;
class SessionLifecycleManager;

/// Collaborators handed to the server.
///
/// The directory repositories and the session store are required. A null
/// tokenCodec or credentials gets the built-in JWT codec and salted SHA-256
/// verifier; a null cache gets an in-memory cache when caching is enabled.
/// geoLocator and auditSink may stay null.
struct AuthServerDeps {
    std::shared_ptr<IPrincipalRepository> principals;
    std::shared_ptr<IRoleRepository> roles;
    std::shared_ptr<IPermissionRepository> permissions;
    std::shared_ptr<ISessionStore> sessions;
    std::shared_ptr<ITokenCodec> tokenCodec;
    std::shared_ptr<ICredentialVerifier> credentials;
    std::shared_ptr<IPermissionCache> cache;
    std::shared_ptr<IGeoLocator> geoLocator;
    std::shared_ptr<IAuditSink> auditSink;
};

/// Authentication and authorization service.
///
/// Example:
/// @code
///   auto directory = std::make_shared<InMemoryDirectory>();
///   AuthServer server(AuthConfig{}, {directory, directory, directory,
///                                    std::make_shared<InMemorySessionStore>()});
///
///   auto outcome = server.loginAsync("alice@example.com", "secret",
///                                    {"10.0.0.1", "curl/8"}).get();
///   auto allowed = server.hasPermissionAsync(PrincipalId("1"), "users:read").get();
/// @endcode
class AuthServer {
public:
    AuthServer(AuthConfig config, AuthServerDeps deps);
    ~AuthServer();

    AuthServer(const AuthServer&) = delete;
    AuthServer& operator=(const AuthServer&) = delete;

    // -- Session lifecycle ----------------------------------------------------

    [[nodiscard]] std::future<ServiceResult<AuthOutcome>> loginAsync(std::string identifier,
                                                                     std::string secret,
                                                                     ClientInfo client);

    [[nodiscard]] std::future<ServiceResult<AuthOutcome>> refreshAsync(std::string refreshToken,
                                                                       ClientInfo client);

    [[nodiscard]] std::future<ServiceResult<void>> invalidateAsync(PrincipalId requesterId,
                                                                   std::string token,
                                                                   std::string reason,
                                                                   ClientInfo client);

    [[nodiscard]] std::future<ServiceResult<std::size_t>> invalidateAllAsync(
        PrincipalId actingId, PrincipalId targetId, bool excludeCurrent,
        std::string currentToken, std::string reason, ClientInfo client);

    [[nodiscard]] std::future<ServiceResult<std::vector<Session>>> listActiveSessionsAsync(
        PrincipalId principalId);

    [[nodiscard]] std::future<ServiceResult<Session>> touchSessionAsync(std::string accessToken);

    // -- Authorization --------------------------------------------------------

    [[nodiscard]] std::future<ServiceResult<bool>> hasPermissionAsync(PrincipalId principalId,
                                                                      std::string permissionName);

    [[nodiscard]] std::future<ServiceResult<bool>> hasPermissionAsync(PrincipalId principalId,
                                                                      std::string resource,
                                                                      std::string action);

    [[nodiscard]] std::future<ServiceResult<std::vector<Permission>>> getPermissionsAsync(
        PrincipalId principalId);

    [[nodiscard]] std::future<ServiceResult<std::vector<Role>>> getRolesAsync(
        PrincipalId principalId);

    [[nodiscard]] std::future<ServiceResult<std::optional<Profile>>> getProfileAsync(
        PrincipalId principalId);

    // -- Direct access --------------------------------------------------------

    [[nodiscard]] SessionLifecycleManager& sessions() noexcept { return *sessions_; }
    [[nodiscard]] PermissionResolver& permissions() noexcept { return *resolver_; }
    [[nodiscard]] const AuthConfig& config() const noexcept { return config_; }

private:
    AuthConfig config_;
    std::shared_ptr<cas::foundation::TaskExecutor> collaboratorExecutor_;
    std::shared_ptr<SessionLifecycleManager> sessions_;
    std::shared_ptr<PermissionResolver> resolver_;

    // Declared last so queued requests drain before the engines go away.
    std::unique_ptr<cas::foundation::TaskExecutor> requestExecutor_;
};

}  // namespace cas::service
