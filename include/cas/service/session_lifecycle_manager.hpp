#pragma once

/// @file session_lifecycle_manager.hpp
/// @brief Login, token rotation and session invalidation.
///
/// Orchestrates the credential verifier, token codec, session store, geo
/// locator and audit sink. Credential and token problems come back as
/// AuthOutcome values; store failures come back as errors whose message is
/// generic and whose ErrorCause holds the original failure.

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"
#include "cas/service/session.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cas::foundation {
class TaskExecutor;
}  // namespace cas::foundation

namespace cas::service {

using cas::foundation::ServiceResult;

class IAuditSink;
class ICredentialVerifier;
class IGeoLocator;
class IPermissionRepository;
class IPrincipalRepository;
class ISessionStore;
class ITokenCodec;
struct AuditEvent;

/// Collaborators of the lifecycle manager.
///
/// geoLocator, auditSink and executor may be null: no geolocation ("XX"),
/// no audit trail, and collaborator calls run inline without a deadline.
struct SessionLifecycleDeps {
    std::shared_ptr<IPrincipalRepository> principals;
    std::shared_ptr<IPermissionRepository> permissions;
    std::shared_ptr<ISessionStore> sessions;
    std::shared_ptr<ITokenCodec> tokenCodec;
    std::shared_ptr<ICredentialVerifier> credentials;
    std::shared_ptr<IGeoLocator> geoLocator;
    std::shared_ptr<IAuditSink> auditSink;
    std::shared_ptr<cas::foundation::TaskExecutor> executor;
};

/// Session and token lifecycle engine.
///
/// Thread-safe: holds no mutable state of its own. Concurrent updates to
/// one session are arbitrated by the store's version check.
///
/// Example:
/// @code
///   SessionLifecycleManager manager(config, deps);
///   auto outcome = manager.login("alice@example.com", "secret", {"10.0.0.1", "curl"});
///   if (outcome.hasValue() && outcome.value().success) {
///       auto tokens = *outcome.value().tokens;
///   }
/// @endcode
class SessionLifecycleManager {
public:
    SessionLifecycleManager(AuthConfig config, SessionLifecycleDeps deps);
    ~SessionLifecycleManager();

    SessionLifecycleManager(const SessionLifecycleManager&) = delete;
    SessionLifecycleManager& operator=(const SessionLifecycleManager&) = delete;

    /// Verify credentials and open a session.
    ///
    /// @p identifier is an email when it contains '@', a username otherwise.
    /// Failures: "Invalid credentials", "Account is inactive".
    [[nodiscard]] ServiceResult<AuthOutcome> login(std::string_view identifier,
                                                   std::string_view secret,
                                                   const ClientInfo& client);

    /// Rotate the token pair of the session bound to @p refreshToken.
    ///
    /// Failures: "Invalid refresh token", "Session expired",
    /// "Invalid token format", "Invalid token", "Account is inactive".
    [[nodiscard]] ServiceResult<AuthOutcome> refresh(std::string_view refreshToken,
                                                     const ClientInfo& client);

    /// Self-service invalidation of the session that @p token belongs to.
    ///
    /// @return SessionNotFound, SecurityViolation when the session belongs
    ///         to someone else, or SessionInvalidationFailed.
    [[nodiscard]] ServiceResult<void> invalidate(const PrincipalId& requesterId,
                                                 std::string_view token,
                                                 std::string_view reason,
                                                 const ClientInfo& client);

    /// Invalidate every valid session of @p targetId, optionally keeping the
    /// one @p currentToken belongs to. All-or-nothing on store failure.
    ///
    /// @return Number of sessions invalidated.
    [[nodiscard]] ServiceResult<std::size_t> invalidateAll(const PrincipalId& actingId,
                                                           const PrincipalId& targetId,
                                                           bool excludeCurrent,
                                                           std::string_view currentToken,
                                                           std::string_view reason,
                                                           const ClientInfo& client);

    /// Valid sessions of a principal, newest first.
    [[nodiscard]] ServiceResult<std::vector<Session>> listActiveSessions(
        const PrincipalId& principalId);

    /// Valid session owning @p token (access hash first, then refresh hash).
    [[nodiscard]] ServiceResult<std::optional<Session>> findSessionByToken(
        std::string_view token);

    /// Record use of an access token and return the updated session.
    ///
    /// @return InvalidToken, SessionNotFound or TokenExpired on failure.
    [[nodiscard]] ServiceResult<Session> touchSession(std::string_view accessToken);

    [[nodiscard]] const AuthConfig& config() const noexcept { return config_; }

private:
    ServiceResult<std::optional<Session>> lookupByToken(std::string_view tokenHash);
    ServiceResult<void> persistInvalidation(Session session);
    ServiceResult<std::vector<std::string>> permissionNames(const PrincipalId& principalId);
    std::string resolveCountry(const std::string& ipAddress);
    void publishAudit(AuditEvent event);

    AuthConfig config_;
    SessionLifecycleDeps deps_;
};

}  // namespace cas::service
