/// @file session_lifecycle_manager.cpp
/// @brief SessionLifecycleManager implementation.

#include "cas/service/session_lifecycle_manager.hpp"

#include "cas/foundation/service_logger.hpp"
#include "cas/foundation/task_executor.hpp"
#include "cas/service/anomaly_detector.hpp"
#include "cas/service/audit_sink.hpp"
#include "cas/service/credential_verifier.hpp"
#include "cas/service/directory.hpp"
#include "cas/service/geo_locator.hpp"
#include "cas/service/session_store.hpp"
#include "cas/service/token_codec.hpp"
#include "cas/service/token_hasher.hpp"

#include "bounded_call.hpp"
#include "crypto_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;
using cas::foundation::ServiceError;
using cas::foundation::redactHash;

namespace {

constexpr std::string_view kAuthFailed = "authentication failed";
constexpr std::string_view kRefreshFailed = "token refresh failed";
constexpr std::string_view kInvalidateFailed = "failed to invalidate session";
constexpr std::string_view kInvalidateAllFailed = "failed to invalidate all sessions";

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

LogContext clientContext(const ClientInfo& client) {
    LogContext ctx;
    if (!client.ipAddress.empty()) {
        ctx.clientIp = client.ipAddress;
    }
    if (!client.userAgent.empty()) {
        ctx.extra["user_agent"] = client.userAgent;
    }
    return ctx;
}

/// Log the internal cause, hand back a generic error.
ServiceError wrapFailure(ErrorCode code, std::string_view message, const ServiceError& inner,
                         LogCategory category, LogContext ctx) {
    ctx.extra["cause_subsystem"] = std::string(inner.subsystem());
    ctx.extra["cause"] = std::string(inner.message());
    CAS_LOG_CTX(LogLevel::Error, category, std::string(message), ctx);
    return ServiceError::wrap(code, std::string(message), inner);
}

}  // anonymous namespace

// -- Construction / destruction -----------------------------------------------

SessionLifecycleManager::SessionLifecycleManager(AuthConfig config, SessionLifecycleDeps deps)
    : config_(std::move(config)), deps_(std::move(deps)) {}

SessionLifecycleManager::~SessionLifecycleManager() = default;

// -- Best-effort collaborators ------------------------------------------------

std::string SessionLifecycleManager::resolveCountry(const std::string& ipAddress) {
    if (!deps_.geoLocator || ipAddress.empty()) {
        return std::string(kUnknownCountry);
    }

    auto geo = deps_.geoLocator;
    auto country = detail::boundedCall<std::string>(
        deps_.executor.get(), config_.timeouts.geo, ErrorCode::GeoLookupFailed,
        [geo, ipAddress] { return geo->resolveCountry(ipAddress); });

    // Geolocation never blocks the caller's operation.
    if (country.hasError()) {
        LogContext ctx;
        ctx.clientIp = ipAddress;
        ctx.extra["error"] = std::string(country.error().message());
        CAS_LOG_CTX(LogLevel::Debug, LogCategory::Security, "Geolocation unavailable", ctx);
        return std::string(kUnknownCountry);
    }
    return normalizeCountryCode(country.value());
}

void SessionLifecycleManager::publishAudit(AuditEvent event) {
    if (!deps_.auditSink) {
        return;
    }
    if (event.occurredAt == TimePoint{}) {
        event.occurredAt = Clock::now();
    }

    auto sink = deps_.auditSink;
    auto publish = [sink, event]() {
        auto published = cas::foundation::invokeGuarded<void>(
            [&sink, &event] { return sink->publish(event); }, ErrorCode::AuditPublishFailed);
        // Audit publication is best-effort; a failure is only logged.
        if (published.hasError()) {
            LogContext ctx;
            if (event.principalId.isValid()) {
                ctx.principalId = event.principalId;
            }
            ctx.extra["event"] = event.type;
            ctx.extra["error"] = std::string(published.error().message());
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                        "Failed to publish audit event", ctx);
        }
    };

    if (!deps_.executor) {
        publish();
        return;
    }
    auto posted = deps_.executor->post(publish, cas::foundation::TaskPriority::Low);
    if (posted.hasError()) {
        CAS_LOG_WARN(LogCategory::Audit, "Failed to queue audit event " + event.type);
    }
}

ServiceResult<std::vector<std::string>> SessionLifecycleManager::permissionNames(
    const PrincipalId& principalId) {
    auto repo = deps_.permissions;
    auto perms = detail::boundedCall<std::vector<Permission>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [repo, principalId] { return repo->findPermissionsByPrincipal(principalId); });
    if (perms.hasError()) {
        return ServiceResult<std::vector<std::string>>::err(perms.error());
    }

    std::vector<std::string> names;
    names.reserve(perms.value().size());
    for (const auto& perm : perms.value()) {
        names.push_back(perm.name);
    }
    return ServiceResult<std::vector<std::string>>::ok(std::move(names));
}

// -- Login --------------------------------------------------------------------

ServiceResult<AuthOutcome> SessionLifecycleManager::login(std::string_view identifier,
                                                          std::string_view secret,
                                                          const ClientInfo& client) {
    auto ctx = clientContext(client);

    // 1. Resolve the principal: '@' means email.
    auto principals = deps_.principals;
    bool byEmail = identifier.find('@') != std::string_view::npos;
    std::string key = byEmail ? toLower(identifier) : std::string(identifier);
    auto found = detail::boundedCall<std::optional<Principal>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [principals, key, byEmail] {
            return byEmail ? principals->findPrincipalByEmail(key)
                           : principals->findPrincipalByUsername(key);
        });
    if (found.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::AuthenticationFailed, kAuthFailed, found.error(), LogCategory::Auth, ctx));
    }
    if (!found.value().has_value()) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Auth, "Login failed: unknown principal", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kInvalidCredentials));
    }
    const Principal& principal = *found.value();
    ctx.principalId = principal.id;

    // 2. Inactive accounts never get a session.
    if (!principal.active) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Auth, "Login failed: account inactive", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kAccountInactive));
    }

    // 3. Verify the secret.
    if (!deps_.credentials->verifySecret(secret, principal.secretHash)) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Auth, "Login failed: bad secret", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kInvalidCredentials));
    }

    // 4. Issue tokens scoped to the current permission set.
    auto names = permissionNames(principal.id);
    if (names.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::AuthenticationFailed, kAuthFailed, names.error(), LogCategory::Auth, ctx));
    }
    auto pair = deps_.tokenCodec->issueTokenPair(principal.id, principal.email, names.value());
    if (pair.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::AuthenticationFailed, kAuthFailed, pair.error(), LogCategory::Auth, ctx));
    }
    const TokenPair& tokens = pair.value();

    // 5. Hash both tokens; provenance is best-effort.
    auto sessionKey = detail::secureRandomHex(16);
    if (sessionKey.empty()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::AuthenticationFailed, kAuthFailed,
            ServiceError(ErrorCode::Unknown, "random generator unavailable"),
            LogCategory::Auth, ctx));
    }

    auto now = Clock::now();
    Session session;
    session.id = SessionId(std::move(sessionKey));
    session.ownerId = principal.id;
    session.accessTokenHash = TokenHasher::hashToken(tokens.accessToken);
    session.refreshTokenHash = TokenHasher::hashToken(tokens.refreshToken);
    session.expiresAt = tokens.refreshExpiresAt;
    session.createdAt = now;
    session.lastUsedAt = now;
    session.active = true;
    session.ipAddress = client.ipAddress;
    session.userAgent = client.userAgent;
    session.countryCode = resolveCountry(client.ipAddress);

    // 6. Persisting the session is the point of no return.
    auto store = deps_.sessions;
    auto saved = detail::boundedCall<void>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, session] { return store->save(session); });
    if (saved.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::AuthenticationFailed, kAuthFailed, saved.error(), LogCategory::Auth, ctx));
    }

    ctx.sessionId = session.id;
    ctx.extra["country"] = session.countryCode;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "Login succeeded", ctx);

    AuditEvent event;
    event.type = "login.success";
    event.principalId = principal.id;
    event.sessionId = session.id;
    event.ipAddress = client.ipAddress;
    event.userAgent = client.userAgent;
    event.countryCode = session.countryCode;
    event.occurredAt = now;
    publishAudit(std::move(event));

    return ServiceResult<AuthOutcome>::ok(AuthOutcome::succeeded(
        PrincipalSummary::from(principal), tokens, session.id));
}

// -- Refresh ------------------------------------------------------------------

ServiceResult<AuthOutcome> SessionLifecycleManager::refresh(std::string_view refreshToken,
                                                            const ClientInfo& client) {
    auto ctx = clientContext(client);

    // 1. Signature, issuer and expiry.
    auto validation = deps_.tokenCodec->validateToken(refreshToken);
    if (!validation.valid) {
        ctx.extra["reason"] = validation.reason;
        CAS_LOG_CTX(LogLevel::Debug, LogCategory::Auth, "Refresh rejected by codec", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kInvalidRefreshToken));
    }

    // 2. The token must be bound to a stored session.
    auto tokenHash = TokenHasher::hashToken(refreshToken);
    ctx.extra["token_hash"] = redactHash(tokenHash);
    auto store = deps_.sessions;
    auto found = detail::boundedCall<std::optional<Session>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, tokenHash] { return store->findByRefreshTokenHash(tokenHash); });
    if (found.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::TokenRefreshFailed, kRefreshFailed, found.error(), LogCategory::Auth, ctx));
    }
    if (!found.value().has_value()) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security,
                    "Refresh token has no session", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kInvalidRefreshToken));
    }
    Session session = std::move(*found.value());
    ctx.sessionId = session.id;
    ctx.principalId = session.ownerId;

    // 3. Session validity.
    auto now = Clock::now();
    if (!session.isValid(now)) {
        CAS_LOG_CTX(LogLevel::Info, LogCategory::Session, "Refresh on invalid session", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kSessionExpired));
    }

    // 4. Claims.
    auto subject = deps_.tokenCodec->extractPrincipalId(refreshToken);
    auto email = deps_.tokenCodec->extractEmail(refreshToken);
    if (!subject || !email) {
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kInvalidTokenFormat));
    }

    // 5. The token must belong to the session owner.
    if (*subject != session.ownerId.value()) {
        ctx.extra["token_subject"] = *subject;
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security,
                    "Refresh token subject does not own session", ctx);
        return ServiceResult<AuthOutcome>::ok(AuthOutcome::failed(auth_messages::kInvalidToken));
    }

    // 6. Current principal state from the system of record.
    auto principals = deps_.principals;
    auto owner = session.ownerId;
    auto current = detail::boundedCall<std::optional<Principal>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [principals, owner] { return principals->findPrincipalById(owner); });
    if (current.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::TokenRefreshFailed, kRefreshFailed, current.error(), LogCategory::Auth, ctx));
    }
    if (!current.value().has_value()) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security,
                    "Refresh for a principal that no longer exists", ctx);
        return ServiceResult<AuthOutcome>::ok(AuthOutcome::failed(auth_messages::kInvalidToken));
    }
    const Principal& principal = *current.value();
    if (!principal.active) {
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Auth, "Refresh for inactive account", ctx);
        return ServiceResult<AuthOutcome>::ok(
            AuthOutcome::failed(auth_messages::kAccountInactive));
    }

    // 7. New pair; rotate in place.
    auto names = permissionNames(principal.id);
    if (names.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::TokenRefreshFailed, kRefreshFailed, names.error(), LogCategory::Auth, ctx));
    }
    auto pair = deps_.tokenCodec->issueTokenPair(principal.id, principal.email, names.value());
    if (pair.hasError()) {
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::TokenRefreshFailed, kRefreshFailed, pair.error(), LogCategory::Auth, ctx));
    }
    const TokenPair& tokens = pair.value();

    session.rotate(TokenHasher::hashToken(tokens.accessToken),
                   TokenHasher::hashToken(tokens.refreshToken), tokens.refreshExpiresAt, now);

    auto updated = detail::boundedCall<Session>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, session] { return store->update(session); });
    if (updated.hasError()) {
        // Another refresh of the same token won the race.
        if (updated.error().code() == ErrorCode::SessionConflict) {
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security,
                        "Concurrent refresh lost the rotation race", ctx);
            return ServiceResult<AuthOutcome>::ok(
                AuthOutcome::failed(auth_messages::kInvalidRefreshToken));
        }
        return ServiceResult<AuthOutcome>::err(wrapFailure(
            ErrorCode::TokenRefreshFailed, kRefreshFailed, updated.error(), LogCategory::Auth, ctx));
    }

    CAS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "Token pair rotated", ctx);

    // 8. Same session identity, new tokens.
    return ServiceResult<AuthOutcome>::ok(AuthOutcome::succeeded(
        PrincipalSummary::from(principal), tokens, session.id));
}

// -- Invalidation -------------------------------------------------------------

ServiceResult<std::optional<Session>> SessionLifecycleManager::lookupByToken(
    std::string_view tokenHash) {
    auto store = deps_.sessions;
    std::string hash(tokenHash);

    auto byAccess = detail::boundedCall<std::optional<Session>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, hash] { return store->findByAccessTokenHash(hash); });
    if (byAccess.hasError() || byAccess.value().has_value()) {
        return byAccess;
    }

    return detail::boundedCall<std::optional<Session>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, hash] { return store->findByRefreshTokenHash(hash); });
}

ServiceResult<void> SessionLifecycleManager::persistInvalidation(Session session) {
    auto store = deps_.sessions;
    auto attempts = std::max<uint32_t>(config_.invalidationRetries, 1);

    for (uint32_t attempt = 1;; ++attempt) {
        session.invalidate();
        auto updated = detail::boundedCall<Session>(
            deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
            [store, session] { return store->update(session); });
        if (updated.hasValue()) {
            return ServiceResult<void>::ok();
        }
        if (updated.error().code() != ErrorCode::SessionConflict || attempt >= attempts) {
            return ServiceResult<void>::err(updated.error());
        }

        // A concurrent rotation bumped the version; invalidation must still win.
        auto id = session.id;
        auto reread = detail::boundedCall<std::optional<Session>>(
            deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
            [store, id] { return store->findById(id); });
        if (reread.hasError()) {
            return ServiceResult<void>::err(reread.error());
        }
        if (!reread.value().has_value()) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::SessionNotFound, "session not found"));
        }
        session = std::move(*reread.value());
        if (!session.active) {
            return ServiceResult<void>::ok();
        }
    }
}

ServiceResult<void> SessionLifecycleManager::invalidate(const PrincipalId& requesterId,
                                                        std::string_view token,
                                                        std::string_view reason,
                                                        const ClientInfo& client) {
    auto ctx = clientContext(client);
    ctx.principalId = requesterId;
    ctx.extra["reason"] = std::string(reason);

    // 1-2. Locate the session by access hash, then refresh hash.
    auto tokenHash = TokenHasher::hashToken(token);
    ctx.extra["token_hash"] = redactHash(tokenHash);
    auto found = lookupByToken(tokenHash);
    if (found.hasError()) {
        return ServiceResult<void>::err(wrapFailure(ErrorCode::SessionInvalidationFailed,
                                                    kInvalidateFailed, found.error(),
                                                    LogCategory::Session, ctx));
    }
    if (!found.value().has_value()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::SessionNotFound, "session not found"));
    }
    Session session = std::move(*found.value());
    ctx.sessionId = session.id;

    // 3. Self-service only.
    if (session.ownerId != requesterId) {
        ctx.extra["owner_id"] = session.ownerId.value();
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security,
                    "Attempt to invalidate a session owned by another principal", ctx);
        return ServiceResult<void>::err(ServiceError(
            ErrorCode::SecurityViolation, "session does not belong to requesting principal"));
    }

    // 4. Security trail, enriched with location when available.
    auto country = resolveCountry(client.ipAddress);
    ctx.extra["country"] = country;
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Security, "Session invalidation requested", ctx);

    // 5. Mark inactive.
    auto persisted = persistInvalidation(session);
    if (persisted.hasError()) {
        if (persisted.error().code() == ErrorCode::SessionNotFound) {
            return persisted;
        }
        return ServiceResult<void>::err(wrapFailure(ErrorCode::SessionInvalidationFailed,
                                                    kInvalidateFailed, persisted.error(),
                                                    LogCategory::Session, ctx));
    }

    AuditEvent event;
    event.type = "session.invalidated";
    event.principalId = requesterId;
    event.sessionId = session.id;
    event.ipAddress = client.ipAddress;
    event.userAgent = client.userAgent;
    event.countryCode = country;
    event.reason = std::string(reason);
    publishAudit(std::move(event));

    return ServiceResult<void>::ok();
}

ServiceResult<std::size_t> SessionLifecycleManager::invalidateAll(const PrincipalId& actingId,
                                                                  const PrincipalId& targetId,
                                                                  bool excludeCurrent,
                                                                  std::string_view currentToken,
                                                                  std::string_view reason,
                                                                  const ClientInfo& client) {
    auto ctx = clientContext(client);
    ctx.principalId = targetId;
    ctx.extra["acting_id"] = actingId.value();
    ctx.extra["reason"] = std::string(reason);
    ctx.extra["exclude_current"] = excludeCurrent ? "true" : "false";

    // 1. Record the bulk action regardless of outcome.
    CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security, "Bulk session invalidation requested",
                ctx);

    // 2. Valid sessions of the target.
    auto store = deps_.sessions;
    auto target = targetId;
    auto loaded = detail::boundedCall<std::vector<Session>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, target] { return store->findActiveByOwner(target); });
    if (loaded.hasError()) {
        return ServiceResult<std::size_t>::err(wrapFailure(ErrorCode::SessionInvalidationFailed,
                                                           kInvalidateAllFailed, loaded.error(),
                                                           LogCategory::Session, ctx));
    }

    auto now = Clock::now();
    std::vector<Session> sessions;
    for (auto& session : loaded.value()) {
        if (session.isValid(now)) {
            sessions.push_back(std::move(session));
        }
    }

    // 3. Nothing to do.
    if (sessions.empty()) {
        return ServiceResult<std::size_t>::ok(0);
    }

    // 5. Anomaly signals are informational and use the unfiltered snapshot.
    for (const auto& signal : detectAnomalies(sessions, config_.anomaly, now)) {
        auto signalCtx = ctx;
        signalCtx.extra["anomaly"] = std::string(anomalyKindName(signal.kind));
        signalCtx.extra["observed"] = std::to_string(signal.observed);
        signalCtx.extra["threshold"] = std::to_string(signal.threshold);
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Security, "Session anomaly detected",
                    signalCtx);
    }

    // 4. Keep the caller's current session if asked to.
    if (excludeCurrent && !currentToken.empty()) {
        auto currentHash = TokenHasher::hashToken(currentToken);
        sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                      [&currentHash](const Session& s) {
                                          return s.accessTokenHash == currentHash ||
                                                 s.refreshTokenHash == currentHash;
                                      }),
                       sessions.end());
    }

    // 6. All-or-nothing from the caller's point of view.
    std::size_t count = 0;
    for (const auto& session : sessions) {
        auto persisted = persistInvalidation(session);
        if (persisted.hasError()) {
            auto failCtx = ctx;
            failCtx.sessionId = session.id;
            failCtx.extra["invalidated_before_failure"] = std::to_string(count);
            return ServiceResult<std::size_t>::err(
                wrapFailure(ErrorCode::SessionInvalidationFailed, kInvalidateAllFailed,
                            persisted.error(), LogCategory::Session, failCtx));
        }
        ++count;
    }

    ctx.extra["count"] = std::to_string(count);
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Security, "Sessions invalidated", ctx);

    AuditEvent event;
    event.type = "session.invalidated_all";
    event.principalId = targetId;
    event.ipAddress = client.ipAddress;
    event.userAgent = client.userAgent;
    event.reason = std::string(reason);
    event.details["acting_id"] = actingId.value();
    event.details["count"] = std::to_string(count);
    publishAudit(std::move(event));

    return ServiceResult<std::size_t>::ok(count);
}

// -- Session queries ----------------------------------------------------------

ServiceResult<std::vector<Session>> SessionLifecycleManager::listActiveSessions(
    const PrincipalId& principalId) {
    auto store = deps_.sessions;
    auto loaded = detail::boundedCall<std::vector<Session>>(
        deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
        [store, principalId] { return store->findActiveByOwner(principalId); });
    if (loaded.hasError()) {
        return loaded;
    }

    auto now = Clock::now();
    std::vector<Session> sessions;
    for (auto& session : loaded.value()) {
        if (session.isValid(now)) {
            sessions.push_back(std::move(session));
        }
    }
    std::sort(sessions.begin(), sessions.end(),
              [](const Session& a, const Session& b) { return a.createdAt > b.createdAt; });
    return ServiceResult<std::vector<Session>>::ok(std::move(sessions));
}

ServiceResult<std::optional<Session>> SessionLifecycleManager::findSessionByToken(
    std::string_view token) {
    auto found = lookupByToken(TokenHasher::hashToken(token));
    if (found.hasError()) {
        return found;
    }
    if (found.value().has_value() && !found.value()->isValid()) {
        return ServiceResult<std::optional<Session>>::ok(std::nullopt);
    }
    return found;
}

ServiceResult<Session> SessionLifecycleManager::touchSession(std::string_view accessToken) {
    auto validation = deps_.tokenCodec->validateToken(accessToken);
    if (!validation.valid) {
        return ServiceResult<Session>::err(
            ServiceError(ErrorCode::InvalidToken, std::string(auth_messages::kInvalidToken)));
    }

    auto store = deps_.sessions;
    auto hash = TokenHasher::hashToken(accessToken);
    auto attempts = std::max<uint32_t>(config_.invalidationRetries, 1);

    for (uint32_t attempt = 1;; ++attempt) {
        auto found = detail::boundedCall<std::optional<Session>>(
            deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
            [store, hash] { return store->findByAccessTokenHash(hash); });
        if (found.hasError()) {
            return ServiceResult<Session>::err(found.error());
        }
        if (!found.value().has_value()) {
            return ServiceResult<Session>::err(
                ServiceError(ErrorCode::SessionNotFound, "session not found"));
        }

        Session session = std::move(*found.value());
        auto now = Clock::now();
        if (!session.isValid(now)) {
            return ServiceResult<Session>::err(ServiceError(
                ErrorCode::TokenExpired, std::string(auth_messages::kSessionExpired)));
        }

        session.touch(now);
        auto updated = detail::boundedCall<Session>(
            deps_.executor.get(), config_.timeouts.storage, ErrorCode::StorageTimeout,
            [store, session] { return store->update(session); });
        if (updated.hasValue() || updated.error().code() != ErrorCode::SessionConflict ||
            attempt >= attempts) {
            return updated;
        }
    }
}

}  // namespace cas::service
