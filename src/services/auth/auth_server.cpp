/// @file auth_server.cpp
/// @brief AuthServer implementation: executor ownership and async dispatch.

#include "cas/service/auth_server.hpp"

#include "cas/foundation/service_logger.hpp"
#include "cas/foundation/task_executor.hpp"
#include "cas/service/credential_verifier.hpp"
#include "cas/service/permission_cache.hpp"
#include "cas/service/permission_resolver.hpp"
#include "cas/service/session_lifecycle_manager.hpp"
#include "cas/service/token_codec.hpp"

#include <utility>

namespace cas::service {

using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;
using cas::foundation::TaskExecutor;
using cas::foundation::TaskPriority;

// -- Construction / destruction -----------------------------------------------

AuthServer::AuthServer(AuthConfig config, AuthServerDeps deps) : config_(std::move(config)) {
    if (config_.collaboratorThreads > 0) {
        collaboratorExecutor_ =
            std::make_shared<TaskExecutor>(config_.collaboratorThreads, "cas_collaborator");
    }

    if (!deps.tokenCodec) {
        deps.tokenCodec = std::make_shared<JwtTokenCodec>(config_);
    }
    if (!deps.credentials) {
        deps.credentials = std::make_shared<Sha256CredentialVerifier>();
    }
    if (!config_.cache.enabled) {
        deps.cache.reset();
    } else if (!deps.cache) {
        deps.cache = std::make_shared<InMemoryPermissionCache>(config_.cache);
    }

    SessionLifecycleDeps lifecycle;
    lifecycle.principals = deps.principals;
    lifecycle.permissions = deps.permissions;
    lifecycle.sessions = deps.sessions;
    lifecycle.tokenCodec = deps.tokenCodec;
    lifecycle.credentials = deps.credentials;
    lifecycle.geoLocator = deps.geoLocator;
    lifecycle.auditSink = deps.auditSink;
    lifecycle.executor = collaboratorExecutor_;
    sessions_ = std::make_shared<SessionLifecycleManager>(config_, std::move(lifecycle));

    PermissionResolverDeps resolution;
    resolution.principals = deps.principals;
    resolution.roles = deps.roles;
    resolution.permissions = deps.permissions;
    resolution.cache = deps.cache;
    resolution.executor = collaboratorExecutor_;
    resolver_ = std::make_shared<PermissionResolver>(std::move(resolution), config_.timeouts);

    requestExecutor_ = std::make_unique<TaskExecutor>(
        config_.requestThreads > 0 ? config_.requestThreads : 1, "cas_request");

    LogContext ctx;
    ctx.extra["request_threads"] = std::to_string(requestExecutor_->workerCount());
    ctx.extra["collaborator_threads"] = std::to_string(config_.collaboratorThreads);
    ctx.extra["cache"] = deps.cache ? "enabled" : "disabled";
    CAS_LOG_CTX(LogLevel::Info, LogCategory::Core, "Auth server ready", ctx);
}

AuthServer::~AuthServer() {
    requestExecutor_.reset();
    collaboratorExecutor_.reset();
}

// -- Session lifecycle --------------------------------------------------------

std::future<ServiceResult<AuthOutcome>> AuthServer::loginAsync(std::string identifier,
                                                               std::string secret,
                                                               ClientInfo client) {
    auto manager = sessions_;
    return requestExecutor_->submit<AuthOutcome>(
        [manager, identifier = std::move(identifier), secret = std::move(secret),
         client = std::move(client)] { return manager->login(identifier, secret, client); });
}

std::future<ServiceResult<AuthOutcome>> AuthServer::refreshAsync(std::string refreshToken,
                                                                 ClientInfo client) {
    auto manager = sessions_;
    return requestExecutor_->submit<AuthOutcome>(
        [manager, token = std::move(refreshToken), client = std::move(client)] {
            return manager->refresh(token, client);
        });
}

std::future<ServiceResult<void>> AuthServer::invalidateAsync(PrincipalId requesterId,
                                                             std::string token,
                                                             std::string reason,
                                                             ClientInfo client) {
    auto manager = sessions_;
    return requestExecutor_->submit<void>(
        [manager, requesterId = std::move(requesterId), token = std::move(token),
         reason = std::move(reason), client = std::move(client)] {
            return manager->invalidate(requesterId, token, reason, client);
        });
}

std::future<ServiceResult<std::size_t>> AuthServer::invalidateAllAsync(
    PrincipalId actingId, PrincipalId targetId, bool excludeCurrent, std::string currentToken,
    std::string reason, ClientInfo client) {
    auto manager = sessions_;
    return requestExecutor_->submit<std::size_t>(
        [manager, actingId = std::move(actingId), targetId = std::move(targetId),
         excludeCurrent, currentToken = std::move(currentToken), reason = std::move(reason),
         client = std::move(client)] {
            return manager->invalidateAll(actingId, targetId, excludeCurrent, currentToken,
                                          reason, client);
        });
}

std::future<ServiceResult<std::vector<Session>>> AuthServer::listActiveSessionsAsync(
    PrincipalId principalId) {
    auto manager = sessions_;
    return requestExecutor_->submit<std::vector<Session>>(
        [manager, principalId = std::move(principalId)] {
            return manager->listActiveSessions(principalId);
        });
}

std::future<ServiceResult<Session>> AuthServer::touchSessionAsync(std::string accessToken) {
    auto manager = sessions_;
    return requestExecutor_->submit<Session>(
        [manager, token = std::move(accessToken)] { return manager->touchSession(token); });
}

// -- Authorization ------------------------------------------------------------

std::future<ServiceResult<bool>> AuthServer::hasPermissionAsync(PrincipalId principalId,
                                                                std::string permissionName) {
    auto resolver = resolver_;
    return requestExecutor_->submit<bool>(
        [resolver, principalId = std::move(principalId), name = std::move(permissionName)] {
            return resolver->hasPermission(principalId, name);
        },
        TaskPriority::High);
}

std::future<ServiceResult<bool>> AuthServer::hasPermissionAsync(PrincipalId principalId,
                                                                std::string resource,
                                                                std::string action) {
    auto resolver = resolver_;
    return requestExecutor_->submit<bool>(
        [resolver, principalId = std::move(principalId), resource = std::move(resource),
         action = std::move(action)] {
            return resolver->hasPermission(principalId, resource, action);
        },
        TaskPriority::High);
}

std::future<ServiceResult<std::vector<Permission>>> AuthServer::getPermissionsAsync(
    PrincipalId principalId) {
    auto resolver = resolver_;
    return requestExecutor_->submit<std::vector<Permission>>(
        [resolver, principalId = std::move(principalId)] {
            return resolver->getPermissions(principalId);
        });
}

std::future<ServiceResult<std::vector<Role>>> AuthServer::getRolesAsync(
    PrincipalId principalId) {
    auto resolver = resolver_;
    return requestExecutor_->submit<std::vector<Role>>(
        [resolver, principalId = std::move(principalId)] {
            return resolver->getRoles(principalId);
        });
}

std::future<ServiceResult<std::optional<Profile>>> AuthServer::getProfileAsync(
    PrincipalId principalId) {
    auto resolver = resolver_;
    return requestExecutor_->submit<std::optional<Profile>>(
        [resolver, principalId = std::move(principalId)] {
            return resolver->getProfile(principalId);
        });
}

}  // namespace cas::service
