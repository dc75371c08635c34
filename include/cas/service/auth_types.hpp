#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the auth service.
///
/// Defines principal, role and permission records, token structures,
/// query projections and configuration types used throughout the
/// service layer.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cas/foundation/types.hpp"

namespace cas::service {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using cas::foundation::PermissionId;
using cas::foundation::PrincipalId;
using cas::foundation::RoleId;
using cas::foundation::SessionId;

// -- Directory model ----------------------------------------------------------

/// A named permission, optionally scoped to a resource/action pair.
struct Permission {
    PermissionId id;
    std::string name;
    std::string resource;
    std::string action;
    std::string description;

    [[nodiscard]] bool matches(std::string_view res, std::string_view act) const {
        return resource == res && action == act;
    }

    bool operator==(const Permission&) const = default;
};

/// A role grouping permissions.
///
/// permissionsLoaded tells whether @c permissions reflects the full set or
/// whether the role was read without them.
struct Role {
    RoleId id;
    std::string name;
    std::string description;
    std::vector<Permission> permissions;
    bool permissionsLoaded = false;

    bool operator==(const Role&) const = default;
};

/// Stored principal record. The secret hash never leaves the service layer.
struct Principal {
    PrincipalId id;
    std::string username;
    std::string email;
    std::string secretHash;
    bool active = true;
    std::vector<RoleId> roleIds;
    TimePoint createdAt{};
};

/// Principal fields safe to hand to callers.
struct PrincipalSummary {
    PrincipalId id;
    std::string username;
    std::string email;
    bool active = true;
    TimePoint createdAt{};

    static PrincipalSummary from(const Principal& principal) {
        return {principal.id, principal.username, principal.email,
                principal.active, principal.createdAt};
    }

    bool operator==(const PrincipalSummary&) const = default;
};

/// Profile projection: principal fields plus role and permission names.
struct Profile {
    PrincipalSummary principal;
    std::vector<std::string> roleNames;
    std::vector<std::string> permissionNames;

    bool operator==(const Profile&) const = default;
};

// -- Token structures ---------------------------------------------------------

/// Access + refresh token pair returned on successful authentication.
struct TokenPair {
    std::string accessToken;
    std::string refreshToken;
    TimePoint accessExpiresAt{};
    TimePoint refreshExpiresAt{};
};

/// Outcome of a signature/expiry check.
struct TokenValidation {
    bool valid = false;
    std::string reason;
};

/// Client provenance captured with every request.
struct ClientInfo {
    std::string ipAddress;
    std::string userAgent;
};

// -- Results ------------------------------------------------------------------

/// Caller-facing failure messages. The vocabulary is fixed.
namespace auth_messages {
inline constexpr std::string_view kInvalidCredentials = "Invalid credentials";
inline constexpr std::string_view kAccountInactive = "Account is inactive";
inline constexpr std::string_view kInvalidRefreshToken = "Invalid refresh token";
inline constexpr std::string_view kSessionExpired = "Session expired";
inline constexpr std::string_view kInvalidTokenFormat = "Invalid token format";
inline constexpr std::string_view kInvalidToken = "Invalid token";
}  // namespace auth_messages

/// Tagged success/failure of a login or refresh.
///
/// Credential and token problems are expected outcomes and travel here as
/// values; only infrastructure failures become a ServiceError.
struct AuthOutcome {
    bool success = false;
    std::string message;
    std::optional<PrincipalSummary> principal;
    std::optional<TokenPair> tokens;
    std::optional<SessionId> sessionId;

    static AuthOutcome succeeded(PrincipalSummary who, TokenPair pair, SessionId session) {
        AuthOutcome out;
        out.success = true;
        out.message = "OK";
        out.principal = std::move(who);
        out.tokens = std::move(pair);
        out.sessionId = std::move(session);
        return out;
    }

    static AuthOutcome failed(std::string_view message) {
        AuthOutcome out;
        out.message = std::string(message);
        return out;
    }
};

// -- Configuration ------------------------------------------------------------

/// Limits above which the anomaly detector raises a signal.
struct AnomalyThresholds {
    std::size_t maxSessions = 10;
    std::size_t maxDistinctIps = 3;
    std::size_t maxRecentSessions = 5;
    std::chrono::seconds recentWindow{3600};
    std::size_t maxDistinctUserAgents = 5;
};

/// Lifetime of each cached projection.
struct CacheTtls {
    std::chrono::seconds principal{300};
    std::chrono::seconds permissionSet{600};
    std::chrono::seconds permissionCheck{300};
    std::chrono::seconds roleById{900};
    std::chrono::seconds principalRoles{600};
    std::chrono::seconds roleList{1800};
    std::chrono::seconds profile{300};
};

struct CacheConfig {
    bool enabled = true;
    std::size_t maxEntries = 10000;
    CacheTtls ttls;
};

/// Deadlines applied at the call site of each collaborator.
struct CollaboratorTimeouts {
    std::chrono::milliseconds cache{50};
    std::chrono::milliseconds geo{200};
    std::chrono::milliseconds storage{2000};
};

/// Configuration for the auth service.
struct AuthConfig {
    /// Secret key for HMAC-SHA256 token signing (min 32 bytes recommended).
    std::string signingKey = "change-me-in-production";

    /// Value of the "iss" claim; tokens from another issuer are rejected.
    std::string issuer = "cas";

    std::chrono::seconds accessTokenExpiry{900};      // 15 minutes
    std::chrono::seconds refreshTokenExpiry{604800};  // 7 days

    AnomalyThresholds anomaly;
    CollaboratorTimeouts timeouts;
    CacheConfig cache;

    std::size_t requestThreads = 4;
    std::size_t collaboratorThreads = 4;

    /// Attempts made to persist an invalidation that races a rotation.
    uint32_t invalidationRetries = 3;
};

}  // namespace cas::service
