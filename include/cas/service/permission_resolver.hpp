#pragma once

/// @file permission_resolver.hpp
/// @brief Cache-aside permission, role, principal and profile queries.
///
/// Every query reads the cache first, falls back to the system of record on
/// a miss, on insufficient fidelity or on any cache error, and writes the
/// answer back best-effort. "Not found" answers are cached too.

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"

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

class IPermissionCache;
class IPermissionRepository;
class IPrincipalRepository;
class IRoleRepository;

/// Collaborators of the resolver.
///
/// cache may be null (caching disabled); executor may be null (cache calls
/// run inline without a deadline).
struct PermissionResolverDeps {
    std::shared_ptr<IPrincipalRepository> principals;
    std::shared_ptr<IRoleRepository> roles;
    std::shared_ptr<IPermissionRepository> permissions;
    std::shared_ptr<IPermissionCache> cache;
    std::shared_ptr<cas::foundation::TaskExecutor> executor;
};

/// Answers "may P do X" and related lookups.
///
/// Cache failures never reach the caller; only system-of-record failures do.
/// Results are identical whether the cache is healthy, failing or absent.
///
/// Example:
/// @code
///   PermissionResolver resolver(deps, config.timeouts);
///   auto allowed = resolver.hasPermission(PrincipalId("42"), "users:read");
///   auto allowed2 = resolver.hasPermission(PrincipalId("42"), "users", "read");
/// @endcode
class PermissionResolver {
public:
    PermissionResolver(PermissionResolverDeps deps, CollaboratorTimeouts timeouts);
    ~PermissionResolver();

    PermissionResolver(const PermissionResolver&) = delete;
    PermissionResolver& operator=(const PermissionResolver&) = delete;

    /// Name-based permission check.
    [[nodiscard]] ServiceResult<bool> hasPermission(const PrincipalId& principalId,
                                                    std::string_view permissionName);

    /// Resource/action permission check.
    [[nodiscard]] ServiceResult<bool> hasPermission(const PrincipalId& principalId,
                                                    std::string_view resource,
                                                    std::string_view action);

    /// Effective permissions of a principal.
    [[nodiscard]] ServiceResult<std::vector<Permission>> getPermissions(
        const PrincipalId& principalId);

    /// Roles of a principal, permissions loaded.
    [[nodiscard]] ServiceResult<std::vector<Role>> getRoles(const PrincipalId& principalId);

    /// Role by id; nullopt when the role does not exist.
    [[nodiscard]] ServiceResult<std::optional<Role>> getRole(const RoleId& roleId,
                                                             bool withPermissions);

    /// One page of roles (zero-based), without permissions.
    [[nodiscard]] ServiceResult<std::vector<Role>> listRoles(std::size_t page, std::size_t size);

    [[nodiscard]] ServiceResult<std::optional<PrincipalSummary>> findPrincipalByEmail(
        std::string_view email);

    [[nodiscard]] ServiceResult<std::optional<PrincipalSummary>> findPrincipalById(
        const PrincipalId& principalId);

    [[nodiscard]] ServiceResult<std::optional<Profile>> getProfile(const PrincipalId& principalId);

    /// Drop cached projections after a principal's roles or state changed.
    void invalidatePrincipal(const PrincipalId& principalId, std::string_view email);

    /// Drop cached projections after a role or its permissions changed.
    void invalidateRole(const RoleId& roleId);

private:
    ServiceResult<bool> check(const PrincipalId& principalId, std::string checkKey,
                              std::string_view name, std::string_view resource,
                              std::string_view action);

    PermissionResolverDeps deps_;
    CollaboratorTimeouts timeouts_;
};

}  // namespace cas::service
