#pragma once

/// @file directory.hpp
/// @brief System-of-record interfaces for principals, roles and permissions,
///        plus an in-memory implementation.
///
/// These repositories are authoritative. The permission cache only ever
/// holds projections of what they return.

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cas::service {

using cas::foundation::ServiceResult;

/// Principal lookups. Implementations must be thread-safe.
class IPrincipalRepository {
public:
    virtual ~IPrincipalRepository() = default;

    virtual ServiceResult<std::optional<Principal>> findPrincipalById(
        const PrincipalId& id) const = 0;

    /// Lookup by email; callers pass the lower-cased address.
    virtual ServiceResult<std::optional<Principal>> findPrincipalByEmail(
        std::string_view email) const = 0;

    /// Case-insensitive lookup by username.
    virtual ServiceResult<std::optional<Principal>> findPrincipalByUsername(
        std::string_view username) const = 0;
};

/// Role lookups. Implementations must be thread-safe.
class IRoleRepository {
public:
    virtual ~IRoleRepository() = default;

    /// Role by id, with or without its permission list.
    virtual ServiceResult<std::optional<Role>> findRoleById(
        const RoleId& id, bool withPermissions) const = 0;

    /// Roles assigned to a principal, permissions loaded.
    virtual ServiceResult<std::vector<Role>> findRolesByPrincipal(
        const PrincipalId& id) const = 0;

    /// One page of all roles ordered by name. @p page is zero-based.
    virtual ServiceResult<std::vector<Role>> listRoles(std::size_t page,
                                                       std::size_t size) const = 0;
};

/// Permission lookups. Implementations must be thread-safe.
class IPermissionRepository {
public:
    virtual ~IPermissionRepository() = default;

    /// Effective permissions of a principal across all its roles, deduplicated.
    virtual ServiceResult<std::vector<Permission>> findPermissionsByPrincipal(
        const PrincipalId& id) const = 0;
};

/// Thread-safe in-memory directory for testing and development.
///
/// Production deployments should use a database-backed implementation.
class InMemoryDirectory : public IPrincipalRepository,
                          public IRoleRepository,
                          public IPermissionRepository {
public:
    // -- Queries --------------------------------------------------------------

    ServiceResult<std::optional<Principal>> findPrincipalById(
        const PrincipalId& id) const override;

    ServiceResult<std::optional<Principal>> findPrincipalByEmail(
        std::string_view email) const override;

    ServiceResult<std::optional<Principal>> findPrincipalByUsername(
        std::string_view username) const override;

    ServiceResult<std::optional<Role>> findRoleById(
        const RoleId& id, bool withPermissions) const override;

    ServiceResult<std::vector<Role>> findRolesByPrincipal(
        const PrincipalId& id) const override;

    ServiceResult<std::vector<Role>> listRoles(std::size_t page,
                                               std::size_t size) const override;

    ServiceResult<std::vector<Permission>> findPermissionsByPrincipal(
        const PrincipalId& id) const override;

    // -- Administration -------------------------------------------------------

    /// Add a principal. Email is stored lower-cased.
    /// AlreadyExists on a duplicate id, email or username.
    ServiceResult<void> addPrincipal(Principal principal);

    /// Add a role (its permission list is ignored; use assignPermission).
    ServiceResult<void> addRole(Role role);

    ServiceResult<void> addPermission(Permission permission);

    /// NotFound for an unknown principal, RoleNotFound for an unknown role.
    ServiceResult<void> assignRole(const PrincipalId& principalId, const RoleId& roleId);

    /// RoleNotFound or PermissionNotFound on unknown ids.
    ServiceResult<void> assignPermission(const RoleId& roleId,
                                         const PermissionId& permissionId);

    /// Activate or deactivate a principal. NotFound if unknown.
    ServiceResult<void> setActive(const PrincipalId& principalId, bool active);

private:
    struct RoleRecord {
        Role role;
        std::vector<PermissionId> permissionIds;
    };

    Role materialize(const RoleRecord& record, bool withPermissions) const;

    mutable std::mutex mutex_;
    std::unordered_map<PrincipalId, Principal> principals_;
    std::unordered_map<RoleId, RoleRecord> roles_;
    std::unordered_map<PermissionId, Permission> permissions_;
};

}  // namespace cas::service
