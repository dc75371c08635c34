#pragma once

/// @file permission_cache.hpp
/// @brief Cache-aside store for permission, role, principal and profile
///        projections.
///
/// The cache is never authoritative. Every read may miss or fail, and the
/// resolver falls back to the system of record in both cases.

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cas::service {

using cas::foundation::ServiceResult;

/// Cache read outcome for projections that support negative caching.
///
/// nullopt: miss. Engaged but empty: a cached "not found".
template <typename T>
using CachedEntry = std::optional<std::optional<T>>;

/// Key layout shared by every cache backend.
namespace cache_keys {

/// Check discriminator for a name-based permission check.
[[nodiscard]] std::string checkByName(std::string_view permissionName);

/// Check discriminator for a resource/action permission check.
[[nodiscard]] std::string checkByResource(std::string_view resource, std::string_view action);

[[nodiscard]] std::string principalByEmail(std::string_view email);
[[nodiscard]] std::string principalById(const PrincipalId& id);
[[nodiscard]] std::string permissionSet(const PrincipalId& id);
[[nodiscard]] std::string permissionCheck(const PrincipalId& id, std::string_view checkKey);
[[nodiscard]] std::string permissionCheckPrefix(const PrincipalId& id);
[[nodiscard]] std::string roleById(const RoleId& id);
[[nodiscard]] std::string principalRoles(const PrincipalId& id);
[[nodiscard]] std::string principalRolesPrefix();
[[nodiscard]] std::string roleList(std::size_t page, std::size_t size);
[[nodiscard]] std::string roleListPrefix();
[[nodiscard]] std::string profile(const PrincipalId& id);

}  // namespace cache_keys

/// Abstract permission cache.
///
/// A true miss is reported as an empty optional, never as an error. Errors
/// mean the cache itself could not answer (transport, timeout, corruption).
class IPermissionCache {
public:
    virtual ~IPermissionCache() = default;

    // -- Permission checks ----------------------------------------------------

    virtual ServiceResult<std::optional<bool>> getPermissionCheck(
        const PrincipalId& id, std::string_view checkKey) = 0;
    virtual ServiceResult<void> putPermissionCheck(
        const PrincipalId& id, std::string_view checkKey, bool allowed) = 0;

    // -- Permission sets ------------------------------------------------------

    virtual ServiceResult<std::optional<std::vector<Permission>>> getPermissions(
        const PrincipalId& id) = 0;
    virtual ServiceResult<void> putPermissions(
        const PrincipalId& id, const std::vector<Permission>& permissions) = 0;

    // -- Roles ----------------------------------------------------------------

    virtual ServiceResult<std::optional<std::vector<Role>>> getPrincipalRoles(
        const PrincipalId& id) = 0;
    virtual ServiceResult<void> putPrincipalRoles(
        const PrincipalId& id, const std::vector<Role>& roles) = 0;

    virtual ServiceResult<CachedEntry<Role>> getRole(const RoleId& id) = 0;
    virtual ServiceResult<void> putRole(const RoleId& id, const std::optional<Role>& role) = 0;

    virtual ServiceResult<std::optional<std::vector<Role>>> getRoleList(
        std::size_t page, std::size_t size) = 0;
    virtual ServiceResult<void> putRoleList(
        std::size_t page, std::size_t size, const std::vector<Role>& roles) = 0;

    // -- Principals and profiles ----------------------------------------------

    virtual ServiceResult<CachedEntry<PrincipalSummary>> getPrincipalByEmail(
        std::string_view email) = 0;
    virtual ServiceResult<void> putPrincipalByEmail(
        std::string_view email, const std::optional<PrincipalSummary>& principal) = 0;

    virtual ServiceResult<CachedEntry<PrincipalSummary>> getPrincipalById(
        const PrincipalId& id) = 0;
    virtual ServiceResult<void> putPrincipalById(
        const PrincipalId& id, const std::optional<PrincipalSummary>& principal) = 0;

    virtual ServiceResult<CachedEntry<Profile>> getProfile(const PrincipalId& id) = 0;
    virtual ServiceResult<void> putProfile(
        const PrincipalId& id, const std::optional<Profile>& profile) = 0;

    // -- Maintenance ----------------------------------------------------------

    /// Drop every projection of one principal.
    virtual ServiceResult<void> invalidatePrincipal(const PrincipalId& id,
                                                    std::string_view email) = 0;

    /// Drop a role and every list that may contain it.
    virtual ServiceResult<void> invalidateRole(const RoleId& id) = 0;
};

/// Thread-safe in-process LRU cache with per-projection TTL.
///
/// Usage:
/// @code
///   CacheConfig config;
///   config.maxEntries = 1000;
///   InMemoryPermissionCache cache(config);
///
///   cache.putPermissionCheck(id, cache_keys::checkByName("users:read"), true);
///   auto cached = cache.getPermissionCheck(id, cache_keys::checkByName("users:read"));
///
///   cache.invalidatePrincipal(id, "user@example.com"); // On role change
/// @endcode
class InMemoryPermissionCache : public IPermissionCache {
public:
    explicit InMemoryPermissionCache(CacheConfig config);
    ~InMemoryPermissionCache() override;

    InMemoryPermissionCache(const InMemoryPermissionCache&) = delete;
    InMemoryPermissionCache& operator=(const InMemoryPermissionCache&) = delete;

    ServiceResult<std::optional<bool>> getPermissionCheck(
        const PrincipalId& id, std::string_view checkKey) override;
    ServiceResult<void> putPermissionCheck(
        const PrincipalId& id, std::string_view checkKey, bool allowed) override;

    ServiceResult<std::optional<std::vector<Permission>>> getPermissions(
        const PrincipalId& id) override;
    ServiceResult<void> putPermissions(
        const PrincipalId& id, const std::vector<Permission>& permissions) override;

    ServiceResult<std::optional<std::vector<Role>>> getPrincipalRoles(
        const PrincipalId& id) override;
    ServiceResult<void> putPrincipalRoles(
        const PrincipalId& id, const std::vector<Role>& roles) override;

    ServiceResult<CachedEntry<Role>> getRole(const RoleId& id) override;
    ServiceResult<void> putRole(const RoleId& id, const std::optional<Role>& role) override;

    ServiceResult<std::optional<std::vector<Role>>> getRoleList(
        std::size_t page, std::size_t size) override;
    ServiceResult<void> putRoleList(
        std::size_t page, std::size_t size, const std::vector<Role>& roles) override;

    ServiceResult<CachedEntry<PrincipalSummary>> getPrincipalByEmail(
        std::string_view email) override;
    ServiceResult<void> putPrincipalByEmail(
        std::string_view email, const std::optional<PrincipalSummary>& principal) override;

    ServiceResult<CachedEntry<PrincipalSummary>> getPrincipalById(
        const PrincipalId& id) override;
    ServiceResult<void> putPrincipalById(
        const PrincipalId& id, const std::optional<PrincipalSummary>& principal) override;

    ServiceResult<CachedEntry<Profile>> getProfile(const PrincipalId& id) override;
    ServiceResult<void> putProfile(
        const PrincipalId& id, const std::optional<Profile>& profile) override;

    ServiceResult<void> invalidatePrincipal(const PrincipalId& id,
                                            std::string_view email) override;

    ServiceResult<void> invalidateRole(const RoleId& id) override;

    /// Remove every entry whose key starts with @p prefix.
    /// @return Number of entries removed.
    std::size_t invalidateByPrefix(std::string_view prefix);

    /// Remove all entries from the cache.
    void clear();

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] uint64_t hitCount() const;

    [[nodiscard]] uint64_t missCount() const;

    /// Cache hit rate (0.0 to 1.0).
    [[nodiscard]] double hitRate() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cas::service
