/// @file permission_resolver.cpp
/// @brief PermissionResolver implementation.
///
/// All query shapes share one cache-aside routine parameterized by four
/// steps: read the cache, decide whether the hit is good enough, load from
/// the system of record, write back.

#include "cas/service/permission_resolver.hpp"

#include "cas/foundation/service_logger.hpp"
#include "cas/foundation/task_executor.hpp"
#include "cas/service/directory.hpp"
#include "cas/service/permission_cache.hpp"

#include "bounded_call.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <set>
#include <string>

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;
using cas::foundation::TaskExecutor;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Steps of one cache-aside lookup.
template <typename T>
struct CacheAside {
    std::string_view what;
    std::function<ServiceResult<std::optional<T>>()> read;
    std::function<bool(const T&)> sufficient;
    std::function<ServiceResult<T>()> load;
    std::function<ServiceResult<void>(const T&)> write;
};

template <typename T>
ServiceResult<T> resolve(TaskExecutor* executor, const CollaboratorTimeouts& timeouts,
                         bool cacheEnabled, CacheAside<T> steps) {
    if (cacheEnabled) {
        auto cached = detail::boundedCall<std::optional<T>>(
            executor, timeouts.cache, ErrorCode::CacheTimeout, steps.read);
        if (cached.hasError()) {
            // Cache trouble is a miss, never an error for the caller.
            LogContext ctx;
            ctx.extra["query"] = std::string(steps.what);
            ctx.extra["error"] = std::string(cached.error().message());
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "Cache read failed", ctx);
        } else if (cached.value().has_value() &&
                   (!steps.sufficient || steps.sufficient(*cached.value()))) {
            return ServiceResult<T>::ok(std::move(*cached.value()));
        }
    }

    auto loaded = detail::boundedCall<T>(executor, timeouts.storage, ErrorCode::StorageTimeout,
                                         steps.load);
    if (loaded.hasError()) {
        return loaded;
    }

    if (cacheEnabled) {
        const T& value = loaded.value();
        auto write = steps.write;
        auto written = detail::boundedCall<void>(
            executor, timeouts.cache, ErrorCode::CacheTimeout,
            [write, value] { return write(value); });
        // Write-back is best-effort; the loaded value is returned regardless.
        if (written.hasError()) {
            LogContext ctx;
            ctx.extra["query"] = std::string(steps.what);
            ctx.extra["error"] = std::string(written.error().message());
            CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "Cache write-back failed", ctx);
        }
    }
    return loaded;
}

std::optional<PrincipalSummary> summarize(const std::optional<Principal>& principal) {
    if (!principal) {
        return std::nullopt;
    }
    return PrincipalSummary::from(*principal);
}

}  // anonymous namespace

// -- Construction / destruction -----------------------------------------------

PermissionResolver::PermissionResolver(PermissionResolverDeps deps,
                                       CollaboratorTimeouts timeouts)
    : deps_(std::move(deps)), timeouts_(timeouts) {}

PermissionResolver::~PermissionResolver() = default;

// -- Permission checks --------------------------------------------------------

ServiceResult<bool> PermissionResolver::check(const PrincipalId& principalId,
                                              std::string checkKey, std::string_view name,
                                              std::string_view resource,
                                              std::string_view action) {
    auto cache = deps_.cache;
    auto repo = deps_.permissions;
    bool byName = !name.empty();
    std::string wantName(name);
    std::string wantResource(resource);
    std::string wantAction(action);

    CacheAside<bool> steps;
    steps.what = "permission check";
    steps.read = [cache, principalId, checkKey] {
        return cache->getPermissionCheck(principalId, checkKey);
    };
    steps.load = [repo, principalId, byName, wantName, wantResource,
                  wantAction]() -> ServiceResult<bool> {
        auto perms = repo->findPermissionsByPrincipal(principalId);
        if (perms.hasError()) {
            return ServiceResult<bool>::err(perms.error());
        }
        bool allowed = std::any_of(
            perms.value().begin(), perms.value().end(), [&](const Permission& p) {
                return byName ? p.name == wantName : p.matches(wantResource, wantAction);
            });
        return ServiceResult<bool>::ok(allowed);
    };
    steps.write = [cache, principalId, checkKey](const bool& allowed) {
        return cache->putPermissionCheck(principalId, checkKey, allowed);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

ServiceResult<bool> PermissionResolver::hasPermission(const PrincipalId& principalId,
                                                      std::string_view permissionName) {
    return check(principalId, cache_keys::checkByName(permissionName), permissionName, {}, {});
}

ServiceResult<bool> PermissionResolver::hasPermission(const PrincipalId& principalId,
                                                      std::string_view resource,
                                                      std::string_view action) {
    return check(principalId, cache_keys::checkByResource(resource, action), {}, resource,
                 action);
}

// -- Permission sets and roles ------------------------------------------------

ServiceResult<std::vector<Permission>> PermissionResolver::getPermissions(
    const PrincipalId& principalId) {
    auto cache = deps_.cache;
    auto repo = deps_.permissions;

    CacheAside<std::vector<Permission>> steps;
    steps.what = "permission set";
    steps.read = [cache, principalId] { return cache->getPermissions(principalId); };
    steps.load = [repo, principalId] { return repo->findPermissionsByPrincipal(principalId); };
    steps.write = [cache, principalId](const std::vector<Permission>& perms) {
        return cache->putPermissions(principalId, perms);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

ServiceResult<std::vector<Role>> PermissionResolver::getRoles(const PrincipalId& principalId) {
    auto cache = deps_.cache;
    auto repo = deps_.roles;

    CacheAside<std::vector<Role>> steps;
    steps.what = "principal roles";
    steps.read = [cache, principalId] { return cache->getPrincipalRoles(principalId); };
    steps.sufficient = [](const std::vector<Role>& roles) {
        return std::all_of(roles.begin(), roles.end(),
                           [](const Role& r) { return r.permissionsLoaded; });
    };
    steps.load = [repo, principalId] { return repo->findRolesByPrincipal(principalId); };
    steps.write = [cache, principalId](const std::vector<Role>& roles) {
        return cache->putPrincipalRoles(principalId, roles);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

ServiceResult<std::optional<Role>> PermissionResolver::getRole(const RoleId& roleId,
                                                               bool withPermissions) {
    auto cache = deps_.cache;
    auto repo = deps_.roles;

    CacheAside<std::optional<Role>> steps;
    steps.what = "role by id";
    steps.read = [cache, roleId] { return cache->getRole(roleId); };
    steps.sufficient = [withPermissions](const std::optional<Role>& role) {
        return !role || !withPermissions || role->permissionsLoaded;
    };
    steps.load = [repo, roleId, withPermissions] {
        return repo->findRoleById(roleId, withPermissions);
    };
    steps.write = [cache, roleId](const std::optional<Role>& role) {
        return cache->putRole(roleId, role);
    };

    auto result = resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
    // A richer cached copy is trimmed to the fidelity that was asked for.
    if (result.hasValue() && result.value() && !withPermissions) {
        result.value()->permissions.clear();
        result.value()->permissionsLoaded = false;
    }
    return result;
}

ServiceResult<std::vector<Role>> PermissionResolver::listRoles(std::size_t page,
                                                               std::size_t size) {
    auto cache = deps_.cache;
    auto repo = deps_.roles;

    CacheAside<std::vector<Role>> steps;
    steps.what = "role list";
    steps.read = [cache, page, size] { return cache->getRoleList(page, size); };
    steps.load = [repo, page, size] { return repo->listRoles(page, size); };
    steps.write = [cache, page, size](const std::vector<Role>& roles) {
        return cache->putRoleList(page, size, roles);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

// -- Principals and profiles --------------------------------------------------

ServiceResult<std::optional<PrincipalSummary>> PermissionResolver::findPrincipalByEmail(
    std::string_view email) {
    auto cache = deps_.cache;
    auto repo = deps_.principals;
    auto key = toLower(email);

    CacheAside<std::optional<PrincipalSummary>> steps;
    steps.what = "principal by email";
    steps.read = [cache, key] { return cache->getPrincipalByEmail(key); };
    steps.load = [repo, key]() -> ServiceResult<std::optional<PrincipalSummary>> {
        auto found = repo->findPrincipalByEmail(key);
        if (found.hasError()) {
            return ServiceResult<std::optional<PrincipalSummary>>::err(found.error());
        }
        return ServiceResult<std::optional<PrincipalSummary>>::ok(summarize(found.value()));
    };
    steps.write = [cache, key](const std::optional<PrincipalSummary>& principal) {
        return cache->putPrincipalByEmail(key, principal);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

ServiceResult<std::optional<PrincipalSummary>> PermissionResolver::findPrincipalById(
    const PrincipalId& principalId) {
    auto cache = deps_.cache;
    auto repo = deps_.principals;

    CacheAside<std::optional<PrincipalSummary>> steps;
    steps.what = "principal by id";
    steps.read = [cache, principalId] { return cache->getPrincipalById(principalId); };
    steps.load = [repo, principalId]() -> ServiceResult<std::optional<PrincipalSummary>> {
        auto found = repo->findPrincipalById(principalId);
        if (found.hasError()) {
            return ServiceResult<std::optional<PrincipalSummary>>::err(found.error());
        }
        return ServiceResult<std::optional<PrincipalSummary>>::ok(summarize(found.value()));
    };
    steps.write = [cache, principalId](const std::optional<PrincipalSummary>& principal) {
        return cache->putPrincipalById(principalId, principal);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

ServiceResult<std::optional<Profile>> PermissionResolver::getProfile(
    const PrincipalId& principalId) {
    auto cache = deps_.cache;
    auto principals = deps_.principals;
    auto roles = deps_.roles;
    auto permissions = deps_.permissions;

    CacheAside<std::optional<Profile>> steps;
    steps.what = "profile";
    steps.read = [cache, principalId] { return cache->getProfile(principalId); };
    steps.load = [principals, roles, permissions,
                  principalId]() -> ServiceResult<std::optional<Profile>> {
        auto found = principals->findPrincipalById(principalId);
        if (found.hasError()) {
            return ServiceResult<std::optional<Profile>>::err(found.error());
        }
        if (!found.value()) {
            return ServiceResult<std::optional<Profile>>::ok(std::nullopt);
        }

        auto roleList = roles->findRolesByPrincipal(principalId);
        if (roleList.hasError()) {
            return ServiceResult<std::optional<Profile>>::err(roleList.error());
        }
        auto permList = permissions->findPermissionsByPrincipal(principalId);
        if (permList.hasError()) {
            return ServiceResult<std::optional<Profile>>::err(permList.error());
        }

        Profile profile;
        profile.principal = PrincipalSummary::from(*found.value());
        for (const auto& role : roleList.value()) {
            profile.roleNames.push_back(role.name);
        }
        std::set<std::string> names;
        for (const auto& perm : permList.value()) {
            names.insert(perm.name);
        }
        profile.permissionNames.assign(names.begin(), names.end());
        return ServiceResult<std::optional<Profile>>::ok(std::move(profile));
    };
    steps.write = [cache, principalId](const std::optional<Profile>& profile) {
        return cache->putProfile(principalId, profile);
    };
    return resolve(deps_.executor.get(), timeouts_, cache != nullptr, std::move(steps));
}

// -- Maintenance --------------------------------------------------------------

void PermissionResolver::invalidatePrincipal(const PrincipalId& principalId,
                                             std::string_view email) {
    if (!deps_.cache) {
        return;
    }
    auto cache = deps_.cache;
    auto key = toLower(email);
    auto dropped = detail::boundedCall<void>(
        deps_.executor.get(), timeouts_.cache, ErrorCode::CacheTimeout,
        [cache, principalId, key] { return cache->invalidatePrincipal(principalId, key); });
    if (dropped.hasError()) {
        LogContext ctx;
        ctx.principalId = principalId;
        ctx.extra["error"] = std::string(dropped.error().message());
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "Cache invalidation failed", ctx);
    }
}

void PermissionResolver::invalidateRole(const RoleId& roleId) {
    if (!deps_.cache) {
        return;
    }
    auto cache = deps_.cache;
    auto dropped = detail::boundedCall<void>(
        deps_.executor.get(), timeouts_.cache, ErrorCode::CacheTimeout,
        [cache, roleId] { return cache->invalidateRole(roleId); });
    if (dropped.hasError()) {
        LogContext ctx;
        ctx.extra["role_id"] = roleId.value();
        ctx.extra["error"] = std::string(dropped.error().message());
        CAS_LOG_CTX(LogLevel::Warning, LogCategory::Cache, "Cache invalidation failed", ctx);
    }
}

}  // namespace cas::service
