/// @file directory.cpp
/// @brief InMemoryDirectory implementation.

#include "cas/service/directory.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::ServiceError;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // anonymous namespace

// -- Queries ------------------------------------------------------------------

ServiceResult<std::optional<Principal>> InMemoryDirectory::findPrincipalById(
    const PrincipalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = principals_.find(id);
    if (it == principals_.end()) {
        return ServiceResult<std::optional<Principal>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<Principal>>::ok(it->second);
}

ServiceResult<std::optional<Principal>> InMemoryDirectory::findPrincipalByEmail(
    std::string_view email) const {
    auto key = toLower(email);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, principal] : principals_) {
        if (principal.email == key) {
            return ServiceResult<std::optional<Principal>>::ok(principal);
        }
    }
    return ServiceResult<std::optional<Principal>>::ok(std::nullopt);
}

ServiceResult<std::optional<Principal>> InMemoryDirectory::findPrincipalByUsername(
    std::string_view username) const {
    auto key = toLower(username);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, principal] : principals_) {
        if (toLower(principal.username) == key) {
            return ServiceResult<std::optional<Principal>>::ok(principal);
        }
    }
    return ServiceResult<std::optional<Principal>>::ok(std::nullopt);
}

Role InMemoryDirectory::materialize(const RoleRecord& record, bool withPermissions) const {
    Role role = record.role;
    role.permissions.clear();
    role.permissionsLoaded = withPermissions;
    if (withPermissions) {
        for (const auto& permId : record.permissionIds) {
            auto it = permissions_.find(permId);
            if (it != permissions_.end()) {
                role.permissions.push_back(it->second);
            }
        }
    }
    return role;
}

ServiceResult<std::optional<Role>> InMemoryDirectory::findRoleById(
    const RoleId& id, bool withPermissions) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roles_.find(id);
    if (it == roles_.end()) {
        return ServiceResult<std::optional<Role>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<Role>>::ok(materialize(it->second, withPermissions));
}

ServiceResult<std::vector<Role>> InMemoryDirectory::findRolesByPrincipal(
    const PrincipalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Role> result;
    auto it = principals_.find(id);
    if (it == principals_.end()) {
        return ServiceResult<std::vector<Role>>::ok(std::move(result));
    }
    for (const auto& roleId : it->second.roleIds) {
        auto roleIt = roles_.find(roleId);
        if (roleIt != roles_.end()) {
            result.push_back(materialize(roleIt->second, true));
        }
    }
    return ServiceResult<std::vector<Role>>::ok(std::move(result));
}

ServiceResult<std::vector<Role>> InMemoryDirectory::listRoles(std::size_t page,
                                                              std::size_t size) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Role> all;
    all.reserve(roles_.size());
    for (const auto& [id, record] : roles_) {
        all.push_back(materialize(record, false));
    }
    std::sort(all.begin(), all.end(),
              [](const Role& a, const Role& b) { return a.name < b.name; });

    std::vector<Role> result;
    if (size == 0 || page >= (all.size() + size - 1) / size) {
        return ServiceResult<std::vector<Role>>::ok(std::move(result));
    }
    auto begin = page * size;
    auto end = std::min(all.size(), begin + size);
    result.assign(all.begin() + static_cast<std::ptrdiff_t>(begin),
                  all.begin() + static_cast<std::ptrdiff_t>(end));
    return ServiceResult<std::vector<Role>>::ok(std::move(result));
}

ServiceResult<std::vector<Permission>> InMemoryDirectory::findPermissionsByPrincipal(
    const PrincipalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Permission> result;
    auto it = principals_.find(id);
    if (it == principals_.end()) {
        return ServiceResult<std::vector<Permission>>::ok(std::move(result));
    }

    std::set<PermissionId> seen;
    for (const auto& roleId : it->second.roleIds) {
        auto roleIt = roles_.find(roleId);
        if (roleIt == roles_.end()) {
            continue;
        }
        for (const auto& permId : roleIt->second.permissionIds) {
            auto permIt = permissions_.find(permId);
            if (permIt != permissions_.end() && seen.insert(permId).second) {
                result.push_back(permIt->second);
            }
        }
    }
    return ServiceResult<std::vector<Permission>>::ok(std::move(result));
}

// -- Administration -----------------------------------------------------------

ServiceResult<void> InMemoryDirectory::addPrincipal(Principal principal) {
    if (!principal.id.isValid()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "principal id is empty"));
    }
    principal.email = toLower(principal.email);
    auto username = toLower(principal.username);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, existing] : principals_) {
        if (id == principal.id || existing.email == principal.email ||
            (!username.empty() && toLower(existing.username) == username)) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::AlreadyExists, "principal already exists"));
        }
    }
    if (principal.createdAt == TimePoint{}) {
        principal.createdAt = Clock::now();
    }
    auto key = principal.id;
    principals_.emplace(std::move(key), std::move(principal));
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryDirectory::addRole(Role role) {
    if (!role.id.isValid()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "role id is empty"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (roles_.count(role.id) > 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "role already exists"));
    }
    role.permissions.clear();
    role.permissionsLoaded = false;
    auto key = role.id;
    roles_.emplace(std::move(key), RoleRecord{std::move(role), {}});
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryDirectory::addPermission(Permission permission) {
    if (!permission.id.isValid()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "permission id is empty"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (permissions_.count(permission.id) > 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "permission already exists"));
    }
    auto key = permission.id;
    permissions_.emplace(std::move(key), std::move(permission));
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryDirectory::assignRole(const PrincipalId& principalId,
                                                  const RoleId& roleId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = principals_.find(principalId);
    if (it == principals_.end()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotFound, "principal not found"));
    }
    if (roles_.count(roleId) == 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::RoleNotFound, "role not found: " + roleId.value()));
    }
    auto& ids = it->second.roleIds;
    if (std::find(ids.begin(), ids.end(), roleId) == ids.end()) {
        ids.push_back(roleId);
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryDirectory::assignPermission(const RoleId& roleId,
                                                        const PermissionId& permissionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roles_.find(roleId);
    if (it == roles_.end()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::RoleNotFound, "role not found: " + roleId.value()));
    }
    if (permissions_.count(permissionId) == 0) {
        return ServiceResult<void>::err(ServiceError(
            ErrorCode::PermissionNotFound, "permission not found: " + permissionId.value()));
    }
    auto& ids = it->second.permissionIds;
    if (std::find(ids.begin(), ids.end(), permissionId) == ids.end()) {
        ids.push_back(permissionId);
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryDirectory::setActive(const PrincipalId& principalId, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = principals_.find(principalId);
    if (it == principals_.end()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotFound, "principal not found"));
    }
    it->second.active = active;
    return ServiceResult<void>::ok();
}

}  // namespace cas::service
