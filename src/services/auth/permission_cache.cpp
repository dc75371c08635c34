/// @file permission_cache.cpp
/// @brief InMemoryPermissionCache implementation using a doubly-linked list
///        + hash map for O(1) LRU eviction and lookup.

#include "cas/service/permission_cache.hpp"

#include <algorithm>
#include <any>
#include <atomic>
#include <cctype>
#include <list>
#include <mutex>
#include <unordered_map>

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::ServiceError;

// ── Key layout ──────────────────────────────────────────────────────────────

namespace cache_keys {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // anonymous namespace

std::string checkByName(std::string_view permissionName) {
    return "name:" + std::string(permissionName);
}

std::string checkByResource(std::string_view resource, std::string_view action) {
    // The length prefix pins the resource boundary; either field may contain ':'.
    return "resource:" + std::to_string(resource.size()) + ":" + std::string(resource) +
           ":action:" + std::string(action);
}

std::string principalByEmail(std::string_view email) {
    return "auth:user:email:" + lower(email);
}

std::string principalById(const PrincipalId& id) {
    return "auth:user:id:" + id.value();
}

std::string permissionSet(const PrincipalId& id) {
    return "auth:user:permissions:" + id.value();
}

std::string permissionCheck(const PrincipalId& id, std::string_view checkKey) {
    return permissionCheckPrefix(id) + std::string(checkKey);
}

std::string permissionCheckPrefix(const PrincipalId& id) {
    return "auth:permission:check:" + id.value() + ":";
}

std::string roleById(const RoleId& id) {
    return "auth:role:id:" + id.value();
}

std::string principalRoles(const PrincipalId& id) {
    return principalRolesPrefix() + id.value();
}

std::string principalRolesPrefix() {
    return "auth:user:roles:";
}

std::string roleList(std::size_t page, std::size_t size) {
    return roleListPrefix() + std::to_string(page) + ":" + std::to_string(size);
}

std::string roleListPrefix() {
    return "auth:roles:list:";
}

std::string profile(const PrincipalId& id) {
    return "auth:user:profile:" + id.value();
}

}  // namespace cache_keys

// ── Cache entry stored in the LRU list ──────────────────────────────────────

namespace {

struct CacheEntry {
    std::string key;
    std::any value;
    std::chrono::steady_clock::time_point expiresAt;
};

}  // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct InMemoryPermissionCache::Impl {
    CacheConfig config;

    // LRU list: front = most recently used, back = least recently used.
    std::list<CacheEntry> lruList;

    // Map from key to iterator into the LRU list for O(1) lookup.
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> index;

    mutable std::mutex mutex;

    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    void touch(std::list<CacheEntry>::iterator it) {
        lruList.splice(lruList.begin(), lruList, it);
    }

    void evictLru() {
        if (lruList.empty()) {
            return;
        }
        index.erase(lruList.back().key);
        lruList.pop_back();
    }

    void erase(const std::string& key) {
        auto it = index.find(key);
        if (it != index.end()) {
            lruList.erase(it->second);
            index.erase(it);
        }
    }

    /// Typed read. An entry of the wrong type is dropped and reported as
    /// CacheCorrupted.
    template <typename T>
    ServiceResult<std::optional<T>> get(const std::string& key) {
        std::lock_guard lock(mutex);

        auto it = index.find(key);
        if (it == index.end()) {
            misses.fetch_add(1, std::memory_order_relaxed);
            return ServiceResult<std::optional<T>>::ok(std::nullopt);
        }

        auto listIt = it->second;
        if (listIt->expiresAt <= std::chrono::steady_clock::now()) {
            lruList.erase(listIt);
            index.erase(it);
            misses.fetch_add(1, std::memory_order_relaxed);
            return ServiceResult<std::optional<T>>::ok(std::nullopt);
        }

        const auto* value = std::any_cast<T>(&listIt->value);
        if (value == nullptr) {
            lruList.erase(listIt);
            index.erase(it);
            return ServiceResult<std::optional<T>>::err(
                ServiceError(ErrorCode::CacheCorrupted, "unexpected entry type for " + key));
        }

        touch(listIt);
        hits.fetch_add(1, std::memory_order_relaxed);
        return ServiceResult<std::optional<T>>::ok(*value);
    }

    template <typename T>
    ServiceResult<void> put(const std::string& key, T value, std::chrono::seconds ttl) {
        std::lock_guard lock(mutex);

        auto expiresAt = std::chrono::steady_clock::now() + ttl;

        auto it = index.find(key);
        if (it != index.end()) {
            auto listIt = it->second;
            listIt->value = std::move(value);
            listIt->expiresAt = expiresAt;
            touch(listIt);
            return ServiceResult<void>::ok();
        }

        if (config.maxEntries == 0) {
            return ServiceResult<void>::ok();
        }
        if (lruList.size() >= config.maxEntries) {
            evictLru();
        }

        lruList.push_front(CacheEntry{key, std::move(value), expiresAt});
        index[key] = lruList.begin();
        return ServiceResult<void>::ok();
    }

    std::size_t eraseByPrefix(std::string_view prefix) {
        std::size_t count = 0;
        for (auto it = lruList.begin(); it != lruList.end();) {
            if (it->key.compare(0, prefix.size(), prefix) == 0) {
                index.erase(it->key);
                it = lruList.erase(it);
                ++count;
            } else {
                ++it;
            }
        }
        return count;
    }
};

// ── Construction / destruction ──────────────────────────────────────────────

InMemoryPermissionCache::InMemoryPermissionCache(CacheConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = std::move(config);
}

InMemoryPermissionCache::~InMemoryPermissionCache() = default;

// ── Permission checks ───────────────────────────────────────────────────────

ServiceResult<std::optional<bool>> InMemoryPermissionCache::getPermissionCheck(
    const PrincipalId& id, std::string_view checkKey) {
    return impl_->get<bool>(cache_keys::permissionCheck(id, checkKey));
}

ServiceResult<void> InMemoryPermissionCache::putPermissionCheck(
    const PrincipalId& id, std::string_view checkKey, bool allowed) {
    return impl_->put(cache_keys::permissionCheck(id, checkKey), allowed,
                      impl_->config.ttls.permissionCheck);
}

// ── Permission sets ─────────────────────────────────────────────────────────

ServiceResult<std::optional<std::vector<Permission>>> InMemoryPermissionCache::getPermissions(
    const PrincipalId& id) {
    return impl_->get<std::vector<Permission>>(cache_keys::permissionSet(id));
}

ServiceResult<void> InMemoryPermissionCache::putPermissions(
    const PrincipalId& id, const std::vector<Permission>& permissions) {
    return impl_->put(cache_keys::permissionSet(id), permissions,
                      impl_->config.ttls.permissionSet);
}

// ── Roles ───────────────────────────────────────────────────────────────────

ServiceResult<std::optional<std::vector<Role>>> InMemoryPermissionCache::getPrincipalRoles(
    const PrincipalId& id) {
    return impl_->get<std::vector<Role>>(cache_keys::principalRoles(id));
}

ServiceResult<void> InMemoryPermissionCache::putPrincipalRoles(
    const PrincipalId& id, const std::vector<Role>& roles) {
    return impl_->put(cache_keys::principalRoles(id), roles,
                      impl_->config.ttls.principalRoles);
}

ServiceResult<CachedEntry<Role>> InMemoryPermissionCache::getRole(const RoleId& id) {
    return impl_->get<std::optional<Role>>(cache_keys::roleById(id));
}

ServiceResult<void> InMemoryPermissionCache::putRole(const RoleId& id,
                                                     const std::optional<Role>& role) {
    return impl_->put(cache_keys::roleById(id), role, impl_->config.ttls.roleById);
}

ServiceResult<std::optional<std::vector<Role>>> InMemoryPermissionCache::getRoleList(
    std::size_t page, std::size_t size) {
    return impl_->get<std::vector<Role>>(cache_keys::roleList(page, size));
}

ServiceResult<void> InMemoryPermissionCache::putRoleList(
    std::size_t page, std::size_t size, const std::vector<Role>& roles) {
    return impl_->put(cache_keys::roleList(page, size), roles, impl_->config.ttls.roleList);
}

// ── Principals and profiles ─────────────────────────────────────────────────

ServiceResult<CachedEntry<PrincipalSummary>> InMemoryPermissionCache::getPrincipalByEmail(
    std::string_view email) {
    return impl_->get<std::optional<PrincipalSummary>>(cache_keys::principalByEmail(email));
}

ServiceResult<void> InMemoryPermissionCache::putPrincipalByEmail(
    std::string_view email, const std::optional<PrincipalSummary>& principal) {
    return impl_->put(cache_keys::principalByEmail(email), principal,
                      impl_->config.ttls.principal);
}

ServiceResult<CachedEntry<PrincipalSummary>> InMemoryPermissionCache::getPrincipalById(
    const PrincipalId& id) {
    return impl_->get<std::optional<PrincipalSummary>>(cache_keys::principalById(id));
}

ServiceResult<void> InMemoryPermissionCache::putPrincipalById(
    const PrincipalId& id, const std::optional<PrincipalSummary>& principal) {
    return impl_->put(cache_keys::principalById(id), principal, impl_->config.ttls.principal);
}

ServiceResult<CachedEntry<Profile>> InMemoryPermissionCache::getProfile(const PrincipalId& id) {
    return impl_->get<std::optional<Profile>>(cache_keys::profile(id));
}

ServiceResult<void> InMemoryPermissionCache::putProfile(
    const PrincipalId& id, const std::optional<Profile>& profile) {
    return impl_->put(cache_keys::profile(id), profile, impl_->config.ttls.profile);
}

// ── Maintenance ─────────────────────────────────────────────────────────────

ServiceResult<void> InMemoryPermissionCache::invalidatePrincipal(const PrincipalId& id,
                                                                 std::string_view email) {
    std::lock_guard lock(impl_->mutex);
    if (!email.empty()) {
        impl_->erase(cache_keys::principalByEmail(email));
    }
    impl_->erase(cache_keys::principalById(id));
    impl_->erase(cache_keys::permissionSet(id));
    impl_->erase(cache_keys::principalRoles(id));
    impl_->erase(cache_keys::profile(id));
    impl_->eraseByPrefix(cache_keys::permissionCheckPrefix(id));
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryPermissionCache::invalidateRole(const RoleId& id) {
    std::lock_guard lock(impl_->mutex);
    impl_->erase(cache_keys::roleById(id));
    impl_->eraseByPrefix(cache_keys::roleListPrefix());
    impl_->eraseByPrefix(cache_keys::principalRolesPrefix());
    return ServiceResult<void>::ok();
}

std::size_t InMemoryPermissionCache::invalidateByPrefix(std::string_view prefix) {
    std::lock_guard lock(impl_->mutex);
    return impl_->eraseByPrefix(prefix);
}

void InMemoryPermissionCache::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->lruList.clear();
    impl_->index.clear();
}

// ── Accessors ───────────────────────────────────────────────────────────────

std::size_t InMemoryPermissionCache::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->lruList.size();
}

uint64_t InMemoryPermissionCache::hitCount() const {
    return impl_->hits.load(std::memory_order_relaxed);
}

uint64_t InMemoryPermissionCache::missCount() const {
    return impl_->misses.load(std::memory_order_relaxed);
}

double InMemoryPermissionCache::hitRate() const {
    auto h = impl_->hits.load(std::memory_order_relaxed);
    auto m = impl_->misses.load(std::memory_order_relaxed);
    auto total = h + m;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(h) / static_cast<double>(total);
}

}  // namespace cas::service
