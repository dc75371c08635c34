#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "cas/foundation/error_code.hpp"
#include "cas/foundation/task_executor.hpp"
#include "cas/service/credential_verifier.hpp"
#include "cas/service/permission_cache.hpp"
#include "cas/service/permission_resolver.hpp"
#include "support/directory_fixture.hpp"
#include "support/test_doubles.hpp"

using namespace cas::service;
using cas::foundation::ErrorCode;
using cas::foundation::ServiceResult;
using cas::foundation::TaskExecutor;
using cas::test::CountingDirectory;
using cas::test::FailingPermissionCache;
using cas::test::ThrowingPermissionCache;
using namespace std::chrono_literals;

namespace {

enum class CacheMode { Healthy, Failing, Throwing, Absent };

}  // namespace

class PermissionResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto inner = std::make_shared<InMemoryDirectory>();
        cas::test::seedDirectory(*inner, verifier_);
        directory_ = std::make_shared<CountingDirectory>(inner);
        inner_ = inner;
        cache_ = std::make_shared<InMemoryPermissionCache>(CacheConfig{});
    }

    std::unique_ptr<PermissionResolver> makeResolver(
        CacheMode mode, std::shared_ptr<TaskExecutor> executor = nullptr,
        CollaboratorTimeouts timeouts = {}) {
        PermissionResolverDeps deps;
        deps.principals = directory_;
        deps.roles = directory_;
        deps.permissions = directory_;
        deps.executor = std::move(executor);
        switch (mode) {
            case CacheMode::Healthy: deps.cache = cache_; break;
            case CacheMode::Failing: deps.cache = std::make_shared<FailingPermissionCache>(); break;
            case CacheMode::Throwing: deps.cache = std::make_shared<ThrowingPermissionCache>(); break;
            case CacheMode::Absent: break;
        }
        return std::make_unique<PermissionResolver>(std::move(deps), timeouts);
    }

    Sha256CredentialVerifier verifier_;
    std::shared_ptr<InMemoryDirectory> inner_;
    std::shared_ptr<CountingDirectory> directory_;
    std::shared_ptr<InMemoryPermissionCache> cache_;
};

// -- Checks -------------------------------------------------------------------

TEST_F(PermissionResolverTest, NameAndResourceChecks) {
    auto resolver = makeResolver(CacheMode::Healthy);

    EXPECT_TRUE(resolver->hasPermission(PrincipalId("1"), "users:read").value());
    EXPECT_FALSE(resolver->hasPermission(PrincipalId("1"), "users:write").value());
    EXPECT_TRUE(resolver->hasPermission(PrincipalId("9"), "users", "write").value());
    EXPECT_FALSE(resolver->hasPermission(PrincipalId("1"), "sessions", "manage").value());
    EXPECT_FALSE(resolver->hasPermission(PrincipalId("404"), "users:read").value());
}

TEST_F(PermissionResolverTest, SecondCheckIsServedFromCache) {
    auto resolver = makeResolver(CacheMode::Healthy);

    ASSERT_TRUE(resolver->hasPermission(PrincipalId("1"), "users:read").value());
    auto readsAfterFirst = directory_->reads();
    ASSERT_TRUE(resolver->hasPermission(PrincipalId("1"), "users:read").value());
    EXPECT_EQ(directory_->reads(), readsAfterFirst);
}

TEST_F(PermissionResolverTest, DeniedCheckIsCachedToo) {
    auto resolver = makeResolver(CacheMode::Healthy);

    ASSERT_FALSE(resolver->hasPermission(PrincipalId("1"), "users:write").value());
    auto reads = directory_->reads();
    ASSERT_FALSE(resolver->hasPermission(PrincipalId("1"), "users:write").value());
    EXPECT_EQ(directory_->reads(), reads);
}

// A permission literally named like a resource/action key must not answer the
// resource/action check from the cache.
TEST_F(PermissionResolverTest, NameCheckDoesNotAnswerResourceCheck) {
    ASSERT_TRUE(inner_
                    ->addPermission(Permission{PermissionId("odd"), "resource:reports:action:read",
                                               "misc", "other", ""})
                    .hasValue());
    ASSERT_TRUE(inner_->assignPermission(RoleId("reader"), PermissionId("odd")).hasValue());
    auto resolver = makeResolver(CacheMode::Healthy);

    EXPECT_TRUE(resolver->hasPermission(PrincipalId("1"), "resource:reports:action:read").value());
    EXPECT_FALSE(resolver->hasPermission(PrincipalId("1"), "reports", "read").value());
}

TEST_F(PermissionResolverTest, ResourceChecksWithEmbeddedSeparatorsDoNotShareAnswers) {
    ASSERT_TRUE(inner_
                    ->addPermission(Permission{PermissionId("tricky"), "tricky", "a:action:b",
                                               "c", ""})
                    .hasValue());
    ASSERT_TRUE(inner_->assignPermission(RoleId("reader"), PermissionId("tricky")).hasValue());
    auto resolver = makeResolver(CacheMode::Healthy);

    EXPECT_TRUE(resolver->hasPermission(PrincipalId("1"), "a:action:b", "c").value());
    EXPECT_FALSE(resolver->hasPermission(PrincipalId("1"), "a", "b:action:c").value());
}

// -- Cache failure equivalence --------------------------------------------------

TEST_F(PermissionResolverTest, SameAnswersWithHealthyFailingOrAbsentCache) {
    auto healthy = makeResolver(CacheMode::Healthy);
    auto failing = makeResolver(CacheMode::Failing);
    auto throwing = makeResolver(CacheMode::Throwing);
    auto absent = makeResolver(CacheMode::Absent);

    for (const char* id : {"1", "2", "3", "9", "404"}) {
        PrincipalId who(id);
        for (const char* name : {"users:read", "users:write", "sessions:manage"}) {
            auto expected = absent->hasPermission(who, name);
            ASSERT_TRUE(expected.hasValue());
            EXPECT_EQ(healthy->hasPermission(who, name).value(), expected.value());
            EXPECT_EQ(failing->hasPermission(who, name).value(), expected.value());
            EXPECT_EQ(throwing->hasPermission(who, name).value(), expected.value());
        }
        for (auto* degraded : {failing.get(), throwing.get()}) {
            EXPECT_EQ(degraded->getPermissions(who).value(), absent->getPermissions(who).value());
            EXPECT_EQ(degraded->getRoles(who).value(), absent->getRoles(who).value());
            EXPECT_EQ(degraded->getProfile(who).value(), absent->getProfile(who).value());
            EXPECT_EQ(degraded->findPrincipalById(who).value(),
                      absent->findPrincipalById(who).value());
        }
    }
    for (auto* degraded : {failing.get(), throwing.get()}) {
        EXPECT_EQ(degraded->listRoles(0, 10).value(), absent->listRoles(0, 10).value());
        EXPECT_EQ(degraded->getRole(RoleId("admin"), true).value(),
                  absent->getRole(RoleId("admin"), true).value());
        EXPECT_EQ(degraded->findPrincipalByEmail("root@example.com").value(),
                  absent->findPrincipalByEmail("root@example.com").value());
    }
}

TEST_F(PermissionResolverTest, ThrowingCacheIsAMissWithoutExecutor) {
    auto resolver = makeResolver(CacheMode::Throwing);

    ServiceResult<bool> allowed = ServiceResult<bool>::ok(false);
    EXPECT_NO_THROW(allowed = resolver->hasPermission(PrincipalId("1"), "users:read"));
    ASSERT_TRUE(allowed.hasValue());
    EXPECT_TRUE(allowed.value());

    EXPECT_NO_THROW(resolver->invalidatePrincipal(PrincipalId("1"), "alice@example.com"));
    EXPECT_NO_THROW(resolver->invalidateRole(RoleId("reader")));
}

TEST_F(PermissionResolverTest, NonStandardThrowFromCacheIsAMiss) {
    PermissionResolverDeps deps;
    deps.principals = directory_;
    deps.roles = directory_;
    deps.permissions = directory_;
    deps.cache = std::make_shared<ThrowingPermissionCache>(true);
    PermissionResolver resolver(std::move(deps), CollaboratorTimeouts{});

    ServiceResult<std::optional<Profile>> profile = ServiceResult<std::optional<Profile>>::ok(
        std::nullopt);
    EXPECT_NO_THROW(profile = resolver.getProfile(PrincipalId("9")));
    ASSERT_TRUE(profile.hasValue() && profile.value().has_value());
    EXPECT_EQ(profile.value()->principal.username, "root");
}

TEST_F(PermissionResolverTest, ThrowingCacheIsAMissOnExecutor) {
    auto executor = std::make_shared<TaskExecutor>(2);
    PermissionResolverDeps deps;
    deps.principals = directory_;
    deps.roles = directory_;
    deps.permissions = directory_;
    deps.cache = std::make_shared<ThrowingPermissionCache>(true);
    deps.executor = executor;
    PermissionResolver resolver(std::move(deps), CollaboratorTimeouts{});

    ServiceResult<bool> allowed = ServiceResult<bool>::ok(false);
    EXPECT_NO_THROW(allowed = resolver.hasPermission(PrincipalId("9"), "users", "write"));
    ASSERT_TRUE(allowed.hasValue());
    EXPECT_TRUE(allowed.value());
}

TEST_F(PermissionResolverTest, SlowCacheIsBoundedAndTreatedAsMiss) {
    auto executor = std::make_shared<TaskExecutor>(2);
    PermissionResolverDeps deps;
    deps.principals = directory_;
    deps.roles = directory_;
    deps.permissions = directory_;
    deps.cache = std::make_shared<FailingPermissionCache>(300ms);
    deps.executor = executor;
    CollaboratorTimeouts timeouts;
    timeouts.cache = 20ms;
    PermissionResolver resolver(std::move(deps), timeouts);

    auto start = std::chrono::steady_clock::now();
    auto allowed = resolver.hasPermission(PrincipalId("1"), "users:read");
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(allowed.hasValue());
    EXPECT_TRUE(allowed.value());
    EXPECT_LT(elapsed, 250ms);
}

TEST_F(PermissionResolverTest, SystemOfRecordFailurePropagates) {
    auto resolver = makeResolver(CacheMode::Absent);
    directory_->setFailing(true);

    auto result = resolver->hasPermission(PrincipalId("1"), "users:read");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StorageError);

    EXPECT_TRUE(resolver->getProfile(PrincipalId("1")).hasError());
}

// -- Negative caching -----------------------------------------------------------

TEST_F(PermissionResolverTest, MissingRoleHitsSystemOfRecordOnce) {
    auto resolver = makeResolver(CacheMode::Healthy);

    auto first = resolver->getRole(RoleId("ghost"), false);
    ASSERT_TRUE(first.hasValue());
    EXPECT_FALSE(first.value().has_value());
    EXPECT_EQ(directory_->reads(), 1u);

    auto second = resolver->getRole(RoleId("ghost"), false);
    ASSERT_TRUE(second.hasValue());
    EXPECT_FALSE(second.value().has_value());
    EXPECT_EQ(directory_->reads(), 1u);
}

TEST_F(PermissionResolverTest, MissingPrincipalAndProfileAreNegativeCached) {
    auto resolver = makeResolver(CacheMode::Healthy);

    EXPECT_FALSE(resolver->findPrincipalByEmail("Nobody@Example.com").value().has_value());
    EXPECT_FALSE(resolver->findPrincipalByEmail("nobody@example.com").value().has_value());
    EXPECT_FALSE(resolver->findPrincipalById(PrincipalId("404")).value().has_value());
    EXPECT_FALSE(resolver->findPrincipalById(PrincipalId("404")).value().has_value());
    EXPECT_FALSE(resolver->getProfile(PrincipalId("404")).value().has_value());
    EXPECT_FALSE(resolver->getProfile(PrincipalId("404")).value().has_value());

    EXPECT_EQ(directory_->reads(), 3u);
}

// -- Role fidelity --------------------------------------------------------------

TEST_F(PermissionResolverTest, BareCachedRoleDoesNotSatisfyFullRequest) {
    auto resolver = makeResolver(CacheMode::Healthy);

    auto bare = resolver->getRole(RoleId("admin"), false);
    ASSERT_TRUE(bare.hasValue() && bare.value().has_value());
    EXPECT_FALSE(bare.value()->permissionsLoaded);

    auto full = resolver->getRole(RoleId("admin"), true);
    ASSERT_TRUE(full.hasValue() && full.value().has_value());
    EXPECT_TRUE(full.value()->permissionsLoaded);
    EXPECT_EQ(full.value()->permissions.size(), 3u);
    EXPECT_EQ(directory_->reads(), 2u);
}

TEST_F(PermissionResolverTest, FullCachedRoleIsTrimmedForBareRequest) {
    auto resolver = makeResolver(CacheMode::Healthy);

    ASSERT_TRUE(resolver->getRole(RoleId("admin"), true).hasValue());
    auto bare = resolver->getRole(RoleId("admin"), false);
    ASSERT_TRUE(bare.hasValue() && bare.value().has_value());
    EXPECT_FALSE(bare.value()->permissionsLoaded);
    EXPECT_TRUE(bare.value()->permissions.empty());
    EXPECT_EQ(directory_->reads(), 1u);
}

// -- Projections ----------------------------------------------------------------

TEST_F(PermissionResolverTest, ProfileCombinesRolesAndPermissions) {
    auto resolver = makeResolver(CacheMode::Healthy);

    auto profile = resolver->getProfile(PrincipalId("9"));
    ASSERT_TRUE(profile.hasValue() && profile.value().has_value());
    EXPECT_EQ(profile.value()->principal.username, "root");
    EXPECT_EQ(profile.value()->roleNames, std::vector<std::string>{"admin"});
    EXPECT_EQ(profile.value()->permissionNames,
              (std::vector<std::string>{"sessions:manage", "users:read", "users:write"}));
}

TEST_F(PermissionResolverTest, EmailLookupIsCaseInsensitive) {
    auto resolver = makeResolver(CacheMode::Healthy);
    auto found = resolver->findPrincipalByEmail("BOB@example.COM");
    ASSERT_TRUE(found.hasValue() && found.value().has_value());
    EXPECT_EQ(found.value()->id, PrincipalId("2"));
}

TEST_F(PermissionResolverTest, InvalidatePrincipalForcesReload) {
    auto resolver = makeResolver(CacheMode::Healthy);

    ASSERT_FALSE(resolver->hasPermission(PrincipalId("1"), "users:write").value());
    ASSERT_TRUE(inner_->assignRole(PrincipalId("1"), RoleId("admin")).hasValue());

    // Stale until invalidated.
    EXPECT_FALSE(resolver->hasPermission(PrincipalId("1"), "users:write").value());
    resolver->invalidatePrincipal(PrincipalId("1"), "alice@example.com");
    EXPECT_TRUE(resolver->hasPermission(PrincipalId("1"), "users:write").value());
}

TEST_F(PermissionResolverTest, InvalidateRoleForcesRoleReload) {
    auto resolver = makeResolver(CacheMode::Healthy);

    auto before = resolver->getRole(RoleId("reader"), true);
    ASSERT_TRUE(before.hasValue() && before.value().has_value());
    ASSERT_EQ(before.value()->permissions.size(), 1u);

    ASSERT_TRUE(inner_->assignPermission(RoleId("reader"), PermissionId("users:write")).hasValue());
    resolver->invalidateRole(RoleId("reader"));

    auto after = resolver->getRole(RoleId("reader"), true);
    ASSERT_TRUE(after.hasValue() && after.value().has_value());
    EXPECT_EQ(after.value()->permissions.size(), 2u);
}
