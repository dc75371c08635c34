/// @file auth_server_integration_test.cpp
/// @brief Integration tests for AuthServer: login, rotation, invalidation
///        and permission checks through the asynchronous facade.

#include <gtest/gtest.h>

#include "cas/foundation/error_code.hpp"
#include "cas/service/auth_server.hpp"
#include "cas/service/auth_types.hpp"
#include "cas/service/credential_verifier.hpp"
#include "cas/service/directory.hpp"
#include "cas/service/session_store.hpp"
#include "cas/service/token_codec.hpp"
#include "cas/service/token_hasher.hpp"
#include "support/directory_fixture.hpp"
#include "support/test_doubles.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace cas::service;
using cas::foundation::ErrorCode;

// =============================================================================
// Integration fixture: AuthServer over in-memory collaborators
// =============================================================================

class AuthServerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.signingKey = "integration-test-key-at-least-32-bytes-long!";
        config_.accessTokenExpiry = std::chrono::seconds{600};
        config_.refreshTokenExpiry = std::chrono::seconds{3600};
        config_.requestThreads = 4;
        config_.collaboratorThreads = 2;

        directory_ = std::make_shared<InMemoryDirectory>();
        Sha256CredentialVerifier verifier;
        cas::test::seedDirectory(*directory_, verifier);
        store_ = std::make_shared<InMemorySessionStore>();
        audit_ = std::make_shared<cas::test::RecordingAuditSink>();

        AuthServerDeps deps;
        deps.principals = directory_;
        deps.roles = directory_;
        deps.permissions = directory_;
        deps.sessions = store_;
        deps.auditSink = audit_;
        server_ = std::make_unique<AuthServer>(config_, std::move(deps));
    }

    AuthOutcome login(const std::string& who, const std::string& ip = "10.0.0.1") {
        auto result = server_->loginAsync(who + "@example.com", who + "-secret",
                                          {ip, "integration"}).get();
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? std::move(result).value() : AuthOutcome{};
    }

    std::vector<Session> storedSessions(const std::string& owner) {
        auto all = store_->findByOwner(PrincipalId(owner));
        EXPECT_TRUE(all.hasValue());
        return all.hasValue() ? all.value() : std::vector<Session>{};
    }

    AuthConfig config_;
    std::shared_ptr<InMemoryDirectory> directory_;
    std::shared_ptr<InMemorySessionStore> store_;
    std::shared_ptr<cas::test::RecordingAuditSink> audit_;
    std::unique_ptr<AuthServer> server_;
};

// =============================================================================
// Login
// =============================================================================

TEST_F(AuthServerIntegrationTest, LoginPersistsExactlyOneActiveSession) {
    auto outcome = login("alice");

    ASSERT_TRUE(outcome.success);
    ASSERT_TRUE(outcome.tokens.has_value());
    EXPECT_FALSE(outcome.tokens->accessToken.empty());
    EXPECT_FALSE(outcome.tokens->refreshToken.empty());

    auto sessions = storedSessions("1");
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_TRUE(sessions[0].active);
    EXPECT_TRUE(sessions[0].isValid());
    EXPECT_EQ(sessions[0].id, *outcome.sessionId);
}

TEST_F(AuthServerIntegrationTest, DeactivatedAccountGetsNoSession) {
    auto result = server_->loginAsync("carol@example.com", "carol-secret", {}).get();

    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().success);
    EXPECT_EQ(result.value().message, "Account is inactive");
    EXPECT_TRUE(storedSessions("3").empty());
}

TEST_F(AuthServerIntegrationTest, StoredRecordHoldsNoRawToken) {
    auto outcome = login("bob");
    auto sessions = storedSessions("2");
    ASSERT_EQ(sessions.size(), 1u);

    const auto& s = sessions[0];
    for (const auto& raw : {outcome.tokens->accessToken, outcome.tokens->refreshToken}) {
        EXPECT_EQ(s.accessTokenHash.find(raw), std::string::npos);
        EXPECT_EQ(s.refreshTokenHash.find(raw), std::string::npos);
    }
    EXPECT_EQ(s.accessTokenHash, TokenHasher::hashToken(outcome.tokens->accessToken));
}

// =============================================================================
// Token rotation
// =============================================================================

TEST_F(AuthServerIntegrationTest, RefreshRotationRoundTrip) {
    auto first = login("alice");
    auto oldHash = TokenHasher::hashToken(first.tokens->refreshToken);

    auto rotated = server_->refreshAsync(first.tokens->refreshToken, {}).get();
    ASSERT_TRUE(rotated.hasValue());
    ASSERT_TRUE(rotated.value().success);
    auto newHash = TokenHasher::hashToken(rotated.value().tokens->refreshToken);

    auto byOld = store_->findByRefreshTokenHash(oldHash);
    ASSERT_TRUE(byOld.hasValue());
    EXPECT_FALSE(byOld.value().has_value() && byOld.value()->isValid());

    auto byNew = store_->findByRefreshTokenHash(newHash);
    ASSERT_TRUE(byNew.hasValue() && byNew.value().has_value());
    EXPECT_TRUE(byNew.value()->isValid());
    EXPECT_EQ(byNew.value()->id, *first.sessionId);
    EXPECT_EQ(byNew.value()->ownerId, PrincipalId("1"));
}

TEST_F(AuthServerIntegrationTest, RefreshAfterInvalidationReportsExpiredSession) {
    auto outcome = login("alice");
    auto invalidated = server_
                           ->invalidateAsync(PrincipalId("1"), outcome.tokens->accessToken,
                                             "logout", {})
                           .get();
    ASSERT_TRUE(invalidated.hasValue());

    auto result = server_->refreshAsync(outcome.tokens->refreshToken, {}).get();
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().success);
    EXPECT_EQ(result.value().message, "Session expired");
}

TEST_F(AuthServerIntegrationTest, RefreshTokenOfAnotherPrincipalIsRejected) {
    // A session owned by alice whose refresh hash belongs to a token minted for bob.
    JwtTokenCodec codec(config_);
    auto bobs = codec.issueTokenPair(PrincipalId("2"), "bob@example.com", {});
    ASSERT_TRUE(bobs.hasValue());

    Session forged;
    forged.id = SessionId("forged-session");
    forged.ownerId = PrincipalId("1");
    forged.accessTokenHash = TokenHasher::hashToken("unused-access");
    forged.refreshTokenHash = TokenHasher::hashToken(bobs.value().refreshToken);
    forged.createdAt = Clock::now();
    forged.lastUsedAt = forged.createdAt;
    forged.expiresAt = forged.createdAt + std::chrono::hours(1);
    ASSERT_TRUE(store_->save(forged).hasValue());

    auto result = server_->refreshAsync(bobs.value().refreshToken, {}).get();
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().success);
    EXPECT_EQ(result.value().message, "Invalid token");
}

// =============================================================================
// Invalidation
// =============================================================================

TEST_F(AuthServerIntegrationTest, InvalidateAllExcludingCurrentLeavesOne) {
    auto a = login("alice", "10.0.0.1");
    auto b = login("alice", "10.0.0.2");
    auto c = login("alice", "10.0.0.3");

    auto count = server_
                     ->invalidateAllAsync(PrincipalId("1"), PrincipalId("1"), true,
                                          b.tokens->accessToken, "logout-others", {})
                     .get();
    ASSERT_TRUE(count.hasValue());
    EXPECT_EQ(count.value(), 2u);

    auto active = server_->listActiveSessionsAsync(PrincipalId("1")).get();
    ASSERT_TRUE(active.hasValue());
    ASSERT_EQ(active.value().size(), 1u);
    EXPECT_EQ(active.value()[0].id, *b.sessionId);

    for (const auto& outcome : {a, c}) {
        auto touched = server_->touchSessionAsync(outcome.tokens->accessToken).get();
        ASSERT_TRUE(touched.hasError());
        EXPECT_EQ(touched.error().code(), ErrorCode::TokenExpired);
    }
}

TEST_F(AuthServerIntegrationTest, CrossUserInvalidationLeavesVictimSessionValid) {
    login("alice");
    auto bob = login("bob");

    auto result = server_
                      ->invalidateAsync(PrincipalId("1"), bob.tokens->accessToken,
                                        "not mine", {})
                      .get();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SecurityViolation);

    auto touched = server_->touchSessionAsync(bob.tokens->accessToken).get();
    ASSERT_TRUE(touched.hasValue());
    EXPECT_TRUE(touched.value().isValid());
}

TEST_F(AuthServerIntegrationTest, ConcurrentLoginsAreIndependent) {
    std::vector<std::future<cas::foundation::ServiceResult<AuthOutcome>>> pending;
    for (int i = 0; i < 16; ++i) {
        pending.push_back(server_->loginAsync("root@example.com", "root-secret",
                                              {"10.0.0." + std::to_string(i % 3), "load"}));
    }
    for (auto& f : pending) {
        auto result = f.get();
        ASSERT_TRUE(result.hasValue());
        EXPECT_TRUE(result.value().success);
    }

    auto active = server_->listActiveSessionsAsync(PrincipalId("9")).get();
    ASSERT_TRUE(active.hasValue());
    EXPECT_EQ(active.value().size(), 16u);
}

// =============================================================================
// Authorization
// =============================================================================

TEST_F(AuthServerIntegrationTest, PermissionChecksThroughFacade) {
    EXPECT_TRUE(server_->hasPermissionAsync(PrincipalId("1"), "users:read").get().value());
    EXPECT_FALSE(server_->hasPermissionAsync(PrincipalId("1"), "users:write").get().value());
    EXPECT_TRUE(
        server_->hasPermissionAsync(PrincipalId("9"), "sessions", "manage").get().value());

    auto perms = server_->getPermissionsAsync(PrincipalId("9")).get();
    ASSERT_TRUE(perms.hasValue());
    EXPECT_EQ(perms.value().size(), 3u);

    auto roles = server_->getRolesAsync(PrincipalId("1")).get();
    ASSERT_TRUE(roles.hasValue());
    ASSERT_EQ(roles.value().size(), 1u);
    EXPECT_EQ(roles.value()[0].name, "reader");

    auto profile = server_->getProfileAsync(PrincipalId("404")).get();
    ASSERT_TRUE(profile.hasValue());
    EXPECT_FALSE(profile.value().has_value());
}

TEST_F(AuthServerIntegrationTest, CacheDisabledGivesSameAnswers) {
    AuthConfig uncached = config_;
    uncached.cache.enabled = false;
    AuthServerDeps deps;
    deps.principals = directory_;
    deps.roles = directory_;
    deps.permissions = directory_;
    deps.sessions = store_;
    AuthServer plain(uncached, std::move(deps));

    for (const char* id : {"1", "2", "3", "9"}) {
        EXPECT_EQ(plain.getProfileAsync(PrincipalId(id)).get().value(),
                  server_->getProfileAsync(PrincipalId(id)).get().value());
        EXPECT_EQ(plain.hasPermissionAsync(PrincipalId(id), "users", "write").get().value(),
                  server_->hasPermissionAsync(PrincipalId(id), "users", "write").get().value());
    }
}
