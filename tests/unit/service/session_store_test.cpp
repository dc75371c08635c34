#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "cas/foundation/error_code.hpp"
#include "cas/service/session_store.hpp"

using namespace cas::service;
using cas::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

Session makeSession(const std::string& id, const std::string& owner,
                    TimePoint expiresAt = Clock::now() + 1h) {
    Session s;
    s.id = SessionId(id);
    s.ownerId = PrincipalId(owner);
    s.accessTokenHash = "access-" + id;
    s.refreshTokenHash = "refresh-" + id;
    s.createdAt = Clock::now();
    s.lastUsedAt = s.createdAt;
    s.expiresAt = expiresAt;
    s.ipAddress = "10.0.0.1";
    s.userAgent = "ua";
    s.countryCode = "ZZ";
    return s;
}

}  // namespace

class InMemorySessionStoreTest : public ::testing::Test {
protected:
    InMemorySessionStore store_;
};

TEST_F(InMemorySessionStoreTest, SaveAndLookupByEveryIndex) {
    ASSERT_TRUE(store_.save(makeSession("s1", "alice")).hasValue());

    auto byId = store_.findById(SessionId("s1"));
    ASSERT_TRUE(byId.hasValue());
    ASSERT_TRUE(byId.value().has_value());
    EXPECT_EQ(byId.value()->ownerId, PrincipalId("alice"));

    auto byAccess = store_.findByAccessTokenHash("access-s1");
    ASSERT_TRUE(byAccess.hasValue() && byAccess.value().has_value());
    auto byRefresh = store_.findByRefreshTokenHash("refresh-s1");
    ASSERT_TRUE(byRefresh.hasValue() && byRefresh.value().has_value());

    auto missing = store_.findByAccessTokenHash("nope");
    ASSERT_TRUE(missing.hasValue());
    EXPECT_FALSE(missing.value().has_value());
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(InMemorySessionStoreTest, DuplicateSaveRejected) {
    ASSERT_TRUE(store_.save(makeSession("s1", "alice")).hasValue());
    auto again = store_.save(makeSession("s1", "alice"));
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(InMemorySessionStoreTest, UpdateBumpsVersionAndReindexes) {
    auto session = makeSession("s1", "alice");
    ASSERT_TRUE(store_.save(session).hasValue());

    session.rotate("access-new", "refresh-new", session.expiresAt + 1h, Clock::now());
    auto updated = store_.update(session);
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().version, 1u);

    auto old = store_.findByRefreshTokenHash("refresh-s1");
    ASSERT_TRUE(old.hasValue());
    EXPECT_FALSE(old.value().has_value());

    auto fresh = store_.findByRefreshTokenHash("refresh-new");
    ASSERT_TRUE(fresh.hasValue() && fresh.value().has_value());
    EXPECT_EQ(fresh.value()->id, SessionId("s1"));
}

TEST_F(InMemorySessionStoreTest, StaleVersionConflicts) {
    auto session = makeSession("s1", "alice");
    ASSERT_TRUE(store_.save(session).hasValue());

    auto first = session;
    first.rotate("a-1", "r-1", session.expiresAt, Clock::now());
    ASSERT_TRUE(store_.update(first).hasValue());

    auto second = session;
    second.rotate("a-2", "r-2", session.expiresAt, Clock::now());
    auto lost = store_.update(second);
    ASSERT_TRUE(lost.hasError());
    EXPECT_EQ(lost.error().code(), ErrorCode::SessionConflict);
}

TEST_F(InMemorySessionStoreTest, OwnerAndProvenanceAreImmutable) {
    auto session = makeSession("s1", "alice");
    ASSERT_TRUE(store_.save(session).hasValue());

    auto hijack = session;
    hijack.ownerId = PrincipalId("mallory");
    EXPECT_TRUE(store_.update(hijack).hasError());

    auto edited = session;
    edited.ipAddress = "203.0.113.9";
    edited.countryCode = "AU";
    auto stored = store_.update(edited);
    ASSERT_TRUE(stored.hasValue());
    EXPECT_EQ(stored.value().ipAddress, "10.0.0.1");
    EXPECT_EQ(stored.value().countryCode, "ZZ");
}

TEST_F(InMemorySessionStoreTest, InactiveIsSticky) {
    auto session = makeSession("s1", "alice");
    ASSERT_TRUE(store_.save(session).hasValue());

    session.invalidate();
    auto inactive = store_.update(session);
    ASSERT_TRUE(inactive.hasValue());

    auto revived = inactive.value();
    revived.active = true;
    auto stored = store_.update(revived);
    ASSERT_TRUE(stored.hasValue());
    EXPECT_FALSE(stored.value().active);
}

TEST_F(InMemorySessionStoreTest, UpdateUnknownSession) {
    auto result = store_.update(makeSession("ghost", "alice"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SessionNotFound);
}

TEST_F(InMemorySessionStoreTest, ActiveByOwnerSkipsInvalid) {
    ASSERT_TRUE(store_.save(makeSession("s1", "alice")).hasValue());
    ASSERT_TRUE(store_.save(makeSession("s2", "alice", Clock::now() - 1min)).hasValue());
    auto revoked = makeSession("s3", "alice");
    revoked.active = false;
    ASSERT_TRUE(store_.save(revoked).hasValue());
    ASSERT_TRUE(store_.save(makeSession("s4", "bob")).hasValue());

    auto active = store_.findActiveByOwner(PrincipalId("alice"));
    ASSERT_TRUE(active.hasValue());
    ASSERT_EQ(active.value().size(), 1u);
    EXPECT_EQ(active.value()[0].id, SessionId("s1"));

    auto all = store_.findByOwner(PrincipalId("alice"));
    ASSERT_TRUE(all.hasValue());
    EXPECT_EQ(all.value().size(), 3u);
}
