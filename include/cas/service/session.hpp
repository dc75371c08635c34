#pragma once

/// @file session.hpp
/// @brief Server-side record of one issued token pair.

#include "cas/service/auth_types.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace cas::service {

/// One issued credential grant.
///
/// Only hashes of the tokens are held. A session is valid iff it is active
/// and the refresh expiry lies in the future; @c active is cleared only by
/// invalidation and never set back.
///
/// @c version is the optimistic-concurrency token checked by
/// ISessionStore::update().
struct Session {
    SessionId id;
    PrincipalId ownerId;
    std::string accessTokenHash;
    std::string refreshTokenHash;
    TimePoint expiresAt{};
    TimePoint createdAt{};
    TimePoint lastUsedAt{};
    bool active = true;
    std::string ipAddress;
    std::string userAgent;
    std::string countryCode;
    uint64_t version = 0;

    [[nodiscard]] bool isValid(TimePoint now = Clock::now()) const {
        return active && now < expiresAt;
    }

    void invalidate() { active = false; }

    /// Replace token hashes and expiry with a newly issued pair's values.
    void rotate(std::string newAccessHash, std::string newRefreshHash,
                TimePoint newExpiresAt, TimePoint now) {
        accessTokenHash = std::move(newAccessHash);
        refreshTokenHash = std::move(newRefreshHash);
        expiresAt = newExpiresAt;
        touch(now);
    }

    /// Advance lastUsedAt; never moves it backwards.
    void touch(TimePoint now) {
        if (now > lastUsedAt) {
            lastUsedAt = now;
        }
    }
};

}  // namespace cas::service
