#pragma once

/// @file session_store.hpp
/// @brief Session persistence interface and in-memory implementation.
///
/// Abstracts session storage so the lifecycle manager can work with any
/// backend (in-memory, Redis, SQL database, etc.). Records are keyed by
/// session id, by token hash and by owner; raw tokens never reach a store.

#include "cas/foundation/service_result.hpp"
#include "cas/service/session.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cas::service {

using cas::foundation::ServiceResult;

/// Abstract interface for session persistence.
///
/// Implementations must be thread-safe and apply update() atomically per
/// row.
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /// Insert a new session. AlreadyExists if the id or a token hash is taken.
    virtual ServiceResult<void> save(const Session& session) = 0;

    /// Replace a stored session if its version still equals
    /// @p session.version.
    ///
    /// @return The stored record (version advanced by one), SessionNotFound,
    ///         or SessionConflict when another writer got there first.
    virtual ServiceResult<Session> update(const Session& session) = 0;

    virtual ServiceResult<std::optional<Session>> findById(const SessionId& id) const = 0;

    virtual ServiceResult<std::optional<Session>> findByAccessTokenHash(
        std::string_view hash) const = 0;

    virtual ServiceResult<std::optional<Session>> findByRefreshTokenHash(
        std::string_view hash) const = 0;

    /// Valid sessions (active and unexpired) owned by @p owner.
    virtual ServiceResult<std::vector<Session>> findActiveByOwner(
        const PrincipalId& owner) const = 0;

    /// Every session owned by @p owner, valid or not.
    virtual ServiceResult<std::vector<Session>> findByOwner(const PrincipalId& owner) const = 0;
};

/// Thread-safe in-memory session store for testing and development.
///
/// Production deployments should use a persistent store (Redis, database).
class InMemorySessionStore : public ISessionStore {
public:
    ServiceResult<void> save(const Session& session) override;

    ServiceResult<Session> update(const Session& session) override;

    ServiceResult<std::optional<Session>> findById(const SessionId& id) const override;

    ServiceResult<std::optional<Session>> findByAccessTokenHash(
        std::string_view hash) const override;

    ServiceResult<std::optional<Session>> findByRefreshTokenHash(
        std::string_view hash) const override;

    ServiceResult<std::vector<Session>> findActiveByOwner(
        const PrincipalId& owner) const override;

    ServiceResult<std::vector<Session>> findByOwner(const PrincipalId& owner) const override;

    /// Number of stored sessions, valid or not.
    [[nodiscard]] std::size_t size() const;

private:
    std::optional<Session> lookup(
        const std::unordered_map<std::string, SessionId>& index, std::string_view hash) const;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, Session> sessions_;
    std::unordered_map<std::string, SessionId> byAccessHash_;
    std::unordered_map<std::string, SessionId> byRefreshHash_;
};

}  // namespace cas::service
