/// @file session_store.cpp
/// @brief InMemorySessionStore implementation.

#include "cas/service/session_store.hpp"

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::ServiceError;

ServiceResult<void> InMemorySessionStore::save(const Session& session) {
    if (!session.id.isValid()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "session id is empty"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session.id) > 0 ||
        byAccessHash_.count(session.accessTokenHash) > 0 ||
        byRefreshHash_.count(session.refreshTokenHash) > 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "session already exists"));
    }

    byAccessHash_[session.accessTokenHash] = session.id;
    byRefreshHash_[session.refreshTokenHash] = session.id;
    sessions_.emplace(session.id, session);
    return ServiceResult<void>::ok();
}

ServiceResult<Session> InMemorySessionStore::update(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        return ServiceResult<Session>::err(
            ServiceError(ErrorCode::SessionNotFound, "session not found"));
    }

    auto& stored = it->second;
    if (stored.version != session.version) {
        return ServiceResult<Session>::err(
            ServiceError(ErrorCode::SessionConflict, "session modified concurrently"));
    }
    if (stored.ownerId != session.ownerId) {
        return ServiceResult<Session>::err(
            ServiceError(ErrorCode::InvalidArgument, "session owner is immutable"));
    }

    if (stored.accessTokenHash != session.accessTokenHash) {
        auto taken = byAccessHash_.find(session.accessTokenHash);
        if (taken != byAccessHash_.end() && taken->second != session.id) {
            return ServiceResult<Session>::err(
                ServiceError(ErrorCode::AlreadyExists, "access token hash already in use"));
        }
    }
    if (stored.refreshTokenHash != session.refreshTokenHash) {
        auto taken = byRefreshHash_.find(session.refreshTokenHash);
        if (taken != byRefreshHash_.end() && taken->second != session.id) {
            return ServiceResult<Session>::err(
                ServiceError(ErrorCode::AlreadyExists, "refresh token hash already in use"));
        }
    }

    byAccessHash_.erase(stored.accessTokenHash);
    byRefreshHash_.erase(stored.refreshTokenHash);

    // Identity, owner, provenance and creation time are fixed at save().
    Session next = session;
    next.createdAt = stored.createdAt;
    next.ipAddress = stored.ipAddress;
    next.userAgent = stored.userAgent;
    next.countryCode = stored.countryCode;
    next.active = stored.active && session.active;
    if (next.lastUsedAt < stored.lastUsedAt) {
        next.lastUsedAt = stored.lastUsedAt;
    }
    next.version = stored.version + 1;

    byAccessHash_[next.accessTokenHash] = next.id;
    byRefreshHash_[next.refreshTokenHash] = next.id;
    stored = next;
    return ServiceResult<Session>::ok(std::move(next));
}

ServiceResult<std::optional<Session>> InMemorySessionStore::findById(
    const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return ServiceResult<std::optional<Session>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<Session>>::ok(it->second);
}

std::optional<Session> InMemorySessionStore::lookup(
    const std::unordered_map<std::string, SessionId>& index, std::string_view hash) const {
    auto idIt = index.find(std::string(hash));
    if (idIt == index.end()) {
        return std::nullopt;
    }
    auto it = sessions_.find(idIt->second);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ServiceResult<std::optional<Session>> InMemorySessionStore::findByAccessTokenHash(
    std::string_view hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ServiceResult<std::optional<Session>>::ok(lookup(byAccessHash_, hash));
}

ServiceResult<std::optional<Session>> InMemorySessionStore::findByRefreshTokenHash(
    std::string_view hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ServiceResult<std::optional<Session>>::ok(lookup(byRefreshHash_, hash));
}

ServiceResult<std::vector<Session>> InMemorySessionStore::findActiveByOwner(
    const PrincipalId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    std::vector<Session> result;
    for (const auto& [id, session] : sessions_) {
        if (session.ownerId == owner && session.isValid(now)) {
            result.push_back(session);
        }
    }
    return ServiceResult<std::vector<Session>>::ok(std::move(result));
}

ServiceResult<std::vector<Session>> InMemorySessionStore::findByOwner(
    const PrincipalId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> result;
    for (const auto& [id, session] : sessions_) {
        if (session.ownerId == owner) {
            result.push_back(session);
        }
    }
    return ServiceResult<std::vector<Session>>::ok(std::move(result));
}

std::size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace cas::service
