#pragma once

/// @file token_hasher.hpp
/// @brief One-way token hashing used for every session lookup.

#include <string>
#include <string_view>

namespace cas::service {

/// Deterministic one-way hash of a bearer token.
///
/// The same token always yields the same hash, so stores can index
/// sessions by hash and never see the raw token.
class TokenHasher {
public:
    /// Lowercase hex SHA-256 of @p token (64 characters).
    [[nodiscard]] static std::string hashToken(std::string_view token);
};

}  // namespace cas::service
