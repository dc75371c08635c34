#pragma once

/// @file token_codec.hpp
/// @brief Signed-token codec interface and HS256 JWT implementation.
///
/// Token format (RFC 7519):
///   base64url(header) . base64url(payload) . base64url(signature)

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cas::service {

using cas::foundation::ServiceResult;

/// Decoded JWT claims payload.
struct TokenClaims {
    std::string subject;                   ///< Principal ID ("sub").
    std::string email;                     ///< Principal email ("email").
    std::vector<std::string> permissions;  ///< Permission names ("perms").
    std::string type;                      ///< "access" or "refresh" ("typ").
    std::string jti;                       ///< Unique token ID ("jti").
    std::string issuer;                    ///< Issuer ("iss").
    TimePoint issuedAt{};                  ///< Issued-at ("iat").
    TimePoint expiresAt{};                 ///< Expiry ("exp").
};

/// Issues, validates and reads signed tokens.
///
/// Implementations must be thread-safe.
class ITokenCodec {
public:
    virtual ~ITokenCodec() = default;

    /// Issue an access/refresh pair for a principal and its permission names.
    virtual ServiceResult<TokenPair> issueTokenPair(
        const PrincipalId& principalId, std::string_view email,
        const std::vector<std::string>& permissionNames) = 0;

    /// Check signature, issuer and expiry.
    [[nodiscard]] virtual TokenValidation validateToken(std::string_view token) const = 0;

    /// Principal id claim of a correctly signed token, or nullopt.
    [[nodiscard]] virtual std::optional<std::string> extractPrincipalId(
        std::string_view token) const = 0;

    /// Email claim of a correctly signed token, or nullopt.
    [[nodiscard]] virtual std::optional<std::string> extractEmail(
        std::string_view token) const = 0;
};

/// HS256 JWT codec.
///
/// Both tokens of a pair are JWTs distinguished by the "typ" claim. Every
/// token carries a fresh random "jti", so two pairs issued for the same
/// principal within one second still differ.
///
/// Example:
/// @code
///   AuthConfig config;
///   config.signingKey = "0123456789abcdef0123456789abcdef";
///   JwtTokenCodec codec(config);
///   auto pair = codec.issueTokenPair(PrincipalId("42"), "a@b.io", {"users:read"});
///   auto check = codec.validateToken(pair.value().accessToken);
/// @endcode
class JwtTokenCodec : public ITokenCodec {
public:
    explicit JwtTokenCodec(const AuthConfig& config);

    ServiceResult<TokenPair> issueTokenPair(
        const PrincipalId& principalId, std::string_view email,
        const std::vector<std::string>& permissionNames) override;

    [[nodiscard]] TokenValidation validateToken(std::string_view token) const override;

    [[nodiscard]] std::optional<std::string> extractPrincipalId(
        std::string_view token) const override;

    [[nodiscard]] std::optional<std::string> extractEmail(
        std::string_view token) const override;

    /// Decode the claims of a correctly signed token without checking expiry.
    [[nodiscard]] std::optional<TokenClaims> decodeClaims(std::string_view token) const;

    /// Sign arbitrary claims. Exposed for tools and tests.
    [[nodiscard]] std::string encode(const TokenClaims& claims) const;

private:
    std::string signingKey_;
    std::string issuer_;
    std::chrono::seconds accessExpiry_;
    std::chrono::seconds refreshExpiry_;
};

}  // namespace cas::service
