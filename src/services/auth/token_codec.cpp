/// @file token_codec.cpp
/// @brief JwtTokenCodec implementation (HS256).
///
/// Header:  {"alg":"HS256","typ":"JWT"}
/// Payload: {"sub":"...","email":"...","perms":[...],"typ":"access|refresh",
///           "jti":"...","iss":"...","iat":N,"exp":N}

#include "cas/service/token_codec.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <sstream>
#include <string>

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::ServiceError;

// ---------------------------------------------------------------------------
// Minimal JSON helpers (flat objects only)
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";
constexpr std::string_view kAccessType = "access";
constexpr std::string_view kRefreshType = "refresh";

/// Escape a string for JSON output.
std::string jsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    out.push_back('"');
    return out;
}

int64_t toEpoch(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpoch(int64_t epoch) {
    return TimePoint(std::chrono::seconds(epoch));
}

/// Split "a.b.c" into exactly three parts, or return an empty vector.
std::vector<std::string_view> splitToken(std::string_view token) {
    auto first = token.find('.');
    if (first == std::string_view::npos) {
        return {};
    }
    auto second = token.find('.', first + 1);
    if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos) {
        return {};
    }
    return {token.substr(0, first), token.substr(first + 1, second - first - 1),
            token.substr(second + 1)};
}

/// Read a quoted JSON string starting right after its opening quote.
/// On return @p pos points past the closing quote.
std::optional<std::string> readJsonString(std::string_view json, std::size_t& pos) {
    std::string out;
    while (pos < json.size()) {
        char c = json[pos++];
        if (c == '"') {
            return out;
        }
        if (c == '\\') {
            if (pos >= json.size()) {
                return std::nullopt;
            }
            char esc = json[pos++];
            switch (esc) {
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                default:
                    out.push_back(esc);
                    break;
            }
            continue;
        }
        out.push_back(c);
    }
    return std::nullopt;
}

/// Extract a JSON string value by key.
std::optional<std::string> extractJsonString(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":\"";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    return readJsonString(json, pos);
}

/// Extract a JSON integer value by key.
std::optional<int64_t> extractJsonInt(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(json.data() + pos, json.data() + json.size(), result);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

/// Extract a JSON string array by key.
std::vector<std::string> extractJsonStringArray(std::string_view json, std::string_view key) {
    std::vector<std::string> result;
    std::string needle = "\"" + std::string(key) + "\":[";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return result;
    }
    pos += needle.size();
    while (pos < json.size() && json[pos] != ']') {
        if (json[pos] == '"') {
            ++pos;
            auto item = readJsonString(json, pos);
            if (!item) {
                break;
            }
            result.push_back(std::move(*item));
        } else {
            ++pos;
        }
    }
    return result;
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// JwtTokenCodec
// ---------------------------------------------------------------------------

JwtTokenCodec::JwtTokenCodec(const AuthConfig& config)
    : signingKey_(config.signingKey),
      issuer_(config.issuer),
      accessExpiry_(config.accessTokenExpiry),
      refreshExpiry_(config.refreshTokenExpiry) {}

std::string JwtTokenCodec::encode(const TokenClaims& claims) const {
    std::ostringstream payload;
    payload << "{\"sub\":" << jsonEscape(claims.subject)
            << ",\"email\":" << jsonEscape(claims.email) << ",\"perms\":[";
    for (std::size_t i = 0; i < claims.permissions.size(); ++i) {
        if (i > 0) {
            payload << ",";
        }
        payload << jsonEscape(claims.permissions[i]);
    }
    payload << "],\"typ\":" << jsonEscape(claims.type)
            << ",\"jti\":" << jsonEscape(claims.jti)
            << ",\"iss\":" << jsonEscape(claims.issuer)
            << ",\"iat\":" << toEpoch(claims.issuedAt)
            << ",\"exp\":" << toEpoch(claims.expiresAt) << "}";

    std::string signingInput =
        detail::base64urlEncode(kHeader) + "." + detail::base64urlEncode(payload.str());
    auto mac = detail::hmacSha256(signingKey_, signingInput);
    return signingInput + "." + detail::base64urlEncode(mac.data(), mac.size());
}

ServiceResult<TokenPair> JwtTokenCodec::issueTokenPair(
    const PrincipalId& principalId, std::string_view email,
    const std::vector<std::string>& permissionNames) {
    if (!principalId.isValid()) {
        return ServiceResult<TokenPair>::err(
            ServiceError(ErrorCode::InvalidArgument, "principal id is empty"));
    }

    // Whole seconds, so the expiry survives the round trip through "exp".
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());

    auto accessJti = detail::secureRandomHex(16);
    auto refreshJti = detail::secureRandomHex(16);
    if (accessJti.empty() || refreshJti.empty()) {
        return ServiceResult<TokenPair>::err(
            ServiceError(ErrorCode::InvalidToken, "random generator unavailable"));
    }

    TokenClaims claims;
    claims.subject = principalId.value();
    claims.email = std::string(email);
    claims.permissions = permissionNames;
    claims.issuer = issuer_;
    claims.issuedAt = now;

    TokenPair pair;

    claims.type = std::string(kAccessType);
    claims.jti = std::move(accessJti);
    claims.expiresAt = now + accessExpiry_;
    pair.accessToken = encode(claims);
    pair.accessExpiresAt = claims.expiresAt;

    // Refresh tokens only need to identify the principal.
    claims.type = std::string(kRefreshType);
    claims.jti = std::move(refreshJti);
    claims.permissions.clear();
    claims.expiresAt = now + refreshExpiry_;
    pair.refreshToken = encode(claims);
    pair.refreshExpiresAt = claims.expiresAt;

    return ServiceResult<TokenPair>::ok(std::move(pair));
}

std::optional<TokenClaims> JwtTokenCodec::decodeClaims(std::string_view token) const {
    auto parts = splitToken(token);
    if (parts.empty()) {
        return std::nullopt;
    }

    auto headerJson = detail::base64urlDecode(parts[0]);
    if (!headerJson || extractJsonString(*headerJson, "alg") != std::optional<std::string>("HS256")) {
        return std::nullopt;
    }

    std::string signingInput = std::string(parts[0]) + "." + std::string(parts[1]);
    auto expectedMac = detail::hmacSha256(signingKey_, signingInput);
    auto expectedSig = detail::base64urlEncode(expectedMac.data(), expectedMac.size());
    if (!detail::constantTimeEqual(expectedSig, parts[2])) {
        return std::nullopt;
    }

    auto payloadJson = detail::base64urlDecode(parts[1]);
    if (!payloadJson || payloadJson->empty()) {
        return std::nullopt;
    }

    TokenClaims claims;
    claims.subject = extractJsonString(*payloadJson, "sub").value_or("");
    claims.email = extractJsonString(*payloadJson, "email").value_or("");
    claims.permissions = extractJsonStringArray(*payloadJson, "perms");
    claims.type = extractJsonString(*payloadJson, "typ").value_or("");
    claims.jti = extractJsonString(*payloadJson, "jti").value_or("");
    claims.issuer = extractJsonString(*payloadJson, "iss").value_or("");
    claims.issuedAt = fromEpoch(extractJsonInt(*payloadJson, "iat").value_or(0));
    claims.expiresAt = fromEpoch(extractJsonInt(*payloadJson, "exp").value_or(0));
    return claims;
}

TokenValidation JwtTokenCodec::validateToken(std::string_view token) const {
    if (splitToken(token).empty()) {
        return {false, "malformed token"};
    }

    auto claims = decodeClaims(token);
    if (!claims) {
        return {false, "invalid signature"};
    }
    if (claims->issuer != issuer_) {
        return {false, "invalid issuer"};
    }
    if (Clock::now() >= claims->expiresAt) {
        return {false, "token expired"};
    }
    return {true, {}};
}

std::optional<std::string> JwtTokenCodec::extractPrincipalId(std::string_view token) const {
    auto claims = decodeClaims(token);
    if (!claims || claims->subject.empty()) {
        return std::nullopt;
    }
    return claims->subject;
}

std::optional<std::string> JwtTokenCodec::extractEmail(std::string_view token) const {
    auto claims = decodeClaims(token);
    if (!claims || claims->email.empty()) {
        return std::nullopt;
    }
    return claims->email;
}

}  // namespace cas::service
