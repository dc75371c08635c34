#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic primitives: SHA-256, HMAC-SHA256, Base64URL.
///
/// Digest, MAC and randomness come from OpenSSL 3.x. Encoding helpers are
/// local. Used internally by TokenHasher, JwtTokenCodec and
/// Sha256CredentialVerifier.

#include <array>
#include <cstdint>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cas::service::detail {

using Digest = std::array<uint8_t, 32>;

// =============================================================================
// SHA-256 / HMAC-SHA256
// =============================================================================

/// Compute SHA-256 digest of the input.
/// Returns an all-zero digest if OpenSSL reports a failure.
[[nodiscard]] inline Digest sha256(std::string_view input) {
    Digest digest{};
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != digest.size()) {
        return Digest{};
    }
    return digest;
}

/// Compute HMAC-SHA256(key, message).
/// Returns an all-zero MAC if OpenSSL reports a failure.
[[nodiscard]] inline Digest hmacSha256(std::string_view key, std::string_view message) {
    Digest mac{};
    unsigned int len = 0;
    auto* out = HMAC(EVP_sha256(),
                     key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                     mac.data(), &len);
    if (out == nullptr || len != mac.size()) {
        return Digest{};
    }
    return mac;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5, no padding)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode base64url. Returns nullopt on a character outside the alphabet.
[[nodiscard]] inline std::optional<std::string> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    std::string result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=') {
            break;
        }
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

// =============================================================================
// Hex encoding
// =============================================================================

/// Encode bytes to lowercase hex string.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

[[nodiscard]] inline std::string toHex(const Digest& data) {
    return toHex(data.data(), data.size());
}

// =============================================================================
// Secure random generation
// =============================================================================

/// Fill @p numBytes from the OpenSSL CSPRNG.
/// Returns an empty vector if the generator is not seeded.
[[nodiscard]] inline std::vector<uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (numBytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return {};
    }
    return buf;
}

/// Generate @p numBytes random bytes, hex-encoded.
[[nodiscard]] inline std::string secureRandomHex(std::size_t numBytes) {
    auto buf = secureRandomBytes(numBytes);
    return toHex(buf.data(), buf.size());
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two strings in constant time with respect to their content.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace cas::service::detail
