/// @file credential_verifier.cpp
/// @brief Sha256CredentialVerifier implementation using SHA-256 + random salt.

#include "cas/service/credential_verifier.hpp"

#include "crypto_utils.hpp"

namespace cas::service {

namespace {

constexpr std::string_view kScheme = "sha256";

// Excludes look-alike characters (0/O, 1/l/I).
constexpr std::string_view kSecretAlphabet =
    "ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz23456789";

}  // anonymous namespace

std::string Sha256CredentialVerifier::hashWithSalt(std::string_view plain,
                                                   std::string_view salt) {
    std::string combined;
    combined.reserve(salt.size() + plain.size());
    combined.append(salt);
    combined.append(plain);

    std::string out(kScheme);
    out += '$';
    out.append(salt);
    out += '$';
    out += detail::toHex(detail::sha256(combined));
    return out;
}

std::string Sha256CredentialVerifier::hashSecret(std::string_view plain) const {
    return hashWithSalt(plain, detail::secureRandomHex(16));  // 16 bytes -> 32 hex chars
}

bool Sha256CredentialVerifier::verifySecret(std::string_view plain,
                                            std::string_view storedHash) const {
    // sha256$<salt>$<digest>
    auto first = storedHash.find('$');
    if (first == std::string_view::npos || storedHash.substr(0, first) != kScheme) {
        return false;
    }
    auto second = storedHash.find('$', first + 1);
    if (second == std::string_view::npos || second == first + 1 ||
        second + 1 >= storedHash.size()) {
        return false;
    }
    auto salt = storedHash.substr(first + 1, second - first - 1);
    auto computed = hashWithSalt(plain, salt);
    return detail::constantTimeEqual(computed, storedHash);
}

std::string Sha256CredentialVerifier::generateTemporarySecret(std::size_t length) const {
    auto bytes = detail::secureRandomBytes(length);
    std::string secret;
    secret.reserve(bytes.size());
    for (auto b : bytes) {
        secret.push_back(kSecretAlphabet[b % kSecretAlphabet.size()]);
    }
    return secret;
}

}  // namespace cas::service
