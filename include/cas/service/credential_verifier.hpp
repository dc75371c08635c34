#pragma once

/// @file credential_verifier.hpp
/// @brief Secret hashing and verification.
///
/// The interface is swappable with bcrypt or argon2id implementations in
/// production deployments.

#include <cstddef>
#include <string>
#include <string_view>

namespace cas::service {

/// Verifies plaintext secrets against stored hashes.
class ICredentialVerifier {
public:
    virtual ~ICredentialVerifier() = default;

    /// True if @p plain matches @p storedHash. Malformed hashes never match.
    [[nodiscard]] virtual bool verifySecret(std::string_view plain,
                                            std::string_view storedHash) const = 0;

    /// Produce a storable hash of @p plain.
    [[nodiscard]] virtual std::string hashSecret(std::string_view plain) const = 0;

    /// Random secret of @p length characters for temporary credentials.
    [[nodiscard]] virtual std::string generateTemporarySecret(std::size_t length) const = 0;
};

/// Salted SHA-256 verifier.
///
/// Stored format: "sha256$<salt hex>$<digest hex>" where
/// digest = SHA-256(salt + secret).
///
/// Example:
/// @code
///   Sha256CredentialVerifier verifier;
///   auto stored = verifier.hashSecret("my_password");
///   bool ok = verifier.verifySecret("my_password", stored);
/// @endcode
class Sha256CredentialVerifier : public ICredentialVerifier {
public:
    [[nodiscard]] bool verifySecret(std::string_view plain,
                                    std::string_view storedHash) const override;

    [[nodiscard]] std::string hashSecret(std::string_view plain) const override;

    [[nodiscard]] std::string generateTemporarySecret(std::size_t length) const override;

    /// Hash @p plain with the given salt, in stored format.
    [[nodiscard]] static std::string hashWithSalt(std::string_view plain, std::string_view salt);
};

}  // namespace cas::service
