/// @file token_hasher.cpp
/// @brief TokenHasher implementation using SHA-256.

#include "cas/service/token_hasher.hpp"

#include "crypto_utils.hpp"

namespace cas::service {

std::string TokenHasher::hashToken(std::string_view token) {
    return detail::toHex(detail::sha256(token));
}

}  // namespace cas::service
