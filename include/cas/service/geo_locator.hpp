#pragma once

/// @file geo_locator.hpp
/// @brief IP geolocation collaborator and a prefix-table implementation.

#include "cas/foundation/service_result.hpp"

#include <map>
#include <string>
#include <string_view>

namespace cas::service {

using cas::foundation::ServiceResult;

/// Country code used when geolocation has no answer.
inline constexpr std::string_view kUnknownCountry = "XX";

/// Normalize a raw lookup result to a two-letter upper-case code.
///
/// Empty or "UNKNOWN" becomes "XX"; longer values are truncated to two
/// characters; a single character is padded with 'X'.
[[nodiscard]] std::string normalizeCountryCode(std::string_view raw);

/// Resolves a country for an IP address. Implementations must be thread-safe.
class IGeoLocator {
public:
    virtual ~IGeoLocator() = default;

    /// Country code for @p ipAddress, or GeoLookupFailed.
    virtual ServiceResult<std::string> resolveCountry(std::string_view ipAddress) = 0;
};

/// Longest-prefix match of the textual IP against a configured table.
///
/// Example:
/// @code
///   PrefixGeoLocator geo({{"10.", "ZZ"}, {"203.0.113.", "AU"}});
///   auto country = geo.resolveCountry("203.0.113.7");  // "AU"
/// @endcode
class PrefixGeoLocator : public IGeoLocator {
public:
    PrefixGeoLocator() = default;
    explicit PrefixGeoLocator(std::map<std::string, std::string> prefixes);

    ServiceResult<std::string> resolveCountry(std::string_view ipAddress) override;

    void addPrefix(std::string prefix, std::string countryCode);

private:
    std::map<std::string, std::string> prefixes_;
};

}  // namespace cas::service
