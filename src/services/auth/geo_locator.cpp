/// @file geo_locator.cpp
/// @brief Country-code normalization and PrefixGeoLocator.

#include "cas/service/geo_locator.hpp"

#include <algorithm>
#include <cctype>

namespace cas::service {

using cas::foundation::ErrorCode;
using cas::foundation::ServiceError;

std::string normalizeCountryCode(std::string_view raw) {
    auto begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::string(kUnknownCountry);
    }
    auto end = raw.find_last_not_of(" \t\r\n");
    std::string code(raw.substr(begin, end - begin + 1));
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (code == "UNKNOWN") {
        return std::string(kUnknownCountry);
    }
    if (code.size() > 2) {
        code.resize(2);
    } else if (code.size() == 1) {
        code.push_back('X');
    }
    return code;
}

PrefixGeoLocator::PrefixGeoLocator(std::map<std::string, std::string> prefixes)
    : prefixes_(std::move(prefixes)) {}

void PrefixGeoLocator::addPrefix(std::string prefix, std::string countryCode) {
    prefixes_[std::move(prefix)] = std::move(countryCode);
}

ServiceResult<std::string> PrefixGeoLocator::resolveCountry(std::string_view ipAddress) {
    const std::string* best = nullptr;
    std::size_t bestLen = 0;
    for (const auto& [prefix, country] : prefixes_) {
        if (prefix.size() > bestLen && ipAddress.substr(0, prefix.size()) == prefix) {
            best = &country;
            bestLen = prefix.size();
        }
    }
    if (best == nullptr) {
        return ServiceResult<std::string>::err(ServiceError(
            ErrorCode::GeoLookupFailed, "no location for " + std::string(ipAddress)));
    }
    return ServiceResult<std::string>::ok(*best);
}

}  // namespace cas::service
