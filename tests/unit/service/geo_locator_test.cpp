#include <gtest/gtest.h>

#include "cas/foundation/error_code.hpp"
#include "cas/service/geo_locator.hpp"

using namespace cas::service;
using cas::foundation::ErrorCode;

TEST(NormalizeCountryCodeTest, Rules) {
    EXPECT_EQ(normalizeCountryCode(" au "), "AU");
    EXPECT_EQ(normalizeCountryCode("unknown"), "XX");
    EXPECT_EQ(normalizeCountryCode(""), "XX");
    EXPECT_EQ(normalizeCountryCode("   "), "XX");
    EXPECT_EQ(normalizeCountryCode("USA"), "US");
    EXPECT_EQ(normalizeCountryCode("d"), "DX");
}

TEST(PrefixGeoLocatorTest, LongestPrefixWins) {
    PrefixGeoLocator geo({{"203.", "AA"}, {"203.0.113.", "AU"}});
    auto country = geo.resolveCountry("203.0.113.7");
    ASSERT_TRUE(country.hasValue());
    EXPECT_EQ(country.value(), "AU");

    country = geo.resolveCountry("203.9.9.9");
    ASSERT_TRUE(country.hasValue());
    EXPECT_EQ(country.value(), "AA");
}

TEST(PrefixGeoLocatorTest, UnknownAddressFails) {
    PrefixGeoLocator geo;
    geo.addPrefix("10.", "ZZ");
    auto country = geo.resolveCountry("192.0.2.1");
    ASSERT_TRUE(country.hasError());
    EXPECT_EQ(country.error().code(), ErrorCode::GeoLookupFailed);
}
