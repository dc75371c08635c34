#include <gtest/gtest.h>

#include <set>
#include <string>

#include "crypto_utils.hpp"

using namespace cas::service::detail;

TEST(CryptoUtilsTest, Sha256KnownVector) {
    EXPECT_EQ(toHex(sha256("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(toHex(sha256("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoUtilsTest, HmacSha256Rfc4231Case2) {
    EXPECT_EQ(toHex(hmacSha256("Jefe", "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoUtilsTest, Base64UrlHasNoPaddingAndRoundTrips) {
    EXPECT_EQ(base64urlEncode("f"), "Zg");
    EXPECT_EQ(base64urlEncode("fo"), "Zm8");
    EXPECT_EQ(base64urlEncode("foo"), "Zm9v");
    EXPECT_EQ(base64urlEncode(std::string("\xfb\xff", 2)), "-_8");

    auto decoded = base64urlDecode("-_8");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, std::string("\xfb\xff", 2));
}

TEST(CryptoUtilsTest, Base64UrlRejectsForeignCharacters) {
    EXPECT_FALSE(base64urlDecode("ab+c").has_value());
    EXPECT_FALSE(base64urlDecode("ab/c").has_value());
}

TEST(CryptoUtilsTest, SecureRandomHexLengthAndUniqueness) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        auto value = secureRandomHex(16);
        EXPECT_EQ(value.size(), 32u);
        seen.insert(value);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(CryptoUtilsTest, ConstantTimeEqual) {
    EXPECT_TRUE(constantTimeEqual("abc", "abc"));
    EXPECT_FALSE(constantTimeEqual("abc", "abd"));
    EXPECT_FALSE(constantTimeEqual("abc", "abcd"));
    EXPECT_TRUE(constantTimeEqual("", ""));
}
