// tests/checksum_test.cpp
// Unit tests for MD5 and base64 helpers.

#include <gtest/gtest.h>
#include "checksum.hpp"

#include <string>
#include <vector>

using namespace tether;

namespace {

std::string text_of(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

} // namespace

// ==================== MD5 ====================

TEST(Md5Test, KnownVectors) {
    EXPECT_EQ(Md5().hex_digest(), "d41d8cd98f00b204e9800998ecf8427e");

    Md5 abc;
    abc.update("abc");
    EXPECT_EQ(abc.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");

    Md5 fox;
    fox.update("The quick brown fox jumps over the lazy dog");
    EXPECT_EQ(fox.hex_digest(), "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Md5Test, StreamingMatchesOneShot) {
    Md5 whole;
    whole.update("0123456789");

    Md5 parts;
    parts.update("01234");
    parts.update("");
    parts.update("56789");
    EXPECT_EQ(parts.hex_digest(), whole.hex_digest());
    EXPECT_EQ(whole.hex_digest(), "781e5e245d69b566979b86e28d23f2c7");
}

TEST(Md5Test, DigestDoesNotFinalize) {
    Md5 md5;
    md5.update("a");
    std::string early = md5.hex_digest();
    md5.update("bc");
    EXPECT_NE(md5.hex_digest(), early);
    EXPECT_EQ(md5.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(Md5Test, DigestCompareIgnoresCase) {
    EXPECT_TRUE(digest_equals("900150983CD24FB0D6963F7D28E17F72",
                              "900150983cd24fb0d6963f7d28e17f72"));
    EXPECT_FALSE(digest_equals("900150983cd24fb0", "900150983cd24fb0d6963f7d28e17f72"));
    EXPECT_FALSE(digest_equals("d41d8cd98f00b204e9800998ecf8427e",
                               "900150983cd24fb0d6963f7d28e17f72"));
}

// ==================== Base64 ====================

TEST(Base64Test, DecodesPadded) {
    EXPECT_EQ(text_of(base64_decode("aGVsbG8=")), "hello");
    EXPECT_EQ(text_of(base64_decode("Zm9vYmFy")), "foobar");
    EXPECT_EQ(text_of(base64_decode("MDEyMzQ1Njc4OQ==")), "0123456789");
}

TEST(Base64Test, DecodesUnpadded) {
    EXPECT_EQ(text_of(base64_decode("Zm9vYmE")), "fooba");
    EXPECT_EQ(text_of(base64_decode("Zg")), "f");
}

TEST(Base64Test, EmptyInput) {
    EXPECT_TRUE(base64_decode("").empty());
}

TEST(Base64Test, SkipsWhitespace) {
    EXPECT_EQ(text_of(base64_decode("aGVs\nbG8=\n")), "hello");
}

TEST(Base64Test, BinaryBytes) {
    auto out = base64_decode("AP8Q");
    EXPECT_EQ(out, (std::vector<uint8_t>{0x00, 0xFF, 0x10}));
}

TEST(Base64Test, RejectsInvalid) {
    EXPECT_THROW(base64_decode("a"), TetherError);
    EXPECT_THROW(base64_decode("ab!d"), TetherError);
    EXPECT_THROW(base64_decode("a=bc"), TetherError);
}
