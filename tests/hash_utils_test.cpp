#include "../common/hash_utils.hpp"
#include <gtest/gtest.h>
#include <cctype>
#include <string>

TEST(HashUtilsTest, KnownDigests) {
    EXPECT_EQ(HashUtils::digest(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(HashUtils::digest("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HashUtils::digest("hello!"), "ce06092fb948d9ffac7d1a376e404b26b7575bcc11ee05a4615fef4fec3a308b");
}

TEST(HashUtilsTest, DigestCoversEmbeddedNulBytes) {
    std::string withNul("a\0b", 3);
    EXPECT_NE(HashUtils::digest(withNul), HashUtils::digest("a"));
    EXPECT_EQ(HashUtils::digest(withNul), HashUtils::digest(withNul.data(), withNul.size()));
}

TEST(HashUtilsTest, VerifyComparesAgainstLowercaseHex) {
    std::string expected = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
    EXPECT_TRUE(HashUtils::verify("hello", expected));
    EXPECT_FALSE(HashUtils::verify("hello!", expected));
    EXPECT_FALSE(HashUtils::verify("hello", expected.substr(1)));
    EXPECT_FALSE(HashUtils::verify("hello", ""));

    std::string upper = expected;
    for (char& c : upper) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    EXPECT_FALSE(HashUtils::verify("hello", upper));
}

TEST(HashUtilsTest, RecognisesDigestText) {
    EXPECT_TRUE(HashUtils::isDigest(HashUtils::digest("anything")));
    EXPECT_EQ(HashUtils::digest("anything").size(), HashUtils::DIGEST_HEX_LENGTH);
    EXPECT_FALSE(HashUtils::isDigest(""));
    EXPECT_FALSE(HashUtils::isDigest(std::string(63, 'a')));
    EXPECT_FALSE(HashUtils::isDigest(std::string(64, 'g')));
    EXPECT_FALSE(HashUtils::isDigest(std::string(64, 'A')));
    EXPECT_TRUE(HashUtils::isDigest(std::string(64, '0')));
}
