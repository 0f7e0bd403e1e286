#include <gtest/gtest.h>
#include <idscrub/crypto.hpp>

#include <set>

namespace idscrub {
namespace crypto {
namespace {

// ==================== Random Tests ====================

TEST(RandomBytesTest, ReturnsRequestedLength) {
    auto bytes = random_bytes(32);

    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value().size(), 32u);
}

TEST(RandomBytesTest, ZeroLengthIsEmpty) {
    auto bytes = random_bytes(0);

    ASSERT_TRUE(bytes.is_ok());
    EXPECT_TRUE(bytes.value().empty());
}

TEST(RandomBytesTest, ConsecutiveDrawsDiffer) {
    auto a = random_bytes(16);
    auto b = random_bytes(16);

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value(), b.value());
}

TEST(RandomStringTest, UsesOnlyAlphabetCharacters) {
    const std::string alphabet = "0123456789abcdef";
    auto drawn = random_string(alphabet, 512);

    ASSERT_TRUE(drawn.is_ok());
    EXPECT_EQ(drawn.value().size(), 512u);
    for (char c : drawn.value()) {
        EXPECT_NE(alphabet.find(c), std::string::npos) << "unexpected character " << c;
    }
}

TEST(RandomStringTest, CoversTheAlphabet) {
    // 10 symbols, 2000 draws: missing one has probability ~ 10 * 0.9^2000
    auto drawn = random_string("0123456789", 2000);

    ASSERT_TRUE(drawn.is_ok());
    std::set<char> seen(drawn.value().begin(), drawn.value().end());
    EXPECT_EQ(seen.size(), 10u);
}

TEST(RandomStringTest, EmptyAlphabetIsInvalid) {
    auto drawn = random_string("", 4);

    EXPECT_TRUE(drawn.is_error());
    EXPECT_EQ(drawn.error_code(), ErrorCode::InvalidParameter);
}

// ==================== Hashing Tests ====================

TEST(HexEncodeTest, EncodesLowercase) {
    EXPECT_EQ(hex_encode({0x00, 0x0f, 0xab, 0xff}), "000fabff");
    EXPECT_EQ(hex_encode({}), "");
}

TEST(Sha256Test, KnownVectors) {
    auto empty = sha256_hex("");
    auto abc = sha256_hex("abc");

    ASSERT_TRUE(empty.is_ok()) << empty.error_message();
    ASSERT_TRUE(abc.is_ok()) << abc.error_message();
    EXPECT_EQ(empty.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(abc.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, DifferentInputsDiffer) {
    auto a = sha256_hex("/a/storage.json");
    auto b = sha256_hex("/b/storage.json");

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value().size(), 64u);
    EXPECT_NE(a.value(), b.value());
}

}  // namespace
}  // namespace crypto
}  // namespace idscrub
