// ═══════════════════════════════════════════════════════════════════
//  test_crypto.cpp — SHA-256 and random ids
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <fedgate/crypto.h>
#include <fedgate/observability.h>

using namespace fedgate::crypto;

TEST(Sha256Test, EmptyDigest) {
    EXPECT_EQ(Sha256().hex(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HexTest, EncodesEveryByte) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(toHex(bytes, sizeof(bytes)), "000fa5ff");
    EXPECT_EQ(toHex(bytes, 0), "");
}

TEST(Sha256Test, IncrementalDigestIsStable) {
    auto a = Sha256().update("query { a }").update("Op").hex();
    auto b = Sha256().update("query { a }").update("Op").hex();
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 64u);
}

TEST(Sha256Test, PartsAreLengthPrefixed) {
    // "ab" + "c" must not collide with "a" + "bc"
    EXPECT_NE(Sha256().update("ab").update("c").hex(), Sha256().update("a").update("bc").hex());
}

TEST(CryptoRandomTest, RandomBytesLength) {
    EXPECT_EQ(randomBytes(32).size(), 32u);
}

TEST(CryptoRandomTest, RandomHexFormat) {
    auto hex = randomHex(16);
    EXPECT_EQ(hex.size(), 32u); // 16 bytes = 32 hex chars
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
    EXPECT_NE(randomHex(16), randomHex(16));
}

TEST(RequestIdTest, GeneratedIdsAreHex) {
    auto id = fedgate::observability::generateRequestId();
    EXPECT_EQ(id.size(), 16u);
}
