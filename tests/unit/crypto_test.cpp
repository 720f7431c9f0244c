#include "crypto/encoding.hpp"
#include "crypto/hmac.hpp"
#include "crypto/password_hasher.hpp"
#include "crypto/pkce.hpp"
#include "crypto/random.hpp"
#include "crypto/totp.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace endurain::crypto;

namespace {
// RFC 6238 附录 B 的 SHA1 密钥
const std::string kRfcKey = "12345678901234567890";
// RFC 7636 附录 B
const std::string kRfcVerifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";
const std::string kRfcChallenge = "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM";
} // namespace

TEST(EncodingTest, Base32KnownVector) {
    EXPECT_EQ(Base32Encode("foobar"), "MZXW6YTBOI");
    auto decoded = Base32Decode("mzxw 6ytb oi==");
    ASSERT_TRUE(decoded.IsOk());
    EXPECT_EQ(decoded.Value(), "foobar");
    EXPECT_FALSE(Base32Decode("0189").IsOk());
}

TEST(EncodingTest, Base64UrlHasNoPadding) {
    EXPECT_EQ(Base64UrlEncode("\xfb\xff"), "-_8");
    EXPECT_TRUE(IsBase64UrlAlphabet("abc-_XYZ09"));
    EXPECT_FALSE(IsBase64UrlAlphabet("abc+/="));
}

TEST(HmacTest, Rfc4231Vector) {
    EXPECT_EQ(HexEncode(HmacSha256("Jefe", "what do ya want for nothing?").Value()),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HmacTest, NullDigestReportsError) {
    auto mac = HmacDigest(nullptr, "key", "data");
    ASSERT_FALSE(mac.IsOk());
    EXPECT_EQ(mac.GetStatus().Code(), endurain::common::StatusCode::kInternal);
}

TEST(HmacTest, TokenHasherDependsOnSecret) {
    TokenHasher a("secret-a");
    TokenHasher b("secret-b");
    EXPECT_EQ(a.Hash("token").Value(), a.Hash("token").Value());
    EXPECT_NE(a.Hash("token").Value(), b.Hash("token").Value());
    EXPECT_EQ(a.Hash("token").Value().size(), 64u);
}

TEST(HmacTest, ConstantTimeEquals) {
    EXPECT_TRUE(ConstantTimeEquals("abc", "abc"));
    EXPECT_FALSE(ConstantTimeEquals("abc", "abd"));
    EXPECT_FALSE(ConstantTimeEquals("abc", "abcd"));
}

TEST(RandomTest, TokenUrlSafeIsUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        auto token = TokenUrlSafe(32);
        ASSERT_TRUE(token.IsOk());
        EXPECT_EQ(token.Value().size(), 43u);
        EXPECT_TRUE(IsBase64UrlAlphabet(token.Value()));
        seen.insert(token.Value());
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(RandomTest, UuidFormat) {
    auto uuid = RandomUuid();
    ASSERT_TRUE(uuid.IsOk());
    ASSERT_EQ(uuid.Value().size(), 36u);
    EXPECT_EQ(uuid.Value()[14], '4');
    EXPECT_EQ(uuid.Value()[8], '-');
}

TEST(TotpTest, Rfc6238Vectors) {
    TotpParams eight;
    eight.digits = 8;
    EXPECT_EQ(GenerateTotp(kRfcKey, 59, eight), "94287082");
    EXPECT_EQ(GenerateTotp(kRfcKey, 1111111109, eight), "07081804");
    EXPECT_EQ(GenerateTotp(kRfcKey, 1234567890, eight), "89005924");
    EXPECT_EQ(GenerateTotp(kRfcKey, 59), "287082");
}

TEST(TotpTest, VerifyAllowsOneStepDrift) {
    const std::string secret = Base32Encode(kRfcKey);
    const std::int64_t now = 1234567890;
    auto previous = GenerateTotp(kRfcKey, now - 30);
    auto far_past = GenerateTotp(kRfcKey, now - 120);

    EXPECT_TRUE(VerifyTotp(secret, GenerateTotp(kRfcKey, now), now));
    EXPECT_TRUE(VerifyTotp(secret, previous, now));
    EXPECT_FALSE(VerifyTotp(secret, far_past, now));
    EXPECT_FALSE(VerifyTotp(secret, "12345", now));
    EXPECT_FALSE(VerifyTotp("not base32!", "123456", now));
}

TEST(PkceTest, Rfc7636Vector) {
    EXPECT_EQ(ComputeS256Challenge(kRfcVerifier), kRfcChallenge);
    EXPECT_TRUE(VerifyCodeVerifier(kRfcVerifier, kRfcChallenge));
    EXPECT_FALSE(VerifyCodeVerifier(kRfcVerifier + "x", kRfcChallenge));
}

TEST(PkceTest, ChallengeValidation) {
    EXPECT_TRUE(IsValidCodeChallenge(kRfcChallenge, "S256"));
    EXPECT_FALSE(IsValidCodeChallenge(kRfcChallenge, "plain"));
    EXPECT_FALSE(IsValidCodeChallenge("short", "S256"));
    EXPECT_FALSE(IsValidCodeVerifier(std::string(42, 'a')));
    EXPECT_TRUE(IsValidCodeVerifier(std::string(128, 'a')));
    EXPECT_FALSE(IsValidCodeVerifier(std::string(129, 'a')));
}

TEST(PasswordHasherTest, HashAndVerify) {
    PasswordHasher hasher(1000);
    auto encoded = hasher.Hash("correct horse");
    ASSERT_TRUE(encoded.IsOk());
    EXPECT_EQ(encoded.Value().rfind("pbkdf2_sha256$1000$", 0), 0u);
    EXPECT_TRUE(hasher.Verify("correct horse", encoded.Value()));
    EXPECT_FALSE(hasher.Verify("wrong horse", encoded.Value()));

    // 每次哈希使用不同的盐
    auto again = hasher.Hash("correct horse");
    ASSERT_TRUE(again.IsOk());
    EXPECT_NE(encoded.Value(), again.Value());
}

TEST(PasswordHasherTest, MalformedEncodingDoesNotMatch) {
    PasswordHasher hasher(1000);
    EXPECT_FALSE(hasher.Verify("pw", ""));
    EXPECT_FALSE(hasher.Verify("pw", "pbkdf2_sha256$abc$00$00"));
    EXPECT_FALSE(hasher.Verify("pw", "md5$1$00$00"));
}
