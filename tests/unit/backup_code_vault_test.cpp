#include "auth_test_harness.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <set>

using namespace endurain::core;
using namespace endurain::common;

class BackupCodeVaultTest : public ::testing::Test {
protected:
    testutils::AuthHarness h_;
};

TEST(BackupCodeFormatTest, GeneratedCodesUseUnambiguousAlphabet) {
    for (int i = 0; i < 200; ++i) {
        auto code = BackupCodeVault::GenerateBackupCode();
        ASSERT_TRUE(code.IsOk());
        const auto& value = code.Value();
        ASSERT_EQ(value.size(), 9u);
        EXPECT_EQ(value[4], '-');
        for (char c : {'0', 'O', '1', 'I'}) {
            EXPECT_EQ(value.find(c), std::string::npos) << value;
        }
        EXPECT_TRUE(BackupCodeVault::LooksLikeBackupCode(value));
    }
}

TEST(BackupCodeFormatTest, LooksLikeBackupCode) {
    EXPECT_TRUE(BackupCodeVault::LooksLikeBackupCode("ABCD-EFGH"));
    EXPECT_TRUE(BackupCodeVault::LooksLikeBackupCode("abcd-efgh"));
    EXPECT_FALSE(BackupCodeVault::LooksLikeBackupCode("123456"));
    EXPECT_FALSE(BackupCodeVault::LooksLikeBackupCode("ABCDEFGH"));
    EXPECT_FALSE(BackupCodeVault::LooksLikeBackupCode("ABC0-EFGH"));
}

TEST_F(BackupCodeVaultTest, GenerateReturnsPlaintextOnce) {
    auto codes = h_.backup_codes->Generate("user-1");
    ASSERT_TRUE(codes.IsOk()) << codes.GetStatus().Message();
    EXPECT_EQ(codes.Value().size(), 10u);
    std::set<std::string> unique(codes.Value().begin(), codes.Value().end());
    EXPECT_EQ(unique.size(), 10u);

    auto stored = h_.backup_repo->ListForUser("user-1");
    ASSERT_TRUE(stored.IsOk());
    ASSERT_EQ(stored.Value().size(), 10u);
    for (const auto& record : stored.Value()) {
        EXPECT_EQ(unique.count(record.code_hash), 0u);
        EXPECT_FALSE(record.used);
    }
}

TEST_F(BackupCodeVaultTest, CountOutOfRange) {
    EXPECT_EQ(h_.backup_codes->Generate("user-1", 0).GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(h_.backup_codes->Generate("user-1", 51).GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_F(BackupCodeVaultTest, CodeIsConsumedOnce) {
    auto codes = h_.backup_codes->Generate("user-1", 3);
    ASSERT_TRUE(codes.IsOk());
    const std::string code = codes.Value()[1];

    auto first = h_.backup_codes->VerifyAndConsume("user-1", code);
    ASSERT_TRUE(first.IsOk());
    EXPECT_TRUE(first.Value());

    auto second = h_.backup_codes->VerifyAndConsume("user-1", code);
    ASSERT_TRUE(second.IsOk());
    EXPECT_FALSE(second.Value());

    auto status = h_.backup_codes->GetStatus("user-1");
    ASSERT_TRUE(status.IsOk());
    EXPECT_TRUE(status.Value().has_codes);
    EXPECT_EQ(status.Value().total, 3);
    EXPECT_EQ(status.Value().used, 1);
    EXPECT_EQ(status.Value().unused, 2);
}

TEST_F(BackupCodeVaultTest, VerificationNormalizesInput) {
    auto codes = h_.backup_codes->Generate("user-1", 1);
    ASSERT_TRUE(codes.IsOk());
    std::string lowered = codes.Value()[0];
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto verified = h_.backup_codes->VerifyAndConsume("user-1", " " + lowered + " ");
    ASSERT_TRUE(verified.IsOk());
    EXPECT_TRUE(verified.Value());
}

TEST_F(BackupCodeVaultTest, CodesAreScopedToUser) {
    auto codes = h_.backup_codes->Generate("user-1", 2);
    ASSERT_TRUE(codes.IsOk());
    auto verified = h_.backup_codes->VerifyAndConsume("user-2", codes.Value()[0]);
    ASSERT_TRUE(verified.IsOk());
    EXPECT_FALSE(verified.Value());
}

TEST_F(BackupCodeVaultTest, RegenerateReplacesOldCodes) {
    auto old_codes = h_.backup_codes->Generate("user-1", 2);
    ASSERT_TRUE(old_codes.IsOk());
    h_.clock->Advance(10);
    auto new_codes = h_.backup_codes->Generate("user-1", 4);
    ASSERT_TRUE(new_codes.IsOk());

    auto verified = h_.backup_codes->VerifyAndConsume("user-1", old_codes.Value()[0]);
    ASSERT_TRUE(verified.IsOk());
    EXPECT_FALSE(verified.Value());

    auto status = h_.backup_codes->GetStatus("user-1");
    ASSERT_TRUE(status.IsOk());
    EXPECT_EQ(status.Value().total, 4);
    EXPECT_EQ(status.Value().created_at.value_or(0), h_.clock->NowSeconds());
}

TEST_F(BackupCodeVaultTest, RegenerateLeavesOnlyNewUnusedCodes) {
    auto first = h_.backup_codes->Generate("user-1", 10);
    ASSERT_TRUE(first.IsOk());
    auto consumed = h_.backup_codes->VerifyAndConsume("user-1", first.Value()[0]);
    ASSERT_TRUE(consumed.IsOk());
    ASSERT_TRUE(consumed.Value());

    auto second = h_.backup_codes->Generate("user-1", 5);
    ASSERT_TRUE(second.IsOk());
    ASSERT_EQ(second.Value().size(), 5u);

    auto status = h_.backup_codes->GetStatus("user-1");
    ASSERT_TRUE(status.IsOk());
    EXPECT_TRUE(status.Value().has_codes);
    EXPECT_EQ(status.Value().total, 5);
    EXPECT_EQ(status.Value().unused, 5);
    EXPECT_EQ(status.Value().used, 0);
}

TEST_F(BackupCodeVaultTest, StatusForUserWithoutCodes) {
    auto status = h_.backup_codes->GetStatus("nobody");
    ASSERT_TRUE(status.IsOk());
    EXPECT_FALSE(status.Value().has_codes);
    EXPECT_EQ(status.Value().total, 0);
    EXPECT_FALSE(status.Value().created_at.has_value());
}
