#include "auth_test_harness.hpp"

#include "core/auth/errors.hpp"
#include "crypto/pkce.hpp"
#include "crypto/totp.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace endurain::core;
using namespace endurain::common;

namespace {

const std::string kVerifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";

} // namespace

class AuthServiceTest : public ::testing::Test {
protected:
    LoginCommand LoginAs(const std::string& user_name, const std::string& password,
                         ClientType client_type = ClientType::kWeb) {
        LoginCommand command;
        command.user_name = user_name;
        command.password = password;
        command.client_type = client_type;
        command.ip_address = "10.0.0.9";
        command.user_agent = "unit-test";
        return command;
    }

    VerifyMfaCommand MfaAs(const std::string& user_name, const std::string& code) {
        VerifyMfaCommand command;
        command.user_name = user_name;
        command.code = code;
        command.client_type = ClientType::kWeb;
        return command;
    }

    std::string CurrentTotp() {
        return endurain::crypto::GenerateTotp(testutils::TotpKey(), h_.clock->NowSeconds());
    }

    // 与当前窗口内任何有效码都不同的 6 位数字
    std::string WrongTotp() {
        std::set<std::string> valid;
        for (int delta = -1; delta <= 1; ++delta) {
            valid.insert(endurain::crypto::GenerateTotp(testutils::TotpKey(), h_.clock->NowSeconds() + delta * 30));
        }
        for (int i = 0;; ++i) {
            std::string candidate = std::to_string(100000 + i);
            if (valid.count(candidate) == 0) {
                return candidate;
            }
        }
    }

    testutils::AuthHarness h_;
};

TEST_F(AuthServiceTest, PasswordLoginIssuesTokens) {
    auto user_id = h_.AddUser("alice", "password123");
    auto result = h_.auth->Login(LoginAs("alice", "password123"));
    ASSERT_TRUE(result.IsOk()) << result.GetStatus().Message();
    EXPECT_FALSE(result.Value().mfa_required);
    EXPECT_EQ(result.Value().user_id, user_id);
    ASSERT_TRUE(result.Value().tokens.has_value());
    EXPECT_FALSE(result.Value().tokens->refresh_token.empty());
    EXPECT_FALSE(result.Value().pending_session_id.has_value());
}

TEST_F(AuthServiceTest, UnknownUserAndWrongPasswordLookAlike) {
    h_.AddUser("alice", "password123");
    auto wrong = h_.auth->Login(LoginAs("alice", "nope"));
    auto unknown = h_.auth->Login(LoginAs("mallory", "nope"));
    EXPECT_EQ(wrong.GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(wrong.GetStatus().Code(), unknown.GetStatus().Code());
    EXPECT_EQ(wrong.GetStatus().Message(), unknown.GetStatus().Message());
}

TEST_F(AuthServiceTest, InactiveUserCannotLogin) {
    h_.AddUser("alice", "password123", false, false);
    EXPECT_EQ(h_.auth->Login(LoginAs("alice", "password123")).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(AuthServiceTest, RepeatedPasswordFailuresLockLogin) {
    h_.AddUser("alice", "password123");
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(h_.auth->Login(LoginAs("alice", "wrong")).GetStatus().Code(), StatusCode::kUnauthenticated);
    }
    auto locked = h_.auth->Login(LoginAs("alice", "password123"));
    EXPECT_EQ(locked.GetStatus().Code(), StatusCode::kResourceExhausted);
    EXPECT_NE(locked.GetStatus().Message().find("Try again in 300 seconds"), std::string::npos);

    h_.clock->Advance(301);
    EXPECT_TRUE(h_.auth->Login(LoginAs("alice", "password123")).IsOk());
}

TEST_F(AuthServiceTest, MfaLoginWithTotp) {
    auto user_id = h_.AddUser("alice", "password123", true);
    auto first = h_.auth->Login(LoginAs("alice", "password123"));
    ASSERT_TRUE(first.IsOk());
    EXPECT_TRUE(first.Value().mfa_required);
    EXPECT_FALSE(first.Value().tokens.has_value());
    EXPECT_TRUE(h_.mfa_guard->HasPendingLogin("alice").Value());

    auto second = h_.auth->VerifyMfa(MfaAs("alice", CurrentTotp()));
    ASSERT_TRUE(second.IsOk()) << second.GetStatus().Message();
    EXPECT_EQ(second.Value().user_id, user_id);
    ASSERT_TRUE(second.Value().tokens.has_value());
    EXPECT_FALSE(h_.mfa_guard->HasPendingLogin("alice").Value());

    // 待完成登录已清除
    EXPECT_EQ(h_.auth->VerifyMfa(MfaAs("alice", CurrentTotp())).GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(AuthServiceTest, VerifyMfaWithoutPendingLogin) {
    h_.AddUser("alice", "password123", true);
    EXPECT_EQ(h_.auth->VerifyMfa(MfaAs("alice", CurrentTotp())).GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(AuthServiceTest, SixthMfaAttemptRejectedOnLockoutAlone) {
    h_.AddUser("alice", "password123", true);
    ASSERT_TRUE(h_.auth->Login(LoginAs("alice", "password123")).IsOk());

    for (int i = 0; i < 5; ++i) {
        auto failed = h_.auth->VerifyMfa(MfaAs("alice", WrongTotp()));
        EXPECT_EQ(failed.GetStatus().Code(), StatusCode::kUnauthenticated);
        EXPECT_EQ(failed.GetStatus().Message(), "Invalid MFA code");
    }
    auto locked = h_.auth->VerifyMfa(MfaAs("alice", CurrentTotp()));
    EXPECT_EQ(locked.GetStatus().Code(), StatusCode::kResourceExhausted);
    // 锁定期间待完成登录仍保留
    EXPECT_TRUE(h_.mfa_guard->HasPendingLogin("alice").Value());
}

TEST_F(AuthServiceTest, BackupCodeAsSecondFactor) {
    auto user_id = h_.AddUser("alice", "password123", true);
    auto codes = h_.auth->GenerateBackupCodes(user_id, 3);
    ASSERT_TRUE(codes.IsOk());

    ASSERT_TRUE(h_.auth->Login(LoginAs("alice", "password123")).IsOk());
    auto verified = h_.auth->VerifyMfa(MfaAs("alice", codes.Value()[0]));
    ASSERT_TRUE(verified.IsOk()) << verified.GetStatus().Message();

    // 同一个备用码不能再次使用
    ASSERT_TRUE(h_.auth->Login(LoginAs("alice", "password123")).IsOk());
    EXPECT_EQ(h_.auth->VerifyMfa(MfaAs("alice", codes.Value()[0])).GetStatus().Code(),
              StatusCode::kUnauthenticated);

    auto status = h_.auth->GetBackupCodeStatus(user_id);
    ASSERT_TRUE(status.IsOk());
    EXPECT_EQ(status.Value().used, 1);
    EXPECT_EQ(status.Value().unused, 2);
}

TEST_F(AuthServiceTest, CancelPendingMfa) {
    h_.AddUser("alice", "password123", true);
    ASSERT_TRUE(h_.auth->Login(LoginAs("alice", "password123")).IsOk());
    ASSERT_TRUE(h_.auth->CancelPendingMfa("alice").IsOk());
    EXPECT_EQ(h_.auth->VerifyMfa(MfaAs("alice", CurrentTotp())).GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(AuthServiceTest, MobilePkceLoginRequiresExchange) {
    h_.AddUser("alice", "password123");
    auto command = LoginAs("alice", "password123", ClientType::kMobile);
    command.code_challenge = endurain::crypto::ComputeS256Challenge(kVerifier);

    auto result = h_.auth->Login(command);
    ASSERT_TRUE(result.IsOk()) << result.GetStatus().Message();
    EXPECT_FALSE(result.Value().tokens.has_value());
    ASSERT_TRUE(result.Value().pending_session_id.has_value());

    auto tokens = h_.auth->ExchangeTokens(*result.Value().pending_session_id, kVerifier);
    ASSERT_TRUE(tokens.IsOk()) << tokens.GetStatus().Message();
    EXPECT_EQ(tokens.Value().session_id, *result.Value().pending_session_id);
    EXPECT_EQ(h_.auth->ExchangeTokens(*result.Value().pending_session_id, kVerifier).GetStatus().Code(),
              StatusCode::kUnauthenticated);
}

TEST_F(AuthServiceTest, MobileLoginWithBadChallenge) {
    h_.AddUser("alice", "password123");
    auto command = LoginAs("alice", "password123", ClientType::kMobile);
    command.code_challenge = "too-short";
    EXPECT_EQ(h_.auth->Login(command).GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_F(AuthServiceTest, StolenTokenReplayedAfterFiveMinutes) {
    h_.AddUser("alice", "password123");
    auto login = h_.auth->Login(LoginAs("alice", "password123"));
    ASSERT_TRUE(login.IsOk());
    const auto original = *login.Value().tokens;

    RefreshCommand legit;
    legit.refresh_token = original.refresh_token;
    legit.csrf_token = original.csrf_token;
    auto rotated = h_.auth->Refresh(legit);
    ASSERT_TRUE(rotated.IsOk());

    h_.clock->Advance(5 * 60);
    RefreshCommand attacker;
    attacker.refresh_token = original.refresh_token;
    EXPECT_EQ(h_.auth->Refresh(attacker).GetStatus().Code(), StatusCode::kPermissionDenied);

    RefreshCommand victim;
    victim.refresh_token = rotated.Value().refresh_token;
    EXPECT_EQ(h_.auth->Refresh(victim).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(AuthServiceTest, LogoutThenRefreshFails) {
    h_.AddUser("alice", "password123");
    auto login = h_.auth->Login(LoginAs("alice", "password123"));
    ASSERT_TRUE(login.IsOk());
    ASSERT_TRUE(h_.auth->Logout(login.Value().tokens->refresh_token).IsOk());

    RefreshCommand command;
    command.refresh_token = login.Value().tokens->refresh_token;
    EXPECT_EQ(h_.auth->Refresh(command).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(AuthServiceTest, OAuthStateConsumedOnce) {
    CreateOAuthStateCommand command;
    command.idp_id = 1;
    command.nonce = "n";
    auto state_id = h_.auth->CreateOAuthState(command);
    ASSERT_TRUE(state_id.IsOk());
    EXPECT_TRUE(h_.auth->ConsumeOAuthState(state_id.Value()).IsOk());

    auto replay = h_.auth->ConsumeOAuthState(state_id.Value());
    EXPECT_EQ(replay.GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(replay.GetStatus().Message(), kGenericTokenMessage);
}

TEST_F(AuthServiceTest, LinkTokenConsumedOnce) {
    auto issued = h_.auth->IssueLinkToken("user-1", 2, std::nullopt);
    ASSERT_TRUE(issued.IsOk());
    auto consumed = h_.auth->ConsumeLinkToken(issued.Value().token);
    ASSERT_TRUE(consumed.IsOk());
    EXPECT_EQ(consumed.Value().idp_id, 2);
    EXPECT_EQ(h_.auth->ConsumeLinkToken(issued.Value().token).GetStatus().Code(), StatusCode::kUnauthenticated);
}
