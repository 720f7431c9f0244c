#include "auth_test_harness.hpp"

#include "crypto/pkce.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace endurain::core;
using namespace endurain::common;

namespace {

const std::string kVerifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";

RefreshCommand WebRefresh(const IssuedTokens& tokens) {
    RefreshCommand command;
    command.refresh_token = tokens.refresh_token;
    command.client_type = ClientType::kWeb;
    command.csrf_token = tokens.csrf_token;
    command.ip_address = "10.0.0.1";
    command.user_agent = "unit-test";
    return command;
}

// 重放旧令牌时不带 CSRF, CSRF 先于重用检测校验
RefreshCommand Replay(const IssuedTokens& tokens) {
    RefreshCommand command = WebRefresh(tokens);
    command.csrf_token.reset();
    return command;
}

} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        user_id_ = h_.AddUser("alice", "password123");
    }

    IssuedTokens Login(ClientType client_type = ClientType::kWeb) {
        CreateSessionCommand command;
        command.user_id = user_id_;
        command.client_type = client_type;
        command.ip_address = "10.0.0.1";
        command.user_agent = "unit-test";
        auto tokens = h_.sessions->CreateSession(command);
        EXPECT_TRUE(tokens.IsOk()) << tokens.GetStatus().Message();
        return tokens.Value();
    }

    testutils::AuthHarness h_;
    std::string user_id_;
};

TEST_F(SessionManagerTest, CreateSessionStartsNewFamily) {
    auto first = Login();
    auto second = Login();

    std::string session_id;
    ASSERT_TRUE(SessionManager::ParseRefreshToken(first.refresh_token, &session_id));
    EXPECT_EQ(session_id, first.session_id);
    EXPECT_FALSE(first.csrf_token.empty());
    EXPECT_EQ(first.access_token_expires_at, h_.clock->NowSeconds() + 15 * 60);
    EXPECT_EQ(first.refresh_token_expires_at, h_.clock->NowSeconds() + 7 * 86400);

    auto s1 = h_.session_repo->Get(first.session_id);
    auto s2 = h_.session_repo->Get(second.session_id);
    ASSERT_TRUE(s1.IsOk());
    ASSERT_TRUE(s2.IsOk());
    EXPECT_EQ(s1.Value().rotation_count, 0);
    EXPECT_NE(s1.Value().token_family_id, s2.Value().token_family_id);
    // 只保存哈希
    EXPECT_NE(s1.Value().refresh_token_hash, first.refresh_token);
    EXPECT_EQ(s1.Value().refresh_token_hash, h_.token_hasher->Hash(first.refresh_token).Value());
}

TEST_F(SessionManagerTest, ParseRefreshTokenRejectsMalformed) {
    EXPECT_FALSE(SessionManager::ParseRefreshToken("", nullptr));
    EXPECT_FALSE(SessionManager::ParseRefreshToken("no-dot", nullptr));
    EXPECT_FALSE(SessionManager::ParseRefreshToken(".secret", nullptr));
    EXPECT_FALSE(SessionManager::ParseRefreshToken("session.", nullptr));
    EXPECT_TRUE(SessionManager::ParseRefreshToken("a.b.c", nullptr));
}

TEST_F(SessionManagerTest, RefreshRotatesToken) {
    auto tokens = Login();
    h_.clock->Advance(10);
    auto rotated = h_.sessions->Refresh(WebRefresh(tokens));
    ASSERT_TRUE(rotated.IsOk()) << rotated.GetStatus().Message();
    EXPECT_EQ(rotated.Value().session_id, tokens.session_id);
    EXPECT_NE(rotated.Value().refresh_token, tokens.refresh_token);
    EXPECT_NE(rotated.Value().csrf_token, tokens.csrf_token);

    auto session = h_.session_repo->Get(tokens.session_id);
    ASSERT_TRUE(session.IsOk());
    EXPECT_EQ(session.Value().rotation_count, 1);
    EXPECT_EQ(session.Value().last_rotation_at, h_.clock->NowSeconds());
    // 旧令牌变成墓碑
    EXPECT_TRUE(h_.session_repo->FindRotatedToken(h_.token_hasher->Hash(tokens.refresh_token).Value()).IsOk());

    auto again = h_.sessions->Refresh(WebRefresh(rotated.Value()));
    ASSERT_TRUE(again.IsOk());
    session = h_.session_repo->Get(tokens.session_id);
    ASSERT_TRUE(session.IsOk());
    EXPECT_EQ(session.Value().rotation_count, 2);
}

TEST_F(SessionManagerTest, ReplayWithinGraceIsRejectedWithoutPenalty) {
    auto tokens = Login();
    auto rotated = h_.sessions->Refresh(WebRefresh(tokens));
    ASSERT_TRUE(rotated.IsOk());

    h_.clock->Advance(5);
    auto replay = h_.sessions->Refresh(Replay(tokens));
    EXPECT_EQ(replay.GetStatus().Code(), StatusCode::kFailedPrecondition);

    // 会话和最新令牌都不受影响
    auto next = h_.sessions->Refresh(WebRefresh(rotated.Value()));
    EXPECT_TRUE(next.IsOk()) << next.GetStatus().Message();
}

TEST_F(SessionManagerTest, ReplayAfterGraceInvalidatesFamily) {
    auto tokens = Login();
    auto other = Login();
    auto rotated = h_.sessions->Refresh(WebRefresh(tokens));
    ASSERT_TRUE(rotated.IsOk());

    h_.clock->Advance(5 * 60);
    auto replay = h_.sessions->Refresh(Replay(tokens));
    EXPECT_EQ(replay.GetStatus().Code(), StatusCode::kPermissionDenied);

    // 家族内的会话与最新令牌一起失效
    EXPECT_EQ(h_.session_repo->Get(tokens.session_id).GetStatus().Code(), StatusCode::kNotFound);
    auto latest = h_.sessions->Refresh(WebRefresh(rotated.Value()));
    EXPECT_EQ(latest.GetStatus().Code(), StatusCode::kUnauthenticated);

    // 其他家族不受影响
    EXPECT_TRUE(h_.sessions->Refresh(WebRefresh(other)).IsOk());
}

TEST_F(SessionManagerTest, RotatePolicyReissuesDuringGrace) {
    SessionManagerConfig config;
    config.grace_policy = GracePolicy::kRotate;
    testutils::AuthHarness h(config);
    auto user_id = h.AddUser("bob", "password123");
    CreateSessionCommand command;
    command.user_id = user_id;
    auto tokens = h.sessions->CreateSession(command);
    ASSERT_TRUE(tokens.IsOk());

    auto rotated = h.sessions->Refresh(WebRefresh(tokens.Value()));
    ASSERT_TRUE(rotated.IsOk());
    h.clock->Advance(2);

    auto retry = h.sessions->Refresh(Replay(tokens.Value()));
    ASSERT_TRUE(retry.IsOk()) << retry.GetStatus().Message();
    EXPECT_NE(retry.Value().refresh_token, rotated.Value().refresh_token);
    auto session = h.session_repo->Get(tokens.Value().session_id);
    ASSERT_TRUE(session.IsOk());
    EXPECT_EQ(session.Value().rotation_count, 2);
}

TEST_F(SessionManagerTest, ForgedSecretIsRejected) {
    auto tokens = Login();
    RefreshCommand command = WebRefresh(tokens);
    command.refresh_token = tokens.session_id + ".forged";
    EXPECT_EQ(h_.sessions->Refresh(command).GetStatus().Code(), StatusCode::kUnauthenticated);

    command.refresh_token = "unknown-session.secret";
    EXPECT_EQ(h_.sessions->Refresh(command).GetStatus().Code(), StatusCode::kUnauthenticated);

    command.refresh_token = "garbage";
    EXPECT_EQ(h_.sessions->Refresh(command).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(SessionManagerTest, CsrfCheckedForWebClientsOnly) {
    auto tokens = Login();
    RefreshCommand command = WebRefresh(tokens);
    command.csrf_token = "wrong";
    EXPECT_EQ(h_.sessions->Refresh(command).GetStatus().Code(), StatusCode::kInvalidArgument);

    // 不带 CSRF 的 web 刷新允许通过
    command.csrf_token.reset();
    auto rotated = h_.sessions->Refresh(command);
    ASSERT_TRUE(rotated.IsOk());

    auto mobile = Login(ClientType::kMobile);
    RefreshCommand mobile_command = WebRefresh(mobile);
    mobile_command.client_type = ClientType::kMobile;
    mobile_command.csrf_token = "ignored";
    EXPECT_TRUE(h_.sessions->Refresh(mobile_command).IsOk());
}

TEST_F(SessionManagerTest, ExpiredSessionIsRejected) {
    auto tokens = Login();
    h_.clock->Advance(7 * 86400 + 1);
    EXPECT_EQ(h_.sessions->Refresh(WebRefresh(tokens)).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(SessionManagerTest, IdleTimeoutWhenEnabled) {
    SessionManagerConfig config;
    config.idle_timeout_enabled = true;
    config.idle_timeout_hours = 1;
    testutils::AuthHarness h(config);
    auto user_id = h.AddUser("carol", "password123");
    CreateSessionCommand command;
    command.user_id = user_id;
    auto tokens = h.sessions->CreateSession(command);
    ASSERT_TRUE(tokens.IsOk());

    h.clock->Advance(3601);
    EXPECT_EQ(h.sessions->Refresh(WebRefresh(tokens.Value())).GetStatus().Code(), StatusCode::kUnauthenticated);

    auto removed = h.sessions->DeleteIdleSessions();
    ASSERT_TRUE(removed.IsOk());
    EXPECT_EQ(removed.Value(), 1u);
}

TEST_F(SessionManagerTest, DeleteIdleSessionsKeepsActiveWhenDisabled) {
    auto tokens = Login();
    h_.clock->Advance(3 * 86400);
    auto removed = h_.sessions->DeleteIdleSessions();
    ASSERT_TRUE(removed.IsOk());
    EXPECT_EQ(removed.Value(), 0u);
    EXPECT_TRUE(h_.session_repo->Get(tokens.session_id).IsOk());
}

TEST_F(SessionManagerTest, InactiveUserCannotRefresh) {
    auto tokens = Login();
    UserRecord record = h_.users->FindById(user_id_).Value();
    record.active = false;
    ASSERT_TRUE(h_.users->Put(record).IsOk());
    EXPECT_EQ(h_.sessions->Refresh(WebRefresh(tokens)).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(SessionManagerTest, LogoutDeletesSession) {
    auto tokens = Login();
    EXPECT_EQ(h_.sessions->Logout(tokens.session_id + ".wrong").Code(), StatusCode::kUnauthenticated);
    ASSERT_TRUE(h_.sessions->Logout(tokens.refresh_token).IsOk());
    EXPECT_EQ(h_.session_repo->Get(tokens.session_id).GetStatus().Code(), StatusCode::kNotFound);
    // 已登出视为成功
    EXPECT_TRUE(h_.sessions->Logout(tokens.refresh_token).IsOk());
}

TEST_F(SessionManagerTest, ListUserSessions) {
    Login();
    Login(ClientType::kMobile);
    auto sessions = h_.sessions->ListUserSessions(user_id_);
    ASSERT_TRUE(sessions.IsOk());
    EXPECT_EQ(sessions.Value().size(), 2u);
}

class TokenExchangeTest : public SessionManagerTest {
protected:
    // 创建带 PKCE 的 OAuth 状态和待交换会话, 返回会话 id
    std::string PendingSession() {
        CreateOAuthStateCommand state_command;
        state_command.nonce = "password_auth";
        state_command.client_type = ClientType::kMobile;
        state_command.code_challenge = endurain::crypto::ComputeS256Challenge(kVerifier);
        state_command.user_id = user_id_;
        auto state_id = h_.oauth_states->Create(state_command);
        EXPECT_TRUE(state_id.IsOk()) << state_id.GetStatus().Message();
        state_id_ = state_id.Value();

        CreateSessionCommand command;
        command.user_id = user_id_;
        command.client_type = ClientType::kMobile;
        auto session_id = h_.sessions->CreatePendingSession(command, state_id_);
        EXPECT_TRUE(session_id.IsOk());
        return session_id.Value();
    }

    std::string state_id_;
};

TEST_F(TokenExchangeTest, ExchangeIssuesTokensOnce) {
    auto session_id = PendingSession();
    auto tokens = h_.sessions->ExchangeTokens(session_id, kVerifier);
    ASSERT_TRUE(tokens.IsOk()) << tokens.GetStatus().Message();
    EXPECT_EQ(tokens.Value().session_id, session_id);

    auto session = h_.session_repo->Get(session_id);
    ASSERT_TRUE(session.IsOk());
    EXPECT_TRUE(session.Value().tokens_exchanged);
    EXPECT_FALSE(session.Value().oauth_state_id.has_value());
    EXPECT_EQ(h_.oauth_repo->Get(state_id_).GetStatus().Code(), StatusCode::kNotFound);

    auto replay = h_.sessions->ExchangeTokens(session_id, kVerifier);
    EXPECT_EQ(replay.GetStatus().Code(), StatusCode::kUnauthenticated);

    // 交换得到的令牌可以正常刷新
    RefreshCommand command;
    command.refresh_token = tokens.Value().refresh_token;
    command.client_type = ClientType::kMobile;
    EXPECT_TRUE(h_.sessions->Refresh(command).IsOk());
}

TEST_F(TokenExchangeTest, WrongVerifierDoesNotBurnState) {
    auto session_id = PendingSession();
    std::string wrong(43, 'x');
    EXPECT_EQ(h_.sessions->ExchangeTokens(session_id, wrong).GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_TRUE(h_.sessions->ExchangeTokens(session_id, kVerifier).IsOk());
}

TEST_F(TokenExchangeTest, ExchangeAfterCallbackConsumedState) {
    CreateOAuthStateCommand state_command;
    state_command.idp_id = 1;
    state_command.nonce = "oidc-nonce";
    state_command.client_type = ClientType::kMobile;
    state_command.code_challenge = endurain::crypto::ComputeS256Challenge(kVerifier);
    auto state_id = h_.oauth_states->Create(state_command);
    ASSERT_TRUE(state_id.IsOk()) << state_id.GetStatus().Message();

    // IdP 回调先消费 state, 再创建待交换会话
    auto consumed = h_.oauth_states->Consume(state_id.Value());
    ASSERT_TRUE(consumed.IsOk()) << consumed.GetStatus().Message();

    CreateSessionCommand command;
    command.user_id = user_id_;
    command.client_type = ClientType::kMobile;
    auto session_id = h_.sessions->CreatePendingSession(command, state_id.Value());
    ASSERT_TRUE(session_id.IsOk()) << session_id.GetStatus().Message();

    auto by_session = h_.oauth_states->GetBySession(session_id.Value());
    ASSERT_TRUE(by_session.IsOk()) << by_session.GetStatus().Message();
    EXPECT_TRUE(by_session.Value().used);

    auto tokens = h_.sessions->ExchangeTokens(session_id.Value(), kVerifier);
    ASSERT_TRUE(tokens.IsOk()) << tokens.GetStatus().Message();
    EXPECT_EQ(tokens.Value().session_id, session_id.Value());
    EXPECT_EQ(h_.oauth_repo->Get(state_id.Value()).GetStatus().Code(), StatusCode::kNotFound);

    EXPECT_EQ(h_.sessions->ExchangeTokens(session_id.Value(), kVerifier).GetStatus().Code(),
              StatusCode::kUnauthenticated);
}

TEST_F(TokenExchangeTest, ConcurrentExchangeHasOneWinner) {
    auto session_id = PendingSession();
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (h_.sessions->ExchangeTokens(session_id, kVerifier).IsOk()) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

TEST_F(TokenExchangeTest, MarkTokensExchangedOnlyOnce) {
    auto session_id = PendingSession();
    ASSERT_TRUE(h_.sessions->MarkTokensExchanged(session_id).IsOk());
    EXPECT_EQ(h_.oauth_repo->Get(state_id_).GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_EQ(h_.sessions->MarkTokensExchanged(session_id).Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(h_.sessions->ExchangeTokens(session_id, kVerifier).GetStatus().Code(),
              StatusCode::kUnauthenticated);
}

TEST_F(TokenExchangeTest, PendingSessionCannotRefreshBeforeExchange) {
    auto session_id = PendingSession();
    RefreshCommand command;
    command.refresh_token = session_id + ".guess";
    command.client_type = ClientType::kMobile;
    EXPECT_EQ(h_.sessions->Refresh(command).GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(TokenExchangeTest, SessionWithoutStateIsRejected) {
    auto tokens = Login();
    EXPECT_EQ(h_.sessions->ExchangeTokens(tokens.session_id, kVerifier).GetStatus().Code(),
              StatusCode::kUnauthenticated);
    EXPECT_EQ(h_.sessions->ExchangeTokens("missing", kVerifier).GetStatus().Code(),
              StatusCode::kUnauthenticated);
}
