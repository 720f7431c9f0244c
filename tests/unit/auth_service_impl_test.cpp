#include "auth_test_harness.hpp"

#include "core/auth/errors.hpp"
#include "crypto/pkce.hpp"
#include "server/auth_service_impl.hpp"

#include <gtest/gtest.h>

using endurain::core::AuthErrorCode;
using endurain::server::AuthServiceImpl;

namespace {

int Code(AuthErrorCode code) {
    return static_cast<int>(code);
}

} // namespace

class AuthServiceImplTest : public ::testing::Test {
protected:
    void SetUp() override {
        h_.AddUser("alice", "password123");
        service_ = std::make_unique<AuthServiceImpl>(h_.auth);
    }

    proto::auth::LoginResponse Login(const std::string& password, const std::string& client_type = "web") {
        proto::auth::LoginRequest request;
        request.set_username("alice");
        request.set_password(password);
        request.set_client_type(client_type);
        proto::auth::LoginResponse response;
        service_->Login(&context_, &request, &response);
        return response;
    }

    testutils::AuthHarness h_;
    grpc::ServerContext context_;
    std::unique_ptr<AuthServiceImpl> service_;
};

TEST_F(AuthServiceImplTest, LoginFillsTokenBundle) {
    proto::auth::LoginRequest request;
    request.set_username("alice");
    request.set_password("password123");
    request.set_client_type("web");
    proto::auth::LoginResponse response;
    auto status = service_->Login(&context_, &request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.error().code(), Code(AuthErrorCode::kOk));
    EXPECT_FALSE(response.mfa_required());
    EXPECT_FALSE(response.tokens().refresh_token().empty());
    EXPECT_FALSE(response.tokens().csrf_token().empty());
    EXPECT_EQ(response.user_id(), "user-alice");
}

TEST_F(AuthServiceImplTest, InvalidClientType) {
    proto::auth::LoginRequest request;
    request.set_username("alice");
    request.set_password("password123");
    request.set_client_type("desktop");
    proto::auth::LoginResponse response;
    auto status = service_->Login(&context_, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(response.error().code(), Code(AuthErrorCode::kInvalidClientType));
}

TEST_F(AuthServiceImplTest, WrongPasswordThenLockout) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(Login("bad").error().code(), Code(AuthErrorCode::kInvalidCredentials));
    }
    EXPECT_EQ(Login("password123").error().code(), Code(AuthErrorCode::kLockedOut));
}

TEST_F(AuthServiceImplTest, RefreshTheftIsReported) {
    auto login = Login("password123");
    ASSERT_EQ(login.error().code(), 0);

    proto::auth::RefreshRequest request;
    request.set_refresh_token(login.tokens().refresh_token());
    request.set_client_type("web");
    request.set_csrf_token(login.tokens().csrf_token());
    proto::auth::RefreshResponse rotated;
    ASSERT_TRUE(service_->Refresh(&context_, &request, &rotated).ok());
    EXPECT_NE(rotated.tokens().refresh_token(), login.tokens().refresh_token());

    proto::auth::RefreshRequest replay;
    replay.set_refresh_token(login.tokens().refresh_token());
    replay.set_client_type("web");
    proto::auth::RefreshResponse in_grace;
    auto status = service_->Refresh(&context_, &replay, &in_grace);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(in_grace.error().code(), Code(AuthErrorCode::kReuseInGrace));

    h_.clock->Advance(5 * 60);
    proto::auth::RefreshResponse theft;
    status = service_->Refresh(&context_, &replay, &theft);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
    EXPECT_EQ(theft.error().code(), Code(AuthErrorCode::kTokenTheft));
}

TEST_F(AuthServiceImplTest, RefreshRejectsBadCsrf) {
    auto login = Login("password123");
    proto::auth::RefreshRequest request;
    request.set_refresh_token(login.tokens().refresh_token());
    request.set_client_type("web");
    request.set_csrf_token("forged");
    proto::auth::RefreshResponse response;
    service_->Refresh(&context_, &request, &response);
    EXPECT_EQ(response.error().code(), Code(AuthErrorCode::kInvalidCsrf));
}

TEST_F(AuthServiceImplTest, RejectedTokenUsesGenericMessage) {
    proto::auth::RefreshRequest request;
    request.set_refresh_token("unknown.token");
    request.set_client_type("mobile");
    proto::auth::RefreshResponse response;
    auto status = service_->Refresh(&context_, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
    EXPECT_EQ(response.error().code(), Code(AuthErrorCode::kTokenRejected));
    EXPECT_EQ(response.error().message(), endurain::core::kGenericTokenMessage);
}

TEST_F(AuthServiceImplTest, CreateOAuthStateValidation) {
    proto::auth::CreateOAuthStateRequest request;
    request.set_client_type("mobile");
    proto::auth::CreateOAuthStateResponse missing_nonce;
    service_->CreateOAuthState(&context_, &request, &missing_nonce);
    EXPECT_EQ(missing_nonce.error().code(), Code(AuthErrorCode::kInvalidRequest));

    request.set_nonce("nonce");
    proto::auth::CreateOAuthStateResponse missing_pkce;
    service_->CreateOAuthState(&context_, &request, &missing_pkce);
    EXPECT_EQ(missing_pkce.error().code(), Code(AuthErrorCode::kInvalidPkce));

    request.set_code_challenge("E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
    request.set_idp_id(4);
    proto::auth::CreateOAuthStateResponse created;
    ASSERT_TRUE(service_->CreateOAuthState(&context_, &request, &created).ok());
    EXPECT_FALSE(created.state_id().empty());

    proto::auth::ConsumeOAuthStateRequest consume;
    consume.set_state_id(created.state_id());
    proto::auth::ConsumeOAuthStateResponse state;
    ASSERT_TRUE(service_->ConsumeOAuthState(&context_, &consume, &state).ok());
    EXPECT_EQ(state.state().idp_id(), 4);
    EXPECT_EQ(state.state().client_type(), "mobile");
    EXPECT_EQ(state.state().code_challenge_method(), "S256");

    proto::auth::ConsumeOAuthStateResponse replay;
    service_->ConsumeOAuthState(&context_, &consume, &replay);
    EXPECT_EQ(replay.error().code(), Code(AuthErrorCode::kTokenRejected));
}

TEST_F(AuthServiceImplTest, LinkTokenRoundTrip) {
    proto::auth::IssueLinkTokenRequest issue;
    issue.set_user_id("user-alice");
    issue.set_idp_id(9);
    proto::auth::IssueLinkTokenResponse issued;
    ASSERT_TRUE(service_->IssueLinkToken(&context_, &issue, &issued).ok());

    proto::auth::ConsumeLinkTokenRequest consume;
    consume.set_token(issued.token());
    proto::auth::ConsumeLinkTokenResponse consumed;
    ASSERT_TRUE(service_->ConsumeLinkToken(&context_, &consume, &consumed).ok());
    EXPECT_EQ(consumed.user_id(), "user-alice");
    EXPECT_EQ(consumed.idp_id(), 9);

    proto::auth::IssueLinkTokenRequest anonymous;
    proto::auth::IssueLinkTokenResponse rejected;
    service_->IssueLinkToken(&context_, &anonymous, &rejected);
    EXPECT_EQ(rejected.error().code(), Code(AuthErrorCode::kInvalidRequest));
}

TEST_F(AuthServiceImplTest, BackupCodesDefaultCount) {
    proto::auth::GenerateBackupCodesRequest request;
    request.set_user_id("user-alice");
    proto::auth::GenerateBackupCodesResponse response;
    ASSERT_TRUE(service_->GenerateBackupCodes(&context_, &request, &response).ok());
    EXPECT_EQ(response.codes_size(), 10);

    proto::auth::GetBackupCodeStatusRequest status_request;
    status_request.set_user_id("user-alice");
    proto::auth::GetBackupCodeStatusResponse status;
    ASSERT_TRUE(service_->GetBackupCodeStatus(&context_, &status_request, &status).ok());
    EXPECT_TRUE(status.has_codes());
    EXPECT_EQ(status.unused(), 10);
}

TEST(AuthServiceImplStatusTest, InternalErrorsAreSanitized) {
    auto status = AuthServiceImpl::ToGrpcStatus(AuthErrorCode::kInternal,
                                                endurain::common::Status::Internal("db password leaked"));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(status.error_message(), endurain::core::kGenericInternalMessage);

    status = AuthServiceImpl::ToGrpcStatus(AuthErrorCode::kLockedOut,
                                           endurain::common::Status::ResourceExhausted("Try again"));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(status.error_message(), "Try again");
}
