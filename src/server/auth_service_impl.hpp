#pragma once

#include "core/auth/auth_service.hpp"
#include "core/auth/errors.hpp"

#include "auth_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <memory>

namespace endurain {
namespace server {

class AuthServiceImpl final : public proto::auth::AuthService::Service {
public:
    explicit AuthServiceImpl(std::shared_ptr<core::AuthService> auth);

    grpc::Status Login(grpc::ServerContext* context,
                       const proto::auth::LoginRequest* request,
                       proto::auth::LoginResponse* response) override;

    grpc::Status VerifyMfa(grpc::ServerContext* context,
                           const proto::auth::VerifyMfaRequest* request,
                           proto::auth::VerifyMfaResponse* response) override;

    grpc::Status Refresh(grpc::ServerContext* context,
                         const proto::auth::RefreshRequest* request,
                         proto::auth::RefreshResponse* response) override;

    grpc::Status Logout(grpc::ServerContext* context,
                        const proto::auth::LogoutRequest* request,
                        proto::auth::LogoutResponse* response) override;

    grpc::Status ExchangeTokens(grpc::ServerContext* context,
                                const proto::auth::ExchangeTokensRequest* request,
                                proto::auth::ExchangeTokensResponse* response) override;

    grpc::Status CreateOAuthState(grpc::ServerContext* context,
                                  const proto::auth::CreateOAuthStateRequest* request,
                                  proto::auth::CreateOAuthStateResponse* response) override;

    grpc::Status ConsumeOAuthState(grpc::ServerContext* context,
                                   const proto::auth::ConsumeOAuthStateRequest* request,
                                   proto::auth::ConsumeOAuthStateResponse* response) override;

    grpc::Status IssueLinkToken(grpc::ServerContext* context,
                                const proto::auth::IssueLinkTokenRequest* request,
                                proto::auth::IssueLinkTokenResponse* response) override;

    grpc::Status ConsumeLinkToken(grpc::ServerContext* context,
                                  const proto::auth::ConsumeLinkTokenRequest* request,
                                  proto::auth::ConsumeLinkTokenResponse* response) override;

    grpc::Status GenerateBackupCodes(grpc::ServerContext* context,
                                     const proto::auth::GenerateBackupCodesRequest* request,
                                     proto::auth::GenerateBackupCodesResponse* response) override;

    grpc::Status GetBackupCodeStatus(grpc::ServerContext* context,
                                     const proto::auth::GetBackupCodeStatusRequest* request,
                                     proto::auth::GetBackupCodeStatusResponse* response) override;

    // 内部错误只暴露通用信息
    static grpc::Status ToGrpcStatus(core::AuthErrorCode error, const common::Status& status);

private:
    std::shared_ptr<core::AuthService> auth_;
};

}
}
