#include "server/auth_service_impl.hpp"

#include "common/logger.hpp"

#include <optional>
#include <string>

namespace endurain {
namespace server {

namespace {

using common::StatusCode;
using core::AuthErrorCode;

void FillTokens(const core::IssuedTokens& tokens, proto::auth::TokenBundle* bundle) {
    bundle->set_session_id(tokens.session_id);
    bundle->set_user_id(tokens.user_id);
    bundle->set_access_token(tokens.access_token);
    bundle->set_access_token_expires_at(tokens.access_token_expires_at);
    bundle->set_refresh_token(tokens.refresh_token);
    bundle->set_refresh_token_expires_at(tokens.refresh_token_expires_at);
    bundle->set_csrf_token(tokens.csrf_token);
}

std::optional<std::string> OptionalField(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string MethodOrDefault(const std::string& method) {
    return method.empty() ? std::string("S256") : method;
}

// 出错时填充 error 并返回对应的 gRPC 状态
template <typename Response>
grpc::Status Fail(AuthErrorCode error, const common::Status& status, Response* response) {
    core::ErrorToProto(error, status, response->mutable_error());
    return AuthServiceImpl::ToGrpcStatus(error, status);
}

template <typename Response>
void MarkOk(Response* response) {
    core::ErrorToProto(AuthErrorCode::kOk, common::Status::OK(), response->mutable_error());
}

// 登录与 MFA 共用的错误映射
AuthErrorCode LoginError(const common::Status& status) {
    switch (status.Code()) {
        case StatusCode::kUnauthenticated:
            return AuthErrorCode::kInvalidCredentials;
        case StatusCode::kResourceExhausted:
            return AuthErrorCode::kLockedOut;
        case StatusCode::kNotFound:
            return AuthErrorCode::kNoPendingLogin;
        case StatusCode::kInvalidArgument:
            return AuthErrorCode::kInvalidPkce;
        default:
            return AuthErrorCode::kInternal;
    }
}

}

AuthServiceImpl::AuthServiceImpl(std::shared_ptr<core::AuthService> auth)
    : auth_(std::move(auth)) {}

grpc::Status AuthServiceImpl::Login(grpc::ServerContext*,
                                    const proto::auth::LoginRequest* request,
                                    proto::auth::LoginResponse* response) {
    auto client_type = core::ParseClientType(request->client_type());
    if (!client_type) {
        return Fail(AuthErrorCode::kInvalidClientType, core::FromAuthError(AuthErrorCode::kInvalidClientType),
                    response);
    }
    ENDURAIN_LOG_INFO("[AuthService] Login user={} client={}", request->username(), request->client_type());

    core::LoginCommand command;
    command.user_name = request->username();
    command.password = request->password();
    command.client_type = *client_type;
    command.ip_address = request->ip_address();
    command.user_agent = request->user_agent();
    command.code_challenge = OptionalField(request->code_challenge());
    command.code_challenge_method = MethodOrDefault(request->code_challenge_method());

    auto result = auth_->Login(command);
    if (!result.IsOk()) {
        return Fail(LoginError(result.GetStatus()), result.GetStatus(), response);
    }
    const auto& login = result.Value();
    response->set_mfa_required(login.mfa_required);
    response->set_user_id(login.user_id);
    if (login.tokens) {
        FillTokens(*login.tokens, response->mutable_tokens());
    }
    if (login.pending_session_id) {
        response->set_pending_session_id(*login.pending_session_id);
    }
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::VerifyMfa(grpc::ServerContext*,
                                        const proto::auth::VerifyMfaRequest* request,
                                        proto::auth::VerifyMfaResponse* response) {
    auto client_type = core::ParseClientType(request->client_type());
    if (!client_type) {
        return Fail(AuthErrorCode::kInvalidClientType, core::FromAuthError(AuthErrorCode::kInvalidClientType),
                    response);
    }
    ENDURAIN_LOG_INFO("[AuthService] VerifyMfa user={}", request->username());

    core::VerifyMfaCommand command;
    command.user_name = request->username();
    command.code = request->code();
    command.client_type = *client_type;
    command.ip_address = request->ip_address();
    command.user_agent = request->user_agent();
    command.code_challenge = OptionalField(request->code_challenge());
    command.code_challenge_method = MethodOrDefault(request->code_challenge_method());

    auto result = auth_->VerifyMfa(command);
    if (!result.IsOk()) {
        return Fail(LoginError(result.GetStatus()), result.GetStatus(), response);
    }
    const auto& login = result.Value();
    response->set_user_id(login.user_id);
    if (login.tokens) {
        FillTokens(*login.tokens, response->mutable_tokens());
    }
    if (login.pending_session_id) {
        response->set_pending_session_id(*login.pending_session_id);
    }
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::Refresh(grpc::ServerContext*,
                                      const proto::auth::RefreshRequest* request,
                                      proto::auth::RefreshResponse* response) {
    auto client_type = core::ParseClientType(request->client_type());
    if (!client_type) {
        return Fail(AuthErrorCode::kInvalidClientType, core::FromAuthError(AuthErrorCode::kInvalidClientType),
                    response);
    }
    core::RefreshCommand command;
    command.refresh_token = request->refresh_token();
    command.client_type = *client_type;
    if (request->has_csrf_token()) {
        command.csrf_token = request->csrf_token();
    }
    command.ip_address = request->ip_address();
    command.user_agent = request->user_agent();

    auto tokens = auth_->Refresh(command);
    if (!tokens.IsOk()) {
        const auto& status = tokens.GetStatus();
        AuthErrorCode error = AuthErrorCode::kInternal;
        switch (status.Code()) {
            case StatusCode::kUnauthenticated:
                error = AuthErrorCode::kTokenRejected;
                break;
            case StatusCode::kFailedPrecondition:
                error = AuthErrorCode::kReuseInGrace;
                break;
            case StatusCode::kPermissionDenied:
                error = AuthErrorCode::kTokenTheft;
                break;
            case StatusCode::kInvalidArgument:
                error = AuthErrorCode::kInvalidCsrf;
                break;
            default:
                error = AuthErrorCode::kInternal;
                break;
        }
        return Fail(error, status, response);
    }
    FillTokens(tokens.Value(), response->mutable_tokens());
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::Logout(grpc::ServerContext*,
                                     const proto::auth::LogoutRequest* request,
                                     proto::auth::LogoutResponse* response) {
    auto status = auth_->Logout(request->refresh_token());
    if (!status.IsOk()) {
        AuthErrorCode error = status.Code() == StatusCode::kUnauthenticated ? AuthErrorCode::kTokenRejected
                                                                            : AuthErrorCode::kInternal;
        return Fail(error, status, response);
    }
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::ExchangeTokens(grpc::ServerContext*,
                                             const proto::auth::ExchangeTokensRequest* request,
                                             proto::auth::ExchangeTokensResponse* response) {
    ENDURAIN_LOG_INFO("[AuthService] ExchangeTokens session={}", common::Redact(request->session_id()));
    auto tokens = auth_->ExchangeTokens(request->session_id(), request->code_verifier());
    if (!tokens.IsOk()) {
        const auto& status = tokens.GetStatus();
        AuthErrorCode error = AuthErrorCode::kInternal;
        switch (status.Code()) {
            case StatusCode::kUnauthenticated:
                error = AuthErrorCode::kTokenRejected;
                break;
            case StatusCode::kInvalidArgument:
                error = AuthErrorCode::kInvalidPkce;
                break;
            default:
                error = AuthErrorCode::kInternal;
                break;
        }
        return Fail(error, status, response);
    }
    FillTokens(tokens.Value(), response->mutable_tokens());
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::CreateOAuthState(grpc::ServerContext*,
                                               const proto::auth::CreateOAuthStateRequest* request,
                                               proto::auth::CreateOAuthStateResponse* response) {
    auto client_type = core::ParseClientType(request->client_type());
    if (!client_type) {
        return Fail(AuthErrorCode::kInvalidClientType, core::FromAuthError(AuthErrorCode::kInvalidClientType),
                    response);
    }
    if (request->nonce().empty()) {
        return Fail(AuthErrorCode::kInvalidRequest,
                    core::FromAuthError(AuthErrorCode::kInvalidRequest, "OAuth nonce is required"), response);
    }
    core::CreateOAuthStateCommand command;
    if (request->has_idp_id()) {
        command.idp_id = request->idp_id();
    }
    command.nonce = request->nonce();
    command.client_type = *client_type;
    command.code_challenge = OptionalField(request->code_challenge());
    command.code_challenge_method = MethodOrDefault(request->code_challenge_method());
    command.redirect_path = OptionalField(request->redirect_path());
    command.user_id = OptionalField(request->user_id());
    command.ip_address = OptionalField(request->ip_address());

    auto state_id = auth_->CreateOAuthState(command);
    if (!state_id.IsOk()) {
        // nonce 已在上面校验, 剩下的参数错误都来自 PKCE
        AuthErrorCode error = state_id.GetStatus().Code() == StatusCode::kInvalidArgument
                                  ? AuthErrorCode::kInvalidPkce
                                  : AuthErrorCode::kInternal;
        return Fail(error, state_id.GetStatus(), response);
    }
    response->set_state_id(state_id.Value());
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::ConsumeOAuthState(grpc::ServerContext*,
                                                const proto::auth::ConsumeOAuthStateRequest* request,
                                                proto::auth::ConsumeOAuthStateResponse* response) {
    auto state = auth_->ConsumeOAuthState(request->state_id());
    if (!state.IsOk()) {
        AuthErrorCode error = state.GetStatus().Code() == StatusCode::kUnauthenticated
                                  ? AuthErrorCode::kTokenRejected
                                  : AuthErrorCode::kInternal;
        return Fail(error, state.GetStatus(), response);
    }
    const auto& value = state.Value();
    auto* info = response->mutable_state();
    info->set_id(value.id);
    if (value.idp_id) {
        info->set_idp_id(*value.idp_id);
    }
    info->set_user_id(value.user_id.value_or(""));
    info->set_nonce(value.nonce);
    info->set_code_challenge(value.code_challenge.value_or(""));
    info->set_code_challenge_method(value.code_challenge_method.value_or(""));
    info->set_redirect_path(value.redirect_path.value_or(""));
    info->set_client_type(core::ClientTypeToString(value.client_type));
    info->set_created_at(value.created_at);
    info->set_expires_at(value.expires_at);
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::IssueLinkToken(grpc::ServerContext*,
                                             const proto::auth::IssueLinkTokenRequest* request,
                                             proto::auth::IssueLinkTokenResponse* response) {
    auto issued = auth_->IssueLinkToken(request->user_id(), request->idp_id(), OptionalField(request->ip_address()));
    if (!issued.IsOk()) {
        AuthErrorCode error = issued.GetStatus().Code() == StatusCode::kInvalidArgument
                                  ? AuthErrorCode::kInvalidRequest
                                  : AuthErrorCode::kInternal;
        return Fail(error, issued.GetStatus(), response);
    }
    response->set_token(issued.Value().token);
    response->set_expires_at(issued.Value().expires_at);
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::ConsumeLinkToken(grpc::ServerContext*,
                                               const proto::auth::ConsumeLinkTokenRequest* request,
                                               proto::auth::ConsumeLinkTokenResponse* response) {
    auto token = auth_->ConsumeLinkToken(request->token());
    if (!token.IsOk()) {
        AuthErrorCode error = token.GetStatus().Code() == StatusCode::kUnauthenticated
                                  ? AuthErrorCode::kTokenRejected
                                  : AuthErrorCode::kInternal;
        return Fail(error, token.GetStatus(), response);
    }
    response->set_user_id(token.Value().user_id);
    response->set_idp_id(token.Value().idp_id);
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::GenerateBackupCodes(grpc::ServerContext*,
                                                  const proto::auth::GenerateBackupCodesRequest* request,
                                                  proto::auth::GenerateBackupCodesResponse* response) {
    int count = request->count() == 0 ? core::BackupCodeVault::kDefaultCodeCount : request->count();
    ENDURAIN_LOG_INFO("[AuthService] GenerateBackupCodes user={} count={}", request->user_id(), count);
    auto codes = auth_->GenerateBackupCodes(request->user_id(), count);
    if (!codes.IsOk()) {
        AuthErrorCode error = codes.GetStatus().Code() == StatusCode::kInvalidArgument
                                  ? AuthErrorCode::kInvalidRequest
                                  : AuthErrorCode::kInternal;
        return Fail(error, codes.GetStatus(), response);
    }
    for (const auto& code : codes.Value()) {
        response->add_codes(code);
    }
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::GetBackupCodeStatus(grpc::ServerContext*,
                                                  const proto::auth::GetBackupCodeStatusRequest* request,
                                                  proto::auth::GetBackupCodeStatusResponse* response) {
    auto status = auth_->GetBackupCodeStatus(request->user_id());
    if (!status.IsOk()) {
        return Fail(AuthErrorCode::kInternal, status.GetStatus(), response);
    }
    const auto& value = status.Value();
    response->set_has_codes(value.has_codes);
    response->set_total(value.total);
    response->set_used(value.used);
    response->set_unused(value.unused);
    response->set_created_at(value.created_at.value_or(0));
    MarkOk(response);
    return grpc::Status::OK;
}

grpc::Status AuthServiceImpl::ToGrpcStatus(core::AuthErrorCode error, const common::Status& status) {
    if (error == AuthErrorCode::kOk) {
        return grpc::Status::OK;
    }
    if (error == AuthErrorCode::kInternal) {
        return {grpc::StatusCode::INTERNAL, core::kGenericInternalMessage};
    }
    if (error == AuthErrorCode::kTokenRejected) {
        return {grpc::StatusCode::UNAUTHENTICATED, core::kGenericTokenMessage};
    }
    switch (status.Code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
            return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kNotFound:
            return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
            return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
            return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kResourceExhausted:
            return {grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message()};
        case StatusCode::kFailedPrecondition:
            return {grpc::StatusCode::FAILED_PRECONDITION, status.Message()};
        case StatusCode::kUnauthenticated:
            return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kInternal:
        case StatusCode::kUnavailable:
            return {grpc::StatusCode::INTERNAL, core::kGenericInternalMessage};
    }
    return {grpc::StatusCode::UNKNOWN, core::kGenericInternalMessage};
}

}
}
