#include "core/auth/auth_service.hpp"

#include "common/logger.hpp"
#include "core/auth/errors.hpp"

#include <fmt/format.h>

namespace endurain {
namespace core {

namespace {

// 口令登录 PKCE 流程的 OAuth 状态没有 IdP, 用固定 nonce 标识
constexpr char kPasswordAuthNonce[] = "password_auth";

common::Status InternalError(const std::string& context, const common::Status& status) {
    ENDURAIN_LOG_ERROR("{}: {}", context, status.Message());
    return FromAuthError(AuthErrorCode::kInternal);
}

}

AuthService::AuthService(AuthComponents components, crypto::TotpParams totp_params)
    : components_(std::move(components)), totp_params_(totp_params) {}

AuthService::Status AuthService::LockedOutError(MfaLockoutGuard& guard, const std::string& user_name) {
    auto until = guard.GetLockoutTime(user_name);
    if (!until.IsOk()) {
        return InternalError("Failed to read lockout time", until.GetStatus());
    }
    std::int64_t remaining = 0;
    if (until.Value()) {
        remaining = *until.Value() - components_.clock->NowSeconds();
        if (remaining < 0) {
            remaining = 0;
        }
    }
    return FromAuthError(AuthErrorCode::kLockedOut,
                         fmt::format("Too many failed attempts. Try again in {} seconds", remaining));
}

AuthService::StatusOrLogin AuthService::Login(const LoginCommand& command) {
    auto locked = components_.login_guard->IsLockedOut(command.user_name);
    if (!locked.IsOk()) {
        return InternalError("Login lockout check failed", locked.GetStatus());
    }
    if (locked.Value()) {
        ENDURAIN_LOG_WARN("Login rejected for locked user {}", command.user_name);
        return LockedOutError(*components_.login_guard, command.user_name);
    }

    auto user = components_.users->FindByUserName(command.user_name);
    if (!user.IsOk() && user.GetStatus().Code() != common::StatusCode::kNotFound) {
        return InternalError("User lookup failed", user.GetStatus());
    }
    // 用户不存在与口令错误走同一路径
    if (!user.IsOk() || !components_.password_hasher->Verify(command.password, user.Value().password_hash)) {
        auto count = components_.login_guard->RecordFailedAttempt(command.user_name);
        if (!count.IsOk()) {
            return InternalError("Failed to record login failure", count.GetStatus());
        }
        ENDURAIN_LOG_WARN("Failed login for {} ({} attempts)", command.user_name, count.Value());
        return FromAuthError(AuthErrorCode::kInvalidCredentials);
    }
    const UserRecord& record = user.Value();
    if (!record.active) {
        ENDURAIN_LOG_WARN("Login attempt for inactive user {}", record.id);
        return FromAuthError(AuthErrorCode::kInvalidCredentials);
    }
    auto status = components_.login_guard->ResetFailedAttempts(command.user_name);
    if (!status.IsOk()) {
        return InternalError("Failed to reset login attempts", status);
    }

    if (record.mfa_enabled) {
        status = components_.mfa_guard->AddPendingLogin(command.user_name, record.id);
        if (!status.IsOk()) {
            return InternalError("Failed to store pending MFA login", status);
        }
        ENDURAIN_LOG_INFO("User {} passed password check, MFA pending", record.id);
        LoginResult result;
        result.mfa_required = true;
        result.user_id = record.id;
        return StatusOrLogin(std::move(result));
    }
    return IssueForUser(record.id, command.client_type, command.ip_address, command.user_agent,
                        command.code_challenge, command.code_challenge_method);
}

AuthService::StatusOrLogin AuthService::VerifyMfa(const VerifyMfaCommand& command) {
    // 锁定期内不看验证码是否正确
    auto locked = components_.mfa_guard->IsLockedOut(command.user_name);
    if (!locked.IsOk()) {
        return InternalError("MFA lockout check failed", locked.GetStatus());
    }
    if (locked.Value()) {
        ENDURAIN_LOG_WARN("MFA verification rejected for locked user {}", command.user_name);
        return LockedOutError(*components_.mfa_guard, command.user_name);
    }

    auto pending = components_.mfa_guard->GetPendingLogin(command.user_name);
    if (!pending.IsOk()) {
        if (pending.GetStatus().Code() == common::StatusCode::kNotFound) {
            return FromAuthError(AuthErrorCode::kNoPendingLogin);
        }
        return InternalError("Failed to load pending MFA login", pending.GetStatus());
    }
    auto user = components_.users->FindById(pending.Value());
    if (!user.IsOk()) {
        if (user.GetStatus().Code() != common::StatusCode::kNotFound) {
            return InternalError("User lookup failed", user.GetStatus());
        }
        auto deleted = components_.mfa_guard->DeletePendingLogin(command.user_name);
        if (!deleted.IsOk()) {
            ENDURAIN_LOG_WARN("Failed to drop pending login for {}: {}", command.user_name, deleted.Message());
        }
        return FromAuthError(AuthErrorCode::kInvalidCredentials);
    }
    if (!user.Value().active) {
        return FromAuthError(AuthErrorCode::kInvalidCredentials);
    }

    auto verified = VerifySecondFactor(user.Value(), command.code);
    if (!verified.IsOk()) {
        return InternalError("Second factor verification failed", verified.GetStatus());
    }
    if (!verified.Value()) {
        auto count = components_.mfa_guard->RecordFailedAttempt(command.user_name);
        if (!count.IsOk()) {
            return InternalError("Failed to record MFA failure", count.GetStatus());
        }
        ENDURAIN_LOG_WARN("Invalid MFA code for {} ({} attempts)", command.user_name, count.Value());
        return FromAuthError(AuthErrorCode::kInvalidCredentials, "Invalid MFA code");
    }

    auto status = components_.mfa_guard->ResetFailedAttempts(command.user_name);
    if (status.IsOk()) {
        status = components_.login_guard->ResetFailedAttempts(command.user_name);
    }
    if (status.IsOk()) {
        status = components_.mfa_guard->DeletePendingLogin(command.user_name);
    }
    if (!status.IsOk()) {
        return InternalError("Failed to clear MFA state", status);
    }
    ENDURAIN_LOG_INFO("MFA verified for user {}", user.Value().id);
    return IssueForUser(user.Value().id, command.client_type, command.ip_address, command.user_agent,
                        command.code_challenge, command.code_challenge_method);
}

common::StatusOr<bool> AuthService::VerifySecondFactor(const UserRecord& user, const std::string& code) {
    if (BackupCodeVault::LooksLikeBackupCode(code)) {
        return components_.backup_codes->VerifyAndConsume(user.id, code);
    }
    if (user.totp_secret.empty()) {
        ENDURAIN_LOG_WARN("User {} has MFA enabled without a TOTP secret", user.id);
        return common::StatusOr<bool>(false);
    }
    return common::StatusOr<bool>(
        crypto::VerifyTotp(user.totp_secret, code, components_.clock->NowSeconds(), totp_params_));
}

AuthService::StatusOrLogin AuthService::IssueForUser(const std::string& user_id, ClientType client_type,
                                                     const std::string& ip_address, const std::string& user_agent,
                                                     const std::optional<std::string>& code_challenge,
                                                     const std::string& code_challenge_method) {
    CreateSessionCommand session_command;
    session_command.user_id = user_id;
    session_command.client_type = client_type;
    session_command.ip_address = ip_address;
    session_command.user_agent = user_agent;

    LoginResult result;
    result.user_id = user_id;

    if (client_type == ClientType::kMobile && code_challenge) {
        CreateOAuthStateCommand state_command;
        state_command.nonce = kPasswordAuthNonce;
        state_command.client_type = ClientType::kMobile;
        state_command.code_challenge = code_challenge;
        state_command.code_challenge_method = code_challenge_method;
        state_command.user_id = user_id;
        state_command.ip_address = ip_address;
        auto state_id = components_.oauth_states->Create(state_command);
        if (!state_id.IsOk()) {
            if (state_id.GetStatus().Code() == common::StatusCode::kInvalidArgument) {
                return FromAuthError(AuthErrorCode::kInvalidPkce, state_id.GetStatus().Message());
            }
            return InternalError("Failed to create PKCE state", state_id.GetStatus());
        }
        auto session_id = components_.sessions->CreatePendingSession(session_command, state_id.Value());
        if (!session_id.IsOk()) {
            auto deleted = components_.oauth_states->Delete(state_id.Value());
            if (!deleted.IsOk()) {
                ENDURAIN_LOG_WARN("Failed to drop orphan OAuth state: {}", deleted.Message());
            }
            return session_id.GetStatus();
        }
        result.pending_session_id = session_id.Value();
        return StatusOrLogin(std::move(result));
    }

    auto tokens = components_.sessions->CreateSession(session_command);
    if (!tokens.IsOk()) {
        return tokens.GetStatus();
    }
    result.tokens = std::move(tokens).Value();
    return StatusOrLogin(std::move(result));
}

SessionManager::StatusOrTokens AuthService::Refresh(const RefreshCommand& command) {
    return components_.sessions->Refresh(command);
}

AuthService::Status AuthService::Logout(const std::string& refresh_token) {
    return components_.sessions->Logout(refresh_token);
}

SessionManager::StatusOrTokens AuthService::ExchangeTokens(const std::string& session_id,
                                                           const std::string& code_verifier) {
    return components_.sessions->ExchangeTokens(session_id, code_verifier);
}

common::StatusOr<std::string> AuthService::CreateOAuthState(const CreateOAuthStateCommand& command) {
    return components_.oauth_states->Create(command);
}

common::StatusOr<OAuthState> AuthService::ConsumeOAuthState(const std::string& state_id) {
    auto state = components_.oauth_states->Consume(state_id);
    if (!state.IsOk() && state.GetStatus().Code() == common::StatusCode::kNotFound) {
        return FromAuthError(AuthErrorCode::kTokenRejected);
    }
    return state;
}

common::StatusOr<IssuedLinkToken> AuthService::IssueLinkToken(const std::string& user_id, std::int64_t idp_id,
                                                              const std::optional<std::string>& ip_address) {
    return components_.link_tokens->Issue(user_id, idp_id, ip_address);
}

common::StatusOr<IdpLinkToken> AuthService::ConsumeLinkToken(const std::string& token_id) {
    auto token = components_.link_tokens->Consume(token_id);
    if (!token.IsOk() && token.GetStatus().Code() == common::StatusCode::kNotFound) {
        return FromAuthError(AuthErrorCode::kTokenRejected);
    }
    return token;
}

common::StatusOr<std::vector<std::string>> AuthService::GenerateBackupCodes(const std::string& user_id, int count) {
    return components_.backup_codes->Generate(user_id, count);
}

common::StatusOr<BackupCodeStatus> AuthService::GetBackupCodeStatus(const std::string& user_id) {
    return components_.backup_codes->GetStatus(user_id);
}

AuthService::Status AuthService::CancelPendingMfa(const std::string& user_name) {
    return components_.mfa_guard->DeletePendingLogin(user_name);
}

}
}
