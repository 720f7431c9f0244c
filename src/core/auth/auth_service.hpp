#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/link/link_token_issuer.hpp"
#include "core/mfa/backup_code_vault.hpp"
#include "core/mfa/mfa_lockout_guard.hpp"
#include "core/oauth/oauth_state_manager.hpp"
#include "core/session/session_manager.hpp"
#include "core/user/user_directory.hpp"
#include "crypto/password_hasher.hpp"
#include "crypto/totp.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace endurain {
namespace core {

struct LoginCommand {
    std::string user_name;
    std::string password;
    ClientType client_type = ClientType::kWeb;
    std::string ip_address;
    std::string user_agent;
    // 移动端 PKCE 登录
    std::optional<std::string> code_challenge;
    std::string code_challenge_method = "S256";
};

struct VerifyMfaCommand {
    std::string user_name;
    std::string code;   // TOTP 或 XXXX-XXXX 备用码
    ClientType client_type = ClientType::kWeb;
    std::string ip_address;
    std::string user_agent;
    std::optional<std::string> code_challenge;
    std::string code_challenge_method = "S256";
};

// 登录结果三选一: 需要 MFA, 直接签发令牌, 或等待 PKCE 交换的会话
struct LoginResult {
    bool mfa_required = false;
    std::string user_id;
    std::optional<IssuedTokens> tokens;
    std::optional<std::string> pending_session_id;
};

struct AuthComponents {
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<OAuthStateManager> oauth_states;
    std::shared_ptr<LinkTokenIssuer> link_tokens;
    std::shared_ptr<BackupCodeVault> backup_codes;
    std::shared_ptr<MfaLockoutGuard> mfa_guard;
    std::shared_ptr<MfaLockoutGuard> login_guard;
    std::shared_ptr<const UserDirectory> users;
    std::shared_ptr<const crypto::PasswordHasher> password_hasher;
    std::shared_ptr<const common::Clock> clock;
};

// 认证流程编排, 把登录, MFA, 刷新和 OAuth 辅助流程串到各组件上
class AuthService {
public:
    using Status = common::Status;
    using StatusOrLogin = common::StatusOr<LoginResult>;

    explicit AuthService(AuthComponents components, crypto::TotpParams totp_params = {});

    StatusOrLogin Login(const LoginCommand& command);
    StatusOrLogin VerifyMfa(const VerifyMfaCommand& command);

    SessionManager::StatusOrTokens Refresh(const RefreshCommand& command);
    Status Logout(const std::string& refresh_token);
    SessionManager::StatusOrTokens ExchangeTokens(const std::string& session_id, const std::string& code_verifier);

    common::StatusOr<std::string> CreateOAuthState(const CreateOAuthStateCommand& command);
    common::StatusOr<OAuthState> ConsumeOAuthState(const std::string& state_id);

    common::StatusOr<IssuedLinkToken> IssueLinkToken(const std::string& user_id, std::int64_t idp_id,
                                                     const std::optional<std::string>& ip_address);
    common::StatusOr<IdpLinkToken> ConsumeLinkToken(const std::string& token_id);

    common::StatusOr<std::vector<std::string>> GenerateBackupCodes(const std::string& user_id, int count);
    common::StatusOr<BackupCodeStatus> GetBackupCodeStatus(const std::string& user_id);

    // 放弃进行中的 MFA 登录
    Status CancelPendingMfa(const std::string& user_name);

private:
    Status LockedOutError(MfaLockoutGuard& guard, const std::string& user_name);
    StatusOrLogin IssueForUser(const std::string& user_id, ClientType client_type, const std::string& ip_address,
                               const std::string& user_agent, const std::optional<std::string>& code_challenge,
                               const std::string& code_challenge_method);
    common::StatusOr<bool> VerifySecondFactor(const UserRecord& user, const std::string& code);

    AuthComponents components_;
    crypto::TotpParams totp_params_;
};

}
}
