#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/oauth/oauth_state_repository.hpp"
#include "core/session/session_repository.hpp"
#include "core/session/token_rotation.hpp"
#include "core/user/user_directory.hpp"
#include "crypto/hmac.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace endurain {
namespace core {

// 宽限期内重放的处理方式; 两种方式都不会重新下发被替换的旧令牌
enum class GracePolicy {
    kReject = 0,   // 不惩罚, 也不签发新令牌
    kRotate = 1,   // 从会话当前状态签发一次新的轮换
};

std::optional<GracePolicy> ParseGracePolicy(const std::string& text);

struct SessionManagerConfig {
    int refresh_token_ttl_days = 7;
    int access_token_ttl_minutes = 15;
    bool idle_timeout_enabled = false;
    int idle_timeout_hours = 24;
    int absolute_timeout_hours = 720;
    GracePolicy grace_policy = GracePolicy::kReject;
};

// 一次签发的令牌组
struct IssuedTokens {
    std::string session_id;
    std::string user_id;
    std::string access_token;
    std::int64_t access_token_expires_at = 0;
    std::string refresh_token;
    std::int64_t refresh_token_expires_at = 0;
    std::string csrf_token;
};

struct CreateSessionCommand {
    std::string user_id;
    ClientType client_type = ClientType::kWeb;
    std::string ip_address;
    std::string user_agent;
};

struct RefreshCommand {
    std::string refresh_token;
    ClientType client_type = ClientType::kWeb;
    std::optional<std::string> csrf_token;
    std::string ip_address;
    std::string user_agent;
};

class SessionManager {
public:
    using Status = common::Status;
    using StatusOrTokens = common::StatusOr<IssuedTokens>;

    SessionManager(std::shared_ptr<SessionRepository> repository,
                   std::shared_ptr<TokenReuseDetector> detector,
                   std::shared_ptr<OAuthStateRepository> oauth_states,
                   std::shared_ptr<const UserDirectory> users,
                   std::shared_ptr<const crypto::TokenHasher> hasher,
                   std::shared_ptr<const common::Clock> clock,
                   SessionManagerConfig config = {});

    // 登录成功后创建会话与新的令牌家族
    StatusOrTokens CreateSession(const CreateSessionCommand& command);

    // 移动端 PKCE 登录: 会话先不带令牌, 由 ExchangeTokens 一次性签发
    common::StatusOr<std::string> CreatePendingSession(const CreateSessionCommand& command,
                                                       const std::string& oauth_state_id);

    // 刷新并轮换 refresh 令牌, 包含重用检测与家族失效
    StatusOrTokens Refresh(const RefreshCommand& command);

    // 会话不存在视为已登出
    Status Logout(const std::string& refresh_token);

    // 校验 code_verifier 后为待交换会话签发令牌, 每个会话只能成功一次
    StatusOrTokens ExchangeTokens(const std::string& session_id, const std::string& code_verifier);

    // 标记已交换并删除关联的 OAuth 状态; 重复调用返回 kTokenRejected
    Status MarkTokensExchanged(const std::string& session_id);

    common::StatusOr<std::vector<Session>> ListUserSessions(const std::string& user_id);

    // 未开启空闲超时时只清理已过期的会话
    common::StatusOr<std::size_t> DeleteIdleSessions();

    // refresh 令牌格式: <session_id>.<secret>
    static bool ParseRefreshToken(const std::string& refresh_token, std::string* session_id);

private:
    struct MintedTokens {
        IssuedTokens tokens;
        std::string refresh_token_hash;
        std::string csrf_token_hash;
    };

    common::StatusOr<MintedTokens> MintTokens(const std::string& session_id, const std::string& user_id) const;
    // 常量时间比较原始令牌与存储的哈希
    common::StatusOr<bool> HashMatches(const std::string& raw_token, const std::string& stored_hash) const;
    // 空闲与绝对超时检查
    bool IsTimedOut(const Session& session, std::int64_t now) const;
    Status CheckUserActive(const std::string& user_id) const;
    StatusOrTokens RotateSession(const Session& session, const RefreshCommand& command);
    void DeleteLinkedOAuthState(const std::optional<std::string>& oauth_state_id);

    std::shared_ptr<SessionRepository> repository_;
    std::shared_ptr<TokenReuseDetector> detector_;
    std::shared_ptr<OAuthStateRepository> oauth_states_;
    std::shared_ptr<const UserDirectory> users_;
    std::shared_ptr<const crypto::TokenHasher> hasher_;
    std::shared_ptr<const common::Clock> clock_;
    SessionManagerConfig config_;
};

}
}
