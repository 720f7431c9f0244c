#include "core/session/session_manager.hpp"

#include "common/logger.hpp"
#include "core/auth/errors.hpp"
#include "crypto/pkce.hpp"
#include "crypto/random.hpp"

#include <limits>

namespace endurain {
namespace core {

namespace {

constexpr std::int64_t kSecondsPerHour = 3600;
constexpr std::int64_t kSecondsPerDay = 86400;

common::Status Rejected() {
    return FromAuthError(AuthErrorCode::kTokenRejected);
}

common::Status Internal(const std::string& context, const common::Status& status) {
    ENDURAIN_LOG_ERROR("{}: {}", context, status.Message());
    return FromAuthError(AuthErrorCode::kInternal);
}

} // namespace

std::optional<GracePolicy> ParseGracePolicy(const std::string& text) {
    if (text == "reject") {
        return GracePolicy::kReject;
    }
    if (text == "rotate") {
        return GracePolicy::kRotate;
    }
    return std::nullopt;
}

SessionManager::SessionManager(std::shared_ptr<SessionRepository> repository,
                               std::shared_ptr<TokenReuseDetector> detector,
                               std::shared_ptr<OAuthStateRepository> oauth_states,
                               std::shared_ptr<const UserDirectory> users,
                               std::shared_ptr<const crypto::TokenHasher> hasher,
                               std::shared_ptr<const common::Clock> clock,
                               SessionManagerConfig config)
    : repository_(std::move(repository)),
      detector_(std::move(detector)),
      oauth_states_(std::move(oauth_states)),
      users_(std::move(users)),
      hasher_(std::move(hasher)),
      clock_(std::move(clock)),
      config_(config) {}

bool SessionManager::ParseRefreshToken(const std::string& refresh_token, std::string* session_id) {
    auto dot = refresh_token.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= refresh_token.size()) {
        return false;
    }
    if (session_id != nullptr) {
        *session_id = refresh_token.substr(0, dot);
    }
    return true;
}

common::StatusOr<SessionManager::MintedTokens> SessionManager::MintTokens(const std::string& session_id,
                                                                          const std::string& user_id) const {
    auto secret = crypto::TokenUrlSafe(32);
    auto access = crypto::TokenUrlSafe(32);
    auto csrf = crypto::TokenUrlSafe(32);
    if (!secret.IsOk() || !access.IsOk() || !csrf.IsOk()) {
        return Status::Internal("Failed to generate random tokens");
    }
    std::int64_t now = clock_->NowSeconds();

    MintedTokens minted;
    minted.tokens.session_id = session_id;
    minted.tokens.user_id = user_id;
    minted.tokens.access_token = access.Value();
    minted.tokens.access_token_expires_at = now + static_cast<std::int64_t>(config_.access_token_ttl_minutes) * 60;
    minted.tokens.refresh_token = session_id + "." + secret.Value();
    minted.tokens.refresh_token_expires_at = now + config_.refresh_token_ttl_days * kSecondsPerDay;
    minted.tokens.csrf_token = csrf.Value();
    auto refresh_hash = hasher_->Hash(minted.tokens.refresh_token);
    if (!refresh_hash.IsOk()) {
        return refresh_hash.GetStatus();
    }
    auto csrf_hash = hasher_->Hash(minted.tokens.csrf_token);
    if (!csrf_hash.IsOk()) {
        return csrf_hash.GetStatus();
    }
    minted.refresh_token_hash = refresh_hash.Value();
    minted.csrf_token_hash = csrf_hash.Value();
    return common::StatusOr<MintedTokens>(std::move(minted));
}

common::StatusOr<bool> SessionManager::HashMatches(const std::string& raw_token, const std::string& stored_hash) const {
    auto hashed = hasher_->Hash(raw_token);
    if (!hashed.IsOk()) {
        return hashed.GetStatus();
    }
    return common::StatusOr<bool>(crypto::ConstantTimeEquals(hashed.Value(), stored_hash));
}

bool SessionManager::IsTimedOut(const Session& session, std::int64_t now) const {
    if (now > session.expires_at) {
        return true;
    }
    if (!config_.idle_timeout_enabled) {
        return false;
    }
    if (now > session.last_activity_at + config_.idle_timeout_hours * kSecondsPerHour) {
        ENDURAIN_LOG_INFO("Session {} expired due to inactivity", common::Redact(session.id));
        return true;
    }
    if (now > session.created_at + config_.absolute_timeout_hours * kSecondsPerHour) {
        ENDURAIN_LOG_INFO("Session {} reached absolute timeout", common::Redact(session.id));
        return true;
    }
    return false;
}

SessionManager::Status SessionManager::CheckUserActive(const std::string& user_id) const {
    if (!users_) {
        return Status::OK();
    }
    auto user = users_->FindById(user_id);
    if (!user.IsOk()) {
        if (user.GetStatus().Code() == common::StatusCode::kNotFound) {
            ENDURAIN_LOG_WARN("Session belongs to unknown user {}", user_id);
            return Rejected();
        }
        return Internal("User lookup failed", user.GetStatus());
    }
    if (!user.Value().active) {
        ENDURAIN_LOG_WARN("Session belongs to inactive user {}", user_id);
        return Rejected();
    }
    return Status::OK();
}

SessionManager::StatusOrTokens SessionManager::CreateSession(const CreateSessionCommand& command) {
    auto session_id = crypto::RandomUuid();
    auto family_id = crypto::RandomUuid();
    if (!session_id.IsOk() || !family_id.IsOk()) {
        return Internal("Failed to generate session id", Status::Internal("RAND_bytes failed"));
    }
    auto minted = MintTokens(session_id.Value(), command.user_id);
    if (!minted.IsOk()) {
        return Internal("Failed to mint tokens", minted.GetStatus());
    }

    std::int64_t now = clock_->NowSeconds();
    Session session;
    session.id = session_id.Value();
    session.user_id = command.user_id;
    session.token_family_id = family_id.Value();
    session.refresh_token_hash = minted.Value().refresh_token_hash;
    session.rotation_count = 0;
    session.created_at = now;
    session.last_rotation_at = 0;
    session.last_activity_at = now;
    session.expires_at = minted.Value().tokens.refresh_token_expires_at;
    session.csrf_token_hash = minted.Value().csrf_token_hash;
    session.ip_address = command.ip_address;
    session.user_agent = command.user_agent;

    auto status = repository_->Create(session);
    if (!status.IsOk()) {
        return Internal("Failed to create session", status);
    }
    ENDURAIN_LOG_INFO("Session {} created for user {} ({})", common::Redact(session.id), session.user_id,
                      ClientTypeToString(command.client_type));
    return StatusOrTokens(std::move(minted.Value().tokens));
}

common::StatusOr<std::string> SessionManager::CreatePendingSession(const CreateSessionCommand& command,
                                                                   const std::string& oauth_state_id) {
    auto session_id = crypto::RandomUuid();
    auto family_id = crypto::RandomUuid();
    if (!session_id.IsOk() || !family_id.IsOk()) {
        return Internal("Failed to generate session id", Status::Internal("RAND_bytes failed"));
    }
    std::int64_t now = clock_->NowSeconds();
    Session session;
    session.id = session_id.Value();
    session.user_id = command.user_id;
    session.token_family_id = family_id.Value();
    // 交换前没有任何 refresh 令牌能匹配空哈希
    session.refresh_token_hash.clear();
    session.created_at = now;
    session.last_activity_at = now;
    session.expires_at = now + config_.refresh_token_ttl_days * kSecondsPerDay;
    session.ip_address = command.ip_address;
    session.user_agent = command.user_agent;
    session.oauth_state_id = oauth_state_id;
    session.tokens_exchanged = false;

    auto status = repository_->Create(session);
    if (!status.IsOk()) {
        return Internal("Failed to create pending session", status);
    }
    return common::StatusOr<std::string>(session.id);
}

SessionManager::StatusOrTokens SessionManager::Refresh(const RefreshCommand& command) {
    std::string session_id;
    if (!ParseRefreshToken(command.refresh_token, &session_id)) {
        return Rejected();
    }
    auto loaded = repository_->Get(session_id);
    if (!loaded.IsOk()) {
        if (loaded.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return Internal("Failed to load session", loaded.GetStatus());
    }
    const Session& session = loaded.Value();

    if (IsTimedOut(session, clock_->NowSeconds())) {
        return Rejected();
    }

    // CSRF 只对 web 客户端且请求携带时校验; 页面刷新后可以不带
    if (command.client_type == ClientType::kWeb && command.csrf_token && !session.csrf_token_hash.empty()) {
        auto csrf_ok = HashMatches(*command.csrf_token, session.csrf_token_hash);
        if (!csrf_ok.IsOk()) {
            return Internal("Failed to hash CSRF token", csrf_ok.GetStatus());
        }
        if (!csrf_ok.Value()) {
            ENDURAIN_LOG_WARN("Invalid CSRF token on refresh for session {}", common::Redact(session.id));
            return FromAuthError(AuthErrorCode::kInvalidCsrf);
        }
    }

    // 先做重用检测, 再校验当前令牌
    auto reuse = detector_->CheckTokenReuse(command.refresh_token);
    if (!reuse.IsOk()) {
        return Internal("Token reuse check failed", reuse.GetStatus());
    }
    if (reuse.Value().is_reused && !reuse.Value().in_grace_period) {
        auto invalidated = detector_->InvalidateTokenFamily(session.token_family_id);
        if (!invalidated.IsOk()) {
            return Internal("Failed to invalidate token family", invalidated.GetStatus());
        }
        return FromAuthError(AuthErrorCode::kTokenTheft);
    }
    if (reuse.Value().is_reused) {
        if (config_.grace_policy == GracePolicy::kReject) {
            return FromAuthError(AuthErrorCode::kReuseInGrace);
        }
        // kRotate: 以会话当前状态签发新轮换, 跳过对旧令牌的校验
        auto status = CheckUserActive(session.user_id);
        if (!status.IsOk()) {
            return status;
        }
        return RotateSession(session, command);
    }

    auto refresh_ok = HashMatches(command.refresh_token, session.refresh_token_hash);
    if (!refresh_ok.IsOk()) {
        return Internal("Failed to hash refresh token", refresh_ok.GetStatus());
    }
    if (!refresh_ok.Value()) {
        ENDURAIN_LOG_WARN("Invalid refresh token for session {}", common::Redact(session.id));
        return Rejected();
    }
    auto status = CheckUserActive(session.user_id);
    if (!status.IsOk()) {
        return status;
    }
    return RotateSession(session, command);
}

SessionManager::StatusOrTokens SessionManager::RotateSession(const Session& session, const RefreshCommand& command) {
    auto minted = MintTokens(session.id, session.user_id);
    if (!minted.IsOk()) {
        return Internal("Failed to mint tokens", minted.GetStatus());
    }
    std::int64_t now = clock_->NowSeconds();

    // 被替换的令牌写入墓碑, 与会话更新在同一事务中
    auto tombstone = detector_->BuildTombstone(session.refresh_token_hash, session.token_family_id,
                                               session.rotation_count);
    SessionUpdate update;
    update.refresh_token_hash = minted.Value().refresh_token_hash;
    update.rotation_count = session.rotation_count + 1;
    update.last_rotation_at = now;
    update.last_activity_at = now;
    update.expires_at = minted.Value().tokens.refresh_token_expires_at;
    update.csrf_token_hash = minted.Value().csrf_token_hash;
    update.ip_address = command.ip_address;
    update.user_agent = command.user_agent;

    auto status = repository_->Rotate(session.id, session.rotation_count, tombstone, update);
    if (!status.IsOk()) {
        switch (status.Code()) {
            case common::StatusCode::kFailedPrecondition:
            case common::StatusCode::kAlreadyExists:
                // 同一令牌的并发刷新, 另一个请求已经完成轮换
                ENDURAIN_LOG_WARN("Concurrent rotation for family {}", session.token_family_id);
                return FromAuthError(AuthErrorCode::kReuseInGrace);
            case common::StatusCode::kNotFound:
                return Rejected();
            default:
                return Internal("Failed to rotate session", status);
        }
    }
    ENDURAIN_LOG_DEBUG("Session {} rotated to {}", common::Redact(session.id), session.rotation_count + 1);
    return StatusOrTokens(std::move(minted.Value().tokens));
}

SessionManager::Status SessionManager::Logout(const std::string& refresh_token) {
    std::string session_id;
    if (!ParseRefreshToken(refresh_token, &session_id)) {
        return Rejected();
    }
    auto loaded = repository_->Get(session_id);
    if (!loaded.IsOk()) {
        if (loaded.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Status::OK();
        }
        return Internal("Failed to load session", loaded.GetStatus());
    }
    auto refresh_ok = HashMatches(refresh_token, loaded.Value().refresh_token_hash);
    if (!refresh_ok.IsOk()) {
        return Internal("Failed to hash refresh token", refresh_ok.GetStatus());
    }
    if (!refresh_ok.Value()) {
        ENDURAIN_LOG_WARN("Invalid refresh token on logout for session {}", common::Redact(session_id));
        return Rejected();
    }
    auto status = repository_->Delete(session_id);
    if (!status.IsOk() && status.Code() != common::StatusCode::kNotFound) {
        return Internal("Failed to delete session", status);
    }
    DeleteLinkedOAuthState(loaded.Value().oauth_state_id);
    ENDURAIN_LOG_INFO("Session {} logged out", common::Redact(session_id));
    return Status::OK();
}

SessionManager::StatusOrTokens SessionManager::ExchangeTokens(const std::string& session_id,
                                                              const std::string& code_verifier) {
    auto loaded = repository_->Get(session_id);
    if (!loaded.IsOk()) {
        if (loaded.GetStatus().Code() == common::StatusCode::kNotFound) {
            ENDURAIN_LOG_WARN("Token exchange failed: session {} not found", common::Redact(session_id));
            return Rejected();
        }
        return Internal("Failed to load session", loaded.GetStatus());
    }
    const Session& session = loaded.Value();
    if (!session.oauth_state_id) {
        ENDURAIN_LOG_WARN("Token exchange failed: session {} has no OAuth state", common::Redact(session_id));
        return Rejected();
    }
    if (session.tokens_exchanged) {
        ENDURAIN_LOG_WARN("Token exchange replay attempt for session {}", common::Redact(session_id));
        return Rejected();
    }
    auto state = oauth_states_->Get(*session.oauth_state_id);
    if (!state.IsOk()) {
        if (state.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return Internal("Failed to load OAuth state", state.GetStatus());
    }
    if (!state.Value().code_challenge || !state.Value().code_challenge_method) {
        ENDURAIN_LOG_ERROR("Token exchange failed: OAuth state {} missing PKCE data",
                           common::Redact(state.Value().id));
        return FromAuthError(AuthErrorCode::kInvalidPkce, "OAuth state missing PKCE data");
    }
    if (*state.Value().code_challenge_method != crypto::kPkceMethodS256 ||
        !crypto::VerifyCodeVerifier(code_verifier, *state.Value().code_challenge)) {
        ENDURAIN_LOG_WARN("Token exchange failed: PKCE verification for session {}", common::Redact(session_id));
        return FromAuthError(AuthErrorCode::kInvalidPkce, "Invalid code verifier");
    }
    auto status = CheckUserActive(session.user_id);
    if (!status.IsOk()) {
        return status;
    }

    auto minted = MintTokens(session.id, session.user_id);
    if (!minted.IsOk()) {
        return Internal("Failed to mint tokens", minted.GetStatus());
    }
    SessionUpdate update;
    update.refresh_token_hash = minted.Value().refresh_token_hash;
    update.last_activity_at = clock_->NowSeconds();
    update.expires_at = minted.Value().tokens.refresh_token_expires_at;
    // tokens_exchanged 的条件更新是一次性闸门, state 在 IdP 回调时可能已被标记 used
    auto claimed = repository_->CompleteTokenExchange(session.id, update);
    if (!claimed.IsOk()) {
        if (claimed.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return Internal("Failed to store exchanged token", claimed.GetStatus());
    }
    if (!claimed.Value()) {
        ENDURAIN_LOG_WARN("Token exchange replay attempt for session {}", common::Redact(session_id));
        return Rejected();
    }
    DeleteLinkedOAuthState(session.oauth_state_id);
    ENDURAIN_LOG_INFO("Token exchange successful for session {} (user={})", common::Redact(session_id),
                      session.user_id);
    // CSRF 绑定由交换后的第一次刷新建立
    return StatusOrTokens(std::move(minted.Value().tokens));
}

SessionManager::Status SessionManager::MarkTokensExchanged(const std::string& session_id) {
    auto loaded = repository_->Get(session_id);
    if (!loaded.IsOk()) {
        if (loaded.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return Internal("Failed to load session", loaded.GetStatus());
    }
    auto claimed = repository_->CompleteTokenExchange(session_id, SessionUpdate{});
    if (!claimed.IsOk()) {
        if (claimed.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return Internal("Failed to mark tokens exchanged", claimed.GetStatus());
    }
    if (!claimed.Value()) {
        return Rejected();
    }
    DeleteLinkedOAuthState(loaded.Value().oauth_state_id);
    return Status::OK();
}

common::StatusOr<std::vector<Session>> SessionManager::ListUserSessions(const std::string& user_id) {
    return repository_->ListByUser(user_id);
}

common::StatusOr<std::size_t> SessionManager::DeleteIdleSessions() {
    std::int64_t now = clock_->NowSeconds();
    // 未开启空闲超时: 截止时间取最小值, 只按 expires_at 清理
    std::int64_t cutoff = config_.idle_timeout_enabled ? now - config_.idle_timeout_hours * kSecondsPerHour
                                                       : std::numeric_limits<std::int64_t>::min();
    auto removed = repository_->DeleteIdle(cutoff, now);
    if (removed.IsOk() && removed.Value() > 0) {
        ENDURAIN_LOG_INFO("Cleaned up {} idle sessions", removed.Value());
    }
    return removed;
}

void SessionManager::DeleteLinkedOAuthState(const std::optional<std::string>& oauth_state_id) {
    if (!oauth_state_id || !oauth_states_) {
        return;
    }
    auto deleted = oauth_states_->Delete(*oauth_state_id);
    if (!deleted.IsOk()) {
        // 过期清理会回收残留的状态
        ENDURAIN_LOG_WARN("Failed to delete OAuth state {}: {}", common::Redact(*oauth_state_id),
                          deleted.GetStatus().Message());
    }
}

}
}
