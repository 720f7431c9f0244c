#include "core/oauth/oauth_state_manager.hpp"

#include "common/logger.hpp"
#include "crypto/pkce.hpp"
#include "crypto/random.hpp"

namespace endurain {
namespace core {

namespace {
constexpr std::size_t kStateEntropyBytes = 32;
} // namespace

OAuthStateManager::OAuthStateManager(std::shared_ptr<OAuthStateRepository> repository,
                                     std::shared_ptr<SessionRepository> sessions,
                                     std::shared_ptr<const common::Clock> clock,
                                     int ttl_seconds)
    : repository_(std::move(repository)),
      sessions_(std::move(sessions)),
      clock_(std::move(clock)),
      ttl_seconds_(ttl_seconds) {}

OAuthStateManager::Status OAuthStateManager::Rejected() {
    return Status::NotFound("Invalid or expired OAuth state");
}

common::StatusOr<std::string> OAuthStateManager::Create(const CreateOAuthStateCommand& command) {
    if (command.nonce.empty()) {
        return Status::InvalidArgument("OAuth nonce is required");
    }
    if (command.code_challenge) {
        if (!crypto::IsValidCodeChallenge(*command.code_challenge, command.code_challenge_method)) {
            return Status::InvalidArgument("Invalid PKCE code challenge");
        }
    } else if (command.client_type == ClientType::kMobile) {
        return Status::InvalidArgument("PKCE code challenge is required for mobile clients");
    }

    auto id = crypto::TokenUrlSafe(kStateEntropyBytes);
    if (!id.IsOk()) {
        return id.GetStatus();
    }

    OAuthState state;
    state.id = id.Value();
    state.idp_id = command.idp_id;
    state.user_id = command.user_id;
    state.nonce = command.nonce;
    state.code_challenge = command.code_challenge;
    if (command.code_challenge) {
        state.code_challenge_method = command.code_challenge_method;
    }
    state.redirect_path = command.redirect_path;
    state.client_type = command.client_type;
    state.ip_address = command.ip_address;
    state.created_at = clock_->NowSeconds();
    state.expires_at = state.created_at + ttl_seconds_;
    state.used = false;

    auto status = repository_->Create(state);
    if (!status.IsOk()) {
        return status;
    }
    ENDURAIN_LOG_DEBUG("OAuth state created: {} client_type={}", common::Redact(state.id),
                       ClientTypeToString(state.client_type));
    return common::StatusOr<std::string>(state.id);
}

OAuthStateManager::StatusOrState OAuthStateManager::GetValid(const std::string& state_id) {
    auto found = repository_->Get(state_id);
    if (!found.IsOk()) {
        if (found.GetStatus().Code() != common::StatusCode::kNotFound) {
            return found.GetStatus();
        }
        ENDURAIN_LOG_WARN("OAuth state not found: {}", common::Redact(state_id));
        return Rejected();
    }
    const auto& state = found.Value();
    if (clock_->NowSeconds() > state.expires_at) {
        ENDURAIN_LOG_WARN("OAuth state expired: {}", common::Redact(state_id));
        return Rejected();
    }
    if (state.used) {
        ENDURAIN_LOG_WARN("OAuth state already used (replay attempt?): {}", common::Redact(state_id));
        return Rejected();
    }
    return found;
}

OAuthStateManager::Status OAuthStateManager::MarkUsed(const std::string& state_id) {
    auto marked = repository_->MarkUsed(state_id);
    if (!marked.IsOk()) {
        if (marked.GetStatus().Code() == common::StatusCode::kNotFound) {
            ENDURAIN_LOG_WARN("Cannot mark OAuth state used: not found {}", common::Redact(state_id));
        }
        return marked.GetStatus();
    }
    if (marked.Value()) {
        ENDURAIN_LOG_DEBUG("OAuth state marked as used: {}", common::Redact(state_id));
    }
    return Status::OK();
}

OAuthStateManager::StatusOrState OAuthStateManager::Consume(const std::string& state_id) {
    auto state = GetValid(state_id);
    if (!state.IsOk()) {
        return state;
    }
    auto marked = repository_->MarkUsed(state_id);
    if (!marked.IsOk()) {
        if (marked.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return marked.GetStatus();
    }
    if (!marked.Value()) {
        // 并发回调中的失败方
        ENDURAIN_LOG_WARN("OAuth state consumed concurrently: {}", common::Redact(state_id));
        return Rejected();
    }
    state.Value().used = true;
    return state;
}

OAuthStateManager::Status OAuthStateManager::Delete(const std::string& state_id) {
    auto deleted = repository_->Delete(state_id);
    if (!deleted.IsOk()) {
        return deleted.GetStatus();
    }
    return Status::OK();
}

common::StatusOr<std::size_t> OAuthStateManager::SweepExpired(std::int64_t now) {
    auto removed = repository_->DeleteExpired(now);
    if (removed.IsOk() && removed.Value() > 0) {
        ENDURAIN_LOG_DEBUG("Deleted {} expired OAuth states", removed.Value());
    }
    return removed;
}

OAuthStateManager::StatusOrState OAuthStateManager::GetBySession(const std::string& session_id) {
    auto session = sessions_->Get(session_id);
    if (!session.IsOk()) {
        if (session.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return session.GetStatus();
    }
    if (!session.Value().oauth_state_id) {
        return Rejected();
    }
    auto state = repository_->Get(*session.Value().oauth_state_id);
    if (!state.IsOk() && state.GetStatus().Code() == common::StatusCode::kNotFound) {
        return Rejected();
    }
    return state;
}

}
}
