#include "core/session/session_repository.hpp"

#include <mutex>

namespace endurain {
namespace core {

common::Status InMemorySessionRepository::Create(const Session& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sessions_.count(session.id) > 0) {
        return common::Status::AlreadyExists("Session already exists");
    }
    // 与表上的 token_family_id 唯一键一致
    for (const auto& entry : sessions_) {
        if (entry.second.token_family_id == session.token_family_id) {
            return common::Status::AlreadyExists("Token family already has a session");
        }
    }
    sessions_[session.id] = session;
    return common::Status::OK();
}

common::StatusOr<Session> InMemorySessionRepository::Get(const std::string& session_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return common::Status::NotFound("Session not found");
    }
    return common::StatusOr<Session>(it->second);
}

common::Status InMemorySessionRepository::Update(const std::string& session_id, const SessionUpdate& update) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return common::Status::NotFound("Session not found");
    }
    update.ApplyTo(it->second);
    return common::Status::OK();
}

common::Status InMemorySessionRepository::Rotate(const std::string& session_id, int expected_rotation_count,
                                                 const RotatedRefreshToken& tombstone,
                                                 const SessionUpdate& update) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return common::Status::NotFound("Session not found");
    }
    if (it->second.rotation_count != expected_rotation_count) {
        return common::Status::FailedPrecondition("Session was rotated concurrently");
    }
    if (tokens_.count(tombstone.hashed_token) > 0) {
        return common::Status::AlreadyExists("Rotated token already recorded");
    }
    tokens_[tombstone.hashed_token] = tombstone;
    update.ApplyTo(it->second);
    return common::Status::OK();
}

common::StatusOr<bool> InMemorySessionRepository::CompleteTokenExchange(const std::string& session_id,
                                                                       const SessionUpdate& update) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return common::Status::NotFound("Session not found");
    }
    if (it->second.tokens_exchanged) {
        return common::StatusOr<bool>(false);
    }
    update.ApplyTo(it->second);
    it->second.tokens_exchanged = true;
    it->second.oauth_state_id.reset();
    return common::StatusOr<bool>(true);
}

common::Status InMemorySessionRepository::Delete(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return common::Status::NotFound("Session not found");
    }
    std::string family = it->second.token_family_id;
    sessions_.erase(it);
    EraseTokensOfFamilyLocked(family);
    return common::Status::OK();
}

common::StatusOr<std::vector<Session>> InMemorySessionRepository::ListByUser(const std::string& user_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Session> result;
    for (const auto& entry : sessions_) {
        if (entry.second.user_id == user_id) {
            result.push_back(entry.second);
        }
    }
    return common::StatusOr<std::vector<Session>>(std::move(result));
}

common::StatusOr<std::size_t> InMemorySessionRepository::DeleteIdle(std::int64_t idle_cutoff, std::int64_t now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.last_activity_at < idle_cutoff || it->second.expires_at <= now) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return common::StatusOr<std::size_t>(removed);
}

common::Status InMemorySessionRepository::InsertRotatedToken(const RotatedRefreshToken& token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (tokens_.count(token.hashed_token) > 0) {
        return common::Status::AlreadyExists("Rotated token already recorded");
    }
    tokens_[token.hashed_token] = token;
    return common::Status::OK();
}

common::StatusOr<RotatedRefreshToken> InMemorySessionRepository::FindRotatedToken(const std::string& hashed_token) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(hashed_token);
    if (it == tokens_.end()) {
        return common::Status::NotFound("Rotated token not found");
    }
    return common::StatusOr<RotatedRefreshToken>(it->second);
}

common::StatusOr<std::size_t> InMemorySessionRepository::DeleteExpiredRotatedTokens(std::int64_t now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (it->second.expires_at < now) {
            it = tokens_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return common::StatusOr<std::size_t>(removed);
}

common::StatusOr<FamilyDeletion> InMemorySessionRepository::DeleteFamily(const std::string& token_family_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    FamilyDeletion deletion;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.token_family_id == token_family_id) {
            it = sessions_.erase(it);
            ++deletion.sessions;
        } else {
            ++it;
        }
    }
    deletion.tokens = EraseTokensOfFamilyLocked(token_family_id);
    return common::StatusOr<FamilyDeletion>(deletion);
}

std::size_t InMemorySessionRepository::EraseTokensOfFamilyLocked(const std::string& token_family_id) {
    std::size_t removed = 0;
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (it->second.token_family_id == token_family_id) {
            it = tokens_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}
}
