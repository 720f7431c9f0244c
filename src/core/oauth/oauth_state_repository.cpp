#include "core/oauth/oauth_state_repository.hpp"

#include <mutex>

namespace endurain {
namespace core {

common::Status InMemoryOAuthStateRepository::Create(const OAuthState& state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!states_.emplace(state.id, state).second) {
        return common::Status::AlreadyExists("OAuth state already exists");
    }
    return common::Status::OK();
}

common::StatusOr<OAuthState> InMemoryOAuthStateRepository::Get(const std::string& state_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = states_.find(state_id);
    if (it == states_.end()) {
        return common::Status::NotFound("OAuth state not found");
    }
    return common::StatusOr<OAuthState>(it->second);
}

common::StatusOr<bool> InMemoryOAuthStateRepository::MarkUsed(const std::string& state_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = states_.find(state_id);
    if (it == states_.end()) {
        return common::Status::NotFound("OAuth state not found");
    }
    bool transitioned = !it->second.used;
    it->second.used = true;
    return common::StatusOr<bool>(transitioned);
}

common::StatusOr<std::size_t> InMemoryOAuthStateRepository::Delete(const std::string& state_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return common::StatusOr<std::size_t>(states_.erase(state_id));
}

common::StatusOr<std::size_t> InMemoryOAuthStateRepository::DeleteExpired(std::int64_t now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = states_.begin(); it != states_.end();) {
        if (it->second.expires_at < now) {
            it = states_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return common::StatusOr<std::size_t>(removed);
}

}
}
