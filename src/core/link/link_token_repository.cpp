#include "core/link/link_token_repository.hpp"

#include <mutex>

namespace endurain {
namespace core {

common::Status InMemoryLinkTokenRepository::Create(const IdpLinkToken& token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!tokens_.emplace(token.id, token).second) {
        return common::Status::AlreadyExists("Link token already exists");
    }
    return common::Status::OK();
}

common::StatusOr<IdpLinkToken> InMemoryLinkTokenRepository::Get(const std::string& token_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return common::Status::NotFound("Link token not found");
    }
    return common::StatusOr<IdpLinkToken>(it->second);
}

common::StatusOr<bool> InMemoryLinkTokenRepository::MarkUsed(const std::string& token_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return common::Status::NotFound("Link token not found");
    }
    bool transitioned = !it->second.used;
    it->second.used = true;
    return common::StatusOr<bool>(transitioned);
}

common::StatusOr<std::size_t> InMemoryLinkTokenRepository::DeleteExpired(std::int64_t now) {
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

}
}
