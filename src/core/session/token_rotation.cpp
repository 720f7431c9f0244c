#include "core/session/token_rotation.hpp"

#include "common/logger.hpp"

namespace endurain {
namespace core {

TokenReuseDetector::TokenReuseDetector(std::shared_ptr<SessionRepository> repository,
                                       std::shared_ptr<const crypto::TokenHasher> hasher,
                                       std::shared_ptr<const common::Clock> clock,
                                       int grace_seconds)
    : repository_(std::move(repository)),
      hasher_(std::move(hasher)),
      clock_(std::move(clock)),
      grace_seconds_(grace_seconds) {}

common::StatusOr<std::string> TokenReuseDetector::HashToken(const std::string& raw_token) const {
    return hasher_->Hash(raw_token);
}

common::StatusOr<ReuseCheck> TokenReuseDetector::CheckTokenReuse(const std::string& raw_token) const {
    auto hashed = HashToken(raw_token);
    if (!hashed.IsOk()) {
        return hashed.GetStatus();
    }
    auto found = repository_->FindRotatedToken(hashed.Value());
    if (!found.IsOk()) {
        if (found.GetStatus().Code() == common::StatusCode::kNotFound) {
            return common::StatusOr<ReuseCheck>(ReuseCheck{});
        }
        return found.GetStatus();
    }

    const auto& tombstone = found.Value();
    ReuseCheck check;
    check.is_reused = true;
    if (clock_->NowSeconds() <= tombstone.expires_at) {
        // 可能是客户端重试竞争, 不做惩罚
        ENDURAIN_LOG_WARN("Token reuse within grace period for family {} (rotation {})",
                          tombstone.token_family_id, tombstone.rotation_count);
        check.in_grace_period = true;
    } else {
        ENDURAIN_LOG_ERROR("Token reuse detected after grace period for family {} (rotation {}, rotated_at {})",
                           tombstone.token_family_id, tombstone.rotation_count, tombstone.rotated_at);
    }
    return common::StatusOr<ReuseCheck>(check);
}

RotatedRefreshToken TokenReuseDetector::BuildTombstone(const std::string& hashed_token,
                                                       const std::string& token_family_id,
                                                       int rotation_count) const {
    RotatedRefreshToken tombstone;
    tombstone.token_family_id = token_family_id;
    tombstone.hashed_token = hashed_token;
    tombstone.rotation_count = rotation_count;
    tombstone.rotated_at = clock_->NowSeconds();
    tombstone.expires_at = tombstone.rotated_at + grace_seconds_;
    return tombstone;
}

TokenReuseDetector::Status TokenReuseDetector::StoreRotatedToken(const std::string& raw_token,
                                                                 const std::string& token_family_id,
                                                                 int rotation_count) {
    auto hashed = HashToken(raw_token);
    if (!hashed.IsOk()) {
        return hashed.GetStatus();
    }
    return repository_->InsertRotatedToken(BuildTombstone(hashed.Value(), token_family_id, rotation_count));
}

common::StatusOr<std::size_t> TokenReuseDetector::InvalidateTokenFamily(const std::string& token_family_id) {
    auto deleted = repository_->DeleteFamily(token_family_id);
    if (!deleted.IsOk()) {
        ENDURAIN_LOG_ERROR("Failed to invalidate token family {}: {}", token_family_id,
                           deleted.GetStatus().Message());
        return deleted.GetStatus();
    }
    ENDURAIN_LOG_CRITICAL("Invalidated token family {} due to reuse: {} sessions, {} tokens",
                          token_family_id, deleted.Value().sessions, deleted.Value().tokens);
    return common::StatusOr<std::size_t>(deleted.Value().sessions);
}

common::StatusOr<std::size_t> TokenReuseDetector::CleanupExpiredRotatedTokens() {
    auto removed = repository_->DeleteExpiredRotatedTokens(clock_->NowSeconds());
    if (removed.IsOk() && removed.Value() > 0) {
        ENDURAIN_LOG_INFO("Cleaned up {} expired rotated tokens", removed.Value());
    }
    return removed;
}

}
}
