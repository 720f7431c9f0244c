#include "core/link/link_token_issuer.hpp"

#include "common/logger.hpp"
#include "crypto/random.hpp"

namespace endurain {
namespace core {

namespace {

common::Status Rejected() {
    return common::Status::NotFound("Invalid or expired link token");
}

} // namespace

LinkTokenIssuer::LinkTokenIssuer(std::shared_ptr<LinkTokenRepository> repository,
                                 std::shared_ptr<const common::Clock> clock,
                                 int ttl_seconds)
    : repository_(std::move(repository)), clock_(std::move(clock)), ttl_seconds_(ttl_seconds) {}

common::StatusOr<IssuedLinkToken> LinkTokenIssuer::Issue(const std::string& user_id, std::int64_t idp_id,
                                                         const std::optional<std::string>& ip_address) {
    if (user_id.empty()) {
        return Status::InvalidArgument("User id is required");
    }
    auto id = crypto::TokenUrlSafe(32);
    if (!id.IsOk()) {
        return id.GetStatus();
    }

    IdpLinkToken token;
    token.id = id.Value();
    token.user_id = user_id;
    token.idp_id = idp_id;
    token.created_at = clock_->NowSeconds();
    token.expires_at = token.created_at + ttl_seconds_;
    token.used = false;
    token.ip_address = ip_address;

    auto status = repository_->Create(token);
    if (!status.IsOk()) {
        ENDURAIN_LOG_ERROR("Error creating IdP link token: {}", status.Message());
        return status;
    }
    ENDURAIN_LOG_DEBUG("IdP link token issued: {} for user {} idp {}", common::Redact(token.id), user_id, idp_id);
    return common::StatusOr<IssuedLinkToken>(IssuedLinkToken{token.id, token.expires_at});
}

LinkTokenIssuer::StatusOrToken LinkTokenIssuer::Validate(const std::string& token_id) {
    auto found = repository_->Get(token_id);
    if (!found.IsOk()) {
        if (found.GetStatus().Code() != common::StatusCode::kNotFound) {
            ENDURAIN_LOG_ERROR("Error retrieving IdP link token: {}", found.GetStatus().Message());
            return found.GetStatus();
        }
        ENDURAIN_LOG_WARN("IdP link token not found: {}", common::Redact(token_id));
        return Rejected();
    }
    if (clock_->NowSeconds() > found.Value().expires_at) {
        ENDURAIN_LOG_WARN("IdP link token expired: {}", common::Redact(token_id));
        return Rejected();
    }
    if (found.Value().used) {
        ENDURAIN_LOG_WARN("IdP link token already used (replay attempt?): {}", common::Redact(token_id));
        return Rejected();
    }
    return found;
}

LinkTokenIssuer::StatusOrToken LinkTokenIssuer::Consume(const std::string& token_id) {
    auto token = Validate(token_id);
    if (!token.IsOk()) {
        return token;
    }
    auto marked = repository_->MarkUsed(token_id);
    if (!marked.IsOk()) {
        if (marked.GetStatus().Code() == common::StatusCode::kNotFound) {
            return Rejected();
        }
        return marked.GetStatus();
    }
    if (!marked.Value()) {
        ENDURAIN_LOG_WARN("IdP link token consumed concurrently: {}", common::Redact(token_id));
        return Rejected();
    }
    ENDURAIN_LOG_DEBUG("IdP link token marked as used: {}", common::Redact(token_id));
    token.Value().used = true;
    return token;
}

common::StatusOr<std::size_t> LinkTokenIssuer::SweepExpired(std::int64_t now) {
    auto removed = repository_->DeleteExpired(now);
    if (removed.IsOk() && removed.Value() > 0) {
        ENDURAIN_LOG_INFO("Deleted {} expired IdP link tokens", removed.Value());
    }
    return removed;
}

}
}
