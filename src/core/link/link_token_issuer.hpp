#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/link/link_token_repository.hpp"

#include <memory>
#include <optional>
#include <string>

namespace endurain {
namespace core {

struct IssuedLinkToken {
    std::string token;
    std::int64_t expires_at = 0;
};

class LinkTokenIssuer {
public:
    using Status = common::Status;
    using StatusOrToken = common::StatusOr<IdpLinkToken>;

    LinkTokenIssuer(std::shared_ptr<LinkTokenRepository> repository,
                    std::shared_ptr<const common::Clock> clock,
                    int ttl_seconds = 60);

    common::StatusOr<IssuedLinkToken> Issue(const std::string& user_id, std::int64_t idp_id,
                                            const std::optional<std::string>& ip_address = std::nullopt);

    // 不存在, 过期, 已使用 对外不可区分
    StatusOrToken Validate(const std::string& token_id);

    // 在发起下游重定向之前标记已使用; 只有一次调用成功
    StatusOrToken Consume(const std::string& token_id);

    common::StatusOr<std::size_t> SweepExpired(std::int64_t now);

private:
    std::shared_ptr<LinkTokenRepository> repository_;
    std::shared_ptr<const common::Clock> clock_;
    int ttl_seconds_;
};

}
}
