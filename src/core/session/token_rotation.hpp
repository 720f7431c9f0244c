#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_repository.hpp"
#include "crypto/hmac.hpp"

#include <memory>
#include <string>

namespace endurain {
namespace core {

// 令牌重用检查结果
// (false, false) 未被轮换过; (true, true) 宽限期内重放; (true, false) 宽限期后重放, 视为盗用
struct ReuseCheck {
    bool is_reused = false;
    bool in_grace_period = false;
};

class TokenReuseDetector {
public:
    using Status = common::Status;

    TokenReuseDetector(std::shared_ptr<SessionRepository> repository,
                       std::shared_ptr<const crypto::TokenHasher> hasher,
                       std::shared_ptr<const common::Clock> clock,
                       int grace_seconds = 60);

    common::StatusOr<std::string> HashToken(const std::string& raw_token) const;

    common::StatusOr<ReuseCheck> CheckTokenReuse(const std::string& raw_token) const;

    // 以已计算好的哈希构造墓碑, expires_at = now + grace
    RotatedRefreshToken BuildTombstone(const std::string& hashed_token, const std::string& token_family_id,
                                       int rotation_count) const;

    Status StoreRotatedToken(const std::string& raw_token, const std::string& token_family_id,
                             int rotation_count);

    // 删除家族内所有会话与墓碑, 返回删除的会话数; 重复调用返回 0
    common::StatusOr<std::size_t> InvalidateTokenFamily(const std::string& token_family_id);

    common::StatusOr<std::size_t> CleanupExpiredRotatedTokens();

    int GraceSeconds() const { return grace_seconds_; }

private:
    std::shared_ptr<SessionRepository> repository_;
    std::shared_ptr<const crypto::TokenHasher> hasher_;
    std::shared_ptr<const common::Clock> clock_;
    int grace_seconds_;
};

}
}
