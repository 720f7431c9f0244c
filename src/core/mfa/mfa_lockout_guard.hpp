#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/mfa/lockout_policy.hpp"
#include "core/mfa/mfa_state_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace endurain {
namespace core {

// 失败尝试的渐进式锁定, 以及等待 MFA 的登录映射
// key_prefix 用于区分 MFA (mfa:) 与口令登录 (login:) 两套计数
class MfaLockoutGuard {
public:
    using Status = common::Status;

    MfaLockoutGuard(std::shared_ptr<MfaStateStore> store,
                    LockoutPolicy policy,
                    std::shared_ptr<const common::Clock> clock,
                    std::string key_prefix = "mfa:");

    // 返回当前失败次数; 锁定期内不递增
    common::StatusOr<int> RecordFailedAttempt(const std::string& username);

    // 锁定过期后的读取会清除该用户的记录
    common::StatusOr<bool> IsLockedOut(const std::string& username);

    common::StatusOr<std::optional<std::int64_t>> GetLockoutTime(const std::string& username);

    Status ResetFailedAttempts(const std::string& username);

    Status AddPendingLogin(const std::string& username, const std::string& user_id);
    common::StatusOr<std::string> GetPendingLogin(const std::string& username);
    Status DeletePendingLogin(const std::string& username);
    common::StatusOr<bool> HasPendingLogin(const std::string& username);

    common::StatusOr<std::size_t> SweepExpired();

private:
    std::string Key(const std::string& username) const { return key_prefix_ + username; }

    std::shared_ptr<MfaStateStore> store_;
    LockoutPolicy policy_;
    std::shared_ptr<const common::Clock> clock_;
    std::string key_prefix_;
};

}
}
