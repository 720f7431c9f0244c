#include "core/mfa/mfa_lockout_guard.hpp"

#include "common/logger.hpp"

namespace endurain {
namespace core {

MfaLockoutGuard::MfaLockoutGuard(std::shared_ptr<MfaStateStore> store,
                                 LockoutPolicy policy,
                                 std::shared_ptr<const common::Clock> clock,
                                 std::string key_prefix)
    : store_(std::move(store)),
      policy_(std::move(policy)),
      clock_(std::move(clock)),
      key_prefix_(std::move(key_prefix)) {}

common::StatusOr<int> MfaLockoutGuard::RecordFailedAttempt(const std::string& username) {
    auto result = store_->IncrementWithPolicy(Key(username), policy_);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    const auto& r = result.Value();
    if (r.lockout_applied) {
        ENDURAIN_LOG_WARN("Lockout ({}s) applied to {}{} after {} failed attempts",
                          r.lockout_until - clock_->NowSeconds(), key_prefix_, username, r.failed_count);
    }
    return common::StatusOr<int>(r.failed_count);
}

common::StatusOr<bool> MfaLockoutGuard::IsLockedOut(const std::string& username) {
    auto record = store_->GetAttempts(Key(username));
    if (!record.IsOk()) {
        if (record.GetStatus().Code() == common::StatusCode::kNotFound) {
            return common::StatusOr<bool>(false);
        }
        return record.GetStatus();
    }
    if (record.Value().lockout_until == 0) {
        return common::StatusOr<bool>(false);
    }
    if (clock_->NowSeconds() > record.Value().lockout_until) {
        // 锁定已过期, 读取时顺便清理
        auto status = store_->ResetAttempts(Key(username));
        if (!status.IsOk()) {
            return status;
        }
        return common::StatusOr<bool>(false);
    }
    return common::StatusOr<bool>(true);
}

common::StatusOr<std::optional<std::int64_t>> MfaLockoutGuard::GetLockoutTime(const std::string& username) {
    auto record = store_->GetAttempts(Key(username));
    if (!record.IsOk()) {
        if (record.GetStatus().Code() == common::StatusCode::kNotFound) {
            return common::StatusOr<std::optional<std::int64_t>>(std::nullopt);
        }
        return record.GetStatus();
    }
    std::int64_t until = record.Value().lockout_until;
    if (until != 0 && clock_->NowSeconds() <= until) {
        return common::StatusOr<std::optional<std::int64_t>>(until);
    }
    return common::StatusOr<std::optional<std::int64_t>>(std::nullopt);
}

MfaLockoutGuard::Status MfaLockoutGuard::ResetFailedAttempts(const std::string& username) {
    return store_->ResetAttempts(Key(username));
}

MfaLockoutGuard::Status MfaLockoutGuard::AddPendingLogin(const std::string& username, const std::string& user_id) {
    return store_->PutPending(username, user_id);
}

common::StatusOr<std::string> MfaLockoutGuard::GetPendingLogin(const std::string& username) {
    auto pending = store_->GetPending(username);
    if (!pending.IsOk()) {
        return pending.GetStatus();
    }
    return common::StatusOr<std::string>(pending.Value().user_id);
}

MfaLockoutGuard::Status MfaLockoutGuard::DeletePendingLogin(const std::string& username) {
    return store_->DeletePending(username);
}

common::StatusOr<bool> MfaLockoutGuard::HasPendingLogin(const std::string& username) {
    auto pending = store_->GetPending(username);
    if (!pending.IsOk()) {
        if (pending.GetStatus().Code() == common::StatusCode::kNotFound) {
            return common::StatusOr<bool>(false);
        }
        return pending.GetStatus();
    }
    return common::StatusOr<bool>(true);
}

common::StatusOr<std::size_t> MfaLockoutGuard::SweepExpired() {
    auto removed = store_->SweepExpired();
    if (removed.IsOk() && removed.Value() > 0) {
        ENDURAIN_LOG_INFO("Swept {} stale MFA entries", removed.Value());
    }
    return removed;
}

}
}
