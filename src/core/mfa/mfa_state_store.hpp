#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/mfa/lockout_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace endurain {
namespace core {

// 某个键的失败记录, lockout_until 为 0 表示未锁定
struct AttemptRecord {
    int failed_count = 0;
    std::int64_t lockout_until = 0;
    std::int64_t last_failure_at = 0;
};

struct IncrementResult {
    int failed_count = 0;
    std::int64_t lockout_until = 0;
    bool lockout_applied = false;   // 本次调用新施加了锁定
};

// 口令已通过, 等待 MFA 的登录
struct PendingLogin {
    std::string user_id;
    std::int64_t created_at = 0;
};

struct MfaStoreLimits {
    int pending_login_max_age_seconds = 600;
    int attempt_max_age_seconds = 86400;   // 无锁定时, 距最后一次失败的保留时长
};

// 失败计数与待完成登录的存储; 调用方不依赖具体后端
class MfaStateStore {
public:
    virtual ~MfaStateStore() = default;

    virtual common::StatusOr<AttemptRecord> GetAttempts(const std::string& key) = 0;
    // 锁定期内不递增, 原样返回当前计数
    virtual common::StatusOr<IncrementResult> IncrementWithPolicy(const std::string& key,
                                                                  const LockoutPolicy& policy) = 0;
    virtual common::Status ResetAttempts(const std::string& key) = 0;

    virtual common::Status PutPending(const std::string& username, const std::string& user_id) = 0;
    virtual common::StatusOr<PendingLogin> GetPending(const std::string& username) = 0;
    virtual common::Status DeletePending(const std::string& username) = 0;

    // 删除超过最大保留时长的条目, 返回删除数量
    virtual common::StatusOr<std::size_t> SweepExpired() = 0;
};

// 单进程内存实现
class InMemoryMfaStateStore : public MfaStateStore {
public:
    InMemoryMfaStateStore(std::shared_ptr<const common::Clock> clock, MfaStoreLimits limits = {});

    common::StatusOr<AttemptRecord> GetAttempts(const std::string& key) override;
    common::StatusOr<IncrementResult> IncrementWithPolicy(const std::string& key,
                                                          const LockoutPolicy& policy) override;
    common::Status ResetAttempts(const std::string& key) override;

    common::Status PutPending(const std::string& username, const std::string& user_id) override;
    common::StatusOr<PendingLogin> GetPending(const std::string& username) override;
    common::Status DeletePending(const std::string& username) override;

    common::StatusOr<std::size_t> SweepExpired() override;

private:
    bool AttemptExpired(const AttemptRecord& record, std::int64_t now) const;
    bool PendingExpired(const PendingLogin& pending, std::int64_t now) const;

    std::shared_ptr<const common::Clock> clock_;
    MfaStoreLimits limits_;
    std::mutex mutex_;
    std::unordered_map<std::string, AttemptRecord> attempts_;
    std::unordered_map<std::string, PendingLogin> pending_;
};

}
}
