#pragma once

#include "cache/redis_client.hpp"
#include "common/clock.hpp"
#include "core/mfa/mfa_state_store.hpp"

#include <memory>
#include <string>

namespace endurain {
namespace cache {

// 多实例共享的 MFA 状态, 依赖 Redis TTL 回收过期条目
// 失败计数用 hash 保存 (count, until, last), 递增与锁定判断在同一个 Lua 脚本内完成
class RedisMfaStateStore : public core::MfaStateStore {
public:
    RedisMfaStateStore(std::shared_ptr<RedisClient> client,
                       std::shared_ptr<const common::Clock> clock,
                       core::MfaStoreLimits limits = {},
                       std::string key_prefix = "endurain:mfa:");

    common::StatusOr<core::AttemptRecord> GetAttempts(const std::string& key) override;
    common::StatusOr<core::IncrementResult> IncrementWithPolicy(const std::string& key,
                                                                const core::LockoutPolicy& policy) override;
    common::Status ResetAttempts(const std::string& key) override;

    common::Status PutPending(const std::string& username, const std::string& user_id) override;
    common::StatusOr<core::PendingLogin> GetPending(const std::string& username) override;
    common::Status DeletePending(const std::string& username) override;

    // 过期由 TTL 处理, 始终返回 0
    common::StatusOr<std::size_t> SweepExpired() override;

private:
    std::string AttemptsKey(const std::string& key) const { return key_prefix_ + "attempts:" + key; }
    std::string PendingKey(const std::string& username) const { return key_prefix_ + "pending:" + username; }

    std::shared_ptr<RedisClient> client_;
    std::shared_ptr<const common::Clock> clock_;
    core::MfaStoreLimits limits_;
    std::string key_prefix_;
};

}
}
