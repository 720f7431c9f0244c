#pragma once

#include "cache/redis_client.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status_or.hpp"
#include "core/auth/auth_service.hpp"
#include "maintenance/sweeper.hpp"

#include <memory>

namespace endurain {
namespace server {

// 组装完成的认证组件
struct AuthRuntime {
    std::shared_ptr<const common::Clock> clock;
    std::shared_ptr<cache::RedisClient> redis;   // 未启用 Redis 时为空
    std::shared_ptr<core::TokenReuseDetector> detector;
    std::shared_ptr<core::SessionManager> sessions;
    std::shared_ptr<core::OAuthStateManager> oauth_states;
    std::shared_ptr<core::LinkTokenIssuer> link_tokens;
    std::shared_ptr<core::BackupCodeVault> backup_codes;
    std::shared_ptr<core::MfaLockoutGuard> mfa_guard;
    std::shared_ptr<core::MfaLockoutGuard> login_guard;
    std::shared_ptr<core::AuthService> auth;
};

// MySQL / Redis 不可用时回退到内存实现; 配置本身非法时返回 InvalidArgument
common::StatusOr<AuthRuntime> BuildAuthRuntime(const common::AppConfig& config,
                                               std::shared_ptr<const common::Clock> clock);

// 注册令牌墓碑, OAuth 状态, 绑定令牌, 空闲会话和 MFA 条目的清理任务
void RegisterSweepJobs(const AuthRuntime& runtime, maintenance::Sweeper& sweeper);

}
}
