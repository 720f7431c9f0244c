#include "server/auth_runtime.hpp"

#include "cache/redis_mfa_state_store.hpp"
#include "common/logger.hpp"
#include "storage/mysql/backup_code_repository.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/link_token_repository.hpp"
#include "storage/mysql/oauth_state_repository.hpp"
#include "storage/mysql/session_repository.hpp"
#include "storage/mysql/user_directory.hpp"

namespace endurain {
namespace server {

namespace {

// 所有持久化仓库
struct Repositories {
    std::shared_ptr<core::SessionRepository> sessions;
    std::shared_ptr<core::OAuthStateRepository> oauth_states;
    std::shared_ptr<core::LinkTokenRepository> link_tokens;
    std::shared_ptr<core::BackupCodeRepository> backup_codes;
    std::shared_ptr<const core::UserDirectory> users;
};

Repositories CreateInMemoryRepositories() {
    Repositories repos;
    repos.sessions = std::make_shared<core::InMemorySessionRepository>();
    repos.oauth_states = std::make_shared<core::InMemoryOAuthStateRepository>();
    repos.link_tokens = std::make_shared<core::InMemoryLinkTokenRepository>();
    repos.backup_codes = std::make_shared<core::InMemoryBackupCodeRepository>();
    repos.users = std::make_shared<core::InMemoryUserDirectory>();
    return repos;
}

Repositories CreateRepositories(const common::MysqlConfig& config) {
    if (!config.enabled) {
        ENDURAIN_LOG_WARN("[AuthRuntime] MySQL backend disabled; using in-memory repositories");
        return CreateInMemoryRepositories();
    }

    auto pool = std::make_shared<storage::ConnectionPool>(storage::Options::FromConfig(config));
    auto probe = pool->Acquire();
    if (!probe.IsOk()) {
        ENDURAIN_LOG_ERROR("[AuthRuntime] Failed to initialize MySQL connection: {}", probe.GetStatus().Message());
        return CreateInMemoryRepositories();
    }
    ENDURAIN_LOG_INFO("[AuthRuntime] MySQL connection pool initialized ({}:{})", config.host, config.port);

    Repositories repos;
    repos.sessions = std::make_shared<storage::MySqlSessionRepository>(pool);
    repos.oauth_states = std::make_shared<storage::MySqlOAuthStateRepository>(pool);
    repos.link_tokens = std::make_shared<storage::MySqlLinkTokenRepository>(pool);
    repos.backup_codes = std::make_shared<storage::MySqlBackupCodeRepository>(pool);
    repos.users = std::make_shared<storage::MySqlUserDirectory>(pool);
    return repos;
}

std::shared_ptr<cache::RedisClient> CreateRedisClient(const common::RedisConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    auto client = std::make_shared<cache::RedisClient>(config);
    auto status = client->Connect();
    if (!status.IsOk()) {
        ENDURAIN_LOG_WARN("[AuthRuntime] Redis init failed, MFA state stays in memory: {}", status.Message());
        return nullptr;
    }
    return client;
}

std::shared_ptr<core::MfaStateStore> CreateMfaStateStore(const common::MfaConfig& config,
                                                         const std::shared_ptr<cache::RedisClient>& redis,
                                                         const std::shared_ptr<const common::Clock>& clock) {
    core::MfaStoreLimits limits;
    limits.pending_login_max_age_seconds = config.pending_login_max_age_seconds;
    limits.attempt_max_age_seconds = config.attempt_max_age_seconds;
    if (config.backend == "redis") {
        if (redis) {
            ENDURAIN_LOG_INFO("[AuthRuntime] MFA state stored in Redis");
            return std::make_shared<cache::RedisMfaStateStore>(redis, clock, limits);
        }
        ENDURAIN_LOG_WARN("[AuthRuntime] MFA backend 'redis' requested but Redis is unavailable; "
                          "lockouts are per process");
    }
    return std::make_shared<core::InMemoryMfaStateStore>(clock, limits);
}

}

common::StatusOr<AuthRuntime> BuildAuthRuntime(const common::AppConfig& config,
                                               std::shared_ptr<const common::Clock> clock) {
    const auto& security = config.security;
    if (security.secret_key.empty()) {
        return common::Status::InvalidArgument("security.secret_key must not be empty");
    }
    auto grace_policy = core::ParseGracePolicy(security.grace_policy);
    if (!grace_policy) {
        return common::Status::InvalidArgument("Unknown security.grace_policy: " + security.grace_policy);
    }
    if (config.mfa.backend != "memory" && config.mfa.backend != "redis") {
        return common::Status::InvalidArgument("Unknown mfa.backend: " + config.mfa.backend);
    }

    AuthRuntime runtime;
    runtime.clock = clock ? std::move(clock) : std::make_shared<common::SystemClock>();
    runtime.redis = CreateRedisClient(config.cache.redis);

    auto repos = CreateRepositories(config.storage.mysql);
    auto token_hasher = std::make_shared<const crypto::TokenHasher>(security.secret_key);
    auto password_hasher = std::make_shared<const crypto::PasswordHasher>(security.password_hash_iterations);

    runtime.detector = std::make_shared<core::TokenReuseDetector>(repos.sessions, token_hasher, runtime.clock,
                                                                  security.rotation_grace_seconds);

    core::SessionManagerConfig session_config;
    session_config.refresh_token_ttl_days = security.refresh_token_ttl_days;
    session_config.access_token_ttl_minutes = security.access_token_ttl_minutes;
    session_config.idle_timeout_enabled = security.session_idle_timeout_enabled;
    session_config.idle_timeout_hours = security.session_idle_timeout_hours;
    session_config.absolute_timeout_hours = security.session_absolute_timeout_hours;
    session_config.grace_policy = *grace_policy;
    runtime.sessions = std::make_shared<core::SessionManager>(repos.sessions, runtime.detector, repos.oauth_states,
                                                              repos.users, token_hasher, runtime.clock,
                                                              session_config);

    runtime.oauth_states = std::make_shared<core::OAuthStateManager>(repos.oauth_states, repos.sessions,
                                                                     runtime.clock, security.oauth_state_ttl_seconds);
    runtime.link_tokens = std::make_shared<core::LinkTokenIssuer>(repos.link_tokens, runtime.clock,
                                                                  security.link_token_ttl_seconds);
    runtime.backup_codes = std::make_shared<core::BackupCodeVault>(repos.backup_codes, password_hasher,
                                                                   runtime.clock);

    // MFA 与口令登录共用一个存储, 以前缀区分
    auto mfa_store = CreateMfaStateStore(config.mfa, runtime.redis, runtime.clock);
    core::LockoutPolicy policy(config.mfa.lockout_ladder);
    runtime.mfa_guard = std::make_shared<core::MfaLockoutGuard>(mfa_store, policy, runtime.clock, "mfa:");
    runtime.login_guard = std::make_shared<core::MfaLockoutGuard>(mfa_store, policy, runtime.clock, "login:");

    core::AuthComponents components;
    components.sessions = runtime.sessions;
    components.oauth_states = runtime.oauth_states;
    components.link_tokens = runtime.link_tokens;
    components.backup_codes = runtime.backup_codes;
    components.mfa_guard = runtime.mfa_guard;
    components.login_guard = runtime.login_guard;
    components.users = repos.users;
    components.password_hasher = password_hasher;
    components.clock = runtime.clock;
    runtime.auth = std::make_shared<core::AuthService>(std::move(components));

    return common::StatusOr<AuthRuntime>(std::move(runtime));
}

void RegisterSweepJobs(const AuthRuntime& runtime, maintenance::Sweeper& sweeper) {
    auto clock = runtime.clock;
    auto detector = runtime.detector;
    sweeper.Register("rotated_tokens", [detector]() { return detector->CleanupExpiredRotatedTokens(); });

    auto oauth_states = runtime.oauth_states;
    sweeper.Register("oauth_states", [oauth_states, clock]() {
        return oauth_states->SweepExpired(clock->NowSeconds());
    });

    auto link_tokens = runtime.link_tokens;
    sweeper.Register("link_tokens", [link_tokens, clock]() {
        return link_tokens->SweepExpired(clock->NowSeconds());
    });

    auto sessions = runtime.sessions;
    sweeper.Register("idle_sessions", [sessions]() { return sessions->DeleteIdleSessions(); });

    // 两个 guard 共用存储, 清理一次即可
    auto mfa_guard = runtime.mfa_guard;
    sweeper.Register("mfa_state", [mfa_guard]() { return mfa_guard->SweepExpired(); });
}

}
}
