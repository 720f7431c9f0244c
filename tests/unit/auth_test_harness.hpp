#pragma once

#include "common/clock.hpp"
#include "core/auth/auth_service.hpp"
#include "core/link/link_token_repository.hpp"
#include "core/mfa/backup_code_repository.hpp"
#include "core/mfa/mfa_state_store.hpp"
#include "core/oauth/oauth_state_repository.hpp"
#include "core/session/session_repository.hpp"
#include "core/user/user_directory.hpp"
#include "crypto/encoding.hpp"
#include "crypto/hmac.hpp"
#include "crypto/password_hasher.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace testutils {

// TOTP 测试密钥 (RFC 6238)
inline const std::string& TotpKey() {
    static const std::string key = "12345678901234567890";
    return key;
}

// 全内存的认证组件, 时间由 ManualClock 控制
struct AuthHarness {
    explicit AuthHarness(endurain::core::SessionManagerConfig session_config = {}, int grace_seconds = 60) {
        using namespace endurain;
        clock = std::make_shared<common::ManualClock>();
        session_repo = std::make_shared<core::InMemorySessionRepository>();
        oauth_repo = std::make_shared<core::InMemoryOAuthStateRepository>();
        link_repo = std::make_shared<core::InMemoryLinkTokenRepository>();
        backup_repo = std::make_shared<core::InMemoryBackupCodeRepository>();
        users = std::make_shared<core::InMemoryUserDirectory>();
        token_hasher = std::make_shared<const crypto::TokenHasher>("unit-test-secret");
        // 测试中降低迭代次数
        password_hasher = std::make_shared<const crypto::PasswordHasher>(1000);

        detector = std::make_shared<core::TokenReuseDetector>(session_repo, token_hasher, clock, grace_seconds);
        sessions = std::make_shared<core::SessionManager>(session_repo, detector, oauth_repo, users, token_hasher,
                                                          clock, session_config);
        oauth_states = std::make_shared<core::OAuthStateManager>(oauth_repo, session_repo, clock);
        link_tokens = std::make_shared<core::LinkTokenIssuer>(link_repo, clock);
        backup_codes = std::make_shared<core::BackupCodeVault>(backup_repo, password_hasher, clock);
        mfa_store = std::make_shared<core::InMemoryMfaStateStore>(clock);
        mfa_guard = std::make_shared<core::MfaLockoutGuard>(mfa_store, core::LockoutPolicy(), clock, "mfa:");
        login_guard = std::make_shared<core::MfaLockoutGuard>(mfa_store, core::LockoutPolicy(), clock, "login:");

        core::AuthComponents components;
        components.sessions = sessions;
        components.oauth_states = oauth_states;
        components.link_tokens = link_tokens;
        components.backup_codes = backup_codes;
        components.mfa_guard = mfa_guard;
        components.login_guard = login_guard;
        components.users = users;
        components.password_hasher = password_hasher;
        components.clock = clock;
        auth = std::make_shared<core::AuthService>(std::move(components));
    }

    // 写入一个用户, 返回其 id
    std::string AddUser(const std::string& user_name, const std::string& password, bool mfa_enabled = false,
                        bool active = true) {
        endurain::core::UserRecord record;
        record.id = "user-" + user_name;
        record.username = user_name;
        auto hash = password_hasher->Hash(password);
        EXPECT_TRUE(hash.IsOk());
        record.password_hash = hash.Value();
        record.active = active;
        record.mfa_enabled = mfa_enabled;
        if (mfa_enabled) {
            record.totp_secret = endurain::crypto::Base32Encode(TotpKey());
        }
        EXPECT_TRUE(users->Put(record).IsOk());
        return record.id;
    }

    std::shared_ptr<endurain::common::ManualClock> clock;
    std::shared_ptr<endurain::core::InMemorySessionRepository> session_repo;
    std::shared_ptr<endurain::core::InMemoryOAuthStateRepository> oauth_repo;
    std::shared_ptr<endurain::core::InMemoryLinkTokenRepository> link_repo;
    std::shared_ptr<endurain::core::InMemoryBackupCodeRepository> backup_repo;
    std::shared_ptr<endurain::core::InMemoryUserDirectory> users;
    std::shared_ptr<const endurain::crypto::TokenHasher> token_hasher;
    std::shared_ptr<const endurain::crypto::PasswordHasher> password_hasher;
    std::shared_ptr<endurain::core::TokenReuseDetector> detector;
    std::shared_ptr<endurain::core::SessionManager> sessions;
    std::shared_ptr<endurain::core::OAuthStateManager> oauth_states;
    std::shared_ptr<endurain::core::LinkTokenIssuer> link_tokens;
    std::shared_ptr<endurain::core::BackupCodeVault> backup_codes;
    std::shared_ptr<endurain::core::InMemoryMfaStateStore> mfa_store;
    std::shared_ptr<endurain::core::MfaLockoutGuard> mfa_guard;
    std::shared_ptr<endurain::core::MfaLockoutGuard> login_guard;
    std::shared_ptr<endurain::core::AuthService> auth;
};

} // namespace testutils
