#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/mfa/backup_code_repository.hpp"
#include "crypto/password_hasher.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace endurain {
namespace core {

struct BackupCodeStatus {
    bool has_codes = false;
    int total = 0;
    int used = 0;
    int unused = 0;
    std::optional<std::int64_t> created_at;
};

class BackupCodeVault {
public:
    static constexpr int kDefaultCodeCount = 10;

    BackupCodeVault(std::shared_ptr<BackupCodeRepository> repository,
                    std::shared_ptr<const crypto::PasswordHasher> hasher,
                    std::shared_ptr<const common::Clock> clock);

    // XXXX-XXXX, 字符集为去掉 0/O/1/I 的 32 个大写字母和数字
    static common::StatusOr<std::string> GenerateBackupCode();
    static bool LooksLikeBackupCode(const std::string& candidate);

    // 替换用户全部旧码, 明文只在此返回一次
    common::StatusOr<std::vector<std::string>> Generate(const std::string& user_id,
                                                        int count = kDefaultCodeCount);

    // 遍历全部未使用的码后再决定结果, 命中则标记该码已使用
    common::StatusOr<bool> VerifyAndConsume(const std::string& user_id, const std::string& candidate);

    common::StatusOr<BackupCodeStatus> GetStatus(const std::string& user_id);

private:
    std::shared_ptr<BackupCodeRepository> repository_;
    std::shared_ptr<const crypto::PasswordHasher> hasher_;
    std::shared_ptr<const common::Clock> clock_;
};

}
}
