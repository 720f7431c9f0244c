#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/mfa/backup_code.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace endurain {
namespace core {

class BackupCodeRepository {
public:
    virtual ~BackupCodeRepository() = default;

    // 删除用户全部旧码并写入新码, 整体原子
    virtual common::Status Replace(const std::string& user_id, const std::vector<BackupCode>& codes) = 0;
    virtual common::StatusOr<std::vector<BackupCode>> ListForUser(const std::string& user_id) = 0;
    virtual common::StatusOr<std::vector<BackupCode>> ListUnused(const std::string& user_id) = 0;
    // 仅当 used = 0 时更新, 返回是否由本次调用消费
    virtual common::StatusOr<bool> MarkUsed(std::int64_t code_id, const std::string& user_id,
                                            std::int64_t used_at) = 0;
};

class InMemoryBackupCodeRepository : public BackupCodeRepository {
public:
    common::Status Replace(const std::string& user_id, const std::vector<BackupCode>& codes) override;
    common::StatusOr<std::vector<BackupCode>> ListForUser(const std::string& user_id) override;
    common::StatusOr<std::vector<BackupCode>> ListUnused(const std::string& user_id) override;
    common::StatusOr<bool> MarkUsed(std::int64_t code_id, const std::string& user_id,
                                    std::int64_t used_at) override;

private:
    mutable std::shared_mutex mutex_;
    std::int64_t next_id_ = 1;
    std::unordered_map<std::string, std::vector<BackupCode>> codes_;   // user_id -> codes
};

}
}
