#pragma once

#include "core/mfa/backup_code_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace endurain {
namespace storage {

class MySqlBackupCodeRepository : public core::BackupCodeRepository {
public:
    explicit MySqlBackupCodeRepository(std::shared_ptr<ConnectionPool> pool);

    common::Status Replace(const std::string& user_id, const std::vector<core::BackupCode>& codes) override;
    common::StatusOr<std::vector<core::BackupCode>> ListForUser(const std::string& user_id) override;
    common::StatusOr<std::vector<core::BackupCode>> ListUnused(const std::string& user_id) override;
    common::StatusOr<bool> MarkUsed(std::int64_t code_id, const std::string& user_id, std::int64_t used_at) override;

private:
    common::StatusOr<std::vector<core::BackupCode>> List(const std::string& user_id, bool unused_only);

    std::shared_ptr<ConnectionPool> pool_;
};

}
}
