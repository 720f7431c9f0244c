#include "core/mfa/backup_code_repository.hpp"

#include <mutex>

namespace endurain {
namespace core {

common::Status InMemoryBackupCodeRepository::Replace(const std::string& user_id,
                                                     const std::vector<BackupCode>& codes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<BackupCode> stored;
    stored.reserve(codes.size());
    for (auto code : codes) {
        code.id = next_id_++;
        code.user_id = user_id;
        stored.push_back(std::move(code));
    }
    codes_[user_id] = std::move(stored);
    return common::Status::OK();
}

common::StatusOr<std::vector<BackupCode>> InMemoryBackupCodeRepository::ListForUser(const std::string& user_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = codes_.find(user_id);
    if (it == codes_.end()) {
        return common::StatusOr<std::vector<BackupCode>>(std::vector<BackupCode>{});
    }
    return common::StatusOr<std::vector<BackupCode>>(it->second);
}

common::StatusOr<std::vector<BackupCode>> InMemoryBackupCodeRepository::ListUnused(const std::string& user_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<BackupCode> unused;
    auto it = codes_.find(user_id);
    if (it != codes_.end()) {
        for (const auto& code : it->second) {
            if (!code.used) {
                unused.push_back(code);
            }
        }
    }
    return common::StatusOr<std::vector<BackupCode>>(std::move(unused));
}

common::StatusOr<bool> InMemoryBackupCodeRepository::MarkUsed(std::int64_t code_id, const std::string& user_id,
                                                              std::int64_t used_at) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = codes_.find(user_id);
    if (it == codes_.end()) {
        return common::StatusOr<bool>(false);
    }
    for (auto& code : it->second) {
        if (code.id == code_id) {
            if (code.used) {
                return common::StatusOr<bool>(false);
            }
            code.used = true;
            code.used_at = used_at;
            return common::StatusOr<bool>(true);
        }
    }
    return common::StatusOr<bool>(false);
}

}
}
