#include "core/user/user_directory.hpp"

#include <mutex>

namespace endurain {
namespace core {

common::Status InMemoryUserDirectory::Put(const UserRecord& record) {
    if (record.id.empty() || record.username.empty()) {
        return common::Status::InvalidArgument("User id and username are required");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto existing = ids_by_user_name_.find(record.username);
    if (existing != ids_by_user_name_.end() && existing->second != record.id) {
        return common::Status::AlreadyExists("User name already exists");
    }
    auto previous = users_by_id_.find(record.id);
    if (previous != users_by_id_.end() && previous->second.username != record.username) {
        ids_by_user_name_.erase(previous->second.username);
    }
    users_by_id_[record.id] = record;
    ids_by_user_name_[record.username] = record.id;
    return common::Status::OK();
}

common::StatusOr<UserRecord> InMemoryUserDirectory::FindByUserName(const std::string& user_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = ids_by_user_name_.find(user_name);
    if (it == ids_by_user_name_.end()) {
        return common::Status::NotFound("User not found");
    }
    return common::StatusOr<UserRecord>(users_by_id_.at(it->second));
}

common::StatusOr<UserRecord> InMemoryUserDirectory::FindById(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_by_id_.find(id);
    if (it == users_by_id_.end()) {
        return common::Status::NotFound("User not found");
    }
    return common::StatusOr<UserRecord>(it->second);
}

}
}
