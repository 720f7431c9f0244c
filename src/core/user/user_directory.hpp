#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace endurain {
namespace core {

// 认证所需的用户视图, 用户 CRUD 由外部系统维护
struct UserRecord {
    std::string id;
    std::string username;
    std::string password_hash;
    bool active = true;
    bool mfa_enabled = false;
    std::string totp_secret;   // base32, 未开启 MFA 时为空
};

// 用户只读查询接口
class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    virtual common::StatusOr<UserRecord> FindByUserName(const std::string& user_name) const = 0;
    virtual common::StatusOr<UserRecord> FindById(const std::string& id) const = 0;
};

class InMemoryUserDirectory : public UserDirectory {
public:
    // 写入或覆盖一条用户记录
    common::Status Put(const UserRecord& record);

    common::StatusOr<UserRecord> FindByUserName(const std::string& user_name) const override;
    common::StatusOr<UserRecord> FindById(const std::string& id) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, UserRecord> users_by_id_;
    std::unordered_map<std::string, std::string> ids_by_user_name_;
};

}
}
