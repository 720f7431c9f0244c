#pragma once

#include "core/user/user_directory.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace endurain {
namespace storage {

// users 表的只读视图
class MySqlUserDirectory : public core::UserDirectory {
public:
    explicit MySqlUserDirectory(std::shared_ptr<ConnectionPool> pool);

    common::StatusOr<core::UserRecord> FindByUserName(const std::string& user_name) const override;
    common::StatusOr<core::UserRecord> FindById(const std::string& id) const override;

private:
    common::StatusOr<core::UserRecord> FindOne(const std::string& column, const std::string& value) const;

    std::shared_ptr<ConnectionPool> pool_;
};

}
}
