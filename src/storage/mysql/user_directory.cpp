#include "storage/mysql/user_directory.hpp"

#include "storage/mysql/mysql_util.hpp"

#include <fmt/format.h>

namespace endurain {
namespace storage {

MySqlUserDirectory::MySqlUserDirectory(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::StatusOr<core::UserRecord> MySqlUserDirectory::FindOne(const std::string& column,
                                                               const std::string& value) const {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "SELECT id, username, password_hash, active, mfa_enabled, totp_secret FROM users WHERE {} = {} LIMIT 1",
        column, Quote(conn, value));
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(result.Value().get());
    if (!row) {
        return common::Status::NotFound("User not found");
    }
    core::UserRecord record;
    record.id = row[0] ? row[0] : "";
    record.username = row[1] ? row[1] : "";
    record.password_hash = row[2] ? row[2] : "";
    record.active = ParseInt64(row[3]) != 0;
    record.mfa_enabled = ParseInt64(row[4]) != 0;
    record.totp_secret = row[5] ? row[5] : "";
    return common::StatusOr<core::UserRecord>(std::move(record));
}

common::StatusOr<core::UserRecord> MySqlUserDirectory::FindByUserName(const std::string& user_name) const {
    return FindOne("username", user_name);
}

common::StatusOr<core::UserRecord> MySqlUserDirectory::FindById(const std::string& id) const {
    return FindOne("id", id);
}

}
}
