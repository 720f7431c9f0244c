#include "storage/mysql/backup_code_repository.hpp"

#include "storage/mysql/mysql_util.hpp"
#include "storage/mysql/transaction.hpp"

#include <fmt/format.h>

namespace endurain {
namespace storage {

MySqlBackupCodeRepository::MySqlBackupCodeRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::Status MySqlBackupCodeRepository::Replace(const std::string& user_id,
                                                  const std::vector<core::BackupCode>& codes) {
    // 删除旧码与写入新码在一个事务内, 失败时旧码保持不变
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Execute(fmt::format("DELETE FROM mfa_backup_codes WHERE user_id = {}", Quote(tx.Raw(), user_id)));
    if (!status.IsOk()) {
        return status;
    }
    for (const auto& code : codes) {
        status = tx.Execute(fmt::format(
            "INSERT INTO mfa_backup_codes (user_id, code_hash, used, used_at, created_at) "
            "VALUES ({}, {}, 0, NULL, {})",
            Quote(tx.Raw(), user_id),
            Quote(tx.Raw(), code.code_hash),
            code.created_at));
        if (!status.IsOk()) {
            return status;
        }
    }
    return tx.Commit();
}

common::StatusOr<std::vector<core::BackupCode>> MySqlBackupCodeRepository::List(const std::string& user_id,
                                                                                 bool unused_only) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "SELECT id, user_id, code_hash, used, used_at, created_at FROM mfa_backup_codes "
        "WHERE user_id = {}{} ORDER BY id",
        Quote(conn, user_id), unused_only ? " AND used = 0" : "");
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    std::vector<core::BackupCode> codes;
    while (MYSQL_ROW row = mysql_fetch_row(result.Value().get())) {
        core::BackupCode code;
        code.id = ParseInt64(row[0]);
        code.user_id = row[1] ? row[1] : "";
        code.code_hash = row[2] ? row[2] : "";
        code.used = ParseInt64(row[3]) != 0;
        if (row[4]) {
            code.used_at = ParseInt64(row[4]);
        }
        code.created_at = ParseInt64(row[5]);
        codes.push_back(std::move(code));
    }
    return common::StatusOr<std::vector<core::BackupCode>>(std::move(codes));
}

common::StatusOr<std::vector<core::BackupCode>> MySqlBackupCodeRepository::ListForUser(const std::string& user_id) {
    return List(user_id, false);
}

common::StatusOr<std::vector<core::BackupCode>> MySqlBackupCodeRepository::ListUnused(const std::string& user_id) {
    return List(user_id, true);
}

common::StatusOr<bool> MySqlBackupCodeRepository::MarkUsed(std::int64_t code_id, const std::string& user_id,
                                                           std::int64_t used_at) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    std::uint64_t affected = 0;
    auto status = Execute(conn,
                          fmt::format("UPDATE mfa_backup_codes SET used = 1, used_at = {} "
                                      "WHERE id = {} AND user_id = {} AND used = 0",
                                      used_at, code_id, Quote(conn, user_id)),
                          &affected);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<bool>(affected == 1);
}

}
}
