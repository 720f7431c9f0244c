#include "storage/mysql/link_token_repository.hpp"

#include "storage/mysql/mysql_util.hpp"

#include <fmt/format.h>

namespace endurain {
namespace storage {

MySqlLinkTokenRepository::MySqlLinkTokenRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::Status MySqlLinkTokenRepository::Create(const core::IdpLinkToken& token) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "INSERT INTO idp_link_tokens (id, user_id, idp_id, created_at, expires_at, used, ip_address) "
        "VALUES ({}, {}, {}, {}, {}, {}, {})",
        Quote(conn, token.id),
        Quote(conn, token.user_id),
        token.idp_id,
        token.created_at,
        token.expires_at,
        token.used ? 1 : 0,
        QuoteNullable(conn, token.ip_address));
    return Execute(conn, sql);
}

common::StatusOr<core::IdpLinkToken> MySqlLinkTokenRepository::Get(const std::string& token_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto result = Query(conn, fmt::format(
        "SELECT id, user_id, idp_id, created_at, expires_at, used, ip_address "
        "FROM idp_link_tokens WHERE id = {} LIMIT 1",
        Quote(conn, token_id)));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(result.Value().get());
    if (!row) {
        return common::Status::NotFound("Link token not found");
    }
    core::IdpLinkToken token;
    token.id = row[0] ? row[0] : "";
    token.user_id = row[1] ? row[1] : "";
    token.idp_id = ParseInt64(row[2]);
    token.created_at = ParseInt64(row[3]);
    token.expires_at = ParseInt64(row[4]);
    token.used = ParseInt64(row[5]) != 0;
    token.ip_address = NullableString(row[6]);
    return common::StatusOr<core::IdpLinkToken>(std::move(token));
}

common::StatusOr<bool> MySqlLinkTokenRepository::MarkUsed(const std::string& token_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    std::uint64_t affected = 0;
    auto status = Execute(conn,
                          fmt::format("UPDATE idp_link_tokens SET used = 1 WHERE id = {} AND used = 0",
                                      Quote(conn, token_id)),
                          &affected);
    if (!status.IsOk()) {
        return status;
    }
    if (affected == 1) {
        return common::StatusOr<bool>(true);
    }
    auto existing = Query(conn, fmt::format("SELECT 1 FROM idp_link_tokens WHERE id = {}", Quote(conn, token_id)));
    if (!existing.IsOk()) {
        return existing.GetStatus();
    }
    if (mysql_num_rows(existing.Value().get()) == 0) {
        return common::Status::NotFound("Link token not found");
    }
    return common::StatusOr<bool>(false);
}

common::StatusOr<std::size_t> MySqlLinkTokenRepository::DeleteExpired(std::int64_t now) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    std::uint64_t affected = 0;
    auto status = Execute(lease.Value().Raw(),
                          fmt::format("DELETE FROM idp_link_tokens WHERE expires_at < {}", now), &affected);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<std::size_t>(static_cast<std::size_t>(affected));
}

}
}
