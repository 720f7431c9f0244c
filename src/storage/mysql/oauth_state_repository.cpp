#include "storage/mysql/oauth_state_repository.hpp"

#include "storage/mysql/mysql_util.hpp"

#include <fmt/format.h>

namespace endurain {
namespace storage {

namespace {

std::string QuoteNullableInt(const std::optional<std::int64_t>& value) {
    return value ? std::to_string(*value) : std::string("NULL");
}

}

MySqlOAuthStateRepository::MySqlOAuthStateRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::Status MySqlOAuthStateRepository::Create(const core::OAuthState& state) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "INSERT INTO oauth_states (id, idp_id, user_id, nonce, code_challenge, code_challenge_method, "
        "redirect_path, client_type, ip_address, created_at, expires_at, used) "
        "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
        Quote(conn, state.id),
        QuoteNullableInt(state.idp_id),
        QuoteNullable(conn, state.user_id),
        Quote(conn, state.nonce),
        QuoteNullable(conn, state.code_challenge),
        QuoteNullable(conn, state.code_challenge_method),
        QuoteNullable(conn, state.redirect_path),
        Quote(conn, core::ClientTypeToString(state.client_type)),
        QuoteNullable(conn, state.ip_address),
        state.created_at,
        state.expires_at,
        state.used ? 1 : 0);
    return Execute(conn, sql);
}

common::StatusOr<core::OAuthState> MySqlOAuthStateRepository::Get(const std::string& state_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "SELECT id, idp_id, user_id, nonce, code_challenge, code_challenge_method, redirect_path, "
        "client_type, ip_address, created_at, expires_at, used FROM oauth_states WHERE id = {} LIMIT 1",
        Quote(conn, state_id));
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(result.Value().get());
    if (!row) {
        return common::Status::NotFound("OAuth state not found");
    }
    core::OAuthState state;
    state.id = row[0] ? row[0] : "";
    if (row[1]) {
        state.idp_id = ParseInt64(row[1]);
    }
    state.user_id = NullableString(row[2]);
    state.nonce = row[3] ? row[3] : "";
    state.code_challenge = NullableString(row[4]);
    state.code_challenge_method = NullableString(row[5]);
    state.redirect_path = NullableString(row[6]);
    state.client_type = core::ParseClientType(row[7] ? row[7] : "").value_or(core::ClientType::kWeb);
    state.ip_address = NullableString(row[8]);
    state.created_at = ParseInt64(row[9]);
    state.expires_at = ParseInt64(row[10]);
    state.used = ParseInt64(row[11]) != 0;
    return common::StatusOr<core::OAuthState>(std::move(state));
}

common::StatusOr<bool> MySqlOAuthStateRepository::MarkUsed(const std::string& state_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    // 条件更新, 行锁保证并发调用只有一个看到 affected_rows = 1
    auto sql = fmt::format("UPDATE oauth_states SET used = 1 WHERE id = {} AND used = 0", Quote(conn, state_id));
    std::uint64_t affected = 0;
    auto status = Execute(conn, sql, &affected);
    if (!status.IsOk()) {
        return status;
    }
    if (affected == 1) {
        return common::StatusOr<bool>(true);
    }
    auto existing = Query(conn, fmt::format("SELECT 1 FROM oauth_states WHERE id = {}", Quote(conn, state_id)));
    if (!existing.IsOk()) {
        return existing.GetStatus();
    }
    if (mysql_num_rows(existing.Value().get()) == 0) {
        return common::Status::NotFound("OAuth state not found");
    }
    return common::StatusOr<bool>(false);
}

common::StatusOr<std::size_t> MySqlOAuthStateRepository::Delete(const std::string& state_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    std::uint64_t affected = 0;
    auto status = Execute(conn, fmt::format("DELETE FROM oauth_states WHERE id = {}", Quote(conn, state_id)),
                          &affected);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<std::size_t>(static_cast<std::size_t>(affected));
}

common::StatusOr<std::size_t> MySqlOAuthStateRepository::DeleteExpired(std::int64_t now) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    std::uint64_t affected = 0;
    auto status = Execute(lease.Value().Raw(),
                          fmt::format("DELETE FROM oauth_states WHERE expires_at < {}", now), &affected);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<std::size_t>(static_cast<std::size_t>(affected));
}

}
}
