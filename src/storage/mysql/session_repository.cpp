#include "storage/mysql/session_repository.hpp"

#include "storage/mysql/mysql_util.hpp"
#include "storage/mysql/transaction.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <vector>

namespace endurain {
namespace storage {

namespace {

constexpr char kSessionColumns[] =
    "id, user_id, token_family_id, refresh_token_hash, rotation_count, created_at, last_rotation_at, "
    "last_activity_at, expires_at, csrf_token_hash, ip_address, user_agent, oauth_state_id, tokens_exchanged";

core::Session ParseSessionRow(MYSQL_ROW row) {
    core::Session session;
    session.id = row[0] ? row[0] : "";
    session.user_id = row[1] ? row[1] : "";
    session.token_family_id = row[2] ? row[2] : "";
    session.refresh_token_hash = row[3] ? row[3] : "";
    session.rotation_count = static_cast<int>(ParseInt64(row[4]));
    session.created_at = ParseInt64(row[5]);
    session.last_rotation_at = ParseInt64(row[6]);
    session.last_activity_at = ParseInt64(row[7]);
    session.expires_at = ParseInt64(row[8]);
    session.csrf_token_hash = row[9] ? row[9] : "";
    session.ip_address = row[10] ? row[10] : "";
    session.user_agent = row[11] ? row[11] : "";
    session.oauth_state_id = NullableString(row[12]);
    session.tokens_exchanged = ParseInt64(row[13]) != 0;
    return session;
}

// 在事务内锁定会话行, 返回 token_family_id 与 rotation_count
common::Status LockSessionRow(Transaction& tx, const std::string& session_id, std::string* family_id,
                              int* rotation_count) {
    auto sql = fmt::format(
        "SELECT token_family_id, rotation_count FROM users_sessions WHERE id = {} FOR UPDATE",
        Quote(tx.Raw(), session_id));
    auto result = Query(tx.Raw(), sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(result.Value().get());
    if (!row) {
        return common::Status::NotFound("Session not found");
    }
    if (family_id != nullptr) {
        *family_id = row[0] ? row[0] : "";
    }
    if (rotation_count != nullptr) {
        *rotation_count = static_cast<int>(ParseInt64(row[1]));
    }
    return common::Status::OK();
}

}

MySqlSessionRepository::MySqlSessionRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

std::string MySqlSessionRepository::BuildSetClause(MYSQL* conn, const core::SessionUpdate& update) {
    std::vector<std::string> parts;
    if (update.refresh_token_hash) {
        parts.push_back("refresh_token_hash = " + Quote(conn, *update.refresh_token_hash));
    }
    if (update.rotation_count) {
        parts.push_back(fmt::format("rotation_count = {}", *update.rotation_count));
    }
    if (update.last_rotation_at) {
        parts.push_back(fmt::format("last_rotation_at = {}", *update.last_rotation_at));
    }
    if (update.last_activity_at) {
        parts.push_back(fmt::format("last_activity_at = {}", *update.last_activity_at));
    }
    if (update.expires_at) {
        parts.push_back(fmt::format("expires_at = {}", *update.expires_at));
    }
    if (update.csrf_token_hash) {
        parts.push_back("csrf_token_hash = " + Quote(conn, *update.csrf_token_hash));
    }
    if (update.ip_address) {
        parts.push_back("ip_address = " + Quote(conn, *update.ip_address));
    }
    if (update.user_agent) {
        parts.push_back("user_agent = " + Quote(conn, *update.user_agent));
    }
    if (update.oauth_state_id) {
        parts.push_back("oauth_state_id = " + QuoteNullable(conn, *update.oauth_state_id));
    }
    if (update.tokens_exchanged) {
        parts.push_back(fmt::format("tokens_exchanged = {}", *update.tokens_exchanged ? 1 : 0));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

std::string MySqlSessionRepository::BuildTombstoneInsert(MYSQL* conn, const core::RotatedRefreshToken& token) {
    return fmt::format(
        "INSERT INTO rotated_refresh_tokens "
        "(token_family_id, hashed_token, rotation_count, rotated_at, expires_at) "
        "VALUES ({}, {}, {}, {}, {})",
        Quote(conn, token.token_family_id),
        Quote(conn, token.hashed_token),
        token.rotation_count,
        token.rotated_at,
        token.expires_at);
}

common::Status MySqlSessionRepository::Create(const core::Session& session) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "INSERT INTO users_sessions ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
        kSessionColumns,
        Quote(conn, session.id),
        Quote(conn, session.user_id),
        Quote(conn, session.token_family_id),
        Quote(conn, session.refresh_token_hash),
        session.rotation_count,
        session.created_at,
        session.last_rotation_at,
        session.last_activity_at,
        session.expires_at,
        Quote(conn, session.csrf_token_hash),
        Quote(conn, session.ip_address),
        Quote(conn, session.user_agent),
        QuoteNullable(conn, session.oauth_state_id),
        session.tokens_exchanged ? 1 : 0);
    return Execute(conn, sql);
}

common::StatusOr<core::Session> MySqlSessionRepository::Get(const std::string& session_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format("SELECT {} FROM users_sessions WHERE id = {} LIMIT 1", kSessionColumns,
                           Quote(conn, session_id));
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(result.Value().get());
    if (!row) {
        return common::Status::NotFound("Session not found");
    }
    return common::StatusOr<core::Session>(ParseSessionRow(row));
}

common::Status MySqlSessionRepository::Update(const std::string& session_id, const core::SessionUpdate& update) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    std::string set_clause = BuildSetClause(conn, update);
    if (set_clause.empty()) {
        return common::Status::OK();
    }
    // 写入值未变化时 affected_rows 也为 0, 需要再确认行是否存在
    auto sql = fmt::format("UPDATE users_sessions SET {} WHERE id = {}", set_clause, Quote(conn, session_id));
    std::uint64_t affected = 0;
    auto status = Execute(conn, sql, &affected);
    if (!status.IsOk()) {
        return status;
    }
    if (affected == 0) {
        auto existing = Query(conn, fmt::format("SELECT 1 FROM users_sessions WHERE id = {}",
                                                Quote(conn, session_id)));
        if (!existing.IsOk()) {
            return existing.GetStatus();
        }
        if (mysql_num_rows(existing.Value().get()) == 0) {
            return common::Status::NotFound("Session not found");
        }
    }
    return common::Status::OK();
}

common::Status MySqlSessionRepository::Rotate(const std::string& session_id, int expected_rotation_count,
                                              const core::RotatedRefreshToken& tombstone,
                                              const core::SessionUpdate& update) {
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    int current_count = 0;
    status = LockSessionRow(tx, session_id, nullptr, &current_count);
    if (!status.IsOk()) {
        return status;
    }
    if (current_count != expected_rotation_count) {
        return common::Status::FailedPrecondition("Session was rotated concurrently");
    }
    // 墓碑与会话更新同一事务提交, hashed_token 唯一键拦截重复轮换
    status = tx.Execute(BuildTombstoneInsert(tx.Raw(), tombstone));
    if (!status.IsOk()) {
        return status;
    }
    std::string set_clause = BuildSetClause(tx.Raw(), update);
    if (!set_clause.empty()) {
        status = tx.Execute(fmt::format("UPDATE users_sessions SET {} WHERE id = {}", set_clause,
                                        Quote(tx.Raw(), session_id)));
        if (!status.IsOk()) {
            return status;
        }
    }
    return tx.Commit();
}

common::StatusOr<bool> MySqlSessionRepository::CompleteTokenExchange(const std::string& session_id,
                                                                    const core::SessionUpdate& update) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    core::SessionUpdate exchange = update;
    exchange.tokens_exchanged = true;
    exchange.oauth_state_id.emplace();
    // 条件更新, 并发交换只有一个看到 affected_rows = 1
    auto sql = fmt::format("UPDATE users_sessions SET {} WHERE id = {} AND tokens_exchanged = 0",
                           BuildSetClause(conn, exchange), Quote(conn, session_id));
    std::uint64_t affected = 0;
    auto status = Execute(conn, sql, &affected);
    if (!status.IsOk()) {
        return status;
    }
    if (affected == 1) {
        return common::StatusOr<bool>(true);
    }
    auto existing = Query(conn, fmt::format("SELECT 1 FROM users_sessions WHERE id = {}", Quote(conn, session_id)));
    if (!existing.IsOk()) {
        return existing.GetStatus();
    }
    if (mysql_num_rows(existing.Value().get()) == 0) {
        return common::Status::NotFound("Session not found");
    }
    return common::StatusOr<bool>(false);
}

common::Status MySqlSessionRepository::Delete(const std::string& session_id) {
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    std::string family_id;
    status = LockSessionRow(tx, session_id, &family_id, nullptr);
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Execute(fmt::format("DELETE FROM users_sessions WHERE id = {}", Quote(tx.Raw(), session_id)));
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Execute(fmt::format("DELETE FROM rotated_refresh_tokens WHERE token_family_id = {}",
                                    Quote(tx.Raw(), family_id)));
    if (!status.IsOk()) {
        return status;
    }
    return tx.Commit();
}

common::StatusOr<std::vector<core::Session>> MySqlSessionRepository::ListByUser(const std::string& user_id) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format("SELECT {} FROM users_sessions WHERE user_id = {} ORDER BY created_at",
                           kSessionColumns, Quote(conn, user_id));
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    std::vector<core::Session> sessions;
    while (MYSQL_ROW row = mysql_fetch_row(result.Value().get())) {
        sessions.push_back(ParseSessionRow(row));
    }
    return common::StatusOr<std::vector<core::Session>>(std::move(sessions));
}

common::StatusOr<std::size_t> MySqlSessionRepository::DeleteIdle(std::int64_t idle_cutoff, std::int64_t now) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    auto sql = fmt::format("DELETE FROM users_sessions WHERE last_activity_at < {} OR expires_at <= {}",
                           idle_cutoff, now);
    std::uint64_t affected = 0;
    auto status = Execute(lease.Value().Raw(), sql, &affected);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<std::size_t>(static_cast<std::size_t>(affected));
}

common::Status MySqlSessionRepository::InsertRotatedToken(const core::RotatedRefreshToken& token) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    return Execute(lease.Value().Raw(), BuildTombstoneInsert(lease.Value().Raw(), token));
}

common::StatusOr<core::RotatedRefreshToken> MySqlSessionRepository::FindRotatedToken(
    const std::string& hashed_token) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    MYSQL* conn = lease.Value().Raw();
    auto sql = fmt::format(
        "SELECT token_family_id, hashed_token, rotation_count, rotated_at, expires_at "
        "FROM rotated_refresh_tokens WHERE hashed_token = {} LIMIT 1",
        Quote(conn, hashed_token));
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(result.Value().get());
    if (!row) {
        return common::Status::NotFound("Rotated token not found");
    }
    core::RotatedRefreshToken token;
    token.token_family_id = row[0] ? row[0] : "";
    token.hashed_token = row[1] ? row[1] : "";
    token.rotation_count = static_cast<int>(ParseInt64(row[2]));
    token.rotated_at = ParseInt64(row[3]);
    token.expires_at = ParseInt64(row[4]);
    return common::StatusOr<core::RotatedRefreshToken>(std::move(token));
}

common::StatusOr<std::size_t> MySqlSessionRepository::DeleteExpiredRotatedTokens(std::int64_t now) {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    std::uint64_t affected = 0;
    auto status = Execute(lease.Value().Raw(),
                          fmt::format("DELETE FROM rotated_refresh_tokens WHERE expires_at < {}", now),
                          &affected);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<std::size_t>(static_cast<std::size_t>(affected));
}

common::StatusOr<core::FamilyDeletion> MySqlSessionRepository::DeleteFamily(const std::string& token_family_id) {
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    core::FamilyDeletion deletion;
    std::uint64_t affected = 0;
    status = tx.Execute(fmt::format("DELETE FROM users_sessions WHERE token_family_id = {}",
                                    Quote(tx.Raw(), token_family_id)),
                        &affected);
    if (!status.IsOk()) {
        return status;
    }
    deletion.sessions = static_cast<std::size_t>(affected);
    status = tx.Execute(fmt::format("DELETE FROM rotated_refresh_tokens WHERE token_family_id = {}",
                                    Quote(tx.Raw(), token_family_id)),
                        &affected);
    if (!status.IsOk()) {
        return status;
    }
    deletion.tokens = static_cast<std::size_t>(affected);
    status = tx.Commit();
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<core::FamilyDeletion>(deletion);
}

}
}
