#pragma once

#include "core/session/session_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>
#include <string>

namespace endurain {
namespace storage {

// 会话表 users_sessions 与墓碑表 rotated_refresh_tokens
class MySqlSessionRepository : public core::SessionRepository {
public:
    explicit MySqlSessionRepository(std::shared_ptr<ConnectionPool> pool);

    common::Status Create(const core::Session& session) override;
    common::StatusOr<core::Session> Get(const std::string& session_id) override;
    common::Status Update(const std::string& session_id, const core::SessionUpdate& update) override;
    common::Status Rotate(const std::string& session_id, int expected_rotation_count,
                          const core::RotatedRefreshToken& tombstone, const core::SessionUpdate& update) override;
    common::StatusOr<bool> CompleteTokenExchange(const std::string& session_id,
                                                 const core::SessionUpdate& update) override;
    common::Status Delete(const std::string& session_id) override;
    common::StatusOr<std::vector<core::Session>> ListByUser(const std::string& user_id) override;
    common::StatusOr<std::size_t> DeleteIdle(std::int64_t idle_cutoff, std::int64_t now) override;

    common::Status InsertRotatedToken(const core::RotatedRefreshToken& token) override;
    common::StatusOr<core::RotatedRefreshToken> FindRotatedToken(const std::string& hashed_token) override;
    common::StatusOr<std::size_t> DeleteExpiredRotatedTokens(std::int64_t now) override;
    common::StatusOr<core::FamilyDeletion> DeleteFamily(const std::string& token_family_id) override;

private:
    static std::string BuildSetClause(MYSQL* conn, const core::SessionUpdate& update);
    static std::string BuildTombstoneInsert(MYSQL* conn, const core::RotatedRefreshToken& token);

    std::shared_ptr<ConnectionPool> pool_;
};

}
}
