#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace endurain {
namespace core {

// 会话与其轮换墓碑的持久化接口, 每个调用都是一个原子单元
class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    virtual common::Status Create(const Session& session) = 0;
    virtual common::StatusOr<Session> Get(const std::string& session_id) = 0;
    virtual common::Status Update(const std::string& session_id, const SessionUpdate& update) = 0;
    // 写入墓碑并更新会话; 仅当会话当前 rotation_count 等于 expected_rotation_count 时生效,
    // 否则返回 FailedPrecondition
    virtual common::Status Rotate(const std::string& session_id, int expected_rotation_count,
                                  const RotatedRefreshToken& tombstone, const SessionUpdate& update) = 0;
    // 仅当 tokens_exchanged 仍为 false 时写入 update, 同时置 tokens_exchanged 并清除 oauth_state_id;
    // 返回是否由本次调用完成交换
    virtual common::StatusOr<bool> CompleteTokenExchange(const std::string& session_id,
                                                         const SessionUpdate& update) = 0;
    // 删除会话及其家族的墓碑
    virtual common::Status Delete(const std::string& session_id) = 0;
    virtual common::StatusOr<std::vector<Session>> ListByUser(const std::string& user_id) = 0;
    // 删除 last_activity_at < idle_cutoff 或 expires_at <= now 的会话
    virtual common::StatusOr<std::size_t> DeleteIdle(std::int64_t idle_cutoff, std::int64_t now) = 0;

    virtual common::Status InsertRotatedToken(const RotatedRefreshToken& token) = 0;
    virtual common::StatusOr<RotatedRefreshToken> FindRotatedToken(const std::string& hashed_token) = 0;
    virtual common::StatusOr<std::size_t> DeleteExpiredRotatedTokens(std::int64_t now) = 0;
    virtual common::StatusOr<FamilyDeletion> DeleteFamily(const std::string& token_family_id) = 0;
};

class InMemorySessionRepository : public SessionRepository {
public:
    common::Status Create(const Session& session) override;
    common::StatusOr<Session> Get(const std::string& session_id) override;
    common::Status Update(const std::string& session_id, const SessionUpdate& update) override;
    common::Status Rotate(const std::string& session_id, int expected_rotation_count,
                          const RotatedRefreshToken& tombstone, const SessionUpdate& update) override;
    common::StatusOr<bool> CompleteTokenExchange(const std::string& session_id,
                                                 const SessionUpdate& update) override;
    common::Status Delete(const std::string& session_id) override;
    common::StatusOr<std::vector<Session>> ListByUser(const std::string& user_id) override;
    common::StatusOr<std::size_t> DeleteIdle(std::int64_t idle_cutoff, std::int64_t now) override;

    common::Status InsertRotatedToken(const RotatedRefreshToken& token) override;
    common::StatusOr<RotatedRefreshToken> FindRotatedToken(const std::string& hashed_token) override;
    common::StatusOr<std::size_t> DeleteExpiredRotatedTokens(std::int64_t now) override;
    common::StatusOr<FamilyDeletion> DeleteFamily(const std::string& token_family_id) override;

private:
    // 调用方需持有写锁
    std::size_t EraseTokensOfFamilyLocked(const std::string& token_family_id);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;             // session_id -> Session
    std::unordered_map<std::string, RotatedRefreshToken> tokens_;   // hashed_token -> 墓碑
};

}
}
