#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/oauth/oauth_state.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace endurain {
namespace core {

class OAuthStateRepository {
public:
    virtual ~OAuthStateRepository() = default;

    virtual common::Status Create(const OAuthState& state) = 0;
    virtual common::StatusOr<OAuthState> Get(const std::string& state_id) = 0;
    // used 由 false 变为 true 时返回 true, 已使用返回 false
    virtual common::StatusOr<bool> MarkUsed(const std::string& state_id) = 0;
    // 返回删除的行数
    virtual common::StatusOr<std::size_t> Delete(const std::string& state_id) = 0;
    virtual common::StatusOr<std::size_t> DeleteExpired(std::int64_t now) = 0;
};

class InMemoryOAuthStateRepository : public OAuthStateRepository {
public:
    common::Status Create(const OAuthState& state) override;
    common::StatusOr<OAuthState> Get(const std::string& state_id) override;
    common::StatusOr<bool> MarkUsed(const std::string& state_id) override;
    common::StatusOr<std::size_t> Delete(const std::string& state_id) override;
    common::StatusOr<std::size_t> DeleteExpired(std::int64_t now) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, OAuthState> states_;
};

}
}
