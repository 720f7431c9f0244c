#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/link/link_token.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace endurain {
namespace core {

class LinkTokenRepository {
public:
    virtual ~LinkTokenRepository() = default;

    virtual common::Status Create(const IdpLinkToken& token) = 0;
    virtual common::StatusOr<IdpLinkToken> Get(const std::string& token_id) = 0;
    // 仅当 used = 0 时更新, 返回是否发生了转换
    virtual common::StatusOr<bool> MarkUsed(const std::string& token_id) = 0;
    virtual common::StatusOr<std::size_t> DeleteExpired(std::int64_t now) = 0;
};

class InMemoryLinkTokenRepository : public LinkTokenRepository {
public:
    common::Status Create(const IdpLinkToken& token) override;
    common::StatusOr<IdpLinkToken> Get(const std::string& token_id) override;
    common::StatusOr<bool> MarkUsed(const std::string& token_id) override;
    common::StatusOr<std::size_t> DeleteExpired(std::int64_t now) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, IdpLinkToken> tokens_;
};

}
}
