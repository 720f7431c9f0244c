#pragma once

#include "core/link/link_token_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace endurain {
namespace storage {

class MySqlLinkTokenRepository : public core::LinkTokenRepository {
public:
    explicit MySqlLinkTokenRepository(std::shared_ptr<ConnectionPool> pool);

    common::Status Create(const core::IdpLinkToken& token) override;
    common::StatusOr<core::IdpLinkToken> Get(const std::string& token_id) override;
    common::StatusOr<bool> MarkUsed(const std::string& token_id) override;
    common::StatusOr<std::size_t> DeleteExpired(std::int64_t now) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

}
}
