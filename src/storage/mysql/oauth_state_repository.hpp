#pragma once

#include "core/oauth/oauth_state_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace endurain {
namespace storage {

class MySqlOAuthStateRepository : public core::OAuthStateRepository {
public:
    explicit MySqlOAuthStateRepository(std::shared_ptr<ConnectionPool> pool);

    common::Status Create(const core::OAuthState& state) override;
    common::StatusOr<core::OAuthState> Get(const std::string& state_id) override;
    common::StatusOr<bool> MarkUsed(const std::string& state_id) override;
    common::StatusOr<std::size_t> Delete(const std::string& state_id) override;
    common::StatusOr<std::size_t> DeleteExpired(std::int64_t now) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

}
}
