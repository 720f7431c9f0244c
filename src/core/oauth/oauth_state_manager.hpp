#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/oauth/oauth_state_repository.hpp"
#include "core/session/session_repository.hpp"

#include <memory>
#include <optional>
#include <string>

namespace endurain {
namespace core {

struct CreateOAuthStateCommand {
    std::optional<std::int64_t> idp_id;
    std::string nonce;
    ClientType client_type = ClientType::kWeb;
    std::optional<std::string> code_challenge;
    std::string code_challenge_method = "S256";
    std::optional<std::string> redirect_path;
    std::optional<std::string> user_id;
    std::optional<std::string> ip_address;
};

// OAuth/OIDC 流程状态管理: 单次使用, 10 分钟有效
class OAuthStateManager {
public:
    using Status = common::Status;
    using StatusOrState = common::StatusOr<OAuthState>;

    OAuthStateManager(std::shared_ptr<OAuthStateRepository> repository,
                      std::shared_ptr<SessionRepository> sessions,
                      std::shared_ptr<const common::Clock> clock,
                      int ttl_seconds = 600);

    // 返回新的 state id (32 字节熵)
    common::StatusOr<std::string> Create(const CreateOAuthStateCommand& command);

    // 不存在, 已过期, 已使用 三种情况返回同一个 NotFound
    StatusOrState GetValid(const std::string& state_id);

    // 幂等; 状态不存在时返回 NotFound
    Status MarkUsed(const std::string& state_id);

    // 回调时原子地校验并标记使用, 并发调用只有一个成功
    StatusOrState Consume(const std::string& state_id);

    Status Delete(const std::string& state_id);

    common::StatusOr<std::size_t> SweepExpired(std::int64_t now);

    // 通过会话上的 oauth_state_id 找回 PKCE/nonce
    StatusOrState GetBySession(const std::string& session_id);

private:
    static Status Rejected();

    std::shared_ptr<OAuthStateRepository> repository_;
    std::shared_ptr<SessionRepository> sessions_;
    std::shared_ptr<const common::Clock> clock_;
    int ttl_seconds_;
};

}
}
