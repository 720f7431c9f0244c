#pragma once

#include "core/session/session.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace endurain {
namespace core {

// 一次 OAuth/OIDC 流程的服务端状态, id 即 state 参数本身
struct OAuthState {
    std::string id;
    std::optional<std::int64_t> idp_id;          // 口令登录 PKCE 流程无 IdP
    std::optional<std::string> user_id;          // 绑定模式下的当前用户
    std::string nonce;
    std::optional<std::string> code_challenge;
    std::optional<std::string> code_challenge_method;
    std::optional<std::string> redirect_path;
    ClientType client_type = ClientType::kWeb;
    std::optional<std::string> ip_address;
    std::int64_t created_at = 0;
    std::int64_t expires_at = 0;
    bool used = false;
};

}
}
