#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace endurain {
namespace core {

// 跨一次重定向的 IdP 绑定令牌, 单次使用, 60 秒有效
struct IdpLinkToken {
    std::string id;
    std::string user_id;
    std::int64_t idp_id = 0;
    std::int64_t created_at = 0;
    std::int64_t expires_at = 0;
    bool used = false;
    std::optional<std::string> ip_address;
};

}
}
