#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace endurain {
namespace core {

// 客户端类型, 决定令牌的投递方式
enum class ClientType {
    kWeb = 0,
    kMobile = 1,
};

const char* ClientTypeToString(ClientType type);
std::optional<ClientType> ParseClientType(const std::string& text);

// 一次登录对应的会话, refresh 令牌只保存其 HMAC
struct Session {
    std::string id;
    std::string user_id;
    std::string token_family_id;
    std::string refresh_token_hash;
    int rotation_count = 0;
    std::int64_t created_at = 0;
    std::int64_t last_rotation_at = 0;
    std::int64_t last_activity_at = 0;
    std::int64_t expires_at = 0;
    std::string csrf_token_hash;          // PKCE 交换的会话在首次刷新前为空
    std::string ip_address;
    std::string user_agent;
    std::optional<std::string> oauth_state_id;
    bool tokens_exchanged = false;
};

// 会话的局部更新, 只写入已赋值的字段
struct SessionUpdate {
    std::optional<std::string> refresh_token_hash;
    std::optional<int> rotation_count;
    std::optional<std::int64_t> last_rotation_at;
    std::optional<std::int64_t> last_activity_at;
    std::optional<std::int64_t> expires_at;
    std::optional<std::string> csrf_token_hash;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
    // 外层 engaged 且内层为空表示清除关联
    std::optional<std::optional<std::string>> oauth_state_id;
    std::optional<bool> tokens_exchanged;

    void ApplyTo(Session& session) const;
};

// 已被轮换掉的 refresh 令牌墓碑
struct RotatedRefreshToken {
    std::string token_family_id;
    std::string hashed_token;
    int rotation_count = 0;
    std::int64_t rotated_at = 0;
    std::int64_t expires_at = 0;
};

// 家族失效时删除的行数
struct FamilyDeletion {
    std::size_t sessions = 0;
    std::size_t tokens = 0;
};

}
}
