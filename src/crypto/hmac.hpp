#pragma once

#include "common/status_or.hpp"

#include <openssl/evp.h>

#include <string>

namespace endurain {
namespace crypto {

// 原始摘要, 返回二进制字节串
std::string Sha256(const std::string& data);
// OpenSSL 返回失败时为 Internal, 不会产生空摘要
common::StatusOr<std::string> HmacDigest(const EVP_MD* md, const std::string& key, const std::string& data);
common::StatusOr<std::string> HmacSha256(const std::string& key, const std::string& data);
common::StatusOr<std::string> HmacSha1(const std::string& key, const std::string& data);

// 常量时间比较, 长度不同直接返回 false
bool ConstantTimeEquals(const std::string& a, const std::string& b);

// 以服务端密钥计算令牌的确定性查找哈希 (十六进制)
class TokenHasher {
public:
    explicit TokenHasher(std::string secret_key);

    common::StatusOr<std::string> Hash(const std::string& raw_token) const;

private:
    std::string secret_key_;
};

}
}
