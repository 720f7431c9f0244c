#pragma once

#include "common/status_or.hpp"

#include <string>

namespace endurain {
namespace crypto {

// PBKDF2-HMAC-SHA256 口令哈希
// 编码格式: pbkdf2_sha256$<iterations>$<salt_hex>$<hash_hex>
class PasswordHasher {
public:
    explicit PasswordHasher(int iterations = 100000);

    common::StatusOr<std::string> Hash(const std::string& password) const;
    // 格式错误视为不匹配
    bool Verify(const std::string& password, const std::string& encoded) const;

    int Iterations() const { return iterations_; }

private:
    common::StatusOr<std::string> Derive(const std::string& password, const std::string& salt,
                                         int iterations) const;

    int iterations_;
};

}
}
