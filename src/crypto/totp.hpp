#pragma once

#include <cstdint>
#include <string>

namespace endurain {
namespace crypto {

struct TotpParams {
    int step_seconds = 30;
    int digits = 6;
    int window = 1;   // 允许前后各 window 个时间步
};

// RFC 6238 / HMAC-SHA1, key 为解码后的原始密钥; HMAC 失败时返回空串
std::string GenerateTotp(const std::string& key, std::int64_t unix_time, const TotpParams& params = {});

// base32 密钥校验, 密钥非法时返回 false
bool VerifyTotp(const std::string& base32_secret, const std::string& code, std::int64_t unix_time,
                const TotpParams& params = {});

}
}
