#include "crypto/totp.hpp"

#include "crypto/encoding.hpp"
#include "crypto/hmac.hpp"

#include <cctype>

namespace endurain {
namespace crypto {

namespace {

// 计算某个时间步的动态截断码
common::StatusOr<std::string> CodeForCounter(const std::string& key, std::uint64_t counter, int digits) {
    std::string message(8, '\0');
    for (int i = 7; i >= 0; --i) {
        message[i] = static_cast<char>(counter & 0xFF);
        counter >>= 8;
    }
    auto digest = HmacSha1(key, message);
    if (!digest.IsOk()) {
        return digest.GetStatus();
    }
    const std::string& mac = digest.Value();
    int offset = static_cast<unsigned char>(mac.back()) & 0x0F;
    std::uint32_t binary = ((static_cast<unsigned char>(mac[offset]) & 0x7F) << 24) |
                           (static_cast<unsigned char>(mac[offset + 1]) << 16) |
                           (static_cast<unsigned char>(mac[offset + 2]) << 8) |
                           static_cast<unsigned char>(mac[offset + 3]);
    std::uint32_t modulo = 1;
    for (int i = 0; i < digits; ++i) {
        modulo *= 10;
    }
    std::string code = std::to_string(binary % modulo);
    if (static_cast<int>(code.size()) < digits) {
        code.insert(0, static_cast<std::size_t>(digits) - code.size(), '0');
    }
    return common::StatusOr<std::string>(std::move(code));
}

} // namespace

std::string GenerateTotp(const std::string& key, std::int64_t unix_time, const TotpParams& params) {
    std::uint64_t counter = static_cast<std::uint64_t>(unix_time / params.step_seconds);
    auto code = CodeForCounter(key, counter, params.digits);
    if (!code.IsOk()) {
        return std::string();
    }
    return code.Value();
}

bool VerifyTotp(const std::string& base32_secret, const std::string& code, std::int64_t unix_time,
                const TotpParams& params) {
    if (static_cast<int>(code.size()) != params.digits) {
        return false;
    }
    for (char c : code) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    auto key = Base32Decode(base32_secret);
    if (!key.IsOk()) {
        return false;
    }
    std::int64_t counter = unix_time / params.step_seconds;
    bool matched = false;
    for (int delta = -params.window; delta <= params.window; ++delta) {
        std::int64_t c = counter + delta;
        if (c < 0) {
            continue;
        }
        auto expected = CodeForCounter(key.Value(), static_cast<std::uint64_t>(c), params.digits);
        if (!expected.IsOk()) {
            return false;
        }
        if (ConstantTimeEquals(expected.Value(), code)) {
            matched = true;
        }
    }
    return matched;
}

}
}
