#include "crypto/password_hasher.hpp"

#include "crypto/encoding.hpp"
#include "crypto/hmac.hpp"
#include "crypto/random.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>

#include <cstdlib>
#include <vector>

namespace endurain {
namespace crypto {

namespace {

constexpr char kScheme[] = "pbkdf2_sha256";
constexpr std::size_t kSaltLength = 16;
constexpr int kHashLength = 32;

std::vector<std::string> Split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

PasswordHasher::PasswordHasher(int iterations) : iterations_(iterations > 0 ? iterations : 1) {}

common::StatusOr<std::string> PasswordHasher::Derive(const std::string& password, const std::string& salt,
                                                     int iterations) const {
    unsigned char hash[kHashLength];
    int result = PKCS5_PBKDF2_HMAC(
        password.data(), static_cast<int>(password.size()),
        reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        kHashLength,
        hash);
    if (result != 1) {
        return common::Status::Internal("PKCS5_PBKDF2_HMAC failed");
    }
    return common::StatusOr<std::string>(std::string(reinterpret_cast<const char*>(hash), kHashLength));
}

common::StatusOr<std::string> PasswordHasher::Hash(const std::string& password) const {
    auto salt = RandomBytes(kSaltLength);
    if (!salt.IsOk()) {
        return salt.GetStatus();
    }
    auto derived = Derive(password, salt.Value(), iterations_);
    if (!derived.IsOk()) {
        return derived.GetStatus();
    }
    return common::StatusOr<std::string>(
        fmt::format("{}${}${}${}", kScheme, iterations_, HexEncode(salt.Value()), HexEncode(derived.Value())));
}

bool PasswordHasher::Verify(const std::string& password, const std::string& encoded) const {
    auto parts = Split(encoded, '$');
    if (parts.size() != 4 || parts[0] != kScheme) {
        return false;
    }
    char* end = nullptr;
    long iterations = std::strtol(parts[1].c_str(), &end, 10);
    if (end == parts[1].c_str() || *end != '\0' || iterations <= 0) {
        return false;
    }
    auto salt = HexDecode(parts[2]);
    auto expected = HexDecode(parts[3]);
    if (!salt.IsOk() || !expected.IsOk()) {
        return false;
    }
    auto derived = Derive(password, salt.Value(), static_cast<int>(iterations));
    if (!derived.IsOk()) {
        return false;
    }
    return ConstantTimeEquals(derived.Value(), expected.Value());
}

}
}
