#include "crypto/hmac.hpp"

#include "crypto/encoding.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace endurain {
namespace crypto {

std::string Sha256(const std::string& data) {
    unsigned char out[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out);
    return std::string(reinterpret_cast<const char*>(out), SHA256_DIGEST_LENGTH);
}

common::StatusOr<std::string> HmacDigest(const EVP_MD* md, const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (HMAC(md, key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             out, &out_len) == nullptr || out_len == 0) {
        return common::Status::Internal("HMAC computation failed");
    }
    return common::StatusOr<std::string>(std::string(reinterpret_cast<const char*>(out), out_len));
}

common::StatusOr<std::string> HmacSha256(const std::string& key, const std::string& data) {
    return HmacDigest(EVP_sha256(), key, data);
}

common::StatusOr<std::string> HmacSha1(const std::string& key, const std::string& data) {
    return HmacDigest(EVP_sha1(), key, data);
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

TokenHasher::TokenHasher(std::string secret_key) : secret_key_(std::move(secret_key)) {}

common::StatusOr<std::string> TokenHasher::Hash(const std::string& raw_token) const {
    auto mac = HmacSha256(secret_key_, raw_token);
    if (!mac.IsOk()) {
        return mac.GetStatus();
    }
    return common::StatusOr<std::string>(HexEncode(mac.Value()));
}

}
}
