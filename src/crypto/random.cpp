#include "crypto/random.hpp"

#include "crypto/encoding.hpp"

#include <openssl/rand.h>

namespace endurain {
namespace crypto {

common::StatusOr<std::string> RandomBytes(std::size_t length) {
    std::string out(length, '\0');
    if (length == 0) {
        return common::StatusOr<std::string>(std::move(out));
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&out[0]), static_cast<int>(length)) != 1) {
        return common::Status::Internal("RAND_bytes failed");
    }
    return common::StatusOr<std::string>(std::move(out));
}

common::StatusOr<std::string> TokenUrlSafe(std::size_t num_bytes) {
    auto bytes = RandomBytes(num_bytes);
    if (!bytes.IsOk()) {
        return bytes.GetStatus();
    }
    return common::StatusOr<std::string>(Base64UrlEncode(bytes.Value()));
}

common::StatusOr<std::string> RandomUuid() {
    auto bytes_or = RandomBytes(16);
    if (!bytes_or.IsOk()) {
        return bytes_or.GetStatus();
    }
    std::string bytes = std::move(bytes_or.Value());
    bytes[6] = static_cast<char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<char>((bytes[8] & 0x3F) | 0x80);
    std::string hex = HexEncode(bytes);
    std::string uuid = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
                       hex.substr(16, 4) + "-" + hex.substr(20, 12);
    return common::StatusOr<std::string>(std::move(uuid));
}

}
}
