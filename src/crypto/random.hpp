#pragma once

#include "common/status_or.hpp"

#include <cstddef>
#include <string>

namespace endurain {
namespace crypto {

// OpenSSL CSPRNG 随机字节
common::StatusOr<std::string> RandomBytes(std::size_t length);

// num_bytes 字节熵的 base64url 文本
common::StatusOr<std::string> TokenUrlSafe(std::size_t num_bytes = 32);

// 版本 4 UUID
common::StatusOr<std::string> RandomUuid();

}
}
