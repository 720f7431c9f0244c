#pragma once

#include "common/status_or.hpp"

#include <string>

namespace endurain {
namespace crypto {

// 字节串与文本编码之间的转换
std::string HexEncode(const std::string& bytes);
common::StatusOr<std::string> HexDecode(const std::string& hex);

// RFC 4648 base64url, 不带填充
std::string Base64UrlEncode(const std::string& bytes);
bool IsBase64UrlAlphabet(const std::string& text);

// RFC 4648 base32, 解码时忽略大小写, 空格和填充
std::string Base32Encode(const std::string& bytes);
common::StatusOr<std::string> Base32Decode(const std::string& text);

}
}
