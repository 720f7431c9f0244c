#pragma once

#include <string>

namespace endurain {
namespace crypto {

// 仅支持 S256
constexpr char kPkceMethodS256[] = "S256";

// challenge 长度 43..128, base64url 字符集
bool IsValidCodeChallenge(const std::string& challenge, const std::string& method);

// verifier 长度 43..128, RFC 7636 unreserved 字符集
bool IsValidCodeVerifier(const std::string& verifier);

// base64url(SHA256(verifier)) == challenge
bool VerifyCodeVerifier(const std::string& verifier, const std::string& challenge);

std::string ComputeS256Challenge(const std::string& verifier);

}
}
