#include "crypto/pkce.hpp"

#include "crypto/encoding.hpp"
#include "crypto/hmac.hpp"

#include <cctype>

namespace endurain {
namespace crypto {

namespace {
constexpr std::size_t kMinLength = 43;
constexpr std::size_t kMaxLength = 128;
} // namespace

bool IsValidCodeChallenge(const std::string& challenge, const std::string& method) {
    if (method != kPkceMethodS256) {
        return false;
    }
    if (challenge.size() < kMinLength || challenge.size() > kMaxLength) {
        return false;
    }
    return IsBase64UrlAlphabet(challenge);
}

bool IsValidCodeVerifier(const std::string& verifier) {
    if (verifier.size() < kMinLength || verifier.size() > kMaxLength) {
        return false;
    }
    for (char c : verifier) {
        bool unreserved = std::isalnum(static_cast<unsigned char>(c)) ||
                          c == '-' || c == '.' || c == '_' || c == '~';
        if (!unreserved) {
            return false;
        }
    }
    return true;
}

std::string ComputeS256Challenge(const std::string& verifier) {
    return Base64UrlEncode(Sha256(verifier));
}

bool VerifyCodeVerifier(const std::string& verifier, const std::string& challenge) {
    if (!IsValidCodeVerifier(verifier)) {
        return false;
    }
    return ConstantTimeEquals(ComputeS256Challenge(verifier), challenge);
}

}
}
