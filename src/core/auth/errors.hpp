#pragma once

#include "common.pb.h"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <string>

namespace endurain {
namespace core {

enum class AuthErrorCode {
    kOk = 0,
    kInvalidCredentials = 1,
    kTokenRejected = 2,        // 不存在 / 过期 / 已使用, 对外不区分
    kReuseInGrace = 3,
    kTokenTheft = 4,
    kLockedOut = 5,
    kMfaRequired = 6,
    kNoPendingLogin = 7,
    kInvalidClientType = 8,
    kInvalidPkce = 9,
    kInvalidCsrf = 10,
    kInternal = 11,
    kInvalidRequest = 12,      // 请求字段缺失或越界
};

constexpr char kGenericTokenMessage[] = "Invalid or expired token";
constexpr char kGenericInternalMessage[] = "Internal server error";

// 将 AuthErrorCode 转换为通用 Status
inline ::endurain::common::Status FromAuthError(AuthErrorCode error, std::string message = "") {
    using ::endurain::common::Status;
    switch (error) {
        case AuthErrorCode::kOk:
            return Status::OK();
        case AuthErrorCode::kInvalidCredentials:
            return Status::Unauthenticated(message.empty() ? "Invalid username or password" : message);
        case AuthErrorCode::kTokenRejected:
            return Status::Unauthenticated(kGenericTokenMessage);
        case AuthErrorCode::kReuseInGrace:
            return Status::FailedPrecondition(message.empty() ? "Token already rotated, use the latest token" : message);
        case AuthErrorCode::kTokenTheft:
            return Status::PermissionDenied(message.empty() ? "Token reuse detected. All sessions invalidated." : message);
        case AuthErrorCode::kLockedOut:
            return Status::ResourceExhausted(message.empty() ? "Too many failed attempts" : message);
        case AuthErrorCode::kMfaRequired:
            return Status::FailedPrecondition(message.empty() ? "MFA verification required" : message);
        case AuthErrorCode::kNoPendingLogin:
            return Status::NotFound(message.empty() ? "No pending MFA login found for this username" : message);
        case AuthErrorCode::kInvalidClientType:
            return Status::InvalidArgument(message.empty() ? "Invalid client type" : message);
        case AuthErrorCode::kInvalidPkce:
            return Status::InvalidArgument(message.empty() ? "Invalid PKCE parameters" : message);
        case AuthErrorCode::kInvalidCsrf:
            return Status::InvalidArgument(message.empty() ? "Invalid CSRF token" : message);
        case AuthErrorCode::kInternal:
            return Status::Internal(kGenericInternalMessage);
        case AuthErrorCode::kInvalidRequest:
            return Status::InvalidArgument(message.empty() ? "Invalid request" : message);
    }
    return Status::Internal("Unknown auth error");
}

// 将错误信息填充到 protobuf Error 消息中; 内部错误只暴露通用信息
inline void ErrorToProto(AuthErrorCode error, const ::endurain::common::Status& status,
                         ::proto::common::Error* error_proto) {
    if (!error_proto) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(error));
    if (error == AuthErrorCode::kInternal || status.Code() == ::endurain::common::StatusCode::kInternal ||
        status.Code() == ::endurain::common::StatusCode::kUnavailable) {
        error_proto->set_message(kGenericInternalMessage);
        return;
    }
    if (error == AuthErrorCode::kTokenRejected) {
        error_proto->set_message(kGenericTokenMessage);
        return;
    }
    error_proto->set_message(status.Message());
}

}
}
