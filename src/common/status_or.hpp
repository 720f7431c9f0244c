#pragma once

#include "common/status.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace endurain {
namespace common {

// 错误状态或一个值, 二者必居其一
template <typename T>
class StatusOr {
public:
    // 不带值的 OK 会被改写为 Internal
    StatusOr(const Status& status) : status_(status) {
        RejectOkWithoutValue();
    }
    StatusOr(Status&& status) : status_(std::move(status)) {
        RejectOkWithoutValue();
    }

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit StatusOr(U&& value) : status_(Status::OK()), value_(std::in_place, std::forward<U>(value)) {}

    bool IsOk() const { return status_.IsOk(); }
    const Status& GetStatus() const { return status_; }

    // 出错时调用会抛 std::bad_optional_access
    T& Value() & { return value_.value(); }
    T&& Value() && { return std::move(value_).value(); }
    const T& Value() const& { return value_.value(); }
    const T&& Value() const&& = delete;

    template <class U>
    T ValueOr(U&& fallback) const& {
        return value_ ? *value_ : static_cast<T>(std::forward<U>(fallback));
    }

    T* operator->() { return &value_.value(); }
    const T* operator->() const { return &value_.value(); }
    T& operator*() & { return Value(); }
    const T& operator*() const& { return Value(); }

private:
    void RejectOkWithoutValue() {
        if (status_.IsOk()) {
            status_ = Status::Internal("StatusOr constructed from OK status without a value");
        }
    }

    Status status_;
    std::optional<T> value_;
};

} // namespace common
} // namespace endurain
