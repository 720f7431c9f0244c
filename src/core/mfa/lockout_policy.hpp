#pragma once

#include "common/config.hpp"

#include <vector>

namespace endurain {
namespace core {

// 渐进式锁定阶梯: 失败次数达到某级阈值即施加该级锁定时长
class LockoutPolicy {
public:
    LockoutPolicy();
    explicit LockoutPolicy(std::vector<common::LockoutStep> ladder);

    // 返回 failed_count 对应的锁定秒数, 未达到任何阈值返回 0
    int LockoutSecondsFor(int failed_count) const;

    const std::vector<common::LockoutStep>& Ladder() const { return ladder_; }

private:
    std::vector<common::LockoutStep> ladder_;   // 按 failures 升序
};

}
}
