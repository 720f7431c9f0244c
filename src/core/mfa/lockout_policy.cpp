#include "core/mfa/lockout_policy.hpp"

#include <algorithm>

namespace endurain {
namespace core {

LockoutPolicy::LockoutPolicy() : LockoutPolicy(common::MfaConfig{}.lockout_ladder) {}

LockoutPolicy::LockoutPolicy(std::vector<common::LockoutStep> ladder) : ladder_(std::move(ladder)) {
    std::sort(ladder_.begin(), ladder_.end(),
              [](const common::LockoutStep& a, const common::LockoutStep& b) { return a.failures < b.failures; });
}

int LockoutPolicy::LockoutSecondsFor(int failed_count) const {
    int seconds = 0;
    for (const auto& step : ladder_) {
        if (failed_count >= step.failures) {
            seconds = step.lockout_seconds;
        }
    }
    return seconds;
}

}
}
