#pragma once

#include <atomic>
#include <cstdint>

namespace endurain {
namespace common {

// 时间源, 所有过期计算统一使用 UTC Unix 秒
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::int64_t NowSeconds() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t NowSeconds() const override;
};

// 测试用可控时钟
class ManualClock : public Clock {
public:
    explicit ManualClock(std::int64_t start = 1700000000) : now_(start) {}

    std::int64_t NowSeconds() const override { return now_.load(); }
    void Set(std::int64_t now) { now_.store(now); }
    void Advance(std::int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<std::int64_t> now_;
};

}
}
