#pragma once

#include "common/status_or.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace endurain {
namespace maintenance {

// 清理回调, 返回删除的条目数
using SweepJob = std::function<common::StatusOr<std::size_t>()>;

// 在独立线程上按固定间隔执行已注册的清理回调
class Sweeper {
public:
    explicit Sweeper(std::chrono::seconds interval);
    ~Sweeper();

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    // 只能在 Start 之前注册
    void Register(std::string name, SweepJob job);

    void Start();
    // 唤醒并等待线程退出, 可重复调用
    void Stop();

    // 同步执行一轮, 返回各回调删除数之和; 失败的回调只记录日志
    std::size_t RunOnce();

    bool Running() const noexcept { return running_.load(); }
    std::uint64_t Rounds() const noexcept { return rounds_.load(); }

private:
    struct NamedJob {
        std::string name;
        SweepJob job;
    };

    void Loop();

    std::chrono::seconds interval_;
    std::vector<NamedJob> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> rounds_{0};
    std::thread worker_;
};

}
}
