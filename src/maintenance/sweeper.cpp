#include "maintenance/sweeper.hpp"

#include "common/logger.hpp"

#include <exception>

namespace endurain {
namespace maintenance {

Sweeper::Sweeper(std::chrono::seconds interval)
    : interval_(interval.count() > 0 ? interval : std::chrono::seconds(1)) {}

Sweeper::~Sweeper() {
    Stop();
}

void Sweeper::Register(std::string name, SweepJob job) {
    if (running_.load()) {
        ENDURAIN_LOG_WARN("Sweep job {} registered after start, ignored", name);
        return;
    }
    jobs_.push_back(NamedJob{std::move(name), std::move(job)});
}

void Sweeper::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread(&Sweeper::Loop, this);
    ENDURAIN_LOG_INFO("Sweeper started with {} jobs, interval {}s", jobs_.size(), interval_.count());
}

void Sweeper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
        ENDURAIN_LOG_INFO("Sweeper stopped after {} rounds", rounds_.load());
    }
    running_.store(false);
}

std::size_t Sweeper::RunOnce() {
    std::size_t total = 0;
    for (const auto& entry : jobs_) {
        try {
            auto removed = entry.job();
            if (!removed.IsOk()) {
                ENDURAIN_LOG_ERROR("Sweep job {} failed: {}", entry.name, removed.GetStatus().Message());
                continue;
            }
            if (removed.Value() > 0) {
                ENDURAIN_LOG_INFO("Sweep job {} removed {} entries", entry.name, removed.Value());
            }
            total += removed.Value();
        } catch (const std::exception& ex) {
            ENDURAIN_LOG_ERROR("Sweep job {} threw: {}", entry.name, ex.what());
        }
    }
    rounds_.fetch_add(1);
    return total;
}

void Sweeper::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        RunOnce();
        lock.lock();
    }
}

}
}
