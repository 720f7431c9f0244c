#include <gtest/gtest.h>

#include "maintenance/sweeper.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace endurain::common;
using namespace endurain::maintenance;

namespace {

SweepJob Removes(std::size_t count) {
    return [count]() { return StatusOr<std::size_t>(count); };
}

}

TEST(SweeperTest, RunOnceSumsRemovedCounts) {
    Sweeper sweeper(std::chrono::seconds(60));
    sweeper.Register("sessions", Removes(3));
    sweeper.Register("oauth_states", Removes(0));
    sweeper.Register("link_tokens", Removes(2));

    EXPECT_EQ(sweeper.RunOnce(), 5u);
    EXPECT_EQ(sweeper.Rounds(), 1u);
    EXPECT_EQ(sweeper.RunOnce(), 5u);
    EXPECT_EQ(sweeper.Rounds(), 2u);
}

TEST(SweeperTest, FailingJobDoesNotStopTheRound) {
    Sweeper sweeper(std::chrono::seconds(60));
    sweeper.Register("broken", []() -> StatusOr<std::size_t> { return Status::Unavailable("db down"); });
    sweeper.Register("throws", []() -> StatusOr<std::size_t> { throw std::runtime_error("boom"); });
    sweeper.Register("healthy", Removes(4));

    EXPECT_EQ(sweeper.RunOnce(), 4u);
    EXPECT_EQ(sweeper.Rounds(), 1u);
}

TEST(SweeperTest, StartRunsJobsPeriodically) {
    std::atomic<int> calls{0};
    Sweeper sweeper(std::chrono::seconds(1));
    sweeper.Register("counter", [&calls]() {
        calls.fetch_add(1);
        return StatusOr<std::size_t>(std::size_t{1});
    });

    sweeper.Start();
    EXPECT_TRUE(sweeper.Running());
    for (int i = 0; i < 50 && calls.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    sweeper.Stop();

    EXPECT_FALSE(sweeper.Running());
    EXPECT_GE(calls.load(), 1);
    EXPECT_GE(sweeper.Rounds(), 1u);
}

TEST(SweeperTest, StopIsIdempotentAndPromptly) {
    Sweeper sweeper(std::chrono::seconds(3600));
    sweeper.Register("noop", Removes(0));
    sweeper.Start();
    sweeper.Start();

    auto begin = std::chrono::steady_clock::now();
    sweeper.Stop();
    sweeper.Stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(sweeper.Running());
    EXPECT_EQ(sweeper.Rounds(), 0u);
}

TEST(SweeperTest, RegisterAfterStartIsIgnored) {
    Sweeper sweeper(std::chrono::seconds(3600));
    sweeper.Register("first", Removes(1));
    sweeper.Start();
    sweeper.Register("late", Removes(100));
    sweeper.Stop();

    EXPECT_EQ(sweeper.RunOnce(), 1u);
}

TEST(SweeperTest, NonPositiveIntervalStillStops) {
    Sweeper sweeper(std::chrono::seconds(0));
    sweeper.Start();
    sweeper.Stop();
    EXPECT_FALSE(sweeper.Running());
}
