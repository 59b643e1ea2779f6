// ═══════════════════════════════════════════════════════════════════
//  test_scheduler.cpp — Tests for timers and intervals
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <fedgate/scheduler.h>
#include <atomic>
#include <thread>

using namespace fedgate::scheduler;

TEST(TimerHandleTest, SleepRunsFullDurationWhenNotCancelled) {
    TimerHandle handle;
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(handle.sleepFor(std::chrono::milliseconds(30)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(TimerHandleTest, CancelWakesSleeper) {
    TimerHandle handle;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        handle.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(handle.sleepFor(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    canceller.join();
    EXPECT_TRUE(handle.isCancelled());
}

TEST(IntervalTest, ExecutesMultipleTimes) {
    std::atomic<int> count{0};
    Interval interval;
    interval.start([&] { count++; }, 30);
    EXPECT_TRUE(interval.active());

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    interval.stop();
    EXPECT_GE(count.load(), 3);
    EXPECT_FALSE(interval.active());
}

TEST(IntervalTest, NoCallbackAfterStopReturns) {
    std::atomic<int> count{0};
    Interval interval;
    interval.start([&] { count++; }, 20);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    interval.stop();
    int countAtStop = count.load();

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(count.load(), countAtStop);
}

TEST(IntervalTest, RestartReplacesPreviousLoop) {
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    Interval interval;
    interval.start([&] { first++; }, 20);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    interval.start([&] { second++; }, 20);
    int firstAtRestart = first.load();

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    interval.stop();
    EXPECT_EQ(first.load(), firstAtRestart);
    EXPECT_GE(second.load(), 1);
}
