#include <gtest/gtest.h>
#include "periodic_timer.h"
#include "test_helpers.h"
#include <atomic>

namespace droidrun {
namespace {

using testing_support::eventually;

TEST(PeriodicTimerTest, FiresRepeatedlyUntilStopped) {
    std::atomic<int> ticks{0};
    PeriodicTimer timer(std::chrono::milliseconds(20), [&] { ++ticks; });

    timer.start();
    EXPECT_TRUE(timer.running());
    EXPECT_TRUE(eventually([&] { return ticks.load() >= 3; }));

    timer.stop();
    EXPECT_FALSE(timer.running());
    int after_stop = ticks.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(ticks.load(), after_stop);
}

TEST(PeriodicTimerTest, StartDoesNotBlockAndFirstTickWaitsOneInterval) {
    std::atomic<int> ticks{0};
    PeriodicTimer timer(std::chrono::seconds(5), [&] { ++ticks; });

    auto start = std::chrono::steady_clock::now();
    timer.start();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));
    EXPECT_EQ(ticks.load(), 0);

    // Stop wakes the sleeping loop instead of waiting out the interval
    start = std::chrono::steady_clock::now();
    timer.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));
}

TEST(PeriodicTimerTest, CallbackMayStopItsOwnTimer) {
    std::atomic<int> ticks{0};
    std::unique_ptr<PeriodicTimer> timer;
    timer = std::make_unique<PeriodicTimer>(std::chrono::milliseconds(10), [&] {
        if (++ticks == 2) timer->stop();
    });

    timer->start();
    EXPECT_TRUE(eventually([&] { return !timer->running(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(ticks.load(), 2);
    timer.reset();
}

TEST(PeriodicTimerTest, ThrowingCallbackKeepsTicking) {
    std::atomic<int> ticks{0};
    PeriodicTimer timer(std::chrono::milliseconds(10), [&] {
        ++ticks;
        throw std::runtime_error("transient");
    });

    timer.start();
    EXPECT_TRUE(eventually([&] { return ticks.load() >= 3; }));
    timer.stop();
}

TEST(PeriodicTimerTest, CanRestartAfterStop) {
    std::atomic<int> ticks{0};
    PeriodicTimer timer(std::chrono::milliseconds(10), [&] { ++ticks; });

    timer.start();
    timer.stop();
    int before = ticks.load();
    timer.start();
    EXPECT_TRUE(eventually([&] { return ticks.load() > before; }));
    timer.stop();
}

} // namespace
} // namespace droidrun
