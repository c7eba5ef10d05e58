// ENDOW - Time Utilities Tests
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include <gtest/gtest.h>

#include "endow/util/time.h"

#include <thread>

namespace endow {
namespace util {
namespace test {

TEST(TimeTest, GetTimeIsRecent) {
    // 2023-11-14, well before any clock this runs on
    EXPECT_GT(GetTime(), 1700000000);
}

TEST(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(60), "1m");
    EXPECT_EQ(FormatDuration(3600), "1h");
    EXPECT_EQ(FormatDuration(SECONDS_PER_DAY), "1d");
    EXPECT_EQ(FormatDuration(SECONDS_PER_DAY + 2 * 3600 + 3 * 60 + 4), "1d 2h 3m 4s");
    EXPECT_EQ(FormatDuration(3605), "1h 5s");
    EXPECT_EQ(FormatDuration(-90), "-1m 30s");
}

TEST(TimeTest, SleepRunsToDeadline) {
    std::atomic<bool> interrupt{false};
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(SleepInterruptible(Milliseconds(20), interrupt));
    EXPECT_GE(std::chrono::steady_clock::now() - start, Milliseconds(20));
}

TEST(TimeTest, SleepInterrupted) {
    std::atomic<bool> interrupt{true};
    EXPECT_TRUE(SleepInterruptible(Seconds(60), interrupt));

    interrupt.store(false);
    std::thread waker([&interrupt] {
        std::this_thread::sleep_for(Milliseconds(30));
        interrupt.store(true);
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(SleepInterruptible(Seconds(60), interrupt));
    waker.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, Seconds(10));
}

} // namespace test
} // namespace util
} // namespace endow
