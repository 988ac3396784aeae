#include "tus/core/keyed_mutex.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using tus::KeyedMutex;

TEST(KeyedMutexTest, EntryExistsOnlyWhileHeld) {
    KeyedMutex locks;
    EXPECT_EQ(locks.size(), 0u);

    {
        auto guard = locks.lock("a");
        EXPECT_EQ(guard.key(), "a");
        EXPECT_EQ(locks.size(), 1u);
    }

    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyedMutexTest, DifferentKeysDoNotBlock) {
    KeyedMutex locks;

    auto first = locks.lock("a");
    std::atomic<bool> acquired{false};

    std::thread other([&]() {
        auto second = locks.lock("b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
}

TEST(KeyedMutexTest, SameKeyIsMutuallyExclusive) {
    KeyedMutex locks;
    int counter = 0;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto guard = locks.lock("shared");
                const int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                ++counter;
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(counter, 8 * 200);
    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyedMutexTest, MovedGuardReleasesOnce) {
    KeyedMutex locks;

    {
        auto guard = locks.lock("k");
        auto moved = std::move(guard);
        EXPECT_EQ(locks.size(), 1u);
    }

    EXPECT_EQ(locks.size(), 0u);
    auto again = locks.lock("k");
    EXPECT_EQ(locks.size(), 1u);
}
