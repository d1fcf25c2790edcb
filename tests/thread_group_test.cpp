/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/thread_group.hpp"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mediarun;

TEST(ThreadGroupTest, JoinAllWaitsForEveryThread) {
    std::atomic<int> ran{0};
    ThreadGroup group;
    for (int i = 0; i < 3; ++i) {
        group.spawn([&ran] { ++ran; });
    }
    EXPECT_EQ(group.size(), 3u);
    group.joinAll();
    EXPECT_EQ(ran.load(), 3);
    EXPECT_EQ(group.size(), 0u);
}

TEST(ThreadGroupTest, JoinsStartedThreadsWhenScopeUnwinds) {
    std::atomic<bool> finished{false};
    try {
        ThreadGroup group;
        group.spawn([&finished] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            finished = true;
        });
        throw std::runtime_error("second spawn failed");
    } catch (const std::runtime_error&) {
        EXPECT_TRUE(finished.load());
        return;
    }
    FAIL() << "exception did not propagate";
}
