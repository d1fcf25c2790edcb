/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace mediarun {

// Owns a set of threads and joins all of them on destruction, so an exception
// thrown between two spawns never destroys a joinable thread.
class ThreadGroup final {
public:
    ThreadGroup() = default;
    ~ThreadGroup() { joinAll(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;
    ThreadGroup(ThreadGroup&&) = delete;
    ThreadGroup& operator=(ThreadGroup&&) = delete;

    template <typename Fn, typename... Args>
    void spawn(Fn&& fn, Args&&... args) {
        threads_.emplace_back(std::forward<Fn>(fn), std::forward<Args>(args)...);
    }

    void joinAll() noexcept {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

}
