/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <system_error>

#include "mediarun/types.hpp"

namespace mediarun {

// Receives job events. Delivery is fire-and-forget: exceptions thrown here are
// logged by the caller and otherwise ignored, and implementations must not
// block, or stream draining stalls.
class EventSink {
public:
    virtual ~EventSink() = default;

    // From reader threads, possibly two at once.
    virtual void onProgress(const ProgressEvent& event) = 0;
    // Exactly once per job, after every progress event of that job.
    virtual void onOutcome(const TerminalOutcome& outcome) = 0;
};

struct JobEvent {
    enum class Kind : uint8_t { Progress, Outcome };

    Kind kind = Kind::Progress;
    ProgressEvent progress;
    TerminalOutcome outcome;
};

// Sink that hands events to a consumer thread. Progress events beyond the
// capacity are dropped (and counted) instead of queued; outcomes are always kept.
class BoundedEventQueue final : public EventSink {
public:
    explicit BoundedEventQueue(std::size_t capacity = 256) noexcept : capacity_(capacity) {}

    BoundedEventQueue(const BoundedEventQueue&) = delete;
    BoundedEventQueue& operator=(const BoundedEventQueue&) = delete;

    void onProgress(const ProgressEvent& event) override;
    void onOutcome(const TerminalOutcome& outcome) override;

    // Next event in delivery order, or nothing if none arrives within `timeout`.
    [[nodiscard]] std::optional<JobEvent> next(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_.load(); }
    [[nodiscard]] std::size_t size() const noexcept;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::queue<ProgressEvent> progress_;
    std::queue<TerminalOutcome> outcomes_;
    std::atomic<std::size_t> dropped_{0};
};

}
