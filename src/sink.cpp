/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/sink.hpp"
#include "mediarun/logger.hpp"

namespace mediarun {

void BoundedEventQueue::onProgress(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (progress_.size() >= capacity_) {
            auto dropped = ++dropped_;
            LOG_TRACE("Event queue full, dropped progress event (" + std::to_string(dropped) + " total)");
            return;
        }
        progress_.push(event);
    }
    available_.notify_one();
}

void BoundedEventQueue::onOutcome(const TerminalOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push(outcome);
    }
    available_.notify_one();
}

std::optional<JobEvent> BoundedEventQueue::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !progress_.empty() || !outcomes_.empty(); })) {
        return std::nullopt;
    }

    JobEvent event;
    // Progress first: an outcome is only queued after its job's progress events
    if (!progress_.empty()) {
        event.kind = JobEvent::Kind::Progress;
        event.progress = std::move(progress_.front());
        progress_.pop();
    } else {
        event.kind = JobEvent::Kind::Outcome;
        event.outcome = std::move(outcomes_.front());
        outcomes_.pop();
    }
    return event;
}

std::size_t BoundedEventQueue::size() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_.size() + outcomes_.size();
    } catch (const std::system_error&) {
        return 0;
    }
}

}
