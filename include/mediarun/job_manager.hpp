/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "mediarun/launcher.hpp"
#include "mediarun/resolver.hpp"
#include "mediarun/sink.hpp"
#include "mediarun/terminator.hpp"
#include "mediarun/types.hpp"

namespace mediarun {

// Copy of the active-job slot.
struct JobSlot {
    bool active = false;
    std::optional<pid_t> processId;
    std::optional<std::filesystem::path> recordedOutputPath;
    bool cancelRequested = false;
};

enum class StartError : uint8_t {
    None = 0,
    SpawnFailure
};

struct StartResult {
    bool ok = false;
    std::optional<pid_t> processId;
    std::shared_future<TerminalOutcome> outcome;  // when ok: ready once the outcome was delivered and the slot cleared
    StartError error = StartError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Supervises one external tool job at a time.
//
// The single active-job slot (pid, recorded output path, cancel flag) is only
// touched under slotMutex_, and never across I/O. Each started job gets a
// driver thread that waits for exit and resolves the outcome, plus one reader
// thread per monitored stream.
//
// Starting while a job is active overwrites the slot: the earlier job keeps
// running and reporting, but cancel() no longer reaches it.
class JobManager final {
public:
    JobManager();
    JobManager(std::shared_ptr<Launcher> launcher, std::shared_ptr<Terminator> terminator);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;
    JobManager(JobManager&&) = delete;
    JobManager& operator=(JobManager&&) = delete;

    [[nodiscard]] StartResult start(const JobRequest& request, std::shared_ptr<EventSink> sink);

    // Idempotent; does nothing when no job is active.
    void cancel() noexcept;

    [[nodiscard]] JobSlot snapshot() const;
    [[nodiscard]] bool isActive() const;

    // Joins every driver thread, i.e. waits for all started jobs to finish.
    void waitIdle() noexcept;
    // Cancels the active job and waits for all jobs.
    void shutdown() noexcept;

private:
    struct Job;
    struct Driver {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void drive(std::shared_ptr<Job> job, std::shared_ptr<std::atomic<bool>> done);
    void readStream(std::shared_ptr<Job> job, FileDescriptor fd, bool diagnostic, const std::string& name);
    void finish(Job& job, const TerminalOutcome& outcome) noexcept;

    [[nodiscard]] bool cancelRequested() const;
    [[nodiscard]] bool takeCancelRequest();
    void recordDestination(Job& job, const std::string& path);
    void clearSlot() noexcept;
    void emitProgress(Job& job, const ProgressEvent& event) noexcept;
    void emitOutcome(Job& job, const TerminalOutcome& outcome) noexcept;
    void reapFinishedDrivers();

    std::shared_ptr<Launcher> launcher_;
    std::shared_ptr<Terminator> terminator_;
    CompletionResolver resolver_;

    mutable std::mutex slotMutex_;
    JobSlot slot_;

    std::mutex driversMutex_;
    std::vector<Driver> drivers_;
};

}
