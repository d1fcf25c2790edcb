/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/job_manager.hpp"
#include "mediarun/diagnostics.hpp"
#include "mediarun/logger.hpp"
#include "mediarun/progress.hpp"
#include "mediarun/thread_group.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <unistd.h>

namespace mediarun {

struct JobManager::Job {
    JobRequest request;
    std::shared_ptr<EventSink> sink;
    std::unique_ptr<ProcessHandle> process;
    DiagnosticBuffer diagnostics;
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
    std::string label;

    // Guarded by slotMutex_, like the slot itself
    std::optional<std::filesystem::path> recordedOutputPath;

    std::promise<TerminalOutcome> promise;
    bool finished = false;
};

JobManager::JobManager()
    : JobManager(std::make_shared<ProcessLauncher>(), std::make_shared<ProcessGroupTerminator>()) {
}

JobManager::JobManager(std::shared_ptr<Launcher> launcher, std::shared_ptr<Terminator> terminator)
    : launcher_(std::move(launcher)), terminator_(std::move(terminator)) {
    LOG_DEBUG("JobManager created");
}

JobManager::~JobManager() {
    shutdown();
}

StartResult JobManager::start(const JobRequest& request, std::shared_ptr<EventSink> sink) {
    StartResult result;

    auto job = std::make_shared<Job>();
    job->request = request;
    job->sink = std::move(sink);
    job->label = std::string(toString(request.tool)) + " " + request.executable.filename().string();
    result.outcome = job->promise.get_future().share();

    // Registered before spawning so an immediate cancel() has something to act on
    bool overwritten = false;
    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        overwritten = slot_.active;
        slot_.active = true;
        slot_.processId.reset();
        slot_.recordedOutputPath = request.outputPath;
        job->recordedOutputPath = request.outputPath;
    }
    if (overwritten) {
        LOG_WARN("Starting " + job->label + " while another job is active; the earlier job is no longer tracked");
    }

    LaunchSpec spec;
    spec.executable = request.executable;
    spec.arguments = request.arguments;
    spec.streams = monitoredStreams(request.tool);
    spec.priority = request.priority;

    LOG_INFO("Starting " + job->label + " with " + std::to_string(request.arguments.size()) + " argument(s)");
    LaunchResult launched = launcher_->launch(spec);
    if (!launched) {
        clearSlot();
        result.error = StartError::SpawnFailure;
        result.message = launched.message.empty() ? "failed to start " + request.executable.string() : launched.message;
        LOG_ERROR("Spawn failure: " + result.message);
        return result;
    }

    result.processId = launched.handle->processId();
    bool cancelledDuringSpawn = false;
    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        slot_.processId = result.processId;
        cancelledDuringSpawn = slot_.cancelRequested;
    }
    if (cancelledDuringSpawn && result.processId) {
        LOG_INFO("Cancel arrived during spawn, terminating pid " + std::to_string(*result.processId));
        auto terminated = terminator_->terminate(*result.processId);
        if (!terminated) {
            LOG_WARN("Terminate failed: " + terminated.error);
        }
    }

    job->process = std::move(launched.handle);
    if (result.processId) {
        job->label += " [" + std::to_string(*result.processId) + "]";
    }

    reapFinishedDrivers();
    auto done = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(driversMutex_);
        drivers_.push_back(Driver{std::thread(&JobManager::drive, this, job, done), done});
    }

    result.ok = true;
    return result;
}

void JobManager::cancel() noexcept {
    try {
        std::optional<pid_t> pid;
        std::optional<std::filesystem::path> partial;
        bool active = false;
        bool repeated = false;
        {
            std::lock_guard<std::mutex> lock(slotMutex_);
            active = slot_.active;
            if (active) {
                repeated = slot_.cancelRequested;
                slot_.cancelRequested = true;
                pid = slot_.processId;
                partial = slot_.recordedOutputPath;
            }
        }
        if (!active) {
            LOG_DEBUG("Cancel requested with no active job");
            return;
        }
        if (repeated) {
            LOG_DEBUG("Cancel already pending, signalling again");
        }

        LOG_INFO(pid ? "Cancelling job with pid " + std::to_string(*pid) : std::string("Cancelling job with no live process"));
        if (pid) {
            auto terminated = terminator_->terminate(*pid);
            if (!terminated) {
                LOG_WARN("Terminate failed for pid " + std::to_string(*pid) + ": " + terminated.error);
            }
        }

        // Early cleanup; the resolver deletes again once the process is gone
        CompletionResolver::removePartialOutput(partial);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Cancel failed: ") + e.what());
    }
}

JobSlot JobManager::snapshot() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return slot_;
}

bool JobManager::isActive() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return slot_.active;
}

void JobManager::waitIdle() noexcept {
    for (;;) {
        std::vector<Driver> pending;
        {
            std::lock_guard<std::mutex> lock(driversMutex_);
            pending.swap(drivers_);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& driver : pending) {
            if (driver.thread.joinable()) {
                driver.thread.join();
            }
        }
    }
}

void JobManager::shutdown() noexcept {
    cancel();
    waitIdle();
}

void JobManager::drive(std::shared_ptr<Job> job, std::shared_ptr<std::atomic<bool>> done) {
    auto pid = job->process ? job->process->processId() : std::nullopt;
    setThreadName(pid ? "Driver-" + std::to_string(*pid) : std::string("Driver"));

    try {
        // Joined on every path out of this block
        ThreadGroup readers;
        if (auto out = job->process->takeStdout()) {
            readers.spawn(&JobManager::readStream, this, job, std::move(out), false, "stdout");
        }
        if (auto err = job->process->takeStderr()) {
            readers.spawn(&JobManager::readStream, this, job, std::move(err), true, "stderr");
        }

        WaitResult exit = job->process->wait();
        LOG_DEBUG("Process exited: " + job->label + " code " + std::to_string(exit.status.exitCode));

        // The pid is reaped and may be reused; cancel() must not signal it
        {
            std::lock_guard<std::mutex> lock(slotMutex_);
            if (pid && slot_.processId == pid) {
                slot_.processId.reset();
            }
        }

        // All progress of this job is delivered before its outcome
        readers.joinAll();

        bool cancelled = takeCancelRequest();
        std::optional<std::filesystem::path> recorded;
        {
            std::lock_guard<std::mutex> lock(slotMutex_);
            recorded = job->recordedOutputPath;
        }

        finish(*job, resolver_.resolve(cancelled, exit, recorded, job->request, job->diagnostics));

    } catch (const std::exception& e) {
        LOG_ERROR("Driver error for " + job->label + ": " + std::string(e.what()));
        finish(*job, TerminalOutcome::failed(-1, std::string("internal error: ") + e.what()));
    } catch (...) {
        LOG_ERROR("Unknown driver error for " + job->label);
        finish(*job, TerminalOutcome::failed(-1, "internal error"));
    }

    clearThreadName();
    done->store(true);
}

void JobManager::finish(Job& job, const TerminalOutcome& outcome) noexcept {
    if (job.finished) {
        return;
    }
    job.finished = true;

    emitOutcome(job, outcome);
    clearSlot();
    try {
        job.promise.set_value(outcome);
    } catch (const std::future_error& e) {
        LOG_ERROR(std::string("Outcome already set: ") + e.what());
    }
}

void JobManager::readStream(std::shared_ptr<Job> job, FileDescriptor fd, bool diagnostic, const std::string& name) {
    setThreadName("Reader-" + name);

    try {
        RecordSplitter splitter;
        ProgressParser parser(job->request.durationSeconds, job->startedAt);
        std::array<char, 4096> buf{};
        std::size_t records = 0;

        // Returns false once cancellation asks the reader to stop
        auto handle = [&](const std::string& record) {
            if (cancelRequested()) {
                return false;
            }
            ++records;
            if (diagnostic) {
                job->diagnostics.append(decodeLossy(record));
            }
            ParseResult parsed;
            try {
                parsed = parser.parse(record);
            } catch (const std::exception& e) {
                LOG_DEBUG(name + " record not parsed: " + std::string(e.what()));
                return true;
            }
            if (parsed.destination) {
                recordDestination(*job, *parsed.destination);
            }
            if (parsed.event) {
                emitProgress(*job, *parsed.event);
            }
            return true;
        };

        bool stopped = false;
        while (!stopped) {
            ssize_t n = ::read(fd.get(), buf.data(), buf.size());
            if (n == -1 && errno == EINTR) {
                continue;
            }
            if (n == -1) {
                LOG_DEBUG(name + " read error: " + std::string(std::strerror(errno)));
                break;
            }
            if (n == 0) {
                break;
            }
            for (const auto& record : splitter.feed(buf.data(), static_cast<std::size_t>(n))) {
                if (!handle(record)) {
                    stopped = true;
                    break;
                }
            }
        }

        if (stopped) {
            LOG_DEBUG(name + " reader stopped early on cancel after " + std::to_string(records) + " records");
        } else {
            if (auto rest = splitter.finish()) {
                (void)handle(*rest);
            }
            LOG_DEBUG(name + " reached end of stream after " + std::to_string(records) + " records");
        }
    } catch (const std::exception& e) {
        LOG_ERROR(name + " reader error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR(name + " unknown reader error");
    }

    clearThreadName();
    // fd closes here; a child still writing gets EPIPE
}

bool JobManager::cancelRequested() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return slot_.cancelRequested;
}

bool JobManager::takeCancelRequest() {
    std::lock_guard<std::mutex> lock(slotMutex_);
    bool requested = slot_.cancelRequested;
    slot_.cancelRequested = false;
    return requested;
}

void JobManager::recordDestination(Job& job, const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        job.recordedOutputPath = std::filesystem::path(path);
        slot_.recordedOutputPath = job.recordedOutputPath;
    }
    LOG_DEBUG("Output path now " + path);
}

void JobManager::clearSlot() noexcept {
    std::lock_guard<std::mutex> lock(slotMutex_);
    slot_.active = false;
    slot_.processId.reset();
    slot_.recordedOutputPath.reset();
    // A cancel that lands after resolution has nothing left to cancel
    slot_.cancelRequested = false;
}

void JobManager::emitProgress(Job& job, const ProgressEvent& event) noexcept {
    if (!job.sink) return;
    try {
        job.sink->onProgress(event);
    } catch (const std::exception& e) {
        LOG_WARN("Progress delivery failed: " + std::string(e.what()));
    } catch (...) {
        LOG_WARN("Progress delivery failed");
    }
}

void JobManager::emitOutcome(Job& job, const TerminalOutcome& outcome) noexcept {
    if (!job.sink) return;
    try {
        job.sink->onOutcome(outcome);
    } catch (const std::exception& e) {
        LOG_WARN("Outcome delivery failed: " + std::string(e.what()));
    } catch (...) {
        LOG_WARN("Outcome delivery failed");
    }
}

void JobManager::reapFinishedDrivers() {
    std::lock_guard<std::mutex> lock(driversMutex_);
    for (auto it = drivers_.begin(); it != drivers_.end();) {
        if (it->done->load() && it->thread.joinable()) {
            it->thread.join();
            it = drivers_.erase(it);
        } else {
            ++it;
        }
    }
}

}
