/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

#include "mediarun/types.hpp"

namespace mediarun {

// Owning wrapper for a raw descriptor; closes on destruction.
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] int release() noexcept;
    void reset(int fd = -1) noexcept;
    explicit operator bool() const noexcept { return fd_ >= 0; }

private:
    int fd_ = -1;
};

struct ExitStatus {
    int exitCode = -1;      // 128 + signal when killed by a signal
    bool signaled = false;
    int signal = 0;

    [[nodiscard]] bool success() const noexcept { return !signaled && exitCode == 0; }
};

struct WaitResult {
    bool ok = false;
    ExitStatus status;
    std::string error;
};

class ProcessHandle {
public:
    ProcessHandle(std::optional<pid_t> pid, FileDescriptor stdoutFd, FileDescriptor stderrFd) noexcept;
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&&) = delete;
    ProcessHandle& operator=(ProcessHandle&&) = delete;

    [[nodiscard]] std::optional<pid_t> processId() const noexcept { return pid_; }

    // Hands the read end of a captured stream to a reader; empty if not captured.
    [[nodiscard]] FileDescriptor takeStdout() noexcept { return std::move(stdout_); }
    [[nodiscard]] FileDescriptor takeStderr() noexcept { return std::move(stderr_); }

    // Blocks until the process exits. Safe to call once; later calls return the cached status.
    [[nodiscard]] WaitResult wait() noexcept;

private:
    std::optional<pid_t> pid_;
    FileDescriptor stdout_;
    FileDescriptor stderr_;
    bool reaped_ = false;
    ExitStatus status_;
};

struct LaunchSpec {
    std::filesystem::path executable;
    std::vector<std::string> arguments;
    StreamSelection streams;
    WorkPriority priority = WorkPriority::Normal;
};

enum class LaunchError : uint8_t {
    None = 0,
    PipeFailed,
    ForkFailed,
    ExecFailed
};

struct LaunchResult {
    bool ok = false;
    std::unique_ptr<ProcessHandle> handle;
    LaunchError error = LaunchError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Launcher {
public:
    virtual ~Launcher() = default;

    [[nodiscard]] virtual LaunchResult launch(const LaunchSpec& spec) noexcept = 0;
};

// fork/exec launcher. The child leads its own process group, runs at the
// requested niceness, and has unmonitored streams sent to /dev/null.
// Output pipes are raw byte streams; nothing is line buffered on our side.
class ProcessLauncher final : public Launcher {
public:
    [[nodiscard]] LaunchResult launch(const LaunchSpec& spec) noexcept override;
};

}
