/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/launcher.hpp"
#include "mediarun/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediarun {

namespace {

constexpr int kExecFailedExitCode = 127;

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

bool makePipe(Pipe& out) noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return false;
    }
    out.read.reset(fds[0]);
    out.write.reset(fds[1]);
    return true;
}

std::string errnoText(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

// Runs in the forked child: async-signal-safe calls only until exec.
[[noreturn]] void execChild(const LaunchSpec& spec, char* const* argv,
                            int stdoutFd, int stderrFd, int controlFd) noexcept {
    ::setpgid(0, 0);

    if (int nice = niceValue(spec.priority); nice != 0) {
        // Raising priority needs privileges; failure keeps the inherited value
        (void)::setpriority(PRIO_PROCESS, 0, nice);
    }

    ::signal(SIGPIPE, SIG_DFL);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);

    if (::dup2(stdoutFd, STDOUT_FILENO) == -1 || ::dup2(stderrFd, STDERR_FILENO) == -1) {
        int err = errno;
        (void)::write(controlFd, &err, sizeof(err));
        ::_exit(kExecFailedExitCode);
    }

    ::execvp(argv[0], argv);

    int err = errno;
    (void)::write(controlFd, &err, sizeof(err));
    ::_exit(kExecFailedExitCode);
}

}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int FileDescriptor::release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::reset(int fd) noexcept {
    if (fd_ >= 0 && fd_ != fd) {
        ::close(fd_);
    }
    fd_ = fd;
}

ProcessHandle::ProcessHandle(std::optional<pid_t> pid, FileDescriptor stdoutFd, FileDescriptor stderrFd) noexcept
    : pid_(pid), stdout_(std::move(stdoutFd)), stderr_(std::move(stderrFd)) {
}

ProcessHandle::~ProcessHandle() {
    // Never block here; a still-running child is left to whoever owns the pid
    if (pid_ && !reaped_) {
        int status = 0;
        if (::waitpid(*pid_, &status, WNOHANG) == *pid_) {
            reaped_ = true;
        }
    }
}

WaitResult ProcessHandle::wait() noexcept {
    WaitResult result;
    if (reaped_) {
        result.ok = true;
        result.status = status_;
        return result;
    }
    if (!pid_) {
        // Exited before it could be tracked; nothing to reap
        result.ok = true;
        result.status.exitCode = 0;
        return result;
    }

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(*pid_, &status, 0);
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        int err = errno;
        try {
            result.error = errnoText("waitpid failed", err);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("waitpid failed: ") + e.what());
        }
        return result;
    }

    reaped_ = true;
    if (WIFEXITED(status)) {
        status_.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        status_.signaled = true;
        status_.signal = WTERMSIG(status);
        status_.exitCode = 128 + status_.signal;
    }

    result.ok = true;
    result.status = status_;
    return result;
}

LaunchResult ProcessLauncher::launch(const LaunchSpec& spec) noexcept {
    LaunchResult result;
    try {
        if (spec.executable.empty()) {
            result.error = LaunchError::ExecFailed;
            result.message = "no executable given";
            return result;
        }

        // Everything the child needs is built before fork
        std::vector<std::string> args;
        args.reserve(spec.arguments.size() + 1);
        args.push_back(spec.executable.string());
        args.insert(args.end(), spec.arguments.begin(), spec.arguments.end());

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        Pipe outPipe, errPipe, control;
        FileDescriptor devNull(::open("/dev/null", O_WRONLY | O_CLOEXEC));
        if (!devNull || !makePipe(control) ||
            (spec.streams.stdoutMonitored && !makePipe(outPipe)) ||
            (spec.streams.stderrMonitored && !makePipe(errPipe))) {
            result.error = LaunchError::PipeFailed;
            result.message = errnoText("failed to create pipes", errno);
            return result;
        }

        int childOut = spec.streams.stdoutMonitored ? outPipe.write.get() : devNull.get();
        int childErr = spec.streams.stderrMonitored ? errPipe.write.get() : devNull.get();

        pid_t pid = ::fork();
        if (pid == -1) {
            result.error = LaunchError::ForkFailed;
            result.message = errnoText("fork failed", errno);
            return result;
        }
        if (pid == 0) {
            execChild(spec, argv.data(), childOut, childErr, control.write.get());
        }

        // Set from both sides so the group exists before anyone can signal it
        (void)::setpgid(pid, pid);

        outPipe.write.reset();
        errPipe.write.reset();
        control.write.reset();
        devNull.reset();

        // The control pipe closes on a successful exec and carries errno otherwise
        int childErrno = 0;
        ssize_t n;
        do {
            n = ::read(control.read.get(), &childErrno, sizeof(childErrno));
        } while (n == -1 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            result.error = LaunchError::ExecFailed;
            result.message = errnoText(("failed to execute " + spec.executable.string()).c_str(), childErrno);
            LOG_WARN(result.message);
            return result;
        }

        result.handle = std::make_unique<ProcessHandle>(pid, std::move(outPipe.read), std::move(errPipe.read));
        result.ok = true;
        LOG_DEBUG("Launched " + spec.executable.string() + " as pid " + std::to_string(pid) +
                  " (priority " + toString(spec.priority) + ")");
        return result;

    } catch (const std::exception& e) {
        result.ok = false;
        result.handle.reset();
        result.error = LaunchError::ForkFailed;
        result.message = std::string("launch error: ") + e.what();
        LOG_ERROR(result.message);
        return result;
    }
}

}
