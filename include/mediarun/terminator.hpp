/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <csignal>
#include <string>
#include <sys/types.h>

namespace mediarun {

struct TerminateResult {
    bool ok = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Stops a supervised process and, where the platform allows, its descendants.
//
// Contract: best-effort and asynchronous. A successful result only means the
// request was delivered; the process may still be running when it returns.
// Descendants that left the process group (setsid, double fork) are not
// reached and may keep running. There is no escalation to a harder kill.
class Terminator {
public:
    virtual ~Terminator() = default;

    [[nodiscard]] virtual TerminateResult terminate(pid_t pid) noexcept = 0;
};

// Signals the process group led by the child (the launcher makes every child a
// group leader), falling back to the single process when no such group exists.
class ProcessGroupTerminator final : public Terminator {
public:
    explicit ProcessGroupTerminator(int signal = SIGTERM) noexcept : signal_(signal) {}

    [[nodiscard]] TerminateResult terminate(pid_t pid) noexcept override;

private:
    int signal_;
};

}
