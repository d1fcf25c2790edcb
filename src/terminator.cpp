/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/terminator.hpp"
#include "mediarun/logger.hpp"
#include <cerrno>
#include <cstring>
#include <signal.h>

namespace mediarun {

TerminateResult ProcessGroupTerminator::terminate(pid_t pid) noexcept {
    TerminateResult result;
    try {
        if (pid <= 0) {
            result.error = "invalid process id " + std::to_string(pid);
            return result;
        }

        if (::kill(-pid, signal_) == 0) {
            LOG_DEBUG("Sent signal " + std::to_string(signal_) + " to process group " + std::to_string(pid));
            result.ok = true;
            return result;
        }

        // Not a group leader (setpgid lost a race with exec) - signal the process alone
        int err = errno;
        if (err == ESRCH) {
            if (::kill(pid, signal_) == 0) {
                LOG_DEBUG("Sent signal " + std::to_string(signal_) + " to process " + std::to_string(pid));
                result.ok = true;
                return result;
            }
            err = errno;
        }

        result.error = std::strerror(err);
        LOG_DEBUG("Terminate " + std::to_string(pid) + " failed: " + result.error);
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
    }
    return result;
}

}
