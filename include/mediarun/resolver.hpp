/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>

#include "mediarun/diagnostics.hpp"
#include "mediarun/launcher.hpp"
#include "mediarun/types.hpp"

namespace mediarun {

// Turns a finished process into exactly one terminal outcome.
//
// A pending cancellation wins over any exit status: the job is Cancelled and
// its partial output is removed. Otherwise exit code 0 is Succeeded with the
// best available output path, and anything else is Failed with the captured
// diagnostics.
class CompletionResolver {
public:
    [[nodiscard]] TerminalOutcome resolve(bool cancelRequested,
                                          const WaitResult& exit,
                                          const std::optional<std::filesystem::path>& recordedOutputPath,
                                          const JobRequest& request,
                                          const DiagnosticBuffer& diagnostics) const;

    // Recorded path if it is a regular file, else the file rebuilt from the
    // request hints, else a file in the output directory with the same stem.
    [[nodiscard]] static std::filesystem::path resolveOutputPath(
        const std::optional<std::filesystem::path>& recordedOutputPath, const JobRequest& request);

    // Base name used when rebuilding the output file name from the request.
    [[nodiscard]] static std::string expectedStem(const JobRequest& request);

    // Deletes a partial output file if one exists. Failures are logged only.
    static bool removePartialOutput(const std::optional<std::filesystem::path>& path) noexcept;
};

}
