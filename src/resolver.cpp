/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/resolver.hpp"
#include "mediarun/logger.hpp"
#include <algorithm>
#include <vector>

namespace mediarun {

TerminalOutcome CompletionResolver::resolve(bool cancelRequested,
                                            const WaitResult& exit,
                                            const std::optional<std::filesystem::path>& recordedOutputPath,
                                            const JobRequest& request,
                                            const DiagnosticBuffer& diagnostics) const {
    if (cancelRequested) {
        removePartialOutput(recordedOutputPath);
        LOG_INFO("Job cancelled");
        return TerminalOutcome::cancelled();
    }

    if (!exit.ok) {
        LOG_ERROR("Lost track of process: " + exit.error);
        auto text = diagnostics.text();
        return TerminalOutcome::failed(-1, text.empty() ? exit.error : text);
    }

    if (exit.status.success()) {
        auto path = resolveOutputPath(recordedOutputPath, request);
        LOG_INFO("Job succeeded: " + path.string());
        return TerminalOutcome::succeeded(path);
    }

    LOG_WARN("Job failed with exit code " + std::to_string(exit.status.exitCode));
    return TerminalOutcome::failed(exit.status.exitCode, diagnostics.text());
}

std::string CompletionResolver::expectedStem(const JobRequest& request) {
    if (!request.fileNameHint || request.fileNameHint->empty()) {
        return "downloaded_file";
    }
    std::string stem = *request.fileNameHint;
    std::replace(stem.begin(), stem.end(), '.', '_');
    return stem;
}

std::filesystem::path CompletionResolver::resolveOutputPath(
    const std::optional<std::filesystem::path>& recordedOutputPath, const JobRequest& request) {
    std::error_code ec;
    if (recordedOutputPath && std::filesystem::is_regular_file(*recordedOutputPath, ec)) {
        return *recordedOutputPath;
    }

    std::filesystem::path dir;
    if (request.outputDirectory) {
        dir = *request.outputDirectory;
    } else if (recordedOutputPath) {
        dir = std::filesystem::is_directory(*recordedOutputPath, ec) ? *recordedOutputPath
                                                                     : recordedOutputPath->parent_path();
    }
    if (dir.empty() || !std::filesystem::is_directory(dir, ec)) {
        return recordedOutputPath ? *recordedOutputPath : dir;
    }

    const std::string stem = expectedStem(request);
    std::string ext = request.expectedExtension;
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);

    if (!ext.empty()) {
        auto constructed = dir / (stem + "." + ext);
        if (std::filesystem::is_regular_file(constructed, ec)) {
            return constructed;
        }
    }

    // The tool may have picked another container than the one asked for
    std::vector<std::filesystem::path> matches;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc) && it->path().stem().string() == stem) {
            matches.push_back(it->path());
        }
    }
    if (!matches.empty()) {
        std::sort(matches.begin(), matches.end());
        LOG_DEBUG("Output located by stem: " + matches.front().string());
        return matches.front();
    }

    return recordedOutputPath ? *recordedOutputPath : dir;
}

bool CompletionResolver::removePartialOutput(const std::optional<std::filesystem::path>& path) noexcept {
    try {
        if (!path || path->empty()) return false;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(*path, ec)) {
            return false;
        }
        bool removed = std::filesystem::remove(*path, ec);
        if (ec) {
            LOG_WARN("Could not remove partial output " + path->string() + ": " + ec.message());
            return false;
        }
        if (!removed) {
            return false;  // already gone, cancel and resolver race for it
        }
        LOG_DEBUG("Removed partial output: " + path->string());
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Error removing partial output: ") + e.what());
        return false;
    }
}

}
