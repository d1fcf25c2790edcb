/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/types.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace mediarun {

namespace {

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}

StreamSelection monitoredStreams(ToolKind kind) noexcept {
    switch (kind) {
        case ToolKind::Transcoder:
            // ffmpeg writes progress and diagnostics to stderr only
            return StreamSelection{false, true};
        case ToolKind::Downloader:
            return StreamSelection{true, true};
    }
    return StreamSelection{false, true};
}

int niceValue(WorkPriority priority) noexcept {
    switch (priority) {
        case WorkPriority::Idle:   return 19;
        case WorkPriority::Low:    return 10;
        case WorkPriority::Normal: return 0;
        case WorkPriority::High:   return -10;
    }
    return 0;
}

const char* toString(ToolKind kind) noexcept {
    switch (kind) {
        case ToolKind::Transcoder: return "transcoder";
        case ToolKind::Downloader: return "downloader";
    }
    return "unknown";
}

const char* toString(WorkPriority priority) noexcept {
    switch (priority) {
        case WorkPriority::Idle:   return "idle";
        case WorkPriority::Low:    return "low";
        case WorkPriority::Normal: return "normal";
        case WorkPriority::High:   return "high";
    }
    return "unknown";
}

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Running:   return "running";
        case JobState::Succeeded: return "succeeded";
        case JobState::Cancelled: return "cancelled";
        case JobState::Failed:    return "failed";
    }
    return "unknown";
}

std::optional<ToolKind> parseToolKind(const std::string& text) {
    auto value = lowered(text);
    if (value == "transcoder" || value == "ffmpeg") return ToolKind::Transcoder;
    if (value == "downloader" || value == "yt-dlp") return ToolKind::Downloader;
    return std::nullopt;
}

std::optional<WorkPriority> parseWorkPriority(const std::string& text) {
    auto value = lowered(text);
    if (value == "idle") return WorkPriority::Idle;
    if (value == "low") return WorkPriority::Low;
    if (value == "normal") return WorkPriority::Normal;
    if (value == "high") return WorkPriority::High;
    return std::nullopt;
}

TerminalOutcome TerminalOutcome::succeeded(std::filesystem::path path) {
    TerminalOutcome outcome;
    outcome.state = JobState::Succeeded;
    outcome.outputPath = std::move(path);
    return outcome;
}

TerminalOutcome TerminalOutcome::cancelled() {
    TerminalOutcome outcome;
    outcome.state = JobState::Cancelled;
    return outcome;
}

TerminalOutcome TerminalOutcome::failed(int code, std::string diagnostics) {
    TerminalOutcome outcome;
    outcome.state = JobState::Failed;
    outcome.exitCode = code;
    outcome.diagnosticText = std::move(diagnostics);
    return outcome;
}

}
