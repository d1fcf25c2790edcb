/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mediarun/types.hpp"

namespace mediarun {

// Splits a raw byte stream into records. A record ends at the first '\r' or
// '\n', so tools that redraw one terminal line with '\r' and tools that print
// ordinary lines are handled alike. Incomplete records wait for the next feed.
class RecordSplitter {
public:
    [[nodiscard]] std::vector<std::string> feed(const char* data, std::size_t size);
    // Flushes the trailing partial record at end of stream.
    [[nodiscard]] std::optional<std::string> finish();
    [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size(); }

private:
    std::string buffer_;
};

// Replaces invalid UTF-8 sequences with U+FFFD.
[[nodiscard]] std::string decodeLossy(const std::string& bytes);

// Leading "[tag]" of a record, for the tags that carry a status meaning.
enum class ComponentTag : uint8_t { None, Download, Merger, ExtractAudio, Info, Other };

[[nodiscard]] ComponentTag classifyTag(const std::string& tag) noexcept;

struct ParseResult {
    std::optional<ProgressEvent> event;
    std::optional<std::string> destination;  // final output path announced by the tool
};

// Per-stream parser state. One instance per stream per job.
class ProgressParser {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressParser(std::optional<double> knownDurationSeconds = std::nullopt,
                            Clock::time_point startedAt = Clock::now());

    [[nodiscard]] ParseResult parse(const std::string& record);

    [[nodiscard]] std::optional<double> cachedDuration() const noexcept { return duration_; }
    [[nodiscard]] int lastPercent() const noexcept { return lastPercent_; }

    // round(position / duration * 100) clamped to [0, 99]; 0 when duration is unknown.
    [[nodiscard]] static int computePercent(double positionSeconds, std::optional<double> durationSeconds) noexcept;
    [[nodiscard]] static int clampPercent(double percent) noexcept;
    [[nodiscard]] static std::string formatClock(double seconds);

private:
    std::optional<double> duration_;
    Clock::time_point startedAt_;
    int lastPercent_ = 0;
};

}
