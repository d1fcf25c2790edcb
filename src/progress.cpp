/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/progress.hpp"
#include "mediarun/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <regex>

namespace mediarun {

namespace {

// Patterns are compiled once and shared by every parser instance
const std::regex& durationRegex() {
    static const std::regex re(R"(Duration:\s*(\d{2,}):(\d{2}):(\d{2})(?:\.(\d+))?)");
    return re;
}

const std::regex& positionRegex() {
    static const std::regex re(R"(time=\s*(\d{2,}):(\d{2}):(\d{2})(?:\.(\d+))?)");
    return re;
}

const std::regex& speedRegex() {
    static const std::regex re(R"(speed=\s*(\d+\.?\d*)x)");
    return re;
}

const std::regex& transferPercentRegex() {
    static const std::regex re(R"(\[download\]\s+(\d+\.?\d*)%)");
    return re;
}

const std::regex& sizeRegex() {
    static const std::regex re(R"(of\s+~?\s*(\d+\.?\d*[KMGT]?i?B)\b)");
    return re;
}

const std::regex& rateRegex() {
    static const std::regex re(R"(at\s+(\d+\.?\d*[KMGT]?i?B/s))");
    return re;
}

const std::regex& etaRegex() {
    static const std::regex re(R"(ETA\s+(\d{2}:\d{2}(?::\d{2})?))");
    return re;
}

const std::regex& tagRegex() {
    static const std::regex re(R"(^\[([^\]]+)\])");
    return re;
}

const std::regex& alreadyDownloadedRegex() {
    static const std::regex re(R"(\[download\]\s+(.+?)\s+has already been downloaded)");
    return re;
}

constexpr const char* kDestinationMarker = "Destination:";
constexpr const char* kMergeMarker = "Merging formats into";
constexpr const char* kErrorMarker = "ERROR:";

// Tool output is untrusted: an unparsable or overlong number is no match
std::optional<double> parseNumber(const std::string& text) {
    try {
        double value = std::stod(text);
        if (!std::isfinite(value)) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> clockSeconds(const std::smatch& m) {
    auto hours = parseNumber(m[1].str());
    auto minutes = parseNumber(m[2].str());
    auto seconds = parseNumber(m[3].str());
    if (!hours || !minutes || !seconds) return std::nullopt;

    double total = *hours * 3600.0 + *minutes * 60.0 + *seconds;
    if (m[4].matched) {
        total += parseNumber("0." + m[4].str()).value_or(0.0);
    }
    if (!std::isfinite(total)) return std::nullopt;
    return total;
}

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

std::string stripQuotes(std::string value) {
    while (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        value.erase(value.begin());
    }
    while (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
        value.pop_back();
    }
    return value;
}

std::optional<std::string> pathAfter(const std::string& record, const std::string& marker) {
    auto idx = record.find(marker);
    if (idx == std::string::npos) return std::nullopt;
    auto candidate = stripQuotes(trim(record.substr(idx + marker.size())));
    if (candidate.empty()) return std::nullopt;
    return candidate;
}

const char* infoStatus(const std::string& record) {
    if (record.find("Downloading webpage") != std::string::npos) return "Fetching metadata...";
    if (record.find("Downloading m3u8") != std::string::npos) return "Preparing stream...";
    return "Extracting metadata...";
}

bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

}

std::vector<std::string> RecordSplitter::feed(const char* data, std::size_t size) {
    std::vector<std::string> records;
    buffer_.append(data, size);

    std::size_t start = 0;
    for (;;) {
        auto idx = buffer_.find_first_of("\r\n", start);
        if (idx == std::string::npos) break;
        if (idx > start) {
            records.emplace_back(buffer_, start, idx - start);
        }
        start = idx + 1;
    }
    buffer_.erase(0, start);
    return records;
}

std::optional<std::string> RecordSplitter::finish() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

std::string decodeLossy(const std::string& bytes) {
    static const std::string kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t len = 0;
        unsigned int minCodepoint = 0;
        unsigned int codepoint = 0;
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; minCodepoint = 0x80; codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; minCodepoint = 0x800; codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; minCodepoint = 0x10000; codepoint = c & 0x07;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        std::size_t j = 1;
        while (j < len && i + j < n && isContinuationByte(static_cast<unsigned char>(bytes[i + j]))) {
            codepoint = (codepoint << 6) | (static_cast<unsigned char>(bytes[i + j]) & 0x3F);
            ++j;
        }

        bool valid = j == len && codepoint >= minCodepoint && codepoint <= 0x10FFFF &&
                     !(codepoint >= 0xD800 && codepoint <= 0xDFFF);
        if (valid) {
            out.append(bytes, i, len);
        } else {
            out += kReplacement;
        }
        // A broken sequence consumes only the bytes that looked like part of it
        i += j;
    }
    return out;
}

ComponentTag classifyTag(const std::string& tag) noexcept {
    if (tag.empty()) return ComponentTag::None;
    if (tag == "download") return ComponentTag::Download;
    if (tag == "Merger") return ComponentTag::Merger;
    if (tag == "ExtractAudio") return ComponentTag::ExtractAudio;
    if (tag == "info") return ComponentTag::Info;
    return ComponentTag::Other;
}

ProgressParser::ProgressParser(std::optional<double> knownDurationSeconds, Clock::time_point startedAt)
    : startedAt_(startedAt) {
    if (knownDurationSeconds && *knownDurationSeconds > 0.0) {
        duration_ = knownDurationSeconds;
    }
}

int ProgressParser::clampPercent(double percent) noexcept {
    if (!std::isfinite(percent)) return 0;
    double rounded = std::round(percent);
    if (rounded < 0.0) return 0;
    if (rounded > 99.0) return 99;
    return static_cast<int>(rounded);
}

int ProgressParser::computePercent(double positionSeconds, std::optional<double> durationSeconds) noexcept {
    if (!durationSeconds || *durationSeconds <= 0.0) {
        return 0;
    }
    return clampPercent(positionSeconds / *durationSeconds * 100.0);
}

std::string ProgressParser::formatClock(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    // Keeps the cast below in range of long long
    constexpr double kMaxClockSeconds = 1e15;
    if (seconds > kMaxClockSeconds) seconds = kMaxClockSeconds;
    auto total = static_cast<long long>(seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

ParseResult ProgressParser::parse(const std::string& raw) {
    ParseResult result;
    const std::string record = trim(decodeLossy(raw));
    if (record.empty()) {
        return result;
    }

    std::smatch m;

    if (!duration_ && std::regex_search(record, m, durationRegex())) {
        auto seconds = clockSeconds(m);
        if (seconds && *seconds > 0.0) {
            duration_ = seconds;
            LOG_DEBUG("Parsed duration: " + std::to_string(*seconds) + "s");
        }
    }

    std::optional<double> position;
    if (std::regex_search(record, m, positionRegex())) {
        position = clockSeconds(m);
    }

    std::optional<double> transferPercent;
    if (std::regex_search(record, m, transferPercentRegex())) {
        transferPercent = parseNumber(m[1].str());
    }

    ProgressEvent event;
    if (std::regex_search(record, m, speedRegex())) {
        event.speed = m[1].str() + "x";
    } else if (std::regex_search(record, m, rateRegex())) {
        event.speed = m[1].str();
    }
    if (std::regex_search(record, m, sizeRegex())) {
        event.size = m[1].str();
    }
    if (std::regex_search(record, m, etaRegex())) {
        event.eta = m[1].str();
    }

    // Tools often reveal the real file name only after format negotiation,
    // audio extraction or merging; the latest announcement wins.
    if (auto path = pathAfter(record, kDestinationMarker)) {
        result.destination = *path;
        event.status = "Creating output file...";
    } else if (record.find(kMergeMarker) != std::string::npos) {
        if (auto merged = pathAfter(record, kMergeMarker)) {
            result.destination = *merged;
        }
        event.status = "Merging audio and video...";
    } else if (record.find("Deleting original file") != std::string::npos) {
        event.status = "Cleaning up temporary files...";
    } else if (record.find("Fixing video timestamp") != std::string::npos) {
        event.status = "Finalizing media timestamps...";
    }

    if (std::regex_search(record, m, alreadyDownloadedRegex())) {
        result.destination = stripQuotes(m[1].str());
    }

    if (std::regex_search(record, m, tagRegex())) {
        switch (classifyTag(m[1].str())) {
            case ComponentTag::Merger:
                event.status = "Merging audio and video...";
                break;
            case ComponentTag::ExtractAudio:
                event.status = "Extracting audio...";
                break;
            case ComponentTag::Info:
                event.status = infoStatus(record);
                break;
            case ComponentTag::Download:
                if (!transferPercent) {
                    if (record.find(kDestinationMarker) != std::string::npos) {
                        event.status = "Creating output file...";
                    } else if (record.find("Downloading") != std::string::npos) {
                        event.status = "Starting download...";
                    }
                }
                break;
            case ComponentTag::None:
            case ComponentTag::Other:
                break;
        }
    }

    if (transferPercent && !event.status) {
        event.status = *transferPercent >= 99.9 ? "Finalizing download..." : "Downloading...";
    }

    auto errorAt = record.find(kErrorMarker);
    if (errorAt != std::string::npos) {
        auto detail = trim(record.substr(errorAt + std::string(kErrorMarker).size()));
        event.status = "Error: " + (detail.empty() ? record : detail);
    }

    if (!position && !transferPercent && !event.status) {
        return result;  // uninformative record
    }

    if (position) {
        lastPercent_ = computePercent(*position, duration_);
        event.elapsedTime = formatClock(*position);
    } else {
        if (transferPercent) {
            lastPercent_ = clampPercent(*transferPercent);
        }
        auto elapsed = std::chrono::duration<double>(Clock::now() - startedAt_).count();
        event.elapsedTime = formatClock(elapsed);
    }
    event.percent = lastPercent_;

    result.event = std::move(event);
    return result;
}

}
