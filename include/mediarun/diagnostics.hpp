/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <mutex>
#include <string>

namespace mediarun {

// Bounded capture of diagnostic stream text for failure reports. The first
// bytes written win: once the cap is reached further records are ignored and
// nothing already captured is evicted.
class DiagnosticBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 16 * 1024;

    explicit DiagnosticBuffer(std::size_t capacity = kDefaultCapacity) noexcept : capacity_(capacity) {}

    DiagnosticBuffer(const DiagnosticBuffer&) = delete;
    DiagnosticBuffer& operator=(const DiagnosticBuffer&) = delete;

    void append(const std::string& record);

    // Captured text with surrounding whitespace removed.
    [[nodiscard]] std::string text() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool full() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::string text_;
};

}
