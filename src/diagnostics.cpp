/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/diagnostics.hpp"
#include <algorithm>

namespace mediarun {

void DiagnosticBuffer::append(const std::string& record) {
    if (record.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (text_.size() >= capacity_) return;

    std::size_t room = capacity_ - text_.size();
    text_.append(record, 0, std::min(room, record.size()));
    if (text_.size() < capacity_) {
        text_.push_back('\n');
    }
}

std::string DiagnosticBuffer::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* ws = " \t\r\n\f\v";
    auto start = text_.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = text_.find_last_not_of(ws);
    return text_.substr(start, end - start + 1);
}

std::size_t DiagnosticBuffer::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_.size();
}

bool DiagnosticBuffer::full() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_.size() >= capacity_;
}

}
