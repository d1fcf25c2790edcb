/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "mediarun/sink.hpp"
#include "mediarun/types.hpp"

namespace mediarun {

// {"percent", "time", "speed" ("N/A" when unknown), optional "status", "size", "eta"}
[[nodiscard]] nlohmann::json progressToJson(const ProgressEvent& event);

// {"outputPath"} for success, {} for cancellation, {"message"} for failure.
[[nodiscard]] nlohmann::json outcomeToJson(const TerminalOutcome& outcome);

// "progress", "complete", "cancelled" or "error".
[[nodiscard]] const char* eventName(const JobEvent& event) noexcept;

// One line of CLI output: {"event": <name>, "data": <payload>}, without newline.
[[nodiscard]] std::string toJsonLine(const JobEvent& event);

}
