/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/events_json.hpp"

namespace mediarun {

nlohmann::json progressToJson(const ProgressEvent& event) {
    nlohmann::json j;
    j["percent"] = event.percent;
    j["time"] = event.elapsedTime;
    j["speed"] = event.speed.value_or("N/A");
    if (event.status) j["status"] = *event.status;
    if (event.size) j["size"] = *event.size;
    if (event.eta) j["eta"] = *event.eta;
    return j;
}

nlohmann::json outcomeToJson(const TerminalOutcome& outcome) {
    switch (outcome.state) {
        case JobState::Succeeded:
            return {{"outputPath", outcome.outputPath.string()}};
        case JobState::Cancelled:
            return nlohmann::json::object();
        case JobState::Failed: {
            std::string message = outcome.diagnosticText;
            if (message.empty()) {
                message = "Process exited with code " + std::to_string(outcome.exitCode);
            }
            return {{"message", message}};
        }
        case JobState::Running:
            break;
    }
    return nlohmann::json::object();
}

const char* eventName(const JobEvent& event) noexcept {
    if (event.kind == JobEvent::Kind::Progress) {
        return "progress";
    }
    switch (event.outcome.state) {
        case JobState::Succeeded: return "complete";
        case JobState::Cancelled: return "cancelled";
        case JobState::Failed:
        case JobState::Running:
            break;
    }
    return "error";
}

std::string toJsonLine(const JobEvent& event) {
    nlohmann::json line;
    line["event"] = eventName(event);
    line["data"] = event.kind == JobEvent::Kind::Progress ? progressToJson(event.progress)
                                                          : outcomeToJson(event.outcome);
    // Tool output is lossily decoded already; replace rather than throw on leftovers
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
