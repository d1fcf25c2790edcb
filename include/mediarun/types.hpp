#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediarun {

// Job lifecycle states. Running is the only non-terminal one.
enum class JobState : std::uint8_t { Running, Succeeded, Cancelled, Failed };

// Supported external tools. Each kind decides which output streams are watched.
enum class ToolKind : std::uint8_t { Transcoder, Downloader };

enum class WorkPriority : std::uint8_t { Idle, Low, Normal, High };

struct StreamSelection {
    bool stdoutMonitored = false;
    bool stderrMonitored = false;
};

[[nodiscard]] StreamSelection monitoredStreams(ToolKind kind) noexcept;
[[nodiscard]] int niceValue(WorkPriority priority) noexcept;
[[nodiscard]] const char* toString(ToolKind kind) noexcept;
[[nodiscard]] const char* toString(WorkPriority priority) noexcept;
[[nodiscard]] const char* toString(JobState state) noexcept;
[[nodiscard]] std::optional<ToolKind> parseToolKind(const std::string& text);
[[nodiscard]] std::optional<WorkPriority> parseWorkPriority(const std::string& text);

// Tagged terminal classification; only the fields of `state` are meaningful.
struct TerminalOutcome {
    JobState state = JobState::Failed;
    std::filesystem::path outputPath;  // Succeeded
    int exitCode = 0;                  // Failed
    std::string diagnosticText;        // Failed

    [[nodiscard]] static TerminalOutcome succeeded(std::filesystem::path path);
    [[nodiscard]] static TerminalOutcome cancelled();
    [[nodiscard]] static TerminalOutcome failed(int code, std::string diagnostics);

    [[nodiscard]] bool isSucceeded() const noexcept { return state == JobState::Succeeded; }
    [[nodiscard]] bool isCancelled() const noexcept { return state == JobState::Cancelled; }
    [[nodiscard]] bool isFailed() const noexcept { return state == JobState::Failed; }
};

struct ProgressEvent {
    int percent = 0;                    // 0..99 while running
    std::string elapsedTime = "00:00:00";
    std::optional<std::string> speed;
    std::optional<std::string> status;
    std::optional<std::string> size;
    std::optional<std::string> eta;
};

// Opaque, pre-validated description of one tool invocation.
struct JobRequest {
    ToolKind tool = ToolKind::Transcoder;
    std::filesystem::path executable;
    std::vector<std::string> arguments;

    std::optional<std::filesystem::path> outputPath;       // expected output file
    std::optional<std::filesystem::path> outputDirectory;  // where the tool writes
    std::optional<std::string> fileNameHint;
    std::string expectedExtension;
    std::optional<double> durationSeconds;                 // known input duration

    WorkPriority priority = WorkPriority::Normal;
};

}
