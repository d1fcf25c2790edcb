/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/options.hpp"
#include "mediarun/tool_locator.hpp"
#include <filesystem>
#include <stdexcept>

namespace mediarun {

namespace {

Options invalid(Options options, const std::string& message) {
    options.valid = false;
    options.errorMessage = message;
    return options;
}

// "--flag=value" form; empty when `arg` is not that flag
std::optional<std::string> inlineValue(const std::string& arg, const std::string& flag) {
    const std::string prefix = flag + "=";
    if (arg.rfind(prefix, 0) == 0) {
        return arg.substr(prefix.size());
    }
    return std::nullopt;
}

bool takesValue(const std::string& flag) {
    return flag == "--tool" || flag == "--output" || flag == "--output-dir" || flag == "--file-name" ||
           flag == "--ext" || flag == "--duration" || flag == "--priority" || flag == "--queue-size";
}

}

Options parseOptions(int argc, char* argv[]) {
    Options options;
    std::optional<ToolKind> explicitKind;
    int toolIndex = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            if (i + 1 < argc) toolIndex = i + 1;
            break;
        }
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            return options;
        }
        if (arg == "-v" || arg == "--version") {
            options.showVersion = true;
            return options;
        }
        if (arg.empty() || arg[0] != '-') {
            toolIndex = i;
            break;
        }

        std::string flag = arg;
        std::string value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = *inlineValue(arg, flag);
        } else if (takesValue(flag)) {
            if (i + 1 >= argc) {
                return invalid(options, "Option " + flag + " requires a value");
            }
            value = argv[++i];
        }

        if (!takesValue(flag)) {
            return invalid(options, "Unknown option: " + arg);
        }

        if (flag == "--tool") {
            explicitKind = parseToolKind(value);
            if (!explicitKind) {
                return invalid(options, "Unknown tool kind: " + value + " (expected transcoder or downloader)");
            }
        } else if (flag == "--output") {
            options.request.outputPath = std::filesystem::path(value);
        } else if (flag == "--output-dir") {
            options.request.outputDirectory = std::filesystem::path(value);
        } else if (flag == "--file-name") {
            options.request.fileNameHint = value;
        } else if (flag == "--ext") {
            options.request.expectedExtension = value;
        } else if (flag == "--duration") {
            try {
                std::size_t used = 0;
                double seconds = std::stod(value, &used);
                if (used != value.size() || seconds <= 0.0) {
                    return invalid(options, "Invalid value for --duration: " + value);
                }
                options.request.durationSeconds = seconds;
            } catch (const std::exception&) {
                return invalid(options, "Invalid value for --duration: " + value);
            }
        } else if (flag == "--priority") {
            auto priority = parseWorkPriority(value);
            if (!priority) {
                return invalid(options, "Unknown priority: " + value + " (expected idle, low, normal or high)");
            }
            options.request.priority = *priority;
        } else if (flag == "--queue-size") {
            try {
                std::size_t used = 0;
                unsigned long capacity = std::stoul(value, &used);
                if (used != value.size() || capacity == 0 || value[0] == '-') {
                    return invalid(options, "Invalid value for --queue-size: " + value);
                }
                options.queueCapacity = static_cast<std::size_t>(capacity);
            } catch (const std::exception&) {
                return invalid(options, "Invalid value for --queue-size: " + value);
            }
        }
    }

    if (toolIndex < 0) {
        return invalid(options, "Missing tool to run");
    }

    options.toolName = argv[toolIndex];
    if (options.toolName.empty()) {
        return invalid(options, "Missing tool to run");
    }
    for (int i = toolIndex + 1; i < argc; ++i) {
        options.request.arguments.emplace_back(argv[i]);
    }

    options.request.executable = resolveToolPath(options.toolName, argc > 0 ? argv[0] : nullptr);

    if (explicitKind) {
        options.request.tool = *explicitKind;
    } else if (auto inferred = parseToolKind(std::filesystem::path(options.toolName).stem().string())) {
        options.request.tool = *inferred;
    } else {
        options.request.tool = ToolKind::Transcoder;
    }

    return options;
}

}
