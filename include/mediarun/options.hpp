/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

#include "mediarun/types.hpp"

namespace mediarun {

// Parsed mrun command line. When parsing fails, valid is false and
// errorMessage says why.
struct Options {
    bool valid = true;
    std::string errorMessage;

    bool showHelp = false;
    bool showVersion = false;

    JobRequest request;
    std::string toolName;  // as given, before bundled-directory lookup
    std::size_t queueCapacity = 256;
};

// mrun [options] [--] <tool> [tool arguments...]
//
// Everything after the tool name is passed through untouched. The tool kind
// comes from --tool, or from the tool name ("ffmpeg", "yt-dlp"), and defaults
// to transcoder.
[[nodiscard]] Options parseOptions(int argc, char* argv[]);

}
