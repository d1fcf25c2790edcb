/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace mediarun {

// Directories searched for a bundled tool binary, in order:
// $MEDIARUN_BIN_DIR, <executable dir>/bin, <executable dir>.
[[nodiscard]] std::vector<std::filesystem::path> bundledToolDirs(const char* argv0);

// First bundled executable named `name`; otherwise the bare name, left to PATH lookup.
[[nodiscard]] std::filesystem::path resolveToolPath(const std::string& name, const char* argv0);

}
