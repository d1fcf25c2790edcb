/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/tool_locator.hpp"
#include "mediarun/logger.hpp"
#include <cstdlib>
#include <unistd.h>

namespace mediarun {

namespace {

std::filesystem::path executableDir(const char* argv0) {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path();
    }

    std::filesystem::path exePath(argv0 ? argv0 : "");
    if (!exePath.empty()) {
        exePath = std::filesystem::absolute(exePath, ec);
        if (!ec && std::filesystem::exists(exePath, ec)) {
            return exePath.parent_path();
        }
    }
    return {};
}

bool isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

}

std::vector<std::filesystem::path> bundledToolDirs(const char* argv0) {
    std::vector<std::filesystem::path> dirs;
    if (const char* env = std::getenv("MEDIARUN_BIN_DIR"); env && *env) {
        dirs.emplace_back(env);
    }
    auto base = executableDir(argv0);
    if (!base.empty()) {
        dirs.push_back(base / "bin");
        dirs.push_back(base);
    }
    return dirs;
}

std::filesystem::path resolveToolPath(const std::string& name, const char* argv0) {
    if (name.find('/') != std::string::npos) {
        return name;  // already a path
    }
    for (const auto& dir : bundledToolDirs(argv0)) {
        auto candidate = dir / name;
        if (isExecutableFile(candidate)) {
            LOG_DEBUG("Using bundled " + name + ": " + candidate.string());
            return candidate;
        }
    }
    LOG_DEBUG("No bundled " + name + " found, relying on PATH");
    return name;
}

}
