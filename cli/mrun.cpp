/*
 * mediarun - Job runner (mrun)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/events_json.hpp"
#include "mediarun/job_manager.hpp"
#include "mediarun/logger.hpp"
#include "mediarun/options.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace mediarun;

constexpr const char* VERSION = "0.1.0";

constexpr int EXIT_SUCCEEDED = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_SPAWN_FAILURE = 2;
constexpr int EXIT_CANCELLED = 130;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_cancel_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_cancel_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "mediarun Job Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] [--] <tool> [tool arguments...]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Runs one external media tool, prints its progress and outcome as JSON lines\n";
    std::cout << "on stdout. Ctrl-C (SIGINT) or SIGTERM cancels the job.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --tool <kind>        transcoder | downloader (default: inferred from tool name)\n";
    std::cout << "  --output <path>      Expected output file\n";
    std::cout << "  --output-dir <dir>   Directory the tool writes into\n";
    std::cout << "  --file-name <name>   Output base name used to locate the result\n";
    std::cout << "  --ext <ext>          Expected output extension\n";
    std::cout << "  --duration <secs>    Known input duration, for percent before the tool reports one\n";
    std::cout << "  --priority <level>   idle | low | normal | high (default: normal)\n";
    std::cout << "  --queue-size <n>     Progress events buffered before dropping (default: 256)\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0 succeeded, 1 failed or usage error, 2 tool could not be started, 130 cancelled\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  MEDIARUN_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  MEDIARUN_BIN_DIR     Directory searched first for bundled tools\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ffmpeg -y -i in.mov out.mp4\n";
    std::cout << "  " << progName << " --output-dir ./dl --file-name clip --ext mp4 -- yt-dlp -o './dl/clip.%(ext)s' URL\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN so stderr stays quiet; MEDIARUN_LOG_LEVEL overrides
    if (!std::getenv("MEDIARUN_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    else
        Logger::initFromEnv();

    Options options = parseOptions(argc, argv);
    if (options.showHelp) {
        printUsage(argv[0]);
        return EXIT_SUCCEEDED;
    }
    if (options.showVersion) {
        std::cout << VERSION << "\n";
        return EXIT_SUCCEEDED;
    }
    if (!options.valid) {
        std::cerr << "Error: " << options.errorMessage << "\n\n";
        printUsage(argv[0]);
        return EXIT_FAILED;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto manager = std::make_shared<JobManager>();
        auto events = std::make_shared<BoundedEventQueue>(options.queueCapacity);

        StartResult started = manager->start(options.request, events);
        if (!started) {
            JobEvent event;
            event.kind = JobEvent::Kind::Outcome;
            event.outcome = TerminalOutcome::failed(-1, started.message);
            std::cout << toJsonLine(event) << std::endl;
            return EXIT_SPAWN_FAILURE;
        }

        int exitCode = EXIT_FAILED;
        bool cancelSent = false;
        for (;;) {
            if (g_cancel_requested && !cancelSent) {
                LOG_INFO("Signal received, cancelling job");
                manager->cancel();
                cancelSent = true;
            }

            auto event = events->next(std::chrono::milliseconds(100));
            if (!event) {
                continue;
            }

            std::cout << toJsonLine(*event) << std::endl;
            if (event->kind == JobEvent::Kind::Outcome) {
                if (event->outcome.isSucceeded()) {
                    exitCode = EXIT_SUCCEEDED;
                } else if (event->outcome.isCancelled()) {
                    exitCode = EXIT_CANCELLED;
                } else {
                    exitCode = EXIT_FAILED;
                }
                break;
            }
        }

        manager->waitIdle();
        if (events->dropped() > 0) {
            LOG_INFO("Dropped " + std::to_string(events->dropped()) + " progress events");
        }
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}
