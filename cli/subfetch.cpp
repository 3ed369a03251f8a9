/*
 * subfetch - Command line front end
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/app_context.hpp"
#include "subfetch/config.hpp"
#include "subfetch/dependency_manager.hpp"
#include "subfetch/installation_monitor.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/progress_cache.hpp"
#include "subfetch/scanner.hpp"
#include "subfetch/scheduler.hpp"
#include "subfetch/subtitles.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace subfetch;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_cancel_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_cancel_requested = 1;
}

struct CliOptions {
    std::string command;            // "deps" or empty
    std::filesystem::path folder;
    Languages languages;
    std::optional<std::size_t> jobs;
    bool force = false;
    bool overwrite = false;
    bool ignoreExtras = false;
    bool save = false;
    bool noInstall = false;
};

void printUsage(const char* progName) {
    std::cout << "subfetch " << VERSION << " - Concurrent subtitle downloader\n\n";
    std::cout << "Usage: " << progName << " [options] <folder>\n";
    std::cout << "       " << progName << " deps [--no-install]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  folder               Directory scanned recursively for videos\n";
    std::cout << "  deps                 Check (and install) pipx and Subliminal\n\n";
    std::cout << "Options:\n";
    std::cout << "  -l, --lang <code>    Subtitle language, repeatable (e.g. -l en -l fr)\n";
    std::cout << "  -j, --jobs <n>       Concurrent downloads, 1-" << MAX_CONCURRENT_DOWNLOADS
              << " (default " << DEFAULT_CONCURRENT_DOWNLOADS << ")\n";
    std::cout << "  --force              Download even if embedded subtitles exist\n";
    std::cout << "  --overwrite          Process videos that already have subtitles\n";
    std::cout << "  --ignore-extras      Skip Plex/Jellyfin extras folders\n";
    std::cout << "  --save               Remember these options as the new defaults\n";
    std::cout << "  --no-install         Never install missing dependencies\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SUBFETCH_LOG_LEVEL   Console log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Settings: " << defaultSettingsPath().string() << "\n";
    std::cout << "Log file: " << defaultLogPath().string() << "\n";
}

bool parseJobs(const std::string& value, std::size_t& out) {
    try {
        std::size_t pos = 0;
        long parsed = std::stol(value, &pos);
        if (pos != value.size() || parsed < 1 || parsed > static_cast<long>(MAX_CONCURRENT_DOWNLOADS)) {
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-l" || arg == "--lang") && i + 1 < argc) {
            options.languages.push_back(toLower(argv[++i]));
        } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            std::size_t jobs = 0;
            if (!parseJobs(argv[++i], jobs)) {
                std::cerr << "Error: Concurrent downloads must be between 1 and " << MAX_CONCURRENT_DOWNLOADS << "\n";
                return std::nullopt;
            }
            options.jobs = jobs;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--overwrite") {
            options.overwrite = true;
        } else if (arg == "--ignore-extras") {
            options.ignoreExtras = true;
        } else if (arg == "--save") {
            options.save = true;
        } else if (arg == "--no-install") {
            options.noInstall = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return std::nullopt;
        } else if (arg == "deps" && options.command.empty() && options.folder.empty()) {
            options.command = arg;
        } else if (options.folder.empty() && options.command.empty()) {
            options.folder = arg;
        } else {
            std::cerr << "Error: Unexpected argument " << arg << "\n";
            return std::nullopt;
        }
    }

    return options;
}

void applyOverrides(Settings& settings, const CliOptions& options) {
    if (!options.languages.empty()) {
        settings.languages = options.languages;
    }
    if (options.jobs) {
        settings.concurrentDownloads = *options.jobs;
    }
    settings.forceDownload = settings.forceDownload || options.force;
    settings.overwriteExisting = settings.overwriteExisting || options.overwrite;
    settings.ignoreLocalExtras = settings.ignoreLocalExtras || options.ignoreExtras;
}

// Runs the dependency monitor until both stages are usable or nothing more can be done.
bool ensureDependencies(AppContext& ctx, bool allowInstall) {
    InstallationMonitor monitor(ctx.dependencies());
    if (!monitor.start()) {
        std::cerr << "  \033[31mCould not start dependency check\033[0m\n";
        return false;
    }

    DependencyManager deps(monitor, allowInstall);
    bool stage1Requested = false;
    bool gaveUp = false;
    std::string lastStatus;

    while (!g_cancel_requested) {
        for (const auto& event : deps.update()) {
            if (event.result.success) {
                std::cout << "  \033[32m✓\033[0m " << event.result.message << "\n";
            } else {
                std::cout << "  \033[31m✗\033[0m " << event.result.message << "\n";
                gaveUp = true;
            }
        }

        if (deps.ready() || gaveUp) {
            break;
        }

        if (deps.checked() && !deps.installing()) {
            const auto& state = deps.state();
            if (!state.stage1Available) {
                if (!allowInstall) {
                    break;
                }
                if (!stage1Requested) {
                    auto python = ToolchainProbe::pythonVersion();
                    if (!python) {
                        std::cout << "  \033[31m✗\033[0m Python 3 not found; install it and run again\n";
                        break;
                    }
                    LOG_INFO("Found " + *python);
                    stage1Requested = deps.requestStage1Install();
                }
            } else if (!state.stage2Available && !allowInstall) {
                break;
            }
        }

        if (deps.statusText() != lastStatus) {
            lastStatus = deps.statusText();
            std::cout << "  \033[90m" << lastStatus << "\033[0m\n" << std::flush;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    monitor.stop();

    const auto& state = deps.state();
    std::cout << "\n";
    std::cout << "    pipx        " << (state.stage1Available ? "\033[32mavailable\033[0m" : "\033[31mmissing\033[0m") << "\n";
    std::cout << "    subliminal  " << (state.stage2Available ? "\033[32mavailable\033[0m" : "\033[31mmissing\033[0m") << "\n";
    std::cout << "\n";
    return deps.ready();
}

void printProgress(const Progress& p, bool tty) {
    std::string line = "  [" + std::to_string(p.terminal()) + "/" + std::to_string(p.total) + "]  " +
                       std::to_string(p.running) + " running · " +
                       std::to_string(p.succeeded) + " downloaded · " +
                       std::to_string(p.embedded) + " embedded · " +
                       std::to_string(p.failed) + " failed";
    if (tty) {
        std::cout << "\r\033[K" << line << std::flush;
    } else {
        std::cout << line << "\n";
    }
}

void printSummary(const std::vector<Job>& jobs) {
    bool header = false;
    for (const auto& job : jobs) {
        if (job.status.state != Status::Failed && job.status.state != Status::EmbeddedExists) {
            continue;
        }
        if (!header) {
            std::cout << "\n";
            header = true;
        }
        const char* colour = job.status.state == Status::Failed ? "\033[31m" : "\033[33m";
        std::cout << "  " << colour << statusName(job.status.state) << "\033[0m  "
                  << job.target.filename().string() << "\033[90m  " << job.status.reason << "\033[0m\n";
    }
}

int runFetch(AppContext& ctx, const CliOptions& options) {
    const Settings& settings = ctx.settings();

    if (settings.languages.empty()) {
        std::cerr << "Error: Select at least one language (-l <code>)\n";
        return 1;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(options.folder, ec)) {
        std::cerr << "Error: Not a directory: " << options.folder.string() << "\n";
        return 1;
    }

    std::cout << "\n";
    std::cout << "  \033[1msubfetch\033[0m " << VERSION << "\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";

    if (!ensureDependencies(ctx, !options.noInstall)) {
        std::cerr << "  Subliminal is not available. Run 'subfetch deps' for details.\n";
        return 1;
    }

    Scanner scanner(options.folder);
    ScanResult scan = scanner.scan(ScanOptions{settings.languages, settings.overwriteExisting,
                                               settings.ignoreLocalExtras});
    if (!scan.ok) {
        std::cerr << "Error: Failed to scan " << options.folder.string() << "\n";
        return 1;
    }

    std::cout << "    Folder     " << options.folder.string() << "\n";
    std::cout << "    Videos     " << scan.videos.size() << "\n";
    std::cout << "    Missing    " << scan.targets.size() << "\n";
    if (scan.ignoredFolders > 0) {
        std::cout << "    Ignored    " << scan.ignoredFolders << " extras folders\n";
    }
    std::cout << "    Jobs       " << settings.concurrentDownloads << "\n\n";

    if (scan.targets.empty()) {
        std::cout << "  Nothing to do, every video already has subtitles.\n";
        return 0;
    }

    Scheduler scheduler(ctx.collaborators());
    SubmitResult submitted = scheduler.submit(scan.targets, settings.concurrentDownloads,
                                              settings.forceDownload || settings.overwriteExisting,
                                              settings.languages);
    if (!submitted) {
        std::cerr << "Error: " << submitted.message << "\n";
        return 1;
    }

    const bool tty = ::isatty(STDOUT_FILENO) != 0;
    ProgressCache cache(scheduler.store());
    bool cancelSent = false;

    while (scheduler.isRunning()) {
        if (g_cancel_requested && !cancelSent) {
            scheduler.cancel();
            cancelSent = true;
            std::cout << (tty ? "\n" : "") << "  Cancelling, waiting for running downloads...\n" << std::flush;
        }
        if (cache.refresh()) {
            printProgress(cache.progress(), tty);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    scheduler.wait();

    cache.refresh(true);
    printProgress(cache.progress(), tty);
    if (tty) {
        std::cout << "\n";
    }
    printSummary(cache.jobs());

    const Progress& p = cache.progress();
    std::cout << "\n  " << p.completed() << " successful, " << p.failed << " failed\n\n";
    return p.failed == 0 ? 0 : 2;
}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    // Default to WARN so the progress line stays readable; the log file keeps INFO
    if (std::getenv("SUBFETCH_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::WARN);
    }

    auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 1;
    }
    if (options->command.empty() && options->folder.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        AppContext ctx;
        applyOverrides(ctx.settings(), *options);

        if (options->save) {
            SettingsResult saved = ctx.saveSettings();
            std::cout << "  " << saved.message << "\n";
            if (!saved) {
                return 1;
            }
        }

        if (options->command == "deps") {
            return ensureDependencies(ctx, !options->noInstall) ? 0 : 1;
        }

        int rc = runFetch(ctx, *options);
        if (g_cancel_requested) {
            LOG_INFO("Run cancelled by signal");
            return 130;
        }
        return rc;

    } catch (const std::exception& e) {
        LOG_ERROR("subfetch error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
