#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <set>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libaudiomirror/include/event_bus.hpp"
#include "../../libaudiomirror/include/events.hpp"
#include "../../libaudiomirror/include/logger.hpp"
#include "../../libaudiomirror/include/mirror_error.hpp"
#include "../../libaudiomirror/include/prune_engine.hpp"
#include "../../libaudiomirror/include/transfer_scheduler.hpp"

using namespace audiomirror;
namespace fs = std::filesystem;

namespace {

constexpr int kExitMaxFailures = 63;  // failure counts are clamped below the codes below
constexpr int kExitIoError = 74;      // EX_IOERR
constexpr int kExitConfigError = 78;  // EX_CONFIG
constexpr int kExitInterrupted = 130; // standard exit code for SIGINT

std::atomic<bool> interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

// handle ctrl+c or termination signals; only touches a lock-free atomic
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

// simple progress bar printer
void print_progress_bar(const size_t done, const size_t total, const size_t running, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const auto pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " running: " << running
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

void install_sinks(const Settings& settings) {
    Logger::clear_sinks();

    auto console = std::make_unique<ConsoleLogSink>();
    if (settings.quiet) {
        console->log_level = LogLevel::Warning;
    } else if (settings.verbose) {
        console->log_level = LogLevel::Debug;
    } else {
        console->log_level = LogLevel::Info;
    }
    Logger::add_sink(std::move(console));

    if (!settings.log_file.empty()) {
        auto file = std::make_unique<FileLogSink>(settings.log_file);
        if (file->is_open()) {
            Logger::add_sink(std::move(file));
        } else {
            Logger::log(LogLevel::Warning, "Cannot open log file: " + settings.log_file.string(), "main");
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"audiomirror: mirror a directory, transcoding lossless audio on the way."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    install_sinks(settings);
    const MirrorOptions& options = settings.options;

    try {
        options.validate();
    } catch (const MirrorError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitConfigError;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (options.dry_run) {
        Logger::log(LogLevel::Info, "Running in --dry-run mode. Nothing actually happens.", "main");
    }

    TransferConfig transfer_config = options.transfer_config();
    if (!transfer_config.transcoder) {
        Logger::log(LogLevel::Warning,
                    "Perl Audio Converter (pacpl) not found; every transcode will fail", "main");
    }
    if (!transfer_config.copier) {
        Logger::log(LogLevel::Debug, "rsync not found; falling back to plain copies", "main");
    }

    EventBus bus;
    std::vector<Result> results;
    std::mutex results_mtx;

    size_t total = 0;
    size_t done = 0;
    std::set<fs::path> in_flight;
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<PlanCompleteEvent>([&](const PlanCompleteEvent& e) {
        total = e.total_units;
    });

    auto redraw = [&] {
        if (settings.quiet) return;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        print_progress_bar(done, total, in_flight.size(), elapsed);
    };

    bus.subscribe<TransferStartEvent>([&](const TransferStartEvent& e) {
        const std::lock_guard lock(results_mtx);
        in_flight.insert(e.src);
        redraw();
    });

    // generic handler for "finished" events: record the row, update the progress bar
    auto on_finish = [&](Result r) {
        const std::lock_guard lock(results_mtx);
        in_flight.erase(r.src);
        if (!settings.report_path.empty()) {
            results.push_back(std::move(r));
        }
        ++done;
        redraw();
    };

    bus.subscribe<TransferCompleteEvent>([&](const TransferCompleteEvent& e) {
        on_finish(Result{e.src, e.dest, e.transcoded ? "transcoded" : "copied", true,
                         static_cast<double>(e.duration.count()) / 1000.0, {}});
    });
    bus.subscribe<TransferSkippedEvent>([&](const TransferSkippedEvent& e) {
        on_finish(Result{e.src, e.dest, "skipped", true, 0.0, {}});
    });
    bus.subscribe<TransferErrorEvent>([&](const TransferErrorEvent& e) {
        on_finish(Result{e.src, e.dest, "failed", false, 0.0, e.error_message});
    });
    bus.subscribe<TransferCancelledEvent>([&](const TransferCancelledEvent& e) {
        on_finish(Result{e.src, e.dest, "cancelled", false, 0.0, "Interrupted"});
    });
    bus.subscribe<PruneDeleteEvent>([&](const PruneDeleteEvent& e) {
        if (settings.report_path.empty()) return;
        const std::lock_guard lock(results_mtx);
        results.push_back(Result{{}, e.path, options.dry_run ? "would delete" : "deleted",
                                 e.error_message.empty(), 0.0, e.error_message});
    });

    TransferScheduler scheduler(PathMapper(options.mapping_config()),
                                std::move(transfer_config),
                                bus,
                                options.jobs,
                                &interrupted);

    RunSummary summary;
    bool io_error = false;
    try {
        summary = scheduler.run();
    } catch (const fs::filesystem_error& e) {
        Logger::log(LogLevel::Error, std::string("Cannot read the source tree: ") + e.what(), "main");
        return kExitIoError;
    }
    if (!settings.quiet && total > 0) {
        std::cerr << std::endl;
    }

    if (options.delete_extra) {
        if (summary.interrupted) {
            Logger::log(LogLevel::Warning, "Interrupted, not deleting extra destination files", "main");
        } else {
            try {
                const PruneEngine pruner(scheduler.mapper(), &bus);
                const auto extra = pruner.extra_destination_files();
                const auto pruned = pruner.delete_files(extra, options.dry_run);
                if (pruned.failed > 0) {
                    Logger::log(LogLevel::Warning,
                                "Could not delete " + std::to_string(pruned.failed) + " extra files", "main");
                }
            } catch (const fs::filesystem_error& e) {
                Logger::log(LogLevel::Error, std::string("Cannot read the destination tree: ") + e.what(), "main");
                io_error = true;
            }
        }
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.report_path.empty() &&
        !export_csv_report(results, summary, settings.report_path, total_seconds)) {
        Logger::log(LogLevel::Warning, "Cannot write report: " + settings.report_path.string(), "main");
    }

    const size_t errors = summary.errors();
    Logger::log(LogLevel::Info,
                "Done with " + std::to_string(errors) + (errors == 1 ? " error" : " errors") +
                " (" + std::to_string(summary.transcoded) + " transcoded, " +
                std::to_string(summary.copied) + " copied, " +
                std::to_string(summary.skipped) + " up to date)",
                "main");
    if (options.dry_run) {
        Logger::log(LogLevel::Info, "Ran in --dry-run mode. Nothing actually happened.", "main");
    }

    if (summary.interrupted) {
        Logger::log(LogLevel::Warning,
                    "Interrupted: " + std::to_string(summary.cancelled) + " transfers did not run", "main");
        return kExitInterrupted;
    }
    if (errors > 0) {
        return static_cast<int>(std::min<size_t>(errors, kExitMaxFailures));
    }
    return io_error ? kExitIoError : 0;
}
