#include "../../include/transfer_scheduler.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <chrono>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace audiomirror {

namespace {
constexpr auto kStopPollInterval = std::chrono::milliseconds(100);
}

TransferScheduler::TransferScheduler(PathMapper mapper,
                                     TransferConfig config,
                                     EventBus& bus,
                                     const unsigned jobs,
                                     const std::atomic<bool>* interrupt_flag)
    : mapper_(std::move(mapper)),
      config_(std::move(config)),
      bus_(bus),
      jobs_(jobs),
      interrupt_flag_(interrupt_flag) {}

bool TransferScheduler::poll_stop() noexcept {
    if (interrupt_flag_ && interrupt_flag_->load(std::memory_order_relaxed)) {
        request_stop();
    }
    return is_stopped();
}

std::vector<TransferUnit> TransferScheduler::plan() {
    Logger::log(LogLevel::Info,
                "Getting transfer units for each file from " + mapper_.config().source_root.string(),
                "scheduler");
    std::vector<TransferUnit> units;
    for (const auto& src : mapper_.walk_source_files()) {
        if (poll_stop()) break;
        units.emplace_back(src, mapper_.find_destination(src), config_.extra_encoder_options);
    }
    Logger::log(LogLevel::Debug, "Planned " + std::to_string(units.size()) + " transfers", "scheduler");
    return units;
}

std::size_t TransferScheduler::create_destination_dirs(const std::vector<TransferUnit>& units) const {
    std::set<fs::path> dirs;
    for (const auto& unit : units) {
        dirs.insert(unit.dest_dir());
    }

    std::size_t created = 0;
    for (const auto& dir : dirs) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) continue;
        Logger::log(LogLevel::Debug, "Creating directory: " + dir.string(), "scheduler");
        fs::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                        "Failed to create directory: " + dir.string() + " (" + ec.message() + ")",
                        "scheduler");
            continue;
        }
        ++created;
    }
    return created;
}

void TransferScheduler::run_unit(const TransferUnit& unit, const std::stop_token& st, Counters& counters) {
    if (st.stop_requested() || is_stopped()) {
        bus_.publish(TransferCancelledEvent{unit.src(), unit.dest()});
        return;
    }
    bus_.publish(TransferStartEvent{unit.src(), unit.dest()});

    const auto start = std::chrono::steady_clock::now();
    const TransferOutcome outcome = unit.transfer(config_, st);
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    switch (outcome.state) {
        case TransferState::Copied:
            ++counters.copied;
            bus_.publish(TransferCompleteEvent{unit.src(), unit.dest(), false, outcome.dry_run, duration});
            break;
        case TransferState::Transcoded:
            ++counters.transcoded;
            bus_.publish(TransferCompleteEvent{unit.src(), unit.dest(), true, outcome.dry_run, duration});
            break;
        case TransferState::Skipped:
            ++counters.skipped;
            bus_.publish(TransferSkippedEvent{unit.src(), unit.dest()});
            break;
        case TransferState::Failed:
            ++counters.failed;
            bus_.publish(TransferErrorEvent{unit.src(), unit.dest(), outcome.error, outcome.message});
            break;
        case TransferState::Cancelled:
        case TransferState::Pending:
            bus_.publish(TransferCancelledEvent{unit.src(), unit.dest()});
            break;
    }
}

RunSummary TransferScheduler::execute(const std::vector<TransferUnit>& units) {
    RunSummary summary;
    summary.total = units.size();
    Counters counters;

    {
        ThreadPool pool(jobs_);
        Logger::log(LogLevel::Info,
                    "Running " + std::to_string(pool.size()) + (pool.size() > 1 ? " jobs" : " job") +
                    " in parallel to transcode and transfer files",
                    "scheduler");

        for (const auto& unit : units) {
            if (poll_stop()) break;
            pool.enqueue([this, &unit, &counters](const std::stop_token& st) {
                run_unit(unit, st, counters);
            });
        }

        while (!pool.wait_idle_for(kStopPollInterval)) {
            if (poll_stop()) {
                Logger::log(LogLevel::Warning, "Transfer interrupted, stopping jobs...", "scheduler");
                const std::size_t dropped = pool.request_stop();
                Logger::log(LogLevel::Debug,
                            "Dropped " + std::to_string(dropped) + " queued transfers", "scheduler");
                break;
            }
        }
        // leaving the scope joins the workers; running units see their stop token
    }

    summary.copied = counters.copied.load();
    summary.transcoded = counters.transcoded.load();
    summary.skipped = counters.skipped.load();
    summary.failed = counters.failed.load();
    summary.cancelled = summary.total - summary.copied - summary.transcoded - summary.skipped - summary.failed;
    summary.interrupted = poll_stop();

    if (summary.interrupted) {
        Logger::log(LogLevel::Warning,
                    "Transfer interrupted: " + std::to_string(summary.copied + summary.transcoded + summary.skipped) +
                    " completed, " + std::to_string(summary.failed) + " failed, " +
                    std::to_string(summary.cancelled) + " cancelled",
                    "scheduler");
    }
    return summary;
}

RunSummary TransferScheduler::run() {
    auto units = plan();
    std::size_t created = 0;
    if (!config_.dry_run && !poll_stop()) {
        created = create_destination_dirs(units);
    }
    bus_.publish(PlanCompleteEvent{units.size(), created});
    return execute(units);
}

} // namespace audiomirror
