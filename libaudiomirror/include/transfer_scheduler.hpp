/**
 * @file transfer_scheduler.hpp
 * @brief Plans every TransferUnit of a mirror and runs them on a pool.
 */

#ifndef AUDIOMIRROR_TRANSFER_SCHEDULER_HPP
#define AUDIOMIRROR_TRANSFER_SCHEDULER_HPP

#include "event_bus.hpp"
#include "path_mapper.hpp"
#include "transfer_unit.hpp"
#include <atomic>
#include <cstddef>
#include <stop_token>
#include <thread>
#include <vector>

namespace audiomirror {

/**
 * @brief Aggregated result of a run.
 */
struct RunSummary {
    std::size_t total = 0;      ///< Units planned
    std::size_t copied = 0;
    std::size_t transcoded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;     ///< The run's error count
    std::size_t cancelled = 0;  ///< Interrupted or never started
    bool interrupted = false;   ///< An operator interrupt stopped the run

    [[nodiscard]] std::size_t errors() const noexcept { return failed; }
};

/**
 * @brief Orchestrates a full mirror run.
 *
 * @details The run has three steps:
 * - plan: walk the source tree and build one TransferUnit per file;
 * - barrier: create every destination directory before any transfer;
 * - execute: run all units on a ThreadPool, in no particular order.
 *
 * The TransferConfig is shared read-only by all workers. Progress is
 * published on the EventBus; per-unit failures are counted, never thrown.
 *
 * An interrupt (request_stop() or the optional external flag, which may
 * be set from a signal handler) stops dispatching, drops queued units and
 * asks running units to terminate their child processes.
 */
class TransferScheduler {
public:
    /**
     * @param mapper Source/destination mapping.
     * @param config Settings handed to every unit.
     * @param bus EventBus used to publish progress.
     * @param jobs Number of workers; 0 runs units one at a time like 1.
     * @param interrupt_flag Optional flag polled while waiting, e.g. set by SIGINT.
     */
    TransferScheduler(PathMapper mapper,
                      TransferConfig config,
                      EventBus& bus,
                      unsigned jobs = std::thread::hardware_concurrency(),
                      const std::atomic<bool>* interrupt_flag = nullptr);

    /**
     * @brief Walks the source tree and builds all units.
     * @throws std::filesystem::filesystem_error if the walk fails.
     */
    [[nodiscard]] std::vector<TransferUnit> plan();

    /**
     * @brief Creates the distinct destination directories of @p units.
     *
     * Failures are logged; the affected units later fail on their own.
     * @return Number of directories created.
     */
    std::size_t create_destination_dirs(const std::vector<TransferUnit>& units) const;

    /**
     * @brief Runs @p units on the pool and waits for all of them.
     */
    RunSummary execute(const std::vector<TransferUnit>& units);

    /**
     * @brief plan(), create_destination_dirs() (unless dry-run), execute().
     * @throws std::filesystem::filesystem_error if the source walk fails.
     */
    RunSummary run();

    /**
     * @brief Requests the run to stop. Thread-safe.
     */
    void request_stop() noexcept { stop_flag_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const PathMapper& mapper() const noexcept { return mapper_; }
    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    struct Counters {
        std::atomic<std::size_t> copied{0};
        std::atomic<std::size_t> transcoded{0};
        std::atomic<std::size_t> skipped{0};
        std::atomic<std::size_t> failed{0};
    };

    /// Folds the external interrupt flag into stop_flag_.
    bool poll_stop() noexcept;

    void run_unit(const TransferUnit& unit, const std::stop_token& st, Counters& counters);

    PathMapper mapper_;
    const TransferConfig config_;
    EventBus& bus_;
    unsigned jobs_;
    const std::atomic<bool>* interrupt_flag_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace audiomirror

#endif // AUDIOMIRROR_TRANSFER_SCHEDULER_HPP
