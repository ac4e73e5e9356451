#ifndef AUDIOMIRROR_EVENTS_HPP
#define AUDIOMIRROR_EVENTS_HPP

#include "mirror_error.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace audiomirror {

/**
 * @brief Events published while a mirror runs.
 *
 * Plain data carriers sent through EventBus to the CLI (progress bar,
 * CSV report) or any other subscriber.
 */

// --- Planning ---

/**
 * @brief Emitted once every unit is known and destination directories exist.
 */
struct PlanCompleteEvent {
    std::size_t total_units = 0;        ///< Number of source files found
    std::size_t directories_created = 0; ///< Destination directories created
};

// --- Transfers ---

/**
 * @brief Emitted when a worker picks up a unit.
 */
struct TransferStartEvent {
    std::filesystem::path src;
    std::filesystem::path dest;
};

/**
 * @brief Emitted when a unit was copied or transcoded.
 */
struct TransferCompleteEvent {
    std::filesystem::path src;
    std::filesystem::path dest;
    bool transcoded = false;               ///< False for copies
    bool dry_run = false;                  ///< Only logged, nothing written
    std::chrono::milliseconds duration{0}; ///< Time spent in the unit
};

/**
 * @brief Emitted when a unit's destination was already up to date.
 */
struct TransferSkippedEvent {
    std::filesystem::path src;
    std::filesystem::path dest;
};

/**
 * @brief Emitted when a unit fails.
 */
struct TransferErrorEvent {
    std::filesystem::path src;
    std::filesystem::path dest;
    std::optional<ErrorKind> kind; ///< Unset for unexpected exceptions
    std::string error_message;
};

/**
 * @brief Emitted when a unit is abandoned because of an interrupt.
 */
struct TransferCancelledEvent {
    std::filesystem::path src;
    std::filesystem::path dest;
};

// --- Pruning ---

/**
 * @brief Emitted for every extra destination file handled by the pruner.
 */
struct PruneDeleteEvent {
    std::filesystem::path path;
    bool deleted = false;      ///< False on dry-run or failure
    std::string error_message; ///< Set when the removal failed
};

} // namespace audiomirror

#endif // AUDIOMIRROR_EVENTS_HPP
