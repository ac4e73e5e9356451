/**
 * @file prune_engine.hpp
 * @brief Finds and deletes destination files that have no source.
 */

#ifndef AUDIOMIRROR_PRUNE_ENGINE_HPP
#define AUDIOMIRROR_PRUNE_ENGINE_HPP

#include "event_bus.hpp"
#include "path_mapper.hpp"
#include <cstddef>
#include <filesystem>
#include <set>

namespace audiomirror {

/**
 * @brief Counts from PruneEngine::delete_files().
 */
struct PruneSummary {
    std::size_t deleted = 0;
    std::size_t failed = 0;
};

/**
 * @brief Computes extra destination files as a set difference.
 *
 * @details Both the existing destination files and the expected targets
 * are materialized in memory, so memory grows with the size of the
 * destination tree.
 */
class PruneEngine {
public:
    explicit PruneEngine(const PathMapper& mapper, EventBus* bus = nullptr)
        : mapper_(mapper), bus_(bus) {}

    /**
     * @brief Existing destination files minus the destination of every
     * source file.
     * @throws std::filesystem::filesystem_error if a walk fails.
     */
    [[nodiscard]] std::set<std::filesystem::path> extra_destination_files() const;

    /**
     * @brief Removes each file, continuing past failures.
     * @param files Files to delete.
     * @param dry_run Only log what would be deleted.
     */
    PruneSummary delete_files(const std::set<std::filesystem::path>& files, bool dry_run) const;

private:
    const PathMapper& mapper_;
    EventBus* bus_;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_PRUNE_ENGINE_HPP
