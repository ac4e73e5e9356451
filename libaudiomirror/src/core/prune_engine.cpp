#include "../../include/prune_engine.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/mirror_error.hpp"
#include <algorithm>
#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace audiomirror {

std::set<fs::path> PruneEngine::extra_destination_files() const {
    std::set<fs::path> existing;
    for (const auto& p : mapper_.walk_existing_destination_files()) {
        existing.insert(p);
    }
    const auto targets = mapper_.walk_target_files();
    const std::set<fs::path> expected(targets.begin(), targets.end());

    std::set<fs::path> extra;
    std::set_difference(existing.begin(), existing.end(),
                        expected.begin(), expected.end(),
                        std::inserter(extra, extra.end()));
    return extra;
}

PruneSummary PruneEngine::delete_files(const std::set<fs::path>& files, const bool dry_run) const {
    PruneSummary summary;
    for (const auto& f : files) {
        Logger::log(LogLevel::Info, (dry_run ? "Would delete: " : "Deleting: ") + f.string(), "prune");
        if (dry_run) {
            if (bus_) bus_->publish(PruneDeleteEvent{f, false, {}});
            continue;
        }
        std::error_code ec;
        fs::remove(f, ec);
        if (ec) {
            Logger::log(LogLevel::Warning,
                        std::string(to_string(ErrorKind::PruneDeleteFailed)) + ": " + f.string() +
                        " (" + ec.message() + ")",
                        "prune");
            ++summary.failed;
            if (bus_) bus_->publish(PruneDeleteEvent{f, false, ec.message()});
            continue;
        }
        ++summary.deleted;
        if (bus_) bus_->publish(PruneDeleteEvent{f, true, {}});
    }
    return summary;
}

} // namespace audiomirror
