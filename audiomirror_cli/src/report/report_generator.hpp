#ifndef AUDIOMIRROR_REPORT_GENERATOR_HPP
#define AUDIOMIRROR_REPORT_GENERATOR_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "../../../libaudiomirror/include/transfer_scheduler.hpp"

struct Result {
    std::filesystem::path src;  // source file
    std::filesystem::path dest; // destination file
    std::string action;         // copied, transcoded, skipped, failed, cancelled, deleted
    bool success{};             // operation succeeded
    double seconds{};           // processing time
    std::string error_msg;      // if !success, reason of failure
};

/**
 * @brief Writes one CSV row per result followed by the run totals.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const audiomirror::RunSummary& summary,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif //AUDIOMIRROR_REPORT_GENERATOR_HPP
