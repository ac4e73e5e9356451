/**
 * @file subprocess.hpp
 * @brief Running the external transcoding and copy tools.
 */

#ifndef AUDIOMIRROR_SUBPROCESS_HPP
#define AUDIOMIRROR_SUBPROCESS_HPP

#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace audiomirror {

/**
 * @brief Result of a child process run.
 */
struct ProcessResult {
    int exit_code = -1;     ///< Exit status, or -1 if the child did not exit normally
    bool spawned = false;   ///< False if the program could not be started at all
    bool cancelled = false; ///< True if the child was stopped by a stop request or an interrupt signal
    int term_signal = 0;    ///< Signal that killed the child, or 0
};

/**
 * @brief Looks up @p name in the directories listed in $PATH.
 *
 * A name containing a slash is checked as-is.
 * @return Path to an executable regular file, or std::nullopt.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_executable(std::string_view name);

/**
 * @brief Runs a program with stdin, stdout and stderr on the null device.
 *
 * Blocks until the child exits. The child runs in its own process group,
 * so a terminal interrupt only reaches this process. While waiting, @p stop
 * is polled; once a stop is requested the child's group receives SIGTERM
 * (SIGKILL if it lingers) and the result is flagged as cancelled.
 *
 * A child killed by SIGINT, SIGTERM, SIGHUP or SIGKILL from elsewhere is
 * reported as cancelled too. Other fatal signals are failures.
 *
 * @param argv Program path followed by its arguments.
 * @param stop Stop token of the calling worker.
 */
ProcessResult run_silent(const std::vector<std::string>& argv,
                         const std::stop_token& stop = {});

} // namespace audiomirror

#endif // AUDIOMIRROR_SUBPROCESS_HPP
