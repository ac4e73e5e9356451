#ifndef AUDIOMIRROR_LOG_SINK_HPP
#define AUDIOMIRROR_LOG_SINK_HPP

#include <string_view>

namespace audiomirror {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter or format their output.
 */
enum class LogLevel {
    Debug,   ///< Per-file decisions, commands being run
    Info,    ///< Copies, transcodes, deletions and run summaries
    Warning, ///< Non-fatal problems (tags, permission modes, interrupts)
    Error    ///< Failed transfers and aborted runs
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages end up
 * (console, file, ...). The Logger class fans out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_LOG_SINK_HPP
