/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * All library components log through Logger, which delegates each
 * message to the registered ILogSink implementations.
 */

#ifndef AUDIOMIRROR_LOGGER_HPP
#define AUDIOMIRROR_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace audiomirror {

/**
 * @brief Static logging facade for audiomirror.
 *
 * Without any sink installed, messages are dropped.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "audiomirror").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "audiomirror");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_LOGGER_HPP
