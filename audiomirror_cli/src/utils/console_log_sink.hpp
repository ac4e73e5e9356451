#ifndef AUDIOMIRROR_CONSOLE_LOG_SINK_HPP
#define AUDIOMIRROR_CONSOLE_LOG_SINK_HPP

#include "../../../libaudiomirror/include/log_sink.hpp"
#include "../../../libaudiomirror/include/logger.hpp"
#include "log_time.hpp"
#include <iostream>

// prints messages at or above log_level; warnings and errors go to stderr
class ConsoleLogSink final : public audiomirror::ILogSink {
public:
    audiomirror::LogLevel log_level = audiomirror::LogLevel::Info;

    void log(const audiomirror::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;
        auto& out = level >= audiomirror::LogLevel::Warning ? std::cerr : std::cout;
        out << log_timestamp() << " " << audiomirror::Logger::level_to_string(level)
            << " [" << tag << "] " << message << std::endl;
    }
};

#endif // AUDIOMIRROR_CONSOLE_LOG_SINK_HPP
