#ifndef AUDIOMIRROR_FILE_LOG_SINK_HPP
#define AUDIOMIRROR_FILE_LOG_SINK_HPP

#include "../../../libaudiomirror/include/log_sink.hpp"
#include "../../../libaudiomirror/include/logger.hpp"
#include "log_time.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

class FileLogSink final : public audiomirror::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const audiomirror::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << log_timestamp() << " [" << audiomirror::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // AUDIOMIRROR_FILE_LOG_SINK_HPP
