#ifndef AUDIOMIRROR_LOG_TIME_HPP
#define AUDIOMIRROR_LOG_TIME_HPP

#include <chrono>
#include <ctime>
#include <string>

// local wall-clock time as "YYYY-MM-DD HH:MM:SS", for log line prefixes
inline std::string log_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

#endif // AUDIOMIRROR_LOG_TIME_HPP
