#include "report_generator.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

bool export_csv_report(const std::vector<Result>& results,
                       const audiomirror::RunSummary& summary,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Source,Destination,Action,Time(s),Result,Error\n";
    for (const auto& r : results) {
        out << csv_escape(r.src.string()) << ","
            << csv_escape(r.dest.string()) << ","
            << csv_escape(r.action) << ","
            << fixed2(r.seconds) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal,Copied,Transcoded,Skipped,Failed,Cancelled,Interrupted,Time(s)\n"
        << summary.total << ","
        << summary.copied << ","
        << summary.transcoded << ","
        << summary.skipped << ","
        << summary.failed << ","
        << summary.cancelled << ","
        << (summary.interrupted ? "yes" : "no") << ","
        << fixed2(total_seconds) << "\n";
    return static_cast<bool>(out);
}
