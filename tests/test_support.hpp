#ifndef AUDIOMIRROR_TEST_SUPPORT_HPP
#define AUDIOMIRROR_TEST_SUPPORT_HPP

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "../libaudiomirror/include/file_walker.hpp"
#include "../libaudiomirror/include/log_sink.hpp"
#include "../libaudiomirror/include/logger.hpp"

namespace audiomirror::test {

namespace fs = std::filesystem;

// scratch directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "audiomirror-test-XXXXXX").string();
        if (!::mkdtemp(tmpl.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }
    [[nodiscard]] fs::path operator/(const fs::path& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

// changes the working directory until destruction
class ScopedCurrentPath {
public:
    explicit ScopedCurrentPath(const fs::path& dir) : previous_(fs::current_path()) {
        fs::current_path(dir);
    }
    ~ScopedCurrentPath() {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }
    ScopedCurrentPath(const ScopedCurrentPath&) = delete;
    ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

private:
    fs::path previous_;
};

inline void write_file(const fs::path& p, const std::string& content = "data") {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

// 16-bit mono PCM wav of silence, enough for TagLib to parse and tag
inline void write_wav(const fs::path& p, const std::uint32_t samples = 800) {
    std::string out;
    const auto u32 = [&out](const std::uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    };
    const auto u16 = [&out](const std::uint16_t v) {
        out.push_back(static_cast<char>(v & 0xff));
        out.push_back(static_cast<char>(v >> 8));
    };
    const std::uint32_t data_size = samples * 2;

    out += "RIFF";
    u32(36 + data_size);
    out += "WAVE";
    out += "fmt ";
    u32(16);
    u16(1);        // pcm
    u16(1);        // mono
    u32(8000);     // sample rate
    u32(16000);    // byte rate
    u16(2);        // block align
    u16(16);       // bits per sample
    out += "data";
    u32(data_size);
    out.append(data_size, '\0');
    write_file(p, out);
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// shifts the modification time of p by offset relative to now
inline void set_mtime(const fs::path& p, const std::chrono::seconds offset) {
    fs::last_write_time(p, fs::file_time_type::clock::now() + offset);
}

inline fs::path write_script(const fs::path& p, const std::string& body) {
    write_file(p, "#!/bin/sh\n" + body);
    fs::permissions(p, fs::perms::owner_all, fs::perm_options::add);
    return p;
}

// stands in for pacpl: copies SRC to "$(dirname SRC)/<--outfile>.<--to>"
inline fs::path write_fake_transcoder(const fs::path& dir) {
    return write_script(dir / "fake-pacpl",
        "while [ $# -gt 1 ]; do\n"
        "  case \"$1\" in\n"
        "    --to) ext=\"$2\"; shift ;;\n"
        "    --outfile) out=\"$2\"; shift ;;\n"
        "    --eopts) shift ;;\n"
        "  esac\n"
        "  shift\n"
        "done\n"
        "cd \"$(dirname \"$1\")\" || exit 2\n"
        "cp \"$1\" \"$out.$ext\"\n");
}

// files under root, relative to it
inline std::set<fs::path> relative_files(const fs::path& root, const bool include_hidden = true) {
    std::set<fs::path> out;
    for (const auto& p : FileWalker(root, include_hidden)) {
        out.insert(p.lexically_relative(root));
    }
    return out;
}

struct CapturedLine {
    LogLevel level;
    std::string message;
    std::string tag;
};

// records everything logged while it is alive
class LogCapture {
public:
    LogCapture() {
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<Sink>(*this));
    }
    ~LogCapture() { Logger::clear_sinks(); }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] std::vector<CapturedLine> lines() const {
        std::lock_guard lock(mtx_);
        return lines_;
    }

    [[nodiscard]] bool contains(const LogLevel level, const std::string& needle) const {
        for (const auto& l : lines()) {
            if (l.level == level && l.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    struct Sink final : ILogSink {
        explicit Sink(LogCapture& owner) : owner(owner) {}
        void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
            std::lock_guard lock(owner.mtx_);
            owner.lines_.push_back({level, std::string(message), std::string(tag)});
        }
        LogCapture& owner;
    };

    mutable std::mutex mtx_;
    std::vector<CapturedLine> lines_;
};

} // namespace audiomirror::test

#endif // AUDIOMIRROR_TEST_SUPPORT_HPP
