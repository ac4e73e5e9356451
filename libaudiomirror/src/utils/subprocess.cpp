#include "../../include/subprocess.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace audiomirror {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kTermGrace = std::chrono::seconds(2);

bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += '\'' + arg + '\'';
    }
    return cmd;
}

// raii wrapper for posix_spawn_file_actions_t
struct SpawnFileActions {
    posix_spawn_file_actions_t actions{};
    SpawnFileActions() { posix_spawn_file_actions_init(&actions); }
    ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions); }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
};

// raii wrapper for posix_spawnattr_t
struct SpawnAttributes {
    posix_spawnattr_t attr{};
    SpawnAttributes() { posix_spawnattr_init(&attr); }
    ~SpawnAttributes() { posix_spawnattr_destroy(&attr); }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;
};

bool is_interrupt_signal(const int sig) {
    return sig == SIGINT || sig == SIGTERM || sig == SIGHUP || sig == SIGKILL;
}

// terminate a child that outlived a stop request, always reaping it.
// the child leads its own process group, so its helpers go down with it
void terminate_child(const pid_t pid, int& status) {
    ::kill(-pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::waitpid(pid, &status, WNOHANG) == pid) return;
        std::this_thread::sleep_for(kPollInterval);
    }
    ::kill(-pid, SIGKILL);
    ::waitpid(pid, &status, 0);
}

} // namespace

std::optional<fs::path> find_executable(const std::string_view name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string_view::npos) {
        fs::path p(name);
        if (is_executable_file(p)) return p;
        return std::nullopt;
    }
    const char* env_path = std::getenv("PATH");
    if (!env_path) return std::nullopt;

    const std::string_view dirs(env_path);
    std::size_t start = 0;
    while (start <= dirs.size()) {
        auto end = dirs.find(':', start);
        if (end == std::string_view::npos) end = dirs.size();
        const std::string_view dir = dirs.substr(start, end - start);
        const fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable_file(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

ProcessResult run_silent(const std::vector<std::string>& argv, const std::stop_token& stop) {
    ProcessResult result;
    if (argv.empty()) return result;

    Logger::log(LogLevel::Debug, "Calling command: " + join_command(argv), "subprocess");

    SpawnFileActions fa;
    posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&fa.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&fa.actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    SpawnAttributes sa;
    posix_spawnattr_setflags(&sa.attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&sa.attr, 0);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    const int rc = posix_spawn(&pid, argv.front().c_str(), &fa.actions, &sa.attr, args.data(), environ);
    if (rc != 0) {
        Logger::log(LogLevel::Debug,
                    "Cannot start " + argv.front() + ": " + std::strerror(rc), "subprocess");
        return result;
    }
    result.spawned = true;

    int status = 0;
    for (;;) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            Logger::log(LogLevel::Warning,
                        "waitpid failed for " + argv.front() + ": " + std::strerror(errno), "subprocess");
            return result;
        }
        if (stop.stop_requested()) {
            terminate_child(pid, status);
            result.cancelled = true;
            return result;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.cancelled = is_interrupt_signal(result.term_signal);
        Logger::log(LogLevel::Debug,
                    argv.front() + " killed by signal " + std::to_string(result.term_signal), "subprocess");
    }
    return result;
}

} // namespace audiomirror
