#include "../../include/mirror_options.hpp"
#include "../../include/logger.hpp"
#include "../../include/mirror_error.hpp"
#include "../../include/subprocess.hpp"
#include <thread>

namespace audiomirror {

namespace {

std::set<std::string> normalized(const std::set<std::string>& exts) {
    std::set<std::string> out;
    for (const auto& e : exts) {
        auto n = normalize_extension(e);
        if (!n.empty()) out.insert(std::move(n));
    }
    return out;
}

std::optional<std::filesystem::path> resolve_tool(const std::optional<std::filesystem::path>& override_path,
                                                  std::string_view default_name) {
    const std::string name = override_path ? override_path->string() : std::string(default_name);
    auto found = find_executable(name);
    if (!found) {
        Logger::log(LogLevel::Debug, "Executable not found: " + name, "options");
    }
    return found;
}

} // namespace

std::set<std::string> default_transcode_formats() {
    return {"flac", "wv", "wav", "ape", "fla"};
}

unsigned default_job_count() noexcept {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

std::set<std::string> parse_extension_list(std::string_view list) {
    std::set<std::string> out;
    while (!list.empty()) {
        const auto comma = list.find(',');
        std::string_view item = list.substr(0, comma);
        list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);

        const auto first = item.find_first_not_of(" \t");
        if (first == std::string_view::npos) continue;
        const auto last = item.find_last_not_of(" \t");
        auto ext = normalize_extension(item.substr(first, last - first + 1));
        if (!ext.empty()) out.insert(std::move(ext));
    }
    return out;
}

void MirrorOptions::validate() const {
    const auto target = normalize_extension(target_format);
    if (target.empty()) {
        throw MirrorError(ErrorKind::ConfigurationError, "The target format must not be empty");
    }
    if (normalized(transcode_formats).contains(target)) {
        throw MirrorError(ErrorKind::ConfigurationError,
                          "The target format " + target + " must not be one of the transcode formats");
    }
}

MappingConfig MirrorOptions::mapping_config() const {
    MappingConfig config;
    config.source_root = source_directory;
    config.destination_root = destination_directory;
    config.transcode_exts = normalized(transcode_formats);
    config.target_ext = normalize_extension(target_format);
    config.include_hidden = include_hidden;
    return config;
}

TransferConfig MirrorOptions::transfer_config() const {
    TransferConfig config;
    config.force = force;
    config.dry_run = dry_run;
    config.extra_encoder_options = extra_encoder_options;
    config.transcoder = resolve_tool(transcoder, "pacpl");
    config.copier = resolve_tool(copier, "rsync");
    return config;
}

} // namespace audiomirror
