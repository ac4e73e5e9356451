#include "../../include/transfer_unit.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_mapper.hpp"
#include "../../include/subprocess.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace audiomirror {

std::string_view to_string(const TransferState state) noexcept {
    switch (state) {
        case TransferState::Pending:    return "pending";
        case TransferState::Skipped:    return "skipped";
        case TransferState::Copied:     return "copied";
        case TransferState::Transcoded: return "transcoded";
        case TransferState::Failed:     return "failed";
        case TransferState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

TransferUnit::TransferUnit(fs::path src, fs::path dest, std::optional<std::string> extra_encoder_options)
    : src_(std::move(src)),
      dest_(std::move(dest)),
      src_dir_(src_.parent_path()),
      dest_dir_(dest_.parent_path()),
      src_ext_(extension_of(src_)),
      dest_ext_(extension_of(dest_)),
      extra_encoder_options_(std::move(extra_encoder_options)) {}

std::string TransferUnit::describe() const {
    return src_.string() + " -> " + dest_.string();
}

bool TransferUnit::needs_update() const {
    std::error_code ec;
    if (!fs::exists(dest_, ec)) return true;
    const auto src_mtime = modification_time(src_);
    const auto dest_mtime = modification_time(dest_);
    if (!src_mtime || !dest_mtime) return true;
    return *src_mtime > *dest_mtime;
}

bool TransferUnit::needs_transcode() const {
    return normalize_extension(src_ext_) != normalize_extension(dest_ext_);
}

void TransferUnit::check() const {
    std::error_code ec;
    if (!fs::is_regular_file(src_, ec)) {
        throw MirrorError(ErrorKind::MissingSource, "Missing input file: " + src_.string());
    }
    if (!fs::is_directory(dest_dir_, ec)) {
        throw MirrorError(ErrorKind::MissingDestinationDir, "Missing output directory: " + dest_dir_.string());
    }
}

fs::path TransferUnit::transcoder_output_base() const {
    // pacpl wants the output relative to the input's directory, without extension
    fs::path rel = dest_.lexically_relative(src_dir_);
    if (rel.empty()) rel = dest_;
    return rel.replace_extension();
}

std::vector<std::string> TransferUnit::transcode_command(const fs::path& transcoder) const {
    std::vector<std::string> cmd{transcoder.string()};
    if (extra_encoder_options_ && !extra_encoder_options_->empty()) {
        cmd.emplace_back("--eopts");
        cmd.push_back(*extra_encoder_options_);
    }
    cmd.insert(cmd.end(), {"--overwrite", "--keep", "--to", dest_ext_,
                           "--outfile", transcoder_output_base().string(), src_.string()});
    return cmd;
}

TransferState TransferUnit::transcode(const TransferConfig& config, const std::stop_token& stop) const {
    Logger::log(LogLevel::Info,
                (config.dry_run ? "Would transcode: " : "Transcoding: ") + describe(), "transfer");

    if (src_.string().find('"') != std::string::npos ||
        transcoder_output_base().string().find('"') != std::string::npos) {
        throw MirrorError(ErrorKind::UnsupportedFilename,
                          "The transcoder cannot handle filenames containing double quotes: " + src_.string());
    }
    if (config.dry_run) return TransferState::Transcoded;

    if (!config.transcoder) {
        throw MirrorError(ErrorKind::ToolInvocationFailed, "Perl Audio Converter (pacpl) not found");
    }
    const ProcessResult r = run_silent(transcode_command(*config.transcoder), stop);
    if (r.cancelled) return TransferState::Cancelled;
    if (!r.spawned) {
        throw MirrorError(ErrorKind::ToolInvocationFailed,
                          "Cannot run transcoder: " + config.transcoder->string());
    }
    if (r.term_signal != 0) {
        throw MirrorError(ErrorKind::ToolInvocationFailed,
                          "Perl Audio Converter killed by signal " + std::to_string(r.term_signal));
    }
    if (r.exit_code != 0) {
        throw MirrorError(ErrorKind::ToolInvocationFailed,
                          "Perl Audio Converter failed with exit code " + std::to_string(r.exit_code));
    }
    std::error_code ec;
    if (!fs::is_regular_file(dest_, ec)) {
        throw MirrorError(ErrorKind::ToolProducedNoOutput,
                          "Perl Audio Converter did not produce an output file: " + dest_.string());
    }

    try {
        copy_tags(src_, dest_, config.tag_blacklist);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning,
                    std::string(to_string(ErrorKind::TagCopyFailed)) + ": " + describe() + " (" + e.what() + ")",
                    "transfer");
    }
    copy_mode(src_, dest_, "transfer");
    return TransferState::Transcoded;
}

TransferState TransferUnit::copy(const TransferConfig& config, const std::stop_token& stop) const {
    Logger::log(LogLevel::Info,
                (config.dry_run ? "Would copy: " : "Copying: ") + describe(), "transfer");
    if (config.dry_run) return TransferState::Copied;

    std::error_code ec;
    if (fs::exists(dest_, ec) && fs::equivalent(src_, dest_, ec)) {
        Logger::log(LogLevel::Debug, "Already linked: " + describe(), "transfer");
        return TransferState::Copied;
    }

    fs::create_hard_link(src_, dest_, ec);
    if (!ec) return TransferState::Copied;
    Logger::log(LogLevel::Debug, "Hard link failed (" + ec.message() + "): " + describe(), "transfer");

    if (config.copier) {
        const ProcessResult r = run_silent({config.copier->string(), "-q", "-p", src_.string(), dest_.string()}, stop);
        if (r.cancelled) return TransferState::Cancelled;
        if (r.spawned && r.exit_code == 0) return TransferState::Copied;
        Logger::log(LogLevel::Debug,
                    "rsync failed (exit code " + std::to_string(r.exit_code) + "): " + describe(), "transfer");
    }

    ec.clear();
    fs::copy_file(src_, dest_, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw MirrorError(ErrorKind::CopyFailed, "Copy failed: " + ec.message());
    }
    copy_mode(src_, dest_, "transfer");
    return TransferState::Copied;
}

TransferOutcome TransferUnit::transfer(const TransferConfig& config, const std::stop_token& stop) const {
    TransferOutcome outcome;
    outcome.dry_run = config.dry_run;

    if (!config.force && !needs_update()) {
        Logger::log(LogLevel::Debug, "Skipping: " + describe(), "transfer");
        outcome.state = TransferState::Skipped;
        return outcome;
    }

    try {
        if (!config.dry_run) check();
        outcome.state = needs_transcode() ? transcode(config, stop) : copy(config, stop);
        if (outcome.state == TransferState::Cancelled) {
            Logger::log(LogLevel::Warning, "Interrupted: " + describe(), "transfer");
        }
    } catch (const MirrorError& e) {
        Logger::log(LogLevel::Error, "Error transferring " + describe() + ": " + e.what(), "transfer");
        outcome.state = TransferState::Failed;
        outcome.error = e.kind();
        outcome.message = e.what();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Error transferring " + describe() + ": " + e.what(), "transfer");
        outcome.state = TransferState::Failed;
        outcome.message = e.what();
    }
    return outcome;
}

} // namespace audiomirror
