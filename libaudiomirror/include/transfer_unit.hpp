/**
 * @file transfer_unit.hpp
 * @brief One source/destination pair and the logic that brings the
 * destination up to date.
 */

#ifndef AUDIOMIRROR_TRANSFER_UNIT_HPP
#define AUDIOMIRROR_TRANSFER_UNIT_HPP

#include "mirror_error.hpp"
#include "tag_sync.hpp"
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace audiomirror {

/**
 * @brief Lifecycle of a TransferUnit within one run.
 *
 * Every unit starts Pending and ends in exactly one of the other states.
 */
enum class TransferState {
    Pending,
    Skipped,    ///< Destination already up to date
    Copied,
    Transcoded,
    Failed,
    Cancelled   ///< Abandoned because the run was interrupted
};

[[nodiscard]] std::string_view to_string(TransferState state) noexcept;

/**
 * @brief Settings every worker reads and nobody writes during a run.
 */
struct TransferConfig {
    bool force = false;   ///< Transfer even if the destination is newer
    bool dry_run = false; ///< Log the planned action, touch nothing
    std::optional<std::string> extra_encoder_options;  ///< Passed to the transcoder as --eopts
    std::optional<std::filesystem::path> transcoder;   ///< Perl Audio Converter executable
    std::optional<std::filesystem::path> copier;       ///< rsync executable
    TagBlacklist tag_blacklist = TagBlacklist::defaults();
};

/**
 * @brief Result of TransferUnit::transfer().
 */
struct TransferOutcome {
    TransferState state = TransferState::Pending;
    std::optional<ErrorKind> error; ///< Set for Failed outcomes caused by a MirrorError
    std::string message;            ///< Error text for Failed outcomes
    bool dry_run = false;           ///< The action was only logged

    [[nodiscard]] bool failed() const noexcept { return state == TransferState::Failed; }
};

/**
 * @brief Copies or transcodes one source file to its destination.
 *
 * @details All derived fields are computed once in the constructor; the
 * object is immutable afterwards, so a unit can be handed to any worker.
 * The destination directory must exist before transfer() runs.
 */
class TransferUnit {
public:
    TransferUnit(std::filesystem::path src,
                 std::filesystem::path dest,
                 std::optional<std::string> extra_encoder_options = std::nullopt);

    [[nodiscard]] const std::filesystem::path& src() const noexcept { return src_; }
    [[nodiscard]] const std::filesystem::path& dest() const noexcept { return dest_; }
    [[nodiscard]] const std::filesystem::path& src_dir() const noexcept { return src_dir_; }
    [[nodiscard]] const std::filesystem::path& dest_dir() const noexcept { return dest_dir_; }
    [[nodiscard]] const std::string& src_ext() const noexcept { return src_ext_; }
    [[nodiscard]] const std::string& dest_ext() const noexcept { return dest_ext_; }
    [[nodiscard]] const std::optional<std::string>& extra_encoder_options() const noexcept {
        return extra_encoder_options_;
    }

    /// @return "src -> dest", for log lines.
    [[nodiscard]] std::string describe() const;

    /**
     * @brief True when the destination is missing or older than the source.
     */
    [[nodiscard]] bool needs_update() const;

    /**
     * @brief True when source and destination extensions differ
     * (case-insensitively).
     */
    [[nodiscard]] bool needs_transcode() const;

    /**
     * @brief Verifies that the source file and destination directory exist.
     * @throws MirrorError (MissingSource or MissingDestinationDir).
     */
    void check() const;

    /**
     * @brief Output path argument for the transcoder: the destination
     * relative to the source directory, without extension.
     */
    [[nodiscard]] std::filesystem::path transcoder_output_base() const;

    /**
     * @brief Full transcoder command line.
     * @param transcoder Transcoder executable.
     */
    [[nodiscard]] std::vector<std::string> transcode_command(const std::filesystem::path& transcoder) const;

    /**
     * @brief Transcodes src into dest, then copies tags and permissions.
     * @return Transcoded, or Cancelled if @p stop fired while the tool ran.
     * @throws MirrorError on failure.
     */
    TransferState transcode(const TransferConfig& config, const std::stop_token& stop = {}) const;

    /**
     * @brief Copies src to dest: hard link, then the copier tool, then a
     * plain copy followed by a permission copy.
     * @return Copied, or Cancelled if @p stop fired while the tool ran.
     * @throws MirrorError (CopyFailed) if every method fails.
     */
    TransferState copy(const TransferConfig& config, const std::stop_token& stop = {}) const;

    /**
     * @brief Brings dest up to date, skipping it if already current.
     *
     * Never throws: failures are logged with both paths and returned as a
     * Failed outcome.
     */
    TransferOutcome transfer(const TransferConfig& config, const std::stop_token& stop = {}) const;

private:
    std::filesystem::path src_;
    std::filesystem::path dest_;
    std::filesystem::path src_dir_;
    std::filesystem::path dest_dir_;
    std::string src_ext_;
    std::string dest_ext_;
    std::optional<std::string> extra_encoder_options_;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_TRANSFER_UNIT_HPP
