/**
 * @file mirror_options.hpp
 * @brief Run configuration as chosen by the user.
 */

#ifndef AUDIOMIRROR_MIRROR_OPTIONS_HPP
#define AUDIOMIRROR_MIRROR_OPTIONS_HPP

#include "path_mapper.hpp"
#include "transfer_unit.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace audiomirror {

/// @return Lossless formats transcoded by default: flac, wv, wav, ape, fla.
[[nodiscard]] std::set<std::string> default_transcode_formats();

/// @return Number of processor cores, 1 if unknown.
[[nodiscard]] unsigned default_job_count() noexcept;

/**
 * @brief Splits a comma-separated extension list.
 *
 * Items are trimmed and normalized (lower-case, no leading dot); empty
 * items are dropped.
 */
[[nodiscard]] std::set<std::string> parse_extension_list(std::string_view list);

/**
 * @brief Everything that parameterizes a mirror run.
 */
struct MirrorOptions {
    std::filesystem::path source_directory;
    std::filesystem::path destination_directory;
    std::set<std::string> transcode_formats = default_transcode_formats();
    std::string target_format = "ogg";
    std::optional<std::string> extra_encoder_options;
    unsigned jobs = default_job_count();
    bool dry_run = false;
    bool force = false;
    bool include_hidden = false;
    bool delete_extra = false;
    std::optional<std::filesystem::path> transcoder; ///< Defaults to pacpl on $PATH
    std::optional<std::filesystem::path> copier;     ///< Defaults to rsync on $PATH

    /**
     * @brief Rejects a target format that is also a transcode format.
     * @throws MirrorError (ConfigurationError).
     */
    void validate() const;

    /// @return Mapping view of these options; formats are normalized.
    [[nodiscard]] MappingConfig mapping_config() const;

    /// @return Worker settings, with tool paths resolved on $PATH.
    [[nodiscard]] TransferConfig transfer_config() const;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_MIRROR_OPTIONS_HPP
