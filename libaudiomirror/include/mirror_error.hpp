/**
 * @file mirror_error.hpp
 * @brief Error taxonomy shared by the library and the CLI.
 */

#ifndef AUDIOMIRROR_MIRROR_ERROR_HPP
#define AUDIOMIRROR_MIRROR_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace audiomirror {

/**
 * @brief Kinds of failure a run can run into.
 *
 * Only ConfigurationError aborts a whole run. The transfer kinds fail a
 * single unit; TagCopyFailed, PermissionModeCopyFailed and
 * PruneDeleteFailed are only ever logged as warnings.
 */
enum class ErrorKind {
    ConfigurationError,       ///< Target format is also a transcode format
    InvalidPath,              ///< Source path outside the source root
    MissingSource,            ///< Source is not a regular file
    MissingDestinationDir,    ///< Destination directory does not exist
    UnsupportedFilename,      ///< Filename the transcoder cannot be given
    ToolProducedNoOutput,     ///< Transcoder exited 0 without writing the file
    ToolInvocationFailed,     ///< Transcoder missing or exited non-zero
    CopyFailed,               ///< Every copy strategy failed
    TagCopyFailed,            ///< Tags could not be read or written
    PermissionModeCopyFailed, ///< chmod on the destination failed
    PruneDeleteFailed         ///< An extra destination file could not be removed
};

/**
 * @brief Returns a stable, human-readable name for an ErrorKind.
 */
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception carrying an ErrorKind.
 *
 * Thrown inside the library; converted to result values at the unit
 * and run boundaries.
 */
class MirrorError : public std::runtime_error {
public:
    MirrorError(const ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_MIRROR_ERROR_HPP
