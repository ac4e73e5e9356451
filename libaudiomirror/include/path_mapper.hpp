/**
 * @file path_mapper.hpp
 * @brief Translates source paths into destination paths.
 */

#ifndef AUDIOMIRROR_PATH_MAPPER_HPP
#define AUDIOMIRROR_PATH_MAPPER_HPP

#include "file_walker.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace audiomirror {

/**
 * @brief Extension of the final path component: everything after its
 * last dot, or an empty string when there is no dot.
 */
[[nodiscard]] std::string extension_of(const std::filesystem::path& path);

/**
 * @brief Lower-cases an extension and strips one leading dot.
 */
[[nodiscard]] std::string normalize_extension(std::string_view ext);

/**
 * @brief True if @p path lies lexically inside @p parent.
 *
 * `.` and `..` components are resolved without touching the disk.
 * Any path is a sub-path of itself.
 */
[[nodiscard]] bool is_subpath(const std::filesystem::path& path,
                              const std::filesystem::path& parent);

/**
 * @brief Maps a source file to its destination path.
 *
 * If the extension of @p src_path (compared case-insensitively) is in
 * @p transcode_exts it is replaced by @p target_ext; every other part of
 * the path relative to @p src_root is kept unchanged, then rooted under
 * @p dest_root.
 *
 * @param src_path Absolute path under src_root, or a path relative to it.
 * @param src_root Source tree root.
 * @param dest_root Destination tree root.
 * @param transcode_exts Lower-case extensions without the dot.
 * @param target_ext Extension substituted for transcoded files.
 * @return The destination path.
 * @throws MirrorError (InvalidPath) if src_path is outside src_root.
 */
[[nodiscard]] std::filesystem::path find_destination(const std::filesystem::path& src_path,
                                                     const std::filesystem::path& src_root,
                                                     const std::filesystem::path& dest_root,
                                                     const std::set<std::string>& transcode_exts,
                                                     const std::string& target_ext);

/**
 * @brief Mapping configuration shared by the planner and the pruner.
 */
struct MappingConfig {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::set<std::string> transcode_exts; ///< lower-case, no leading dot
    std::string target_ext;               ///< lower-case, no leading dot
    bool include_hidden = false;
};

/**
 * @brief find_destination() bound to a MappingConfig, plus the walks over
 * both trees built on top of it.
 *
 * Both roots are made absolute against the current directory on
 * construction, so every walk yields absolute paths.
 */
class PathMapper {
public:
    explicit PathMapper(MappingConfig config);

    [[nodiscard]] std::filesystem::path find_destination(const std::filesystem::path& src) const;

    /// @return Lazy range over every source file that takes part in the mirror.
    [[nodiscard]] FileWalker walk_source_files() const;

    /// @return Lazy range over every file currently in the destination tree.
    [[nodiscard]] FileWalker walk_existing_destination_files() const;

    /// @return Destination path of every source file.
    [[nodiscard]] std::vector<std::filesystem::path> walk_target_files() const;

    /// @return (source, destination) pair for every source file.
    [[nodiscard]] std::vector<std::pair<std::filesystem::path, std::filesystem::path>>
    walk_source_target_pairs() const;

    [[nodiscard]] const MappingConfig& config() const noexcept { return config_; }

private:
    MappingConfig config_;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_PATH_MAPPER_HPP
