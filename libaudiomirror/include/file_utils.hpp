#ifndef AUDIOMIRROR_FILE_UTILS_HPP
#define AUDIOMIRROR_FILE_UTILS_HPP

#include <filesystem>
#include <optional>
#include <string_view>

namespace audiomirror {

    /**
     * @brief Copies the permission bits of @p src onto @p dest.
     *
     * Allowed to fail, since some network filesystems (e.g. CIFS) refuse
     * mode changes: failures are logged as warnings under @p tag.
     * @return true if the mode was applied.
     */
    bool copy_mode(const std::filesystem::path &src,
                   const std::filesystem::path &dest,
                   std::string_view tag = "file_utils");

    /**
     * @brief Last modification time of @p path, or std::nullopt if it
     * cannot be read.
     */
    [[nodiscard]] std::optional<std::filesystem::file_time_type>
    modification_time(const std::filesystem::path &path);

} // namespace audiomirror

#endif // AUDIOMIRROR_FILE_UTILS_HPP
