#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mirror_error.hpp"
#include <string>
#include <system_error>

namespace audiomirror {

    bool copy_mode(const std::filesystem::path& src,
                   const std::filesystem::path& dest,
                   const std::string_view tag) {
        std::error_code ec;
        const auto st = std::filesystem::status(src, ec);
        if (!ec) {
            std::filesystem::permissions(dest, st.permissions(),
                                         std::filesystem::perm_options::replace, ec);
        }
        if (ec) {
            Logger::log(LogLevel::Warning,
                        std::string(to_string(ErrorKind::PermissionModeCopyFailed)) + ": " +
                        dest.string() + " (" + ec.message() + ")",
                        tag);
            return false;
        }
        return true;
    }

    std::optional<std::filesystem::file_time_type>
    modification_time(const std::filesystem::path& path) {
        std::error_code ec;
        const auto t = std::filesystem::last_write_time(path, ec);
        if (ec) return std::nullopt;
        return t;
    }

} // namespace audiomirror
