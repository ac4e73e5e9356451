#include "../../include/mirror_error.hpp"

namespace audiomirror {

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ConfigurationError:       return "ConfigurationError";
        case ErrorKind::InvalidPath:              return "InvalidPath";
        case ErrorKind::MissingSource:            return "MissingSource";
        case ErrorKind::MissingDestinationDir:    return "MissingDestinationDir";
        case ErrorKind::UnsupportedFilename:      return "UnsupportedFilename";
        case ErrorKind::ToolProducedNoOutput:     return "ToolProducedNoOutput";
        case ErrorKind::ToolInvocationFailed:     return "ToolInvocationFailed";
        case ErrorKind::CopyFailed:               return "CopyFailed";
        case ErrorKind::TagCopyFailed:            return "TagCopyFailed";
        case ErrorKind::PermissionModeCopyFailed: return "PermissionModeCopyFailed";
        case ErrorKind::PruneDeleteFailed:        return "PruneDeleteFailed";
    }
    return "Unknown";
}

} // namespace audiomirror
