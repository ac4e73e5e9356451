#include "../../include/path_mapper.hpp"
#include "../../include/mirror_error.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace audiomirror {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// lexically normal form without a trailing separator
fs::path normalized(const fs::path& p) {
    fs::path n = p.lexically_normal();
    if (!n.has_filename() && n.has_relative_path()) {
        n = n.parent_path();
    }
    return n;
}

// relative path that does not climb out of its root
bool escapes_root(const fs::path& rel) {
    return rel.empty() || *rel.begin() == "..";
}

} // namespace

std::string extension_of(const fs::path& path) {
    const std::string name = path.filename().string();
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) return {};
    return name.substr(dot + 1);
}

std::string normalize_extension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    return to_lower(std::string(ext));
}

bool is_subpath(const fs::path& path, const fs::path& parent) {
    const fs::path rel = normalized(path).lexically_relative(normalized(parent));
    return !escapes_root(rel);
}

fs::path find_destination(const fs::path& src_path,
                          const fs::path& src_root,
                          const fs::path& dest_root,
                          const std::set<std::string>& transcode_exts,
                          const std::string& target_ext) {
    fs::path rel;
    if (src_path.is_absolute()) {
        if (!is_subpath(src_path, src_root)) {
            throw MirrorError(ErrorKind::InvalidPath,
                              "Absolute path must fall within the source root: " + src_path.string());
        }
        rel = normalized(src_path).lexically_relative(normalized(src_root));
    } else {
        rel = normalized(src_path);
        if (escapes_root(rel)) {
            throw MirrorError(ErrorKind::InvalidPath,
                              "Relative path escapes the source root: " + src_path.string());
        }
    }

    const std::string ext = extension_of(rel);
    if (!ext.empty() && transcode_exts.contains(to_lower(ext))) {
        std::string name = rel.filename().string();
        name.replace(name.size() - ext.size(), ext.size(), target_ext);
        rel.replace_filename(name);
    }
    return dest_root / rel;
}

PathMapper::PathMapper(MappingConfig config) : config_(std::move(config)) {
    // walkers yield paths under these roots, so they must not depend on how they were spelled
    config_.source_root = normalized(fs::absolute(config_.source_root));
    config_.destination_root = normalized(fs::absolute(config_.destination_root));
}

fs::path PathMapper::find_destination(const fs::path& src) const {
    return audiomirror::find_destination(src,
                                         config_.source_root,
                                         config_.destination_root,
                                         config_.transcode_exts,
                                         config_.target_ext);
}

FileWalker PathMapper::walk_source_files() const {
    return {config_.source_root, config_.include_hidden};
}

FileWalker PathMapper::walk_existing_destination_files() const {
    return {config_.destination_root, config_.include_hidden};
}

std::vector<fs::path> PathMapper::walk_target_files() const {
    std::vector<fs::path> targets;
    for (const auto& src : walk_source_files()) {
        targets.push_back(find_destination(src));
    }
    return targets;
}

std::vector<std::pair<fs::path, fs::path>> PathMapper::walk_source_target_pairs() const {
    std::vector<std::pair<fs::path, fs::path>> pairs;
    for (const auto& src : walk_source_files()) {
        pairs.emplace_back(src, find_destination(src));
    }
    return pairs;
}

} // namespace audiomirror
