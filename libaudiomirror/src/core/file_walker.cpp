#include "../../include/file_walker.hpp"

namespace fs = std::filesystem;

namespace audiomirror {

bool is_hidden(const fs::path& path) {
    const auto name = path.filename().native();
    return !name.empty() && name.front() == '.';
}

FileWalker::iterator::iterator(const fs::path& root, const bool include_hidden)
    : include_hidden_(include_hidden) {
    if (!fs::exists(root)) return;
    it_ = fs::recursive_directory_iterator(root);
    settle();
}

FileWalker::iterator& FileWalker::iterator::operator++() {
    ++it_;
    settle();
    return *this;
}

// advance until it_ points at a yieldable file or reaches the end
void FileWalker::iterator::settle() {
    for (; it_ != fs::recursive_directory_iterator(); ++it_) {
        const auto& entry = *it_;
        if (!include_hidden_ && is_hidden(entry.path())) {
            if (entry.is_directory() && !entry.is_symlink()) {
                it_.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file()) {
            current_ = entry.path();
            return;
        }
    }
    current_.clear();
}

} // namespace audiomirror
