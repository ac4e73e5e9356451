/**
 * @file file_walker.hpp
 * @brief Lazy recursive enumeration of the regular files below a directory.
 */

#ifndef AUDIOMIRROR_FILE_WALKER_HPP
#define AUDIOMIRROR_FILE_WALKER_HPP

#include <cstddef>
#include <filesystem>
#include <iterator>

namespace audiomirror {

/**
 * @brief Returns true if the final component of @p path starts with a dot.
 */
[[nodiscard]] bool is_hidden(const std::filesystem::path& path);

/**
 * @brief Input range over all regular files below a root directory.
 *
 * @details Nothing is read until iteration starts, and every call to
 * begin() walks the tree again. Paths are yielded as root / relative, so
 * an absolute root produces absolute paths. Order is unspecified.
 *
 * Hidden entries (name starting with '.') are skipped unless requested;
 * a skipped hidden directory is not descended into. Directory symlinks
 * are not followed. Traversal errors propagate as
 * std::filesystem::filesystem_error. A missing root is an empty range.
 */
class FileWalker {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::filesystem::path;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::filesystem::path*;
        using reference = const std::filesystem::path&;

        iterator() = default;
        iterator(const std::filesystem::path& root, bool include_hidden);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.it_ == b.it_;
        }

    private:
        void settle();

        std::filesystem::recursive_directory_iterator it_;
        std::filesystem::path current_;
        bool include_hidden_ = false;
    };

    FileWalker(std::filesystem::path root, const bool include_hidden)
        : root_(std::move(root)), include_hidden_(include_hidden) {}

    [[nodiscard]] iterator begin() const { return {root_, include_hidden_}; }
    [[nodiscard]] iterator end() const { return {}; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    bool include_hidden_;
};

} // namespace audiomirror

#endif // AUDIOMIRROR_FILE_WALKER_HPP
