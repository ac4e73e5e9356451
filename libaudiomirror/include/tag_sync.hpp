/**
 * @file tag_sync.hpp
 * @brief Copying user-visible metadata between audio files.
 *
 * Tags are accessed through the TagView interface. TagLibTagView adapts
 * TagLib's PropertyMap, and FilteredTagView hides blacklisted keys from
 * any other view, so neither copy_tags() nor its callers ever see
 * format-specific fields.
 */

#ifndef AUDIOMIRROR_TAG_SYNC_HPP
#define AUDIOMIRROR_TAG_SYNC_HPP

#include <filesystem>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace audiomirror {

/**
 * @brief Key/value-list view over the metadata of one file.
 */
class TagView {
public:
    virtual ~TagView() = default;

    /// @return Every key currently present.
    [[nodiscard]] virtual std::vector<std::string> keys() const = 0;

    /// @return Values of @p key, empty if absent.
    [[nodiscard]] virtual std::vector<std::string> get(const std::string& key) const = 0;

    /// Replace all values of @p key.
    virtual void set(const std::string& key, const std::vector<std::string>& values) = 0;

    /// Remove @p key if present.
    virtual void remove(const std::string& key) = 0;

    /// Persist pending changes to disk.
    virtual void save() = 0;

    /// Remove every key returned by keys().
    void clear();
};

/**
 * @brief Set of case-insensitive regular expressions matching keys that
 * must not be transferred between formats.
 */
class TagBlacklist {
public:
    TagBlacklist() = default;
    explicit TagBlacklist(const std::vector<std::string>& patterns);

    /**
     * @brief Default blacklist: encoder info, replay-gain levels and
     * internal fields (keys starting with '~').
     */
    static TagBlacklist defaults();

    /// @return true if any pattern is found anywhere in @p key.
    [[nodiscard]] bool matches(std::string_view key) const;

private:
    std::vector<std::regex> patterns_;
};

/**
 * @brief Decorator that applies a TagBlacklist to every operation of
 * another view.
 *
 * Blacklisted keys are left out of keys(); get/set/remove on them log a
 * warning and do nothing.
 */
class FilteredTagView final : public TagView {
public:
    FilteredTagView(std::unique_ptr<TagView> inner, TagBlacklist blacklist);

    [[nodiscard]] std::vector<std::string> keys() const override;
    [[nodiscard]] std::vector<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::vector<std::string>& values) override;
    void remove(const std::string& key) override;
    void save() override;

    [[nodiscard]] bool blacklisted(std::string_view key) const { return blacklist_.matches(key); }

private:
    std::unique_ptr<TagView> inner_;
    TagBlacklist blacklist_;
};

/**
 * @brief Opens a file through TagLib and returns its property view.
 * @throws MirrorError (TagCopyFailed) if TagLib cannot handle the file.
 */
[[nodiscard]] std::unique_ptr<TagView> open_taglib_view(const std::filesystem::path& path);

/**
 * @brief Replace the tags of @p dest with those of @p src.
 *
 * Clears @p dest, copies every key of @p src, then saves @p dest. Pass
 * FilteredTagView instances to keep blacklisted keys out.
 */
void copy_tags(const TagView& src, TagView& dest);

/**
 * @brief Replace the non-blacklisted tags of @p dest with those of @p src.
 *
 * Blacklisted fields are neither read from src nor cleared on dest.
 * @throws MirrorError (TagCopyFailed) on any metadata I/O problem.
 */
void copy_tags(const std::filesystem::path& src,
               const std::filesystem::path& dest,
               const TagBlacklist& blacklist = TagBlacklist::defaults());

} // namespace audiomirror

#endif // AUDIOMIRROR_TAG_SYNC_HPP
