#include "../../include/tag_sync.hpp"
#include "../../include/logger.hpp"
#include "../../include/mirror_error.hpp"
#include <taglib/fileref.h>
#include <taglib/tfile.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstring.h>
#include <taglib/tstringlist.h>

namespace fs = std::filesystem;

namespace audiomirror {

namespace {

/**
 * @brief TagView over TagLib's unified property interface.
 *
 * Changes are staged in a PropertyMap and written back on save().
 */
class TagLibTagView final : public TagView {
public:
    explicit TagLibTagView(const fs::path& path)
        : path_(path), ref_(path.string().c_str()) {
        if (ref_.isNull() || !ref_.file()) {
            throw MirrorError(ErrorKind::TagCopyFailed,
                              "TagLib cannot open file: " + path.string());
        }
        properties_ = ref_.file()->properties();
    }

    [[nodiscard]] std::vector<std::string> keys() const override {
        std::vector<std::string> out;
        for (auto it = properties_.begin(); it != properties_.end(); ++it) {
            out.push_back(it->first.to8Bit(true));
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> get(const std::string& key) const override {
        std::vector<std::string> out;
        const auto it = properties_.find(TagLib::String(key, TagLib::String::UTF8));
        if (it == properties_.end()) return out;
        for (const auto& value : it->second) {
            out.push_back(value.to8Bit(true));
        }
        return out;
    }

    void set(const std::string& key, const std::vector<std::string>& values) override {
        TagLib::StringList list;
        for (const auto& v : values) {
            list.append(TagLib::String(v, TagLib::String::UTF8));
        }
        properties_.replace(TagLib::String(key, TagLib::String::UTF8), list);
    }

    void remove(const std::string& key) override {
        properties_.erase(TagLib::String(key, TagLib::String::UTF8));
    }

    void save() override {
        const TagLib::PropertyMap rejected = ref_.file()->setProperties(properties_);
        for (auto it = rejected.begin(); it != rejected.end(); ++it) {
            Logger::log(LogLevel::Debug,
                        "Tag not supported by " + path_.filename().string() + ": " + it->first.to8Bit(true),
                        "tag_sync");
        }
        if (!ref_.save()) {
            throw MirrorError(ErrorKind::TagCopyFailed, "TagLib cannot save file: " + path_.string());
        }
    }

private:
    fs::path path_;
    TagLib::FileRef ref_;
    TagLib::PropertyMap properties_;
};

} // namespace

void TagView::clear() {
    for (const auto& key : keys()) {
        remove(key);
    }
}

TagBlacklist::TagBlacklist(const std::vector<std::string>& patterns) {
    patterns_.reserve(patterns.size());
    for (const auto& p : patterns) {
        patterns_.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
    }
}

TagBlacklist TagBlacklist::defaults() {
    return TagBlacklist({"encoded", "replaygain", "^~"});
}

bool TagBlacklist::matches(const std::string_view key) const {
    for (const auto& re : patterns_) {
        if (std::regex_search(key.begin(), key.end(), re)) {
            return true;
        }
    }
    return false;
}

FilteredTagView::FilteredTagView(std::unique_ptr<TagView> inner, TagBlacklist blacklist)
    : inner_(std::move(inner)), blacklist_(std::move(blacklist)) {}

std::vector<std::string> FilteredTagView::keys() const {
    std::vector<std::string> out;
    for (auto& key : inner_->keys()) {
        if (!blacklisted(key)) out.push_back(std::move(key));
    }
    return out;
}

std::vector<std::string> FilteredTagView::get(const std::string& key) const {
    if (blacklisted(key)) {
        Logger::log(LogLevel::Warning, key + " is a blacklisted key", "tag_sync");
        return {};
    }
    return inner_->get(key);
}

void FilteredTagView::set(const std::string& key, const std::vector<std::string>& values) {
    if (blacklisted(key)) {
        Logger::log(LogLevel::Warning, key + " is a blacklisted key", "tag_sync");
        return;
    }
    inner_->set(key, values);
}

void FilteredTagView::remove(const std::string& key) {
    if (blacklisted(key)) {
        Logger::log(LogLevel::Warning, key + " is a blacklisted key", "tag_sync");
        return;
    }
    inner_->remove(key);
}

void FilteredTagView::save() {
    inner_->save();
}

std::unique_ptr<TagView> open_taglib_view(const fs::path& path) {
    return std::make_unique<TagLibTagView>(path);
}

void copy_tags(const TagView& src, TagView& dest) {
    dest.clear();
    for (const auto& key : src.keys()) {
        dest.set(key, src.get(key));
    }
    dest.save();
}

void copy_tags(const fs::path& src, const fs::path& dest, const TagBlacklist& blacklist) {
    const FilteredTagView src_view(open_taglib_view(src), blacklist);
    FilteredTagView dest_view(open_taglib_view(dest), blacklist);
    copy_tags(src_view, dest_view);
}

} // namespace audiomirror
