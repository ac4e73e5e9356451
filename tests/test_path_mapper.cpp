#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libaudiomirror/include/mirror_error.hpp"
#include "../libaudiomirror/include/path_mapper.hpp"

using namespace audiomirror;
using namespace audiomirror::test;

namespace {

const std::set<std::string> kLossless{"flac", "wv", "wav", "ape", "fla"};

fs::path map(const fs::path& src) {
    return find_destination(src, "/music/src", "/music/dst", kLossless, "ogg");
}

ErrorKind map_error(const fs::path& src) {
    try {
        (void)map(src);
    } catch (const MirrorError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no error for " << src;
    return ErrorKind::ConfigurationError;
}

} // namespace

TEST(Extension, TextAfterLastDotOfFileName) {
    EXPECT_EQ(extension_of("a/b/song.flac"), "flac");
    EXPECT_EQ(extension_of("a/b/archive.tar.gz"), "gz");
    EXPECT_EQ(extension_of("a.dir/README"), "");
    EXPECT_EQ(extension_of(".flac"), "flac");
}

TEST(Extension, NormalizeLowersAndStripsDot) {
    EXPECT_EQ(normalize_extension(".FLAC"), "flac");
    EXPECT_EQ(normalize_extension("Wv"), "wv");
    EXPECT_EQ(normalize_extension(""), "");
}

TEST(IsSubpath, LexicalContainment) {
    EXPECT_TRUE(is_subpath("/a/b/c", "/a"));
    EXPECT_TRUE(is_subpath("/a", "/a"));
    EXPECT_TRUE(is_subpath("/a/", "/a"));
    EXPECT_FALSE(is_subpath("/ab/c", "/a"));
    EXPECT_FALSE(is_subpath("/a/../b", "/a"));
}

TEST(FindDestination, TranscodedExtensionIsReplaced) {
    EXPECT_EQ(map("/music/src/Artist/Album/01.flac"), "/music/dst/Artist/Album/01.ogg");
    EXPECT_EQ(map("/music/src/x.wv"), "/music/dst/x.ogg");
}

TEST(FindDestination, ExtensionMatchIsCaseInsensitive) {
    EXPECT_EQ(map("/music/src/Track.FLAC"), "/music/dst/Track.ogg");
}

TEST(FindDestination, OtherFilesKeepTheirName) {
    EXPECT_EQ(map("/music/src/a/cover.JPG"), "/music/dst/a/cover.JPG");
    EXPECT_EQ(map("/music/src/a/song.mp3"), "/music/dst/a/song.mp3");
    EXPECT_EQ(map("/music/src/README"), "/music/dst/README");
}

TEST(FindDestination, DirectoryNamesAreNeverRewritten) {
    EXPECT_EQ(map("/music/src/live.flac/set.mp3"), "/music/dst/live.flac/set.mp3");
    EXPECT_EQ(map("/music/src/live.flac/set.flac"), "/music/dst/live.flac/set.ogg");
}

TEST(FindDestination, RelativePathsAreTakenFromTheRoot) {
    EXPECT_EQ(map("Artist/01.ape"), "/music/dst/Artist/01.ogg");
}

TEST(FindDestination, DotComponentsAreResolved) {
    EXPECT_EQ(map("/music/src/./a/../b.flac"), "/music/dst/b.ogg");
}

TEST(FindDestination, PathOutsideTheRootIsRejected) {
    EXPECT_EQ(map_error("/elsewhere/a.flac"), ErrorKind::InvalidPath);
    EXPECT_EQ(map_error("/music/srcfoo/a.flac"), ErrorKind::InvalidPath);
    EXPECT_EQ(map_error("/music/src/../dst/a.flac"), ErrorKind::InvalidPath);
    EXPECT_EQ(map_error("../a.flac"), ErrorKind::InvalidPath);
}

TEST(FindDestination, MappingADestinationAgainIsStable) {
    const fs::path once = map("/music/src/a/01.flac");
    const fs::path twice = find_destination(once, "/music/dst", "/music/dst", kLossless, "ogg");
    EXPECT_EQ(once, twice);
}

TEST(PathMapper, PairsSkipHiddenFiles) {
    TempDir tmp;
    write_file(tmp / "src/a.flac");
    write_file(tmp / "src/b.mp3");
    write_file(tmp / "src/.c.flac");

    const PathMapper mapper({tmp / "src", tmp / "dst", kLossless, "ogg", false});
    std::set<std::pair<fs::path, fs::path>> pairs;
    for (auto& p : mapper.walk_source_target_pairs()) {
        pairs.insert(std::move(p));
    }

    const std::set<std::pair<fs::path, fs::path>> expected{
        {tmp / "src/a.flac", tmp / "dst/a.ogg"},
        {tmp / "src/b.mp3", tmp / "dst/b.mp3"},
    };
    EXPECT_EQ(pairs, expected);
}

TEST(PathMapper, TargetsFollowSourceOrder) {
    TempDir tmp;
    write_file(tmp / "src/x/1.wav");
    write_file(tmp / "src/x/2.txt");

    const PathMapper mapper({tmp / "src", tmp / "dst", kLossless, "ogg", false});
    const auto targets = mapper.walk_target_files();
    const std::set<fs::path> got(targets.begin(), targets.end());
    EXPECT_EQ(got, (std::set<fs::path>{tmp / "dst/x/1.ogg", tmp / "dst/x/2.txt"}));
}

TEST(PathMapper, RelativeRootsAreMadeAbsolute) {
    TempDir tmp;
    write_file(tmp / "src/a.flac");
    const ScopedCurrentPath cwd(tmp.path());
    const fs::path root = fs::current_path();

    const PathMapper mapper({"src/", "out/../dst", kLossless, "ogg", false});
    EXPECT_EQ(mapper.config().source_root, root / "src");
    EXPECT_EQ(mapper.config().destination_root, root / "dst");

    const auto pairs = mapper.walk_source_target_pairs();
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].first, root / "src/a.flac");
    EXPECT_EQ(pairs[0].second, root / "dst/a.ogg");
}
