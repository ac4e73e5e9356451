#include <gtest/gtest.h>
#include "../libaudiomirror/include/mirror_error.hpp"
#include "../libaudiomirror/include/mirror_options.hpp"

using namespace audiomirror;

TEST(ParseExtensionList, TrimsNormalizesAndDropsEmpties) {
    EXPECT_EQ(parse_extension_list(" flac, .WV,,ape ,"),
              (std::set<std::string>{"flac", "wv", "ape"}));
    EXPECT_TRUE(parse_extension_list("").empty());
    EXPECT_TRUE(parse_extension_list(" , ").empty());
}

TEST(MirrorOptions, Defaults) {
    const MirrorOptions options;
    EXPECT_EQ(options.transcode_formats, (std::set<std::string>{"flac", "wv", "wav", "ape", "fla"}));
    EXPECT_EQ(options.target_format, "ogg");
    EXPECT_GE(options.jobs, 1u);
    EXPECT_FALSE(options.dry_run);
    EXPECT_FALSE(options.delete_extra);
    EXPECT_NO_THROW(options.validate());
}

TEST(MirrorOptions, TargetAmongTranscodeFormatsIsAConfigurationError) {
    MirrorOptions options;
    options.target_format = ".FLAC";
    try {
        options.validate();
        FAIL() << "expected MirrorError";
    } catch (const MirrorError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigurationError);
    }
}

TEST(MirrorOptions, EmptyTargetIsAConfigurationError) {
    MirrorOptions options;
    options.target_format = "";
    EXPECT_THROW(options.validate(), MirrorError);
}

TEST(MirrorOptions, MappingConfigIsNormalized) {
    MirrorOptions options;
    options.source_directory = "/in";
    options.destination_directory = "/out";
    options.transcode_formats = {".FLAC", "Wv"};
    options.target_format = "MP3";
    options.include_hidden = true;

    const auto config = options.mapping_config();
    EXPECT_EQ(config.source_root, "/in");
    EXPECT_EQ(config.destination_root, "/out");
    EXPECT_EQ(config.transcode_exts, (std::set<std::string>{"flac", "wv"}));
    EXPECT_EQ(config.target_ext, "mp3");
    EXPECT_TRUE(config.include_hidden);
}

TEST(MirrorOptions, TransferConfigResolvesExplicitTools) {
    MirrorOptions options;
    options.force = true;
    options.extra_encoder_options = "-q 6";
    options.transcoder = "/bin/sh";
    options.copier = "/nonexistent/rsync";

    const auto config = options.transfer_config();
    EXPECT_TRUE(config.force);
    EXPECT_EQ(config.extra_encoder_options, "-q 6");
    EXPECT_EQ(config.transcoder, std::filesystem::path("/bin/sh"));
    EXPECT_FALSE(config.copier.has_value());
}
