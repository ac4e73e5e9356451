#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libaudiomirror/include/events.hpp"
#include "../libaudiomirror/include/prune_engine.hpp"

using namespace audiomirror;
using namespace audiomirror::test;

namespace {

class PruneEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(tmp / "src/a.flac");
        write_file(tmp / "src/b.mp3");
        write_file(tmp / "dst/a.ogg");
        write_file(tmp / "dst/b.mp3");
        write_file(tmp / "dst/a.flac");
        write_file(tmp / "dst/old/gone.mp3");
        write_file(tmp / "dst/.hidden");
    }

    TempDir tmp;
    const PathMapper mapper{{tmp / "src", tmp / "dst", {"flac"}, "ogg", false}};
};

} // namespace

TEST_F(PruneEngineTest, ExtraFilesAreExistingMinusExpected) {
    const PruneEngine pruner(mapper);
    EXPECT_EQ(pruner.extra_destination_files(),
              (std::set<fs::path>{tmp / "dst/a.flac", tmp / "dst/old/gone.mp3"}));
}

TEST_F(PruneEngineTest, DeletingLeavesNoExtraFiles) {
    EventBus bus;
    std::size_t deleted_events = 0;
    bus.subscribe<PruneDeleteEvent>([&deleted_events](const PruneDeleteEvent& e) {
        if (e.deleted) ++deleted_events;
    });

    const PruneEngine pruner(mapper, &bus);
    const auto summary = pruner.delete_files(pruner.extra_destination_files(), false);

    EXPECT_EQ(summary.deleted, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(deleted_events, 2u);
    EXPECT_TRUE(pruner.extra_destination_files().empty());
    EXPECT_TRUE(fs::exists(tmp / "dst/a.ogg"));
    EXPECT_TRUE(fs::exists(tmp / "dst/.hidden"));
}

TEST_F(PruneEngineTest, DryRunDeletesNothing) {
    LogCapture capture;
    const PruneEngine pruner(mapper);
    const auto summary = pruner.delete_files(pruner.extra_destination_files(), true);

    EXPECT_EQ(summary.deleted, 0u);
    EXPECT_TRUE(fs::exists(tmp / "dst/a.flac"));
    EXPECT_TRUE(capture.contains(LogLevel::Info, "Would delete: "));
}

TEST_F(PruneEngineTest, MissingDestinationHasNothingExtra) {
    fs::remove_all(tmp / "dst");
    EXPECT_TRUE(PruneEngine(mapper).extra_destination_files().empty());
}
