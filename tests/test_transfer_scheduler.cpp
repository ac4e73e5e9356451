#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "test_support.hpp"
#include "../libaudiomirror/include/events.hpp"
#include "../libaudiomirror/include/transfer_scheduler.hpp"

using namespace audiomirror;
using namespace audiomirror::test;
using namespace std::chrono_literals;

namespace {

class TransferSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(tmp / "src/a.flac", "lossless");
        write_file(tmp / "src/b.mp3", "lossy");
        write_file(tmp / "src/.c.flac", "hidden");
        write_file(tmp / "src/sub/d.txt", "notes");
        config.transcoder = write_fake_transcoder(tmp / "bin");
    }

    [[nodiscard]] PathMapper mapper() const {
        return PathMapper({tmp / "src", tmp / "dst", {"flac", "wv", "wav", "ape", "fla"}, "ogg", false});
    }

    RunSummary run(const unsigned jobs = 2) {
        TransferScheduler scheduler(mapper(), config, bus, jobs);
        return scheduler.run();
    }

    TempDir tmp;
    TransferConfig config;
    EventBus bus;
};

} // namespace

TEST_F(TransferSchedulerTest, MirrorsTreeTranscodingLossless) {
    const auto summary = run();

    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.transcoded, 1u);
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_EQ(summary.errors(), 0u);
    EXPECT_FALSE(summary.interrupted);
    EXPECT_EQ(relative_files(tmp / "dst"),
              (std::set<fs::path>{"a.ogg", "b.mp3", "sub/d.txt"}));
    EXPECT_EQ(read_file(tmp / "dst/a.ogg"), "lossless");
}

TEST_F(TransferSchedulerTest, SecondRunSkipsEverything) {
    ASSERT_EQ(run().errors(), 0u);
    // transcoded output is written after its source, but make it unambiguous
    set_mtime(tmp / "src/a.flac", -100s);
    set_mtime(tmp / "src/b.mp3", -100s);
    set_mtime(tmp / "src/sub/d.txt", -100s);

    const auto summary = run();
    EXPECT_EQ(summary.skipped, 3u);
    EXPECT_EQ(summary.copied + summary.transcoded, 0u);
    EXPECT_EQ(summary.errors(), 0u);
}

TEST_F(TransferSchedulerTest, ForceRedoesUpToDateFiles) {
    ASSERT_EQ(run().errors(), 0u);
    config.force = true;
    const auto summary = run();
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.transcoded, 1u);
    EXPECT_EQ(summary.copied, 2u);
}

TEST_F(TransferSchedulerTest, DryRunCreatesNothing) {
    config.dry_run = true;
    const auto summary = run();
    EXPECT_EQ(summary.transcoded, 1u);
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_FALSE(fs::exists(tmp / "dst"));
}

TEST_F(TransferSchedulerTest, SingleJobRunsSequentially) {
    const auto summary = run(0);
    EXPECT_EQ(summary.transcoded + summary.copied, 3u);
    EXPECT_EQ(summary.errors(), 0u);
}

TEST_F(TransferSchedulerTest, FailuresAreCountedAndPublished) {
    write_file(tmp / "src/bad \"name\".flac");
    std::atomic<int> unsupported{0};
    bus.subscribe<TransferErrorEvent>([&unsupported](const TransferErrorEvent& e) {
        if (e.kind == ErrorKind::UnsupportedFilename) ++unsupported;
    });

    const auto summary = run();
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.transcoded, 1u);
    EXPECT_EQ(summary.copied, 2u);
    EXPECT_EQ(unsupported.load(), 1);
}

TEST_F(TransferSchedulerTest, PublishesPlanAndCompletion) {
    std::size_t planned = 0;
    std::size_t dirs = 0;
    std::atomic<int> completed{0};
    bus.subscribe<PlanCompleteEvent>([&](const PlanCompleteEvent& e) {
        planned = e.total_units;
        dirs = e.directories_created;
    });
    bus.subscribe<TransferCompleteEvent>([&completed](const TransferCompleteEvent&) { ++completed; });
    std::set<fs::path> started;
    bus.subscribe<TransferStartEvent>([&started](const TransferStartEvent& e) { started.insert(e.src); });

    run();
    EXPECT_EQ(planned, 3u);
    EXPECT_EQ(dirs, 2u);
    EXPECT_EQ(completed.load(), 3);
    EXPECT_EQ(started, (std::set<fs::path>{tmp / "src/a.flac", tmp / "src/b.mp3", tmp / "src/sub/d.txt"}));
}

TEST_F(TransferSchedulerTest, DestinationDirectoriesAreCreatedOnce) {
    TransferScheduler scheduler(mapper(), config, bus, 1);
    const auto units = scheduler.plan();
    EXPECT_EQ(scheduler.create_destination_dirs(units), 2u);
    EXPECT_TRUE(fs::is_directory(tmp / "dst/sub"));
    EXPECT_EQ(scheduler.create_destination_dirs(units), 0u);
}

TEST_F(TransferSchedulerTest, RaisedInterruptFlagStopsBeforeWork) {
    LogCapture capture;
    const std::atomic<bool> interrupted{true};
    TransferScheduler scheduler(mapper(), config, bus, 2, &interrupted);
    const auto summary = scheduler.run();
    EXPECT_TRUE(summary.interrupted);
    EXPECT_TRUE(capture.contains(LogLevel::Warning, "Transfer interrupted"));
    EXPECT_EQ(summary.copied + summary.transcoded, 0u);
    EXPECT_EQ(summary.errors(), 0u);
    EXPECT_FALSE(fs::exists(tmp / "dst/b.mp3"));
}

TEST_F(TransferSchedulerTest, InterruptCancelsRunningTranscodes) {
    fs::remove(tmp / "src/b.mp3");
    fs::remove(tmp / "src/sub/d.txt");
    write_file(tmp / "src/e.flac");
    write_file(tmp / "src/f.flac");
    config.transcoder = write_script(tmp / "bin/slow-pacpl", "exec sleep 30\n");

    std::atomic<bool> interrupted{false};
    TransferScheduler scheduler(mapper(), config, bus, 1, &interrupted);
    std::jthread operator_interrupt([&interrupted] {
        std::this_thread::sleep_for(300ms);
        interrupted = true;
    });

    const auto start = std::chrono::steady_clock::now();
    const auto summary = scheduler.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 15s);

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.cancelled, 3u);
    EXPECT_EQ(summary.errors(), 0u);
    EXPECT_TRUE(scheduler.is_stopped());
}

TEST_F(TransferSchedulerTest, ToolKilledAlongWithInterruptIsNotAFailure) {
    fs::remove(tmp / "src/b.mp3");
    fs::remove(tmp / "src/sub/d.txt");
    write_file(tmp / "src/e.flac");
    // dies the way a terminal Ctrl-C takes down a foreground child
    config.transcoder = write_script(tmp / "bin/killed-pacpl", "sleep 0.2\nkill -KILL $$\n");

    std::atomic<bool> interrupted{false};
    TransferScheduler scheduler(mapper(), config, bus, 1, &interrupted);
    std::jthread operator_interrupt([&interrupted] {
        std::this_thread::sleep_for(200ms);
        interrupted = true;
    });

    const auto summary = scheduler.run();
    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.transcoded, 0u);
    EXPECT_EQ(summary.cancelled, summary.total);
}
