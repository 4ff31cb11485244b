#include "progress_reporter.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using foldervault::test::InterruptingReporter;

TEST(FormatSize, scalesUnits)
{
    EXPECT_EQ(formatSize(0), "0.00 B");
    EXPECT_EQ(formatSize(1023), "1023.00 B");
    EXPECT_EQ(formatSize(1536), "1.50 KB");
    EXPECT_EQ(formatSize(1024ull * 1024), "1.00 MB");
    EXPECT_EQ(formatSize(5ull * 1024 * 1024 * 1024), "5.00 GB");
    EXPECT_EQ(formatSize(2ull * 1024 * 1024 * 1024 * 1024), "2.00 TB");
}

TEST(ProgressLine, backupShowsCountPercentAndSize)
{
    RunStatistics stats;
    stats.filesTotal = 4;
    stats.filesProcessed = 1;
    stats.bytesProcessed = 2048;
    EXPECT_EQ(renderProgressLine(Phase::Backup, stats), "Backing up: 1/4 files (25.0%) - 2.00 KB");
}

TEST(ProgressLine, restoreShowsTotalsAndErrors)
{
    RunStatistics stats;
    stats.filesTotal = 2;
    stats.filesProcessed = 1;
    stats.bytesProcessed = 512;
    stats.bytesTotal = 1024;
    stats.record("bad.txt", ErrorKind::PathEscape, "escapes");
    EXPECT_EQ(renderProgressLine(Phase::Restore, stats),
              "Extracting: 1/2 files (50.0%) - 512.00 B/1.00 KB, 1 error(s)");
}

TEST(ProgressLine, emptyRunIsZeroPercent)
{
    RunStatistics stats;
    EXPECT_EQ(stats.progressPercent(), 0.0);
    EXPECT_EQ(renderProgressLine(Phase::Backup, stats), "Backing up: 0/0 files (0.0%) - 0.00 B");
}

TEST(ProgressThrottle, reportsEveryIntervalEntries)
{
    InterruptingReporter reporter;
    ProgressThrottle throttle(&reporter, Phase::Backup, 3);
    RunStatistics stats;
    for (int i = 0; i < 7; ++i) {
        ++stats.filesProcessed;
        throttle.entryCompleted(stats);
    }
    EXPECT_EQ(reporter.updates, 2);
    EXPECT_EQ(reporter.finishes, 0);
}

TEST(ProgressThrottle, completeFiresExactlyOnce)
{
    InterruptingReporter reporter;
    ProgressThrottle throttle(&reporter, Phase::Restore, 10);
    RunStatistics stats;
    stats.filesProcessed = 3;
    throttle.complete(stats);
    throttle.complete(stats);
    throttle.entryCompleted(stats);
    EXPECT_EQ(reporter.finishes, 1);
    EXPECT_EQ(reporter.updates, 0);
    EXPECT_EQ(reporter.last.filesProcessed, 3u);
}

TEST(ProgressThrottle, nonPositiveIntervalReportsEveryEntry)
{
    InterruptingReporter reporter;
    ProgressThrottle throttle(&reporter, Phase::Backup, 0);
    RunStatistics stats;
    throttle.entryCompleted(stats);
    throttle.entryCompleted(stats);
    EXPECT_EQ(reporter.updates, 2);
}

TEST(ProgressThrottle, toleratesMissingReporter)
{
    ProgressThrottle throttle(nullptr, Phase::Backup, 1);
    RunStatistics stats;
    throttle.entryCompleted(stats);
    throttle.complete(stats);
    SUCCEED();
}

TEST(ConsoleProgressReporter, rewritesOneLine)
{
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);
    ConsoleProgressReporter reporter(out);
    RunStatistics stats;
    stats.filesTotal = 2;
    stats.filesProcessed = 1;
    reporter.update(Phase::Backup, stats);
    stats.filesProcessed = 2;
    reporter.finish(Phase::Backup, stats);

    std::rewind(out);
    std::string text;
    for (int c = std::fgetc(out); c != EOF; c = std::fgetc(out)) {
        text.push_back(static_cast<char>(c));
    }
    std::fclose(out);
    EXPECT_EQ(text, "\rBacking up: 1/2 files (50.0%) - 0.00 B\rBacking up: 2/2 files (100.0%) - 0.00 B\n");
}
