#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include "core/StatisticsParser.hpp"
#include "TestMocks.hpp"

using ::testing::_;
using ::testing::HasSubstr;

namespace {

const char* kSessionStatistics =
    "StartTime 1700000000.00 (Tue Nov 14 22:13:20 2023)\n"
    "EndTime 1700000002.50 (Tue Nov 14 22:13:22 2023)\n"
    "ElapsedTime 2.50 (2.50 seconds)\n"
    "SourceFiles 3\n"
    "SourceFileSize 40960 (40.0 KB)\n"
    "MirrorFiles 3\n"
    "ChangedFiles 1\n"
    "ChangedSourceSize 10000 (9.77 KB)\n"
    "IncrementFiles 1\n"
    "IncrementFileSize 2500 (2.44 KB)\n"
    "TotalDestinationSizeChange 2600 (2.54 KB)\n"
    "Errors 0\n";

const char* kSnapshotBackupOutput =
    "open repository\n"
    "Files:           1 new,     0 changed,     2 unmodified\n"
    "Dirs:            0 new,     1 changed,     0 unmodified\n"
    "Added to the repository: 1.331 MiB (1.200 MiB stored)\n"
    "\n"
    "processed 3 files, 2.000 MiB in 0:04\n"
    "snapshot 1a2b3c4d saved\n";

} // namespace

class StatisticsParserTest : public ::testing::Test {
protected:
    MockLogger mockLogger;
    StatisticsParser parser{&mockLogger};

    void SetUp() override {
        mockLogger.allowAll();
    }
};

TEST_F(StatisticsParserTest, DiffKeepsParenthesizedMagnitude) {
    BackupStatistics stats = parser.parseDiffStatistics("ChangedSourceSize 12345 (12.06 KB)\n");
    EXPECT_DOUBLE_EQ(12.06, stats.changedSourceSize);
}

TEST_F(StatisticsParserTest, DiffSessionFileIsParsed) {
    BackupStatistics stats = parser.parse(EngineKind::DIFF, kSessionStatistics);
    EXPECT_DOUBLE_EQ(1, stats.changedFiles);
    EXPECT_DOUBLE_EQ(9.77, stats.changedSourceSize);
    EXPECT_DOUBLE_EQ(2.44, stats.incrementFileSize);
    EXPECT_DOUBLE_EQ(2.54, stats.totalDestinationSizeChange);
    EXPECT_DOUBLE_EQ(2.5, stats.elapsedSeconds);
    ASSERT_TRUE(stats.sourceFiles.has_value());
    EXPECT_DOUBLE_EQ(3, *stats.sourceFiles);
}

TEST_F(StatisticsParserTest, DiffRatiosUseRawByteCounts) {
    BackupStatistics stats = parser.parseDiffStatistics(kSessionStatistics);
    ASSERT_TRUE(stats.compressionRatioPercent.has_value());
    ASSERT_TRUE(stats.spaceSavingsPercent.has_value());
    EXPECT_DOUBLE_EQ(25.0, *stats.compressionRatioPercent);
    EXPECT_DOUBLE_EQ(75.0, *stats.spaceSavingsPercent);
}

TEST_F(StatisticsParserTest, ZeroChangedSizeLeavesRatiosUndefined) {
    BackupStatistics stats = parser.parseDiffStatistics(
        "ChangedFiles 0\nChangedSourceSize 0 (0 bytes)\nIncrementFileSize 0 (0 bytes)\n");
    EXPECT_FALSE(stats.compressionRatioPercent.has_value());
    EXPECT_FALSE(stats.spaceSavingsPercent.has_value());
}

TEST_F(StatisticsParserTest, DiffKeysMatchByExactFirstToken) {
    BackupStatistics stats = parser.parseDiffStatistics("ChangedFilesExtra 9\nChangedFiles 4\n");
    EXPECT_DOUBLE_EQ(4, stats.changedFiles);
}

TEST_F(StatisticsParserTest, SnapshotAddedSizeConvertedToBytes) {
    BackupStatistics stats = parser.parse(EngineKind::SNAPSHOT, kSnapshotBackupOutput);
    EXPECT_DOUBLE_EQ(1.331 * 1024 * 1024, stats.incrementFileSize);
    EXPECT_DOUBLE_EQ(1.331 * 1024 * 1024, stats.totalDestinationSizeChange);
}

TEST_F(StatisticsParserTest, SnapshotFilesAndProcessedLines) {
    BackupStatistics stats = parser.parseSnapshotOutput(kSnapshotBackupOutput);
    EXPECT_DOUBLE_EQ(1, stats.changedFiles);
    ASSERT_TRUE(stats.sourceFiles.has_value());
    EXPECT_DOUBLE_EQ(3, *stats.sourceFiles);
    EXPECT_DOUBLE_EQ(2.0 * 1024 * 1024, stats.changedSourceSize);
    EXPECT_DOUBLE_EQ(4, stats.elapsedSeconds);
    ASSERT_TRUE(stats.compressionRatioPercent.has_value());
    EXPECT_NEAR(1.331 / 2.0 * 100.0, *stats.compressionRatioPercent, 1e-9);
}

TEST_F(StatisticsParserTest, SnapshotElapsedWithHours) {
    BackupStatistics stats = parser.parseSnapshotOutput("processed 10 files, 5.0 GiB in 1:02:03\n");
    EXPECT_DOUBLE_EQ(3723, stats.elapsedSeconds);
    EXPECT_DOUBLE_EQ(5.0 * 1024 * 1024 * 1024, stats.changedSourceSize);
}

TEST_F(StatisticsParserTest, RepositoryTotals) {
    std::optional<BackupStatistics> stats = parser.parseSnapshotRepositoryStats(
        "repository 1a2b3c4d opened\nStats in restore-size mode:\n"
        "     Snapshot processed:  2\n    Total File Count:  12\n          Total Size:  3.500 KiB\n");
    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(12, *stats->sourceFiles);
    EXPECT_DOUBLE_EQ(3.5 * 1024, *stats->sourceSize);
}

TEST_F(StatisticsParserTest, GarbageYieldsZerosAndWarns) {
    MockLogger strictLogger;
    EXPECT_CALL(strictLogger, warn(HasSubstr("No recognized"))).Times(2);
    StatisticsParser quietParser(&strictLogger);

    BackupStatistics diff = quietParser.parseDiffStatistics("not statistics at all");
    BackupStatistics snapshot = quietParser.parseSnapshotOutput("something unexpected");

    EXPECT_DOUBLE_EQ(0, diff.changedFiles);
    EXPECT_DOUBLE_EQ(0, diff.changedSourceSize);
    EXPECT_DOUBLE_EQ(0, snapshot.incrementFileSize);
    EXPECT_FALSE(snapshot.compressionRatioPercent.has_value());
}

TEST_F(StatisticsParserTest, MissingRepositoryTotalsIsEmpty) {
    EXPECT_FALSE(parser.parseSnapshotRepositoryStats("nothing here").has_value());
}

TEST(StatisticsParserUnitTest, UnitConversion) {
    EXPECT_DOUBLE_EQ(2048, StatisticsParser::unitToBytes(2, "KiB"));
    EXPECT_DOUBLE_EQ(3 * 1024.0 * 1024.0, StatisticsParser::unitToBytes(3, "MiB"));
    EXPECT_DOUBLE_EQ(17, StatisticsParser::unitToBytes(17, "B"));
}
