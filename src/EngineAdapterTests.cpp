#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "core/engines/DiffEngineAdapter.hpp"
#include "core/engines/SnapshotEngineAdapter.hpp"
#include "utils/FileSystem.hpp"
#include "TestMocks.hpp"

using ::testing::_;
using ::testing::ContainerEq;
using ::testing::DoAll;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

const char* kSessionStatistics =
    "ElapsedTime 1.20 (1.20 seconds)\n"
    "ChangedFiles 1\n"
    "ChangedSourceSize 4000 (3.91 KB)\n"
    "IncrementFileSize 1000 (1000 bytes)\n"
    "TotalDestinationSizeChange 1200 (1.17 KB)\n";

const char* kIncrementList =
    "Found 2 increments:\n"
    "    increments.2025-06-12T09-00-00+10-00.dir   Thu Jun 12 09:00:00 2025\n"
    "    increments.2025-06-13T12-25-58+10-00.dir   Fri Jun 13 12:25:58 2025\n"
    "Current mirror: Sat Jun 14 08:00:00 2025\n";

} // namespace

class EngineAdapterTestBase : public ::testing::Test {
protected:
    fs::path workDir = fs::temp_directory_path() / "assetkeeper_engine_test";
    fs::path assetFile = workDir / "house.blend";
    fs::path repoDir = workDir / "house.blend.meta";
    NiceMock<MockLogger> mockLogger;
    std::shared_ptr<NiceMock<MockProcessRunner>> runner = std::make_shared<NiceMock<MockProcessRunner>>();

    void SetUp() override {
        fs::remove_all(workDir);
        fs::create_directories(workDir);
        std::ofstream(assetFile) << "blend data";
    }

    void TearDown() override {
        fs::remove_all(workDir);
    }

    void createDiffRepository(const std::string& statistics = kSessionStatistics) {
        fs::path data = repoDir / DiffEngineAdapter::kDataDirectory;
        fs::create_directories(data);
        std::ofstream(data / "session_statistics.2025-06-12T09-00-00+10-00.data") << "ChangedFiles 9\n";
        std::ofstream(data / "session_statistics.2025-06-13T12-25-58+10-00.data") << statistics;
    }

    void createSnapshotRepository() {
        fs::path engineRepo = repoDir / SnapshotEngineAdapter::kRepositoryDirectory;
        fs::create_directories(engineRepo);
        std::ofstream(engineRepo / SnapshotEngineAdapter::kConfigMarker) << "{}";
    }
};

// ---- 差异引擎 ----

class DiffEngineAdapterTest : public EngineAdapterTestBase {
protected:
    std::unique_ptr<DiffEngineAdapter> adapter;

    void SetUp() override {
        EngineAdapterTestBase::SetUp();
        adapter = std::make_unique<DiffEngineAdapter>(runner, "rdiff-backup", &mockLogger, 1000);
    }
};

TEST_F(DiffEngineAdapterTest, BackupSelectsSingleFileFromParentDirectory) {
    std::vector<std::string> args;
    ProcessOptions options;
    EXPECT_CALL(*runner, run("rdiff-backup", _, _))
        .WillOnce(DoAll(SaveArg<1>(&args), SaveArg<2>(&options),
                        Invoke([this](const std::string&, const std::vector<std::string>&, const ProcessOptions&) {
                            createDiffRepository();
                            return makeProcessResult(0);
                        })));

    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(BackupState::SUCCESS, result.state);
    EXPECT_EQ(1000, options.timeoutMs);
    std::vector<std::string> expected = {
        "--api-version", "201", "backup", "--create-full-path",
        "--include", "**/house.blend", "--exclude", "**",
        FileSystem::toGenericPath(workDir.string()), FileSystem::toGenericPath(repoDir.string())};
    EXPECT_THAT(args, ContainerEq(expected));
}

TEST_F(DiffEngineAdapterTest, BackupReadsNewestSessionStatistics) {
    EXPECT_CALL(*runner, run(_, _, _))
        .WillOnce(Invoke([this](const std::string&, const std::vector<std::string>&, const ProcessOptions&) {
            createDiffRepository();
            return makeProcessResult(0);
        }));

    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());

    ASSERT_TRUE(result.statistics.has_value());
    EXPECT_DOUBLE_EQ(1, result.statistics->changedFiles);
    EXPECT_DOUBLE_EQ(3.91, result.statistics->changedSourceSize);
    ASSERT_TRUE(result.statistics->compressionRatioPercent.has_value());
    EXPECT_DOUBLE_EQ(25.0, *result.statistics->compressionRatioPercent);
}

TEST_F(DiffEngineAdapterTest, AdjacentBackupForcesAndAddsPatterns) {
    std::vector<std::string> args;
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(DoAll(SaveArg<1>(&args), Return(makeProcessResult(0))));

    BackupOptions options;
    options.compression = false;
    options.includePatterns = {"**/*.png"};
    options.excludePatterns = {"**/*.tmp"};
    adapter->backupAdjacent(assetFile.string(), repoDir.string(), options);

    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ("--force", args[2]);
    EXPECT_EQ("backup", args[3]);
    std::vector<std::string> middle(args.begin() + 5, args.end() - 2);
    EXPECT_THAT(middle, ElementsAre("--no-compression", "--include", "**/house.blend", "--include", "**/*.png",
                                    "--exclude", "**/*.tmp", "--exclude", "**"));
}

TEST_F(DiffEngineAdapterTest, ExitCodeOneWithDataIsRecoveredWarning) {
    EXPECT_CALL(*runner, run(_, _, _))
        .WillOnce(Invoke([this](const std::string&, const std::vector<std::string>&, const ProcessOptions&) {
            createDiffRepository();
            return makeProcessResult(1, "", "WARNING: some metadata could not be read\n");
        }));

    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(BackupState::WARNING_RECOVERED, result.state);
    EXPECT_TRUE(result.error.empty());
    EXPECT_TRUE(result.statistics.has_value());
}

TEST_F(DiffEngineAdapterTest, ExitCodeOneWithoutDataIsHardFailure) {
    EXPECT_CALL(*runner, run(_, _, _))
        .WillOnce(Return(makeProcessResult(1, "", "line one\nFatal: cannot write destination\n")));

    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(BackupState::HARD_FAILURE, result.state);
    EXPECT_EQ(1, result.exitCode);
    EXPECT_THAT(result.error, HasSubstr("Fatal: cannot write destination"));
    EXPECT_FALSE(result.statistics.has_value());
}

TEST_F(DiffEngineAdapterTest, MissingSourceDoesNotRunEngine) {
    EXPECT_CALL(*runner, run(_, _, _)).Times(0);
    BackupResult result = adapter->backup((workDir / "gone.blend").string(), repoDir.string(), BackupOptions());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(BackupState::HARD_FAILURE, result.state);
    EXPECT_THAT(result.error, HasSubstr("does not exist"));
}

TEST_F(DiffEngineAdapterTest, RestoreArguments) {
    createDiffRepository();
    std::vector<std::string> args;
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(DoAll(SaveArg<1>(&args), Return(makeProcessResult(0))));

    RestoreOptions options;
    options.assetFileName = "house.blend";
    std::string target = (workDir / "house.blend.restored").string();
    BackupResult result = adapter->restore(repoDir.string(), "2025-06-13T12:25:58+10:00", target, options);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(target, result.restoredPath);
    EXPECT_THAT(args, ElementsAre("--api-version", "201", "restore", "--at", "2025-06-13T12:25:58+10:00",
                                  FileSystem::toGenericPath((repoDir / "house.blend").string()),
                                  FileSystem::toGenericPath(target)));
}

TEST_F(DiffEngineAdapterTest, RestoreLatestOmitsSelector) {
    std::vector<std::string> args = DiffEngineAdapter::buildRestoreArguments("/r/a.meta", "latest", "/t/a", RestoreOptions());
    EXPECT_THAT(args, ElementsAre("--api-version", "201", "restore", "/r/a.meta", "/t/a"));

    RestoreOptions forced;
    forced.force = true;
    args = DiffEngineAdapter::buildRestoreArguments("/r/a.meta", "", "/t/a", forced);
    EXPECT_THAT(args, ElementsAre("--api-version", "201", "--force", "restore", "/r/a.meta", "/t/a"));
}

TEST_F(DiffEngineAdapterTest, RestoreWithoutRepositoryFails) {
    EXPECT_CALL(*runner, run(_, _, _)).Times(0);
    BackupResult result = adapter->restore(repoDir.string(), "latest", (workDir / "out").string(), RestoreOptions());
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error, HasSubstr("No backup repository"));
}

TEST_F(DiffEngineAdapterTest, ParseIncrementsSkipsHeaderAndMirror) {
    std::vector<Increment> increments = DiffEngineAdapter::parseIncrements(kIncrementList);
    ASSERT_EQ(2u, increments.size());
    EXPECT_EQ("2025-06-12T09:00:00+10:00", increments[0].timestamp);
    EXPECT_EQ("2025-06-13T12:25:58+10:00", increments[1].identifier);
    EXPECT_FALSE(increments[1].isSnapshot);
    EXPECT_THAT(increments[1].description, HasSubstr("increments.2025-06-13T12-25-58+10-00.dir"));
}

TEST_F(DiffEngineAdapterTest, ListIncrementsRunsListCommand) {
    createDiffRepository();
    std::vector<std::string> args;
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(DoAll(SaveArg<1>(&args), Return(makeProcessResult(0, kIncrementList))));

    std::vector<Increment> increments = adapter->listIncrements(repoDir.string());
    EXPECT_EQ(2u, increments.size());
    EXPECT_THAT(args, ElementsAre("--api-version", "201", "list", "increments",
                                  FileSystem::toGenericPath(repoDir.string())));
}

TEST_F(DiffEngineAdapterTest, ListFailureYieldsEmptyList) {
    createDiffRepository();
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(Return(makeProcessResult(2, "", "broken")));
    EXPECT_TRUE(adapter->listIncrements(repoDir.string()).empty());
}

TEST_F(DiffEngineAdapterTest, TimestampReformatting) {
    EXPECT_EQ("2025-06-13T12:25:58-05:00", DiffEngineAdapter::reformatIncrementTimestamp("2025-06-13T12-25-58-05-00"));
    EXPECT_EQ("garbage", DiffEngineAdapter::reformatIncrementTimestamp("garbage"));
}

TEST_F(DiffEngineAdapterTest, ProbeRequiresEngineNameInVersion) {
    EXPECT_CALL(*runner, run("rdiff-backup", ElementsAre("--version"), _))
        .WillOnce(Return(makeProcessResult(0, "rdiff-backup 2.2.6\n")))
        .WillOnce(Return(makeProcessResult(0, "something else 1.0\n")));
    EXPECT_TRUE(adapter->isAvailable());
    EXPECT_FALSE(adapter->isAvailable());
}

TEST_F(DiffEngineAdapterTest, DetectSkipsMissingPathCandidates) {
    EXPECT_CALL(*runner, run("/definitely/not/here/rdiff-backup", _, _)).Times(0);
    EXPECT_CALL(*runner, run("rdiff-backup-alt", _, _)).WillOnce(Return(makeProcessResult(0, "rdiff-backup 2.2.6")));

    EXPECT_TRUE(adapter->detectExecutable({"/definitely/not/here/rdiff-backup", "", "rdiff-backup-alt"}));
    EXPECT_EQ("rdiff-backup-alt", adapter->getExecutablePath());
}

// ---- 快照引擎 ----

class SnapshotEngineAdapterTest : public EngineAdapterTestBase {
protected:
    std::unique_ptr<SnapshotEngineAdapter> adapter;

    void SetUp() override {
        EngineAdapterTestBase::SetUp();
        adapter = std::make_unique<SnapshotEngineAdapter>(runner, "restic", &mockLogger);
    }

    std::string engineRepo() const {
        return SnapshotEngineAdapter::engineRepositoryPath(repoDir.string());
    }
};

TEST_F(SnapshotEngineAdapterTest, FirstBackupInitializesThenBacksUp) {
    ::testing::InSequence sequence;
    ProcessOptions initOptions;
    std::vector<std::string> backupArgs;
    EXPECT_CALL(*runner, run("restic", ElementsAre("init", "--insecure-no-password"), _))
        .WillOnce(DoAll(SaveArg<2>(&initOptions), Return(makeProcessResult(0))));
    EXPECT_CALL(*runner, run("restic", _, _))
        .WillOnce(DoAll(SaveArg<1>(&backupArgs),
                        Return(makeProcessResult(0,
                            "Files:           1 new,     0 changed,     0 unmodified\n"
                            "Added to the repository: 1.331 MiB (1.200 MiB stored)\n"
                            "processed 1 files, 2.000 MiB in 0:01\n"
                            "snapshot 1a2b3c4d saved\n"))));

    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());

    EXPECT_TRUE(result.success);
    EXPECT_EQ("1a2b3c4d", result.snapshotId);
    EXPECT_EQ(engineRepo(), initOptions.env["RESTIC_REPOSITORY"]);
    EXPECT_THAT(backupArgs, ElementsAre("backup", assetFile.string(), "--insecure-no-password"));
    ASSERT_TRUE(result.statistics.has_value());
    EXPECT_DOUBLE_EQ(1.331 * 1024 * 1024, result.statistics->incrementFileSize);
    EXPECT_TRUE(fs::is_directory(engineRepo()));
}

TEST_F(SnapshotEngineAdapterTest, ExistingRepositorySkipsInit) {
    createSnapshotRepository();
    std::vector<std::string> args;
    EXPECT_CALL(*runner, run(_, _, _))
        .WillOnce(DoAll(SaveArg<1>(&args), Return(makeProcessResult(0, "snapshot deadbeef saved\n"))));

    BackupOptions options;
    options.tag = "before-render";
    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), options);

    EXPECT_TRUE(result.success);
    EXPECT_EQ("deadbeef", result.snapshotId);
    EXPECT_THAT(args, ElementsAre("backup", assetFile.string(), "--insecure-no-password", "--tag", "before-render"));
}

TEST_F(SnapshotEngineAdapterTest, InitFailureStopsBackup) {
    EXPECT_CALL(*runner, run(_, ElementsAre("init", "--insecure-no-password"), _))
        .WillOnce(Return(makeProcessResult(1, "", "Fatal: create repository failed\n")));
    EXPECT_CALL(*runner, run(_, ::testing::Contains("backup"), _)).Times(0);

    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(BackupState::HARD_FAILURE, result.state);
    EXPECT_THAT(result.error, HasSubstr("Failed to initialize repository"));
    EXPECT_THAT(result.error, HasSubstr("create repository failed"));
}

TEST_F(SnapshotEngineAdapterTest, MissingSnapshotIdIsUnknown) {
    createSnapshotRepository();
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(Return(makeProcessResult(0, "no id in this output")));
    BackupResult result = adapter->backup(assetFile.string(), repoDir.string(), BackupOptions());
    EXPECT_TRUE(result.success);
    EXPECT_EQ("unknown", result.snapshotId);
}

TEST_F(SnapshotEngineAdapterTest, RestoreUsesSelectorAndTarget) {
    createSnapshotRepository();
    std::vector<std::string> args;
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(DoAll(SaveArg<1>(&args), Return(makeProcessResult(0))));

    BackupResult result = adapter->restore(repoDir.string(), "", "/tmp/out", RestoreOptions());

    EXPECT_TRUE(result.success);
    EXPECT_EQ("/tmp/out", result.restoredPath);
    EXPECT_THAT(args, ElementsAre("restore", "latest", "--target", "/tmp/out", "--insecure-no-password"));
}

TEST_F(SnapshotEngineAdapterTest, ForcedRestoreOverwritesExistingFiles) {
    createSnapshotRepository();
    std::vector<std::string> args;
    EXPECT_CALL(*runner, run(_, _, _)).WillOnce(DoAll(SaveArg<1>(&args), Return(makeProcessResult(0))));

    RestoreOptions options;
    options.force = true;
    BackupResult result = adapter->restore(repoDir.string(), "1a2b3c4d", "/tmp/out", options);

    EXPECT_TRUE(result.success);
    EXPECT_EQ("1a2b3c4d", result.snapshotId);
    EXPECT_THAT(args, ElementsAre("restore", "1a2b3c4d", "--target", "/tmp/out", "--overwrite", "always",
                                  "--insecure-no-password"));
}

TEST_F(SnapshotEngineAdapterTest, ListParsesJsonSnapshots) {
    createSnapshotRepository();
    const char* json = R"([
        {"time": "2025-06-13T12:25:58.1+10:00", "id": "1a2b3c4d5e6f", "short_id": "1a2b3c4d", "tags": ["nightly"]},
        {"time": "2025-06-14T08:00:00+10:00", "id": "9f8e7d6c5b4a"}
    ])";
    EXPECT_CALL(*runner, run(_, ElementsAre("snapshots", "--json", "--insecure-no-password"), _))
        .WillOnce(Return(makeProcessResult(0, json)));

    std::vector<Increment> increments = adapter->listIncrements(repoDir.string());

    ASSERT_EQ(2u, increments.size());
    EXPECT_EQ("1a2b3c4d", increments[0].identifier);
    EXPECT_TRUE(increments[0].isSnapshot);
    EXPECT_THAT(increments[0].description, HasSubstr("[nightly]"));
    EXPECT_EQ("9f8e7d6c", increments[1].identifier);
    EXPECT_EQ("2025-06-14T08:00:00+10:00", increments[1].timestamp);
}

TEST_F(SnapshotEngineAdapterTest, MalformedJsonYieldsEmptyList) {
    EXPECT_TRUE(adapter->parseSnapshotList("{not json").empty());
    EXPECT_TRUE(adapter->parseSnapshotList("{\"an\": \"object\"}").empty());
}

TEST_F(SnapshotEngineAdapterTest, RepositoryStatisticsFromStats) {
    createSnapshotRepository();
    EXPECT_CALL(*runner, run(_, ElementsAre("stats", "--insecure-no-password"), _))
        .WillOnce(Return(makeProcessResult(0, "Total File Count:  4\nTotal Size:  2.000 KiB\n")));

    std::optional<BackupStatistics> stats = adapter->repositoryStatistics(repoDir.string());
    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(4, *stats->sourceFiles);
    EXPECT_DOUBLE_EQ(2048, *stats->sourceSize);
}

TEST_F(SnapshotEngineAdapterTest, VerifyRunsCheck) {
    EXPECT_CALL(*runner, run(_, ElementsAre("check", "--insecure-no-password"), _))
        .WillOnce(Return(makeProcessResult(0, "no errors were found\n")));
    EXPECT_TRUE(adapter->verify(repoDir.string()).success);
}

TEST_F(SnapshotEngineAdapterTest, ProbeUsesVersionCommand) {
    EXPECT_CALL(*runner, run("restic", ElementsAre("version"), _))
        .WillOnce(Return(makeProcessResult(0, "restic 0.17.3 compiled with go1.23.3 on linux/amd64\n")));
    EXPECT_TRUE(adapter->isAvailable());
}

TEST(EngineAdapterFactoryTest, CreatesAdapterForKind) {
    NiceMock<MockLogger> logger;
    auto runner = std::make_shared<NiceMock<MockProcessRunner>>();

    std::unique_ptr<EngineAdapter> diff = createEngineAdapter(EngineKind::DIFF, runner, "", &logger);
    std::unique_ptr<EngineAdapter> snapshot = createEngineAdapter(EngineKind::SNAPSHOT, runner, "/opt/restic", &logger);

    EXPECT_EQ(EngineKind::DIFF, diff->getKind());
    EXPECT_EQ("rdiff-backup", diff->getExecutablePath());
    EXPECT_EQ(EngineKind::SNAPSHOT, snapshot->getKind());
    EXPECT_EQ("/opt/restic", snapshot->getExecutablePath());
}

TEST(EngineAdapterHelpersTest, StderrTailKeepsLastLines) {
    std::string stdErr;
    for (int i = 1; i <= 25; ++i) {
        stdErr += "line " + std::to_string(i) + "\n";
    }
    std::string tail = stderrTail(stdErr);
    EXPECT_EQ(0u, tail.find("line 6\n"));
    EXPECT_EQ(19, std::count(tail.begin(), tail.end(), '\n'));
    EXPECT_EQ(tail.size() - std::string("line 25").size(), tail.rfind("line 25"));
}
