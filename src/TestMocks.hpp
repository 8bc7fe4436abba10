#pragma once
#include <gmock/gmock.h>
#include <string>
#include <vector>
#include "utils/ILogger.hpp"
#include "utils/ProcessRunner.hpp"
#include "core/engines/EngineAdapter.hpp"

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));

    // 允许所有日志方法调用
    void allowAll() {
        EXPECT_CALL(*this, log(::testing::_, ::testing::_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*this, setLogLevel(::testing::_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*this, getLogLevel()).WillRepeatedly(::testing::Return(LogLevel::DEBUG));
        EXPECT_CALL(*this, info(::testing::_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*this, error(::testing::_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*this, warn(::testing::_)).WillRepeatedly(::testing::Return());
        EXPECT_CALL(*this, debug(::testing::_)).WillRepeatedly(::testing::Return());
    }
};

// 模拟子进程执行，用于检查引擎命令行与输出解析
class MockProcessRunner : public ProcessRunner {
public:
    MockProcessRunner() : ProcessRunner(nullptr) {}

    MOCK_METHOD(ProcessResult, run,
                (const std::string& executablePath, const std::vector<std::string>& args,
                 const ProcessOptions& options),
                (override));
};

class MockEngineAdapter : public EngineAdapter {
public:
    MOCK_METHOD(EngineKind, getKind, (), (const, override));
    MOCK_METHOD(const std::string&, getExecutablePath, (), (const, override));
    MOCK_METHOD(void, setExecutablePath, (const std::string& path), (override));
    MOCK_METHOD(BackupResult, backup,
                (const std::string& sourcePath, const std::string& repositoryPath, const BackupOptions& options),
                (override));
    MOCK_METHOD(BackupResult, backupAdjacent,
                (const std::string& sourcePath, const std::string& repositoryPath, const BackupOptions& options),
                (override));
    MOCK_METHOD(BackupResult, restore,
                (const std::string& repositoryPath, const std::string& selector, const std::string& targetPath,
                 const RestoreOptions& options),
                (override));
    MOCK_METHOD(std::vector<Increment>, listIncrements, (const std::string& repositoryPath), (override));
    MOCK_METHOD(BackupResult, verify, (const std::string& repositoryPath), (override));
    MOCK_METHOD(BackupResult, info, (const std::string& repositoryPath), (override));
    MOCK_METHOD(std::optional<BackupStatistics>, repositoryStatistics, (const std::string& repositoryPath),
                (override));
    MOCK_METHOD(bool, hasRepository, (const std::string& repositoryPath), (const, override));
    MOCK_METHOD(bool, probe, (const std::string& executablePath), (override));
};

inline ProcessResult makeProcessResult(int exitCode, const std::string& stdOut = std::string(),
                                       const std::string& stdErr = std::string()) {
    ProcessResult result;
    result.exitCode = exitCode;
    result.success = exitCode == 0;
    result.stdOut = stdOut;
    result.stdErr = stdErr;
    if (!result.success) {
        result.error = "Process exited with code " + std::to_string(exitCode);
    }
    return result;
}

inline BackupResult makeBackupResult(bool success) {
    BackupResult result;
    result.success = success;
    result.exitCode = success ? 0 : 2;
    result.state = success ? BackupState::SUCCESS : BackupState::HARD_FAILURE;
    if (!success) {
        result.error = "engine failed";
    }
    return result;
}
