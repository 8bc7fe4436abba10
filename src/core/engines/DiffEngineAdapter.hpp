#pragma once
#include "EngineAdapter.hpp"
#include "../StatisticsParser.hpp"
#include <memory>
#include <string>
#include <vector>
#include <optional>

// rdiff-backup 适配器：引擎以目录为单位工作，单文件通过 include/exclude 模式选取
class DiffEngineAdapter : public EngineAdapter {
public:
    static const char* const kApiVersion;
    static const char* const kDataDirectory;     // 仓库内的引擎数据目录，也是备份存在的标志

    DiffEngineAdapter(std::shared_ptr<ProcessRunner> runner, const std::string& executablePath,
                      ILogger* log, int timeoutMs = 0);

    EngineKind getKind() const override;
    const std::string& getExecutablePath() const override;
    void setExecutablePath(const std::string& path) override;

    BackupResult backup(const std::string& sourcePath, const std::string& repositoryPath,
                        const BackupOptions& options) override;
    BackupResult backupAdjacent(const std::string& sourcePath, const std::string& repositoryPath,
                                const BackupOptions& options) override;
    BackupResult restore(const std::string& repositoryPath, const std::string& selector,
                         const std::string& targetPath, const RestoreOptions& options) override;
    std::vector<Increment> listIncrements(const std::string& repositoryPath) override;
    BackupResult verify(const std::string& repositoryPath) override;
    BackupResult info(const std::string& repositoryPath) override;
    std::optional<BackupStatistics> repositoryStatistics(const std::string& repositoryPath) override;
    bool hasRepository(const std::string& repositoryPath) const override;
    bool probe(const std::string& executablePath) override;

    // 命令行构造与输出解析，不依赖进程执行
    static std::vector<std::string> buildBackupArguments(const std::string& sourceDirectory,
                                                         const std::string& repositoryPath,
                                                         const BackupOptions& options);
    static std::vector<std::string> buildRestoreArguments(const std::string& repositoryPath,
                                                          const std::string& selector,
                                                          const std::string& targetPath,
                                                          const RestoreOptions& options);
    static std::vector<Increment> parseIncrements(const std::string& output);

    // 2025-06-13T12-25-58+10-00 -> 2025-06-13T12:25:58+10:00
    static std::string reformatIncrementTimestamp(const std::string& raw);

    // 最新的 session_statistics 文件（文件名按时间排序，最后一个最新）
    std::optional<std::string> latestSessionStatisticsFile(const std::string& repositoryPath) const;

private:
    BackupResult runBackup(const std::string& sourcePath, const std::string& repositoryPath,
                           const BackupOptions& options);
    ProcessResult execute(const std::vector<std::string>& args);

    std::shared_ptr<ProcessRunner> processRunner;
    std::string executable;
    ILogger* logger;
    int timeoutMs;
    StatisticsParser parser;
};
