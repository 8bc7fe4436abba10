#pragma once
#include "EngineAdapter.hpp"
#include "../StatisticsParser.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>

// restic 适配器：仓库位于元数据目录下的子目录，首次备份时初始化
class SnapshotEngineAdapter : public EngineAdapter {
public:
    static const char* const kRepositoryDirectory;
    static const char* const kConfigMarker;
    static const char* const kNoPasswordFlag;

    SnapshotEngineAdapter(std::shared_ptr<ProcessRunner> runner, const std::string& executablePath,
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

    // 元数据目录内引擎仓库的实际位置
    static std::string engineRepositoryPath(const std::string& repositoryPath);

    static std::vector<std::string> buildBackupArguments(const std::string& sourcePath, const BackupOptions& options);

    // 从 "snapshot 1a2b3c4d saved" 中提取快照ID，找不到时返回空
    static std::string parseSnapshotId(const std::string& output);

    // 解析 snapshots --json 输出；格式错误时返回空列表
    std::vector<Increment> parseSnapshotList(const std::string& jsonOutput) const;

private:
    // 配置标志不存在时执行 init；失败时返回引擎的错误输出
    bool ensureRepository(const std::string& enginePath, std::string& errorMessage);
    ProcessResult execute(const std::string& enginePath, const std::vector<std::string>& args);

    std::shared_ptr<ProcessRunner> processRunner;
    std::string executable;
    ILogger* logger;
    int timeoutMs;
    StatisticsParser parser;
};
