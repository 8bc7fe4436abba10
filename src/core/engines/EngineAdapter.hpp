#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "../Types.hpp"
#include "../models/BackupResult.hpp"
#include "../../utils/ProcessRunner.hpp"

class ILogger;

// 备份引擎适配器接口：差异引擎与快照引擎各自实现，基类不持有状态
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    virtual EngineKind getKind() const = 0;

    virtual const std::string& getExecutablePath() const = 0;
    virtual void setExecutablePath(const std::string& path) = 0;

    // 备份单个文件到仓库目录（repositoryPath 即资产的元数据目录）
    virtual BackupResult backup(const std::string& sourcePath, const std::string& repositoryPath,
                                const BackupOptions& options) = 0;

    // 相邻存储模式的备份，仓库与源文件位于同一父目录下
    virtual BackupResult backupAdjacent(const std::string& sourcePath, const std::string& repositoryPath,
                                        const BackupOptions& options) = 0;

    // selector 为增量时间戳、快照ID或 "latest"
    virtual BackupResult restore(const std::string& repositoryPath, const std::string& selector,
                                 const std::string& targetPath, const RestoreOptions& options) = 0;

    // 列出失败或解析不到内容时返回空列表
    virtual std::vector<Increment> listIncrements(const std::string& repositoryPath) = 0;

    virtual BackupResult verify(const std::string& repositoryPath) = 0;

    virtual BackupResult info(const std::string& repositoryPath) = 0;

    virtual std::optional<BackupStatistics> repositoryStatistics(const std::string& repositoryPath) = 0;

    // 仓库中是否已有引擎创建的数据
    virtual bool hasRepository(const std::string& repositoryPath) const = 0;

    // 用版本探测命令检查指定可执行文件是否是本引擎
    virtual bool probe(const std::string& executablePath) = 0;

    bool isAvailable() {
        return probe(getExecutablePath());
    }

    // 依次探测候选路径，第一个可用的成为当前可执行文件
    bool detectExecutable(const std::vector<std::string>& candidates);
};

// 根据引擎类型创建适配器
std::unique_ptr<EngineAdapter> createEngineAdapter(EngineKind kind,
                                                   std::shared_ptr<ProcessRunner> runner,
                                                   const std::string& executablePath,
                                                   ILogger* logger,
                                                   int timeoutMs = 0);

// 引擎的默认可执行文件名
std::string defaultExecutableName(EngineKind kind);

// 失败结果附带的 stderr 末尾若干行
std::string stderrTail(const std::string& stdErr, size_t maxLines = 20);

// 把进程结果转换为备份结果；失败时 error 附带 stderr 末尾
BackupResult toBackupResult(const ProcessResult& processResult);
