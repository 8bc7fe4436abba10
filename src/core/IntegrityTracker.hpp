#pragma once
#include <string>
#include <vector>
#include "Types.hpp"
#include "RepositoryLocator.hpp"

class ILogger;

// 仓库迁移的各个步骤，失败时用于指明出错位置
enum class RelocationStep {
    NONE,
    ENSURE_PARENT,
    ARCHIVE_EXISTING,
    MOVE,
    VERIFY,
    RECORD_LEDGER
};

std::string toString(RelocationStep step);

struct RenameOutcome {
    bool success = true;
    bool relocated = false;           // 仓库目录已移动到新位置
    bool archived = false;            // 新位置原有的仓库被改名保存
    bool ledgerRecorded = false;
    std::string oldRepositoryPath;
    std::string newRepositoryPath;
    std::string archivePath;
    RelocationStep failedStep = RelocationStep::NONE;
    std::string error;
};

// 资产重命名/移动时保持备份历史：相邻模式下随资产移动仓库目录并记录重命名日志
class IntegrityTracker {
public:
    IntegrityTracker(const RepositoryLocator& locator, ILogger* log);

    // 相邻模式下迁移仓库；全局模式下不做任何事。不抛异常
    RenameOutcome onRename(const std::string& oldLogicalPath, const std::string& newLogicalPath);

    // 从最旧到当前的历史路径链
    std::vector<std::string> historicalPaths(const std::string& currentLogicalPath) const;

    // 迁移协议的单个步骤
    bool ensureDestinationParent(const std::string& newRepositoryPath, std::string& error) const;
    bool archiveIfOccupied(const std::string& newRepositoryPath, std::string& archivePath, std::string& error) const;
    bool moveRepository(const std::string& oldRepositoryPath, const std::string& newRepositoryPath,
                        std::string& error) const;
    bool verifyRelocation(const std::string& oldRepositoryPath, const std::string& newRepositoryPath,
                          std::string& error) const;

    // <目标名>.pre-move-archive.<文件名安全的时间戳>
    static std::string archiveNameFor(const std::string& repositoryPath, const std::string& isoTimestamp);

private:
    void recordLedger(const std::string& oldLogicalPath, const std::string& newLogicalPath,
                      RenameOutcome& outcome) const;

    const RepositoryLocator& locator;
    ILogger* logger;
};
