#include "EngineAdapter.hpp"
#include "DiffEngineAdapter.hpp"
#include "SnapshotEngineAdapter.hpp"
#include "../../utils/FileSystem.hpp"
#include <sstream>

bool EngineAdapter::detectExecutable(const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        if (candidate.empty()) {
            continue;
        }
        // 带路径分隔符的候选先检查文件是否存在，避免无意义的进程启动
        bool hasSeparator = candidate.find('/') != std::string::npos ||
                            candidate.find('\\') != std::string::npos;
        if (hasSeparator && !FileSystem::exists(candidate)) {
            continue;
        }
        if (probe(candidate)) {
            setExecutablePath(candidate);
            return true;
        }
    }
    return false;
}

std::unique_ptr<EngineAdapter> createEngineAdapter(EngineKind kind,
                                                   std::shared_ptr<ProcessRunner> runner,
                                                   const std::string& executablePath,
                                                   ILogger* logger,
                                                   int timeoutMs) {
    std::string exe = executablePath.empty() ? defaultExecutableName(kind) : executablePath;
    if (kind == EngineKind::DIFF) {
        return std::make_unique<DiffEngineAdapter>(std::move(runner), exe, logger, timeoutMs);
    }
    return std::make_unique<SnapshotEngineAdapter>(std::move(runner), exe, logger, timeoutMs);
}

std::string defaultExecutableName(EngineKind kind) {
    return kind == EngineKind::DIFF ? "rdiff-backup" : "restic";
}

std::string stderrTail(const std::string& stdErr, size_t maxLines) {
    std::vector<std::string> lines;
    std::istringstream stream(stdErr);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    size_t start = lines.size() > maxLines ? lines.size() - maxLines : 0;
    std::string tail;
    for (size_t i = start; i < lines.size(); ++i) {
        if (!tail.empty()) {
            tail += "\n";
        }
        tail += lines[i];
    }
    return tail;
}

BackupResult toBackupResult(const ProcessResult& processResult) {
    BackupResult result;
    result.success = processResult.success;
    result.stdOut = processResult.stdOut;
    result.stdErr = processResult.stdErr;
    result.exitCode = processResult.exitCode;
    result.state = processResult.success ? BackupState::SUCCESS : BackupState::HARD_FAILURE;
    if (!processResult.success) {
        result.error = processResult.error.empty()
            ? "Process exited with code " + std::to_string(processResult.exitCode)
            : processResult.error;
        std::string tail = stderrTail(processResult.stdErr);
        if (!tail.empty()) {
            result.error += "\n" + tail;
        }
    }
    return result;
}
