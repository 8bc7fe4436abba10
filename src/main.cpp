#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <memory>
#include <cstdlib>
#include <sstream>
#include <algorithm>

// 跨平台头文件包含
#ifdef _WIN32
    // 在包含windows.h之前定义NOMINMAX宏，以避免max宏与std::max冲突
    #define NOMINMAX
    #include <windows.h>
    #pragma execution_character_set("utf-8")
#endif

#include "core/BackupOrchestrator.hpp"
#include "core/Config.hpp"
#include "core/engines/EngineAdapter.hpp"
#include "core/models/Asset.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/ProcessRunner.hpp"

namespace {

const int kExitSuccess = 0;
const int kExitFailure = 1;
const int kExitUsage = 2;

} // namespace

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    // 运行界面，返回进程退出码
    virtual int run() = 0;

    virtual void showHelp() = 0;

    virtual void showMessage(const std::string& message) = 0;

    virtual void showError(const std::string& message) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;  // 使用原始指针避免循环依赖
    ConsoleLogger& logger;
    AppConfig config;
    std::unique_ptr<BackupOrchestrator> orchestrator;

public:
    ApplicationController(IUserInterface* ui, ConsoleLogger& logger)
        : ui(ui), logger(logger) {}

    // 设置用户界面（用于后期绑定）
    void setUserInterface(IUserInterface* ui) {
        this->ui = ui;
    }

    int start() {
        return ui ? ui->run() : kExitFailure;
    }

    AppConfig& getConfig() {
        return config;
    }

    // 配置确定后创建引擎与编排器
    void initialize() {
        if (config.vaultRoot.empty()) {
            config.vaultRoot = fs::current_path().string();
        } else {
            config.vaultRoot = fs::absolute(config.vaultRoot).lexically_normal().string();
        }
        if (!config.globalBackupRoot.empty()) {
            config.globalBackupRoot = fs::absolute(config.globalBackupRoot).lexically_normal().string();
        }
        logger.setLogLevel(config.logLevel);

        auto runner = std::make_shared<ProcessRunner>(&logger);
        auto engine = createEngineAdapter(config.engineKind, runner, config.enginePath, &logger,
                                          config.processTimeoutMs);
        orchestrator = std::make_unique<BackupOrchestrator>(config, std::move(engine), &logger);
    }

    Asset makeAsset(const std::string& path) const {
        return Asset(path, config.vaultRoot);
    }

    bool executeBackup(const std::string& path, const std::string& tag) {
        Asset asset = makeAsset(path);
        BackupRequest request;
        request.options.tag = tag;

        BackupResult result = orchestrator->backup(asset, request);
        if (!result.success) {
            ui->showError("Backup of " + asset.getLogicalPath() + " failed: " + result.error);
            return false;
        }

        std::string message = "Backup of " + asset.getLogicalPath() + " completed";
        if (result.versionInfo) {
            message += " as " + VersionMapper::displayString(result.versionInfo->version);
        }
        if (!result.snapshotId.empty()) {
            message += " (snapshot " + result.snapshotId + ")";
        }
        if (result.state == BackupState::WARNING_RECOVERED) {
            message += " with warnings (exit code " + std::to_string(result.exitCode) + ")";
        }
        ui->showMessage(message);
        if (result.statistics) {
            showStatistics(*result.statistics);
        }
        return true;
    }

    bool executeRestore(const std::string& path, const std::string& selector, bool force) {
        Asset asset = makeAsset(path);
        BackupResult result = orchestrator->restore(asset, selector, force);
        if (!result.success) {
            ui->showError("Restore of " + asset.getLogicalPath() + " failed: " + result.error);
            return false;
        }
        ui->showMessage("Restored " + asset.getLogicalPath() + " to " + result.restoredPath);
        return true;
    }

    bool executeHistory(const std::string& path) {
        Asset asset = makeAsset(path);
        AssetHistory history = orchestrator->history(asset);

        std::ostringstream out;
        out << "Asset: " << asset.getLogicalPath() << "\n"
            << "Repository: " << history.repositoryPath << "\n"
            << "Has backup: " << (history.hasBackup ? "yes" : "no") << "\n"
            << "Current version: " << VersionMapper::displayString(history.currentVersion) << "\n";

        std::vector<std::string> paths = orchestrator->historicalPaths(asset);
        if (paths.size() > 1) {
            out << "Path history:";
            for (const auto& item : paths) {
                out << " " << item;
            }
            out << "\n";
        }

        out << "Versions (" << history.versions.size() << "):\n";
        for (const auto& record : history.versions) {
            out << "  " << VersionMapper::displayString(record.version) << "  " << record.timestamp
                << "  " << record.sourceFileSize << " bytes";
            if (!record.checksum.empty()) {
                out << "  sha256:" << record.checksum.substr(0, 12);
            }
            out << (record.isLatest ? "  (latest)" : "") << "\n";
        }
        out << "Increments (" << history.increments.size() << "):\n";
        for (const auto& increment : history.increments) {
            out << "  " << increment.identifier << "  " << increment.timestamp << "\n";
        }
        ui->showMessage(out.str());
        if (history.statistics) {
            showStatistics(*history.statistics);
        }
        return true;
    }

    bool executeVerify(const std::string& path) {
        Asset asset = makeAsset(path);
        BackupResult result = orchestrator->verify(asset);
        if (!result.success) {
            ui->showError("Verification of " + asset.getLogicalPath() + " failed: " + result.error);
            return false;
        }
        ui->showMessage("Repository for " + asset.getLogicalPath() + " verified");
        return true;
    }

    bool executeRename(const std::string& oldPath, const std::string& newPath) {
        std::string oldLogical = makeAsset(oldPath).getLogicalPath();
        std::string newLogical = makeAsset(newPath).getLogicalPath();
        RenameOutcome outcome = orchestrator->onAssetRenamed(oldLogical, newLogical);
        if (!outcome.success) {
            ui->showError("Rename handling failed: " + outcome.error);
            return false;
        }
        std::string message = outcome.relocated
            ? "Moved backup history to " + outcome.newRepositoryPath
            : "Rename recorded for " + newLogical;
        if (outcome.archived) {
            message += " (existing data archived to " + outcome.archivePath + ")";
        }
        ui->showMessage(message);
        return true;
    }

    bool executeList() {
        std::vector<BackedUpAsset> assets = orchestrator->listBackedUpAssets();
        RepositorySummary summary = orchestrator->repositorySummary();

        std::ostringstream out;
        out << "Backed up assets (" << assets.size() << "):\n";
        for (const auto& asset : assets) {
            out << "  " << asset.logicalPath << "  " << VersionMapper::displayString(asset.currentVersion)
                << "  " << asset.versionCount << " version(s)  " << asset.repositorySizeBytes << " bytes\n";
        }
        out << "Repositories: " << summary.repositoryCount << "\n"
            << "Total size: " << summary.totalSizeBytes << " bytes";
        if (summary.averageSpaceSavingsPercent) {
            out << "\nAverage space savings: " << std::fixed << std::setprecision(2)
                << *summary.averageSpaceSavingsPercent << "%";
        }
        ui->showMessage(out.str());
        return true;
    }

    bool executeAvailable() {
        if (orchestrator->isAvailable()) {
            ui->showMessage(toString(config.engineKind) + " engine available: " +
                            orchestrator->getEngine().getExecutablePath());
            return true;
        }
        ui->showError(toString(config.engineKind) + " engine is not available");
        return false;
    }

    ConsoleLogger& getLogger() {
        return logger;
    }

private:
    void showStatistics(const BackupStatistics& stats) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2)
            << "Changed files: " << stats.changedFiles << "\n"
            << "Changed source size: " << stats.changedSourceSize << "\n"
            << "Increment size: " << stats.incrementFileSize << "\n"
            << "Elapsed: " << stats.elapsedSeconds << " s";
        if (stats.compressionRatioPercent) {
            out << "\nCompression ratio: " << *stats.compressionRatioPercent << "%";
        }
        if (stats.spaceSavingsPercent) {
            out << "\nSpace savings: " << *stats.spaceSavingsPercent << "%";
        }
        ui->showMessage(out.str());
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    int argc;
    char** argv;

    std::string command;
    std::vector<std::string> positional;
    std::string selector = "latest";
    std::string tag;
    bool force = false;

public:
    CommandLineInterface(ApplicationController& controller, int argc, char** argv)
        : controller(controller), argc(argc), argv(argv) {}

    int run() override {
        try {
            if (!parseArguments()) {
                return kExitUsage;
            }
        } catch (const ConfigurationError& e) {
            showError(std::string("Configuration error: ") + e.what());
            return kExitUsage;
        }

        if (command.empty() || command == "help") {
            showHelp();
            return command.empty() ? kExitUsage : kExitSuccess;
        }

        size_t required = 1;
        if (command == "rename") {
            required = 2;
        } else if (command == "available" || command == "list") {
            required = 0;
        }
        if (positional.size() != required) {
            showError("Command '" + command + "' expects " + std::to_string(required) + " argument(s)");
            return kExitUsage;
        }

        controller.initialize();

        bool ok = false;
        if (command == "backup") {
            ok = controller.executeBackup(positional[0], tag);
        } else if (command == "restore") {
            ok = controller.executeRestore(positional[0], selector, force);
        } else if (command == "history") {
            ok = controller.executeHistory(positional[0]);
        } else if (command == "verify") {
            ok = controller.executeVerify(positional[0]);
        } else if (command == "rename") {
            ok = controller.executeRename(positional[0], positional[1]);
        } else if (command == "list") {
            ok = controller.executeList();
        } else if (command == "available") {
            ok = controller.executeAvailable();
        }
        return ok ? kExitSuccess : kExitFailure;
    }

    void showHelp() override {
        std::cout << "=== AssetKeeper Help Information ===\n";
        std::cout << "Usage: assetkeeper [options] <command> [args]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  backup <asset>            Back up a single asset file\n";
        std::cout << "  restore <asset>           Restore an asset to <asset>.restored\n";
        std::cout << "  history <asset>           Show versions and increments of an asset\n";
        std::cout << "  verify <asset>            Verify the asset's backup repository\n";
        std::cout << "  rename <old> <new>        Move backup history after an asset was renamed\n";
        std::cout << "  list                      List backed up assets and repository totals\n";
        std::cout << "  available                 Check whether the backup engine works\n";
        std::cout << "  help                      Show this help information\n\n";
        std::cout << "Options:\n";
        std::cout << "  --config <file>           Load settings from a JSON file\n";
        std::cout << "  --engine diff|snapshot    Select the backup engine\n";
        std::cout << "  --engine-path <exe>       Engine executable\n";
        std::cout << "  --vault <dir>             Root directory that asset paths are relative to\n";
        std::cout << "  --mode adjacent|global    Repository placement\n";
        std::cout << "  --global-root <dir>       Root of the global backup tree\n";
        std::cout << "  --timeout <ms>            Engine process timeout (0 = none)\n";
        std::cout << "  --tag <text>              Tag attached to snapshot backups\n";
        std::cout << "  --at <selector>           Increment or snapshot to restore (default: latest)\n";
        std::cout << "  --force                   Overwrite an existing restore target\n";
        std::cout << "  --log-level <level>       debug, info, warn or error\n\n";
        std::cout << "Examples:\n";
        std::cout << "  assetkeeper backup scenes/house.blend\n";
        std::cout << "  assetkeeper --engine diff restore scenes/house.blend --at 2025-06-13T12:25:58+10:00\n";
        std::cout << "  assetkeeper rename scenes/house.blend archive/house.blend\n";
    }

    void showMessage(const std::string& message) override {
        std::cout << message << std::endl;
    }

    void showError(const std::string& message) override {
        std::cerr << "Error: " << message << std::endl;
    }

private:
    bool requireValue(int& i, const std::string& option, std::string& value) {
        if (i + 1 >= argc) {
            showError("Option " + option + " requires a value");
            return false;
        }
        value = argv[++i];
        return true;
    }

    // 先读取 --config，再让其他选项覆盖文件中的值
    bool parseArguments() {
        AppConfig& config = controller.getConfig();
        for (int i = 1; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") {
                config = ConfigLoader::loadFromFile(argv[i + 1]);
                break;
            }
        }

        bool enginePathSet = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;
            if (arg == "-h" || arg == "--help") {
                command = "help";
            } else if (arg == "--config") {
                if (!requireValue(i, arg, value)) return false;
            } else if (arg == "--engine") {
                if (!requireValue(i, arg, value)) return false;
                config.engineKind = parseEngineKind(value);
            } else if (arg == "--engine-path") {
                if (!requireValue(i, arg, value)) return false;
                config.enginePath = value;
                enginePathSet = true;
            } else if (arg == "--vault") {
                if (!requireValue(i, arg, value)) return false;
                config.vaultRoot = value;
            } else if (arg == "--mode") {
                if (!requireValue(i, arg, value)) return false;
                config.storageMode = parseStorageMode(value);
            } else if (arg == "--global-root") {
                if (!requireValue(i, arg, value)) return false;
                config.globalBackupRoot = value;
            } else if (arg == "--timeout") {
                if (!requireValue(i, arg, value)) return false;
                config.processTimeoutMs = std::atoi(value.c_str());
            } else if (arg == "--tag") {
                if (!requireValue(i, arg, tag)) return false;
            } else if (arg == "--at") {
                if (!requireValue(i, arg, selector)) return false;
            } else if (arg == "--force") {
                force = true;
            } else if (arg == "--log-level") {
                if (!requireValue(i, arg, value)) return false;
                config.logLevel = ConfigLoader::parseLogLevel(value);
            } else if (arg.rfind("--", 0) == 0) {
                showError("Unknown option: " + arg);
                return false;
            } else if (command.empty()) {
                command = arg;
            } else {
                positional.push_back(arg);
            }
        }

        if (!enginePathSet && config.enginePath.empty()) {
            config.enginePath = defaultExecutableName(config.engineKind);
        }

        static const std::vector<std::string> commands = {
            "backup", "restore", "history", "verify", "rename", "list", "available", "help"
        };
        if (!command.empty() && std::find(commands.begin(), commands.end(), command) == commands.end()) {
            showError("Unknown command: " + command);
            return false;
        }
        return true;
    }
};

int main(int argc, char* argv[]) {
    ConsoleLogger logger;

    // 1. First create controller with null interface pointer
    ApplicationController controller(nullptr, logger);

    // 2. Create command line interface and pass controller reference
    CommandLineInterface cli(controller, argc, argv);

    // 3. Set interface to controller
    controller.setUserInterface(&cli);

    return controller.start();
}
