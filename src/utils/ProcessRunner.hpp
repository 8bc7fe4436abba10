#pragma once
#include <map>
#include <string>
#include <vector>

class ILogger;

// 子进程执行选项
struct ProcessOptions {
    std::string workingDirectory;                 // 空表示继承当前目录
    int timeoutMs = 0;                            // 0 表示不限时
    std::map<std::string, std::string> env;       // 追加/覆盖的环境变量
};

// 子进程执行结果，非零退出码不会抛异常
struct ProcessResult {
    bool success = false;
    std::string stdOut;
    std::string stdErr;
    int exitCode = -1;
    std::string error;        // 空表示没有错误
    bool timedOut = false;
};

// 宿主平台的命令解释器
enum class ShellFlavor {
    POSIX_SHELL,
    POWERSHELL
};

class ProcessRunner {
public:
    explicit ProcessRunner(ILogger* log);
    virtual ~ProcessRunner() = default;

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    // 启动可执行文件并等待结束；启动失败时 exitCode=-1 且 error 非空
    virtual ProcessResult run(const std::string& executablePath,
                              const std::vector<std::string>& args,
                              const ProcessOptions& options = ProcessOptions());

    // 按解释器语法引用单个参数：含空白或元字符的参数用双引号包裹
    static std::string quoteArgument(const std::string& arg, ShellFlavor flavor);

    // 生成完整命令行；PowerShell下带引号的可执行路径需要调用运算符 &
    static std::string buildCommandString(const std::string& executablePath,
                                          const std::vector<std::string>& args,
                                          ShellFlavor flavor);

    static ShellFlavor hostShellFlavor();

protected:
    ILogger* logger;

private:
    ProcessResult runPlatform(const std::string& commandString, const std::string& executablePath,
                              const ProcessOptions& options);
};
