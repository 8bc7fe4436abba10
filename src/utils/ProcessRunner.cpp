#include "ProcessRunner.hpp"
#include "ILogger.hpp"
#include <chrono>
#include <cstring>
#include <thread>

// 跨平台头文件包含
#ifdef _WIN32
    #define NOMINMAX
    #include <windows.h>
#else
    #include <cerrno>
    #include <csignal>
    #include <fcntl.h>
    #include <poll.h>
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <unistd.h>

    extern char** environ;
#endif

namespace {

// 解释器会特殊处理的字符，出现时整个参数需要加引号
bool needsQuoting(const std::string& arg) {
    if (arg.empty()) {
        return true;
    }
    for (char c : arg) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            return true;
        }
        if (std::strchr("*?[]{}$`\"'\\|&;<>()!#~", c) != nullptr) {
            return true;
        }
    }
    return false;
}

// shell 以 126/127 表示命令不可执行/不存在
bool isShellSpawnFailure(int exitCode) {
    return exitCode == 126 || exitCode == 127;
}

} // namespace

ProcessRunner::ProcessRunner(ILogger* log) : logger(log) {}

ShellFlavor ProcessRunner::hostShellFlavor() {
#ifdef _WIN32
    return ShellFlavor::POWERSHELL;
#else
    return ShellFlavor::POSIX_SHELL;
#endif
}

std::string ProcessRunner::quoteArgument(const std::string& arg, ShellFlavor flavor) {
    if (!needsQuoting(arg)) {
        return arg;
    }

    std::string quoted = "\"";
    for (char c : arg) {
        if (flavor == ShellFlavor::POSIX_SHELL) {
            // 双引号内仍然生效的字符需要反斜杠转义
            if (c == '"' || c == '\\' || c == '$' || c == '`') {
                quoted += '\\';
            }
        } else {
            // PowerShell 使用反引号转义
            if (c == '"' || c == '`' || c == '$') {
                quoted += '`';
            }
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string ProcessRunner::buildCommandString(const std::string& executablePath,
                                              const std::vector<std::string>& args,
                                              ShellFlavor flavor) {
    std::string command;
    bool executableQuoted = needsQuoting(executablePath);
    std::string quotedExecutable = quoteArgument(executablePath, flavor);

    if (flavor == ShellFlavor::POWERSHELL && executableQuoted) {
        // PowerShell 把带引号的首个词当作字符串，必须用调用运算符执行
        command = "& " + quotedExecutable;
    } else {
        command = quotedExecutable;
    }

    for (const auto& arg : args) {
        command += " ";
        command += quoteArgument(arg, flavor);
    }
    return command;
}

ProcessResult ProcessRunner::run(const std::string& executablePath,
                                 const std::vector<std::string>& args,
                                 const ProcessOptions& options) {
    std::string commandString = buildCommandString(executablePath, args, hostShellFlavor());
    if (logger) {
        logger->info("Executing command: " + commandString);
    }

    ProcessResult result = runPlatform(commandString, executablePath, options);

    if (logger) {
        if (result.success) {
            logger->debug("Command completed successfully");
        } else if (result.exitCode == -1) {
            logger->error("Process error: " + result.error);
        } else {
            logger->warn("Command failed with exit code " + std::to_string(result.exitCode) + ": " + result.stdErr);
        }
    }
    return result;
}

#ifdef _WIN32

namespace {

std::string readWholePipe(HANDLE pipe) {
    std::string data;
    char buffer[4096];
    DWORD bytesRead = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &bytesRead, nullptr) && bytesRead > 0) {
        data.append(buffer, bytesRead);
    }
    return data;
}

std::string lastErrorMessage() {
    DWORD code = GetLastError();
    char* message = nullptr;
    FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, code, 0, reinterpret_cast<LPSTR>(&message), 0, nullptr);
    std::string text = message ? message : ("error " + std::to_string(code));
    if (message) {
        LocalFree(message);
    }
    return text;
}

// 合并当前进程环境与覆盖项，生成 CreateProcess 需要的环境块
std::string buildEnvironmentBlock(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    LPCH strings = GetEnvironmentStringsA();
    if (strings) {
        for (LPCH cursor = strings; *cursor; cursor += std::strlen(cursor) + 1) {
            std::string entry(cursor);
            auto pos = entry.find('=', 1);
            if (pos != std::string::npos) {
                merged[entry.substr(0, pos)] = entry.substr(pos + 1);
            }
        }
        FreeEnvironmentStringsA(strings);
    }
    for (const auto& kv : overrides) {
        merged[kv.first] = kv.second;
    }

    std::string block;
    for (const auto& kv : merged) {
        block += kv.first + "=" + kv.second;
        block.push_back('\0');
    }
    block.push_back('\0');
    return block;
}

} // namespace

ProcessResult ProcessRunner::runPlatform(const std::string& commandString, const std::string& executablePath,
                                         const ProcessOptions& options) {
    ProcessResult result;

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE outRead = nullptr, outWrite = nullptr, errRead = nullptr, errWrite = nullptr;
    if (!CreatePipe(&outRead, &outWrite, &sa, 0) || !CreatePipe(&errRead, &errWrite, &sa, 0)) {
        result.error = "Failed to create pipes: " + lastErrorMessage();
        return result;
    }
    SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    std::string escaped;
    for (char c : commandString) {
        if (c == '"') {
            escaped += '\\';
        }
        escaped += c;
    }
    std::string commandLine = "powershell.exe -NoProfile -NonInteractive -Command \"" + escaped + "\"";
    std::vector<char> commandBuffer(commandLine.begin(), commandLine.end());
    commandBuffer.push_back('\0');

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;

    PROCESS_INFORMATION pi{};
    std::string environment = buildEnvironmentBlock(options.env);
    BOOL created = CreateProcessA(
        nullptr, commandBuffer.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
        options.env.empty() ? nullptr : environment.data(),
        options.workingDirectory.empty() ? nullptr : options.workingDirectory.c_str(),
        &si, &pi);

    CloseHandle(outWrite);
    CloseHandle(errWrite);

    if (!created) {
        result.error = "Failed to start " + executablePath + ": " + lastErrorMessage();
        CloseHandle(outRead);
        CloseHandle(errRead);
        return result;
    }

    // 管道读取放在独立线程中，避免缓冲区写满导致子进程阻塞
    std::string outData, errData;
    std::thread outReader([&]() { outData = readWholePipe(outRead); });
    std::thread errReader([&]() { errData = readWholePipe(errRead); });

    DWORD waitMs = options.timeoutMs > 0 ? static_cast<DWORD>(options.timeoutMs) : INFINITE;
    DWORD waitResult = WaitForSingleObject(pi.hProcess, waitMs);
    if (waitResult == WAIT_TIMEOUT) {
        // 超时与自然结束竞争时，以先观察到的结果为准
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.timedOut = true;
    }

    outReader.join();
    errReader.join();

    DWORD exitCode = 0;
    GetExitCodeProcess(pi.hProcess, &exitCode);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    CloseHandle(outRead);
    CloseHandle(errRead);

    result.stdOut = outData;
    result.stdErr = errData;
    if (result.timedOut) {
        result.exitCode = -1;
        result.error = "timed out";
        return result;
    }

    result.exitCode = static_cast<int>(exitCode);
    result.success = result.exitCode == 0;
    if (!result.success) {
        result.error = "Process exited with code " + std::to_string(result.exitCode);
    }
    return result;
}

#else

namespace {

// 在父进程中准备好 envp，fork 之后子进程只调用异步信号安全的函数
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** cursor = environ; cursor && *cursor; ++cursor) {
        std::string entry(*cursor);
        auto pos = entry.find('=');
        std::string key = pos == std::string::npos ? entry : entry.substr(0, pos);
        if (overrides.find(key) == overrides.end()) {
            entries.push_back(entry);
        }
    }
    for (const auto& kv : overrides) {
        entries.push_back(kv.first + "=" + kv.second);
    }
    return entries;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

ProcessResult ProcessRunner::runPlatform(const std::string& commandString, const std::string& executablePath,
                                         const ProcessOptions& options) {
    ProcessResult result;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0 || pipe(errPipe) != 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    // exec 让 shell 被引擎进程替换，超时时信号直接送达引擎
    std::string shellCommand = "exec " + commandString;
    std::vector<std::string> envEntries = buildEnvironment(options.env);
    std::vector<char*> envp;
    for (auto& entry : envEntries) {
        envp.push_back(&entry[0]);
    }
    envp.push_back(nullptr);

    const char* shellArgv[] = {"/bin/sh", "-c", shellCommand.c_str(), nullptr};
    const char* workingDirectory = options.workingDirectory.empty() ? nullptr : options.workingDirectory.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("Failed to fork: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // 子进程：独立进程组，便于超时时整组终止
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        if (workingDirectory && chdir(workingDirectory) != 0) {
            _exit(127);
        }
        execve("/bin/sh", const_cast<char* const*>(shellArgv), envp.data());
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    auto startTime = std::chrono::steady_clock::now();
    bool exited = false;
    int status = 0;

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        int waitSliceMs = -1;
        if (options.timeoutMs > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime).count();
            if (elapsed >= options.timeoutMs) {
                // 超时与自然结束竞争时，以先观察到的结果为准
                if (waitpid(pid, &status, WNOHANG) == pid) {
                    exited = true;
                } else {
                    kill(-pid, SIGKILL);
                    kill(pid, SIGKILL);
                    result.timedOut = true;
                }
                break;
            }
            waitSliceMs = static_cast<int>(options.timeoutMs - elapsed);
        }

        pollfd fds[2];
        int count = 0;
        int outIndex = -1, errIndex = -1;
        if (outPipe[0] >= 0) {
            fds[count] = {outPipe[0], POLLIN, 0};
            outIndex = count++;
        }
        if (errPipe[0] >= 0) {
            fds[count] = {errPipe[0], POLLIN, 0};
            errIndex = count++;
        }

        int ready = poll(fds, count, waitSliceMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        char buffer[4096];
        if (outIndex >= 0 && (fds[outIndex].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.stdOut.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(outPipe[0]);
            }
        }
        if (errIndex >= 0 && (fds[errIndex].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(errPipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.stdErr.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(errPipe[0]);
            }
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    // 子进程可能提前关闭输出管道，等待退出同样受超时约束
    while (!exited && !result.timedOut) {
        pid_t waited = waitpid(pid, &status, options.timeoutMs > 0 ? WNOHANG : 0);
        if (waited == pid) {
            exited = true;
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("Failed to wait for process: ") + std::strerror(errno);
            return result;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();
        if (elapsed >= options.timeoutMs) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            result.timedOut = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result.timedOut && !exited) {
        // 回收被终止的子进程，避免僵尸进程
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    if (result.timedOut) {
        result.exitCode = -1;
        result.error = "timed out";
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
        result.error = "Process terminated by signal " + std::to_string(WTERMSIG(status));
        return result;
    }

    if (isShellSpawnFailure(result.exitCode)) {
        // 可执行文件不存在或无法执行，按启动失败处理
        result.error = "Failed to start " + executablePath + ": " +
                       (result.stdErr.empty() ? std::string("command not found") : result.stdErr);
        result.exitCode = -1;
        return result;
    }

    result.success = result.exitCode == 0;
    if (!result.success) {
        result.error = "Process exited with code " + std::to_string(result.exitCode);
    }
    return result;
}

#endif
