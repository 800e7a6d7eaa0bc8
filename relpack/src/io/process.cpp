#include "io/process.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace relpack::io {
namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 50;
constexpr std::chrono::milliseconds kKillGrace{2000};

bool validateWorkingDirectory(const std::filesystem::path &cwd, const relpack::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

bool deadlinePassed(const RunOptions &options, Clock::time_point started) {
    return options.timeout.count() > 0 && Clock::now() - started >= options.timeout;
}

bool cancelRequested(const RunOptions &options) {
    return options.cancel != nullptr && options.cancel->load();
}

#ifdef _WIN32

bool utf8ToWide(const std::string &input, std::wstring &out) {
    out.clear();
    if (input.empty()) {
        return true;
    }

    const int size = MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
    if (size <= 0) {
        return false;
    }

    out.resize(static_cast<std::size_t>(size));
    if (MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, out.data(), size) <= 0) {
        out.clear();
        return false;
    }
    return true;
}

// Reads only what is buffered; children of the build driver may keep the pipe open.
void drainPipe(HANDLE pipe, std::string &out) {
    char buffer[4096];
    for (;;) {
        DWORD available = 0;
        if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) || available == 0) {
            return;
        }
        DWORD got = 0;
        const DWORD want = available < sizeof(buffer) ? available : static_cast<DWORD>(sizeof(buffer));
        if (!ReadFile(pipe, buffer, want, &got, nullptr) || got == 0) {
            return;
        }
        out.append(buffer, got);
    }
}

ProcessResult runCommandWindows(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const relpack::Context &ctx,
    const RunOptions &options
) {
    ProcessResult result;
    result.commandLine = displayCommand(command, args);

    std::wstring wideCmdLine;
    if (!utf8ToWide(result.commandLine, wideCmdLine)) {
        ctx.error("Failed to convert command line to wide string");
        return result;
    }

    std::wstring wideCwd;
    wchar_t *cwdPtr = nullptr;
    if (!cwd.empty()) {
        if (!utf8ToWide(cwd.string(), wideCwd)) {
            ctx.error("Failed to convert working directory to wide string");
            return result;
        }
        cwdPtr = wideCwd.data();
    }

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE readPipe = nullptr;
    HANDLE writePipe = nullptr;
    if (!CreatePipe(&readPipe, &writePipe, &sa, 0)) {
        ctx.error("Failed to create output pipe: Error code ", static_cast<unsigned long>(GetLastError()));
        return result;
    }
    SetHandleInformation(readPipe, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = writePipe;
    si.hStdError = writePipe;
    PROCESS_INFORMATION pi{};

    BOOL ok = CreateProcessW(
        nullptr,
        wideCmdLine.data(),
        nullptr,
        nullptr,
        TRUE,
        CREATE_NO_WINDOW,
        nullptr,
        cwdPtr,
        &si,
        &pi
    );
    CloseHandle(writePipe);

    if (!ok) {
        ctx.error("Failed to create process: Error code ", static_cast<unsigned long>(GetLastError()));
        CloseHandle(readPipe);
        return result;
    }

    const auto started = Clock::now();
    bool terminated = false;
    for (;;) {
        drainPipe(readPipe, result.output);
        if (WaitForSingleObject(pi.hProcess, kPollIntervalMs) != WAIT_TIMEOUT) {
            break;
        }
        if (terminated) {
            continue;
        }
        if (deadlinePassed(options, started)) {
            result.timedOut = true;
        } else if (cancelRequested(options)) {
            result.cancelled = true;
        }
        if (result.timedOut || result.cancelled) {
            TerminateProcess(pi.hProcess, 1);
            terminated = true;
        }
    }
    drainPipe(readPipe, result.output);
    CloseHandle(readPipe);

    DWORD exitCode = 0;
    if (GetExitCodeProcess(pi.hProcess, &exitCode)) {
        result.code = static_cast<int>(exitCode);
    } else {
        result.code = -1;
        ctx.error("Failed to get process exit code");
    }
    if ((result.timedOut || result.cancelled) && result.code == 0) {
        result.code = 1;
    }

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return result;
}

#else

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Returns false once the write side is closed.
bool drainPipe(int fd, std::string &out) {
    char buffer[4096];
    for (;;) {
        const ssize_t got = read(fd, buffer, sizeof(buffer));
        if (got > 0) {
            out.append(buffer, static_cast<std::size_t>(got));
            continue;
        }
        if (got == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// Called between fork and exec, so no allocation.
void writeAll(int fd, const char *text) {
    const std::size_t size = std::strlen(text);
    std::size_t offset = 0;
    while (offset < size) {
        const ssize_t put = write(fd, text + offset, size - offset);
        if (put <= 0) {
            return;
        }
        offset += static_cast<std::size_t>(put);
    }
}

ProcessResult runCommandPosix(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const relpack::Context &ctx,
    const RunOptions &options
) {
    ProcessResult result;
    result.commandLine = displayCommand(command, args);

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    int fds[2] = {-1, -1};
    if (pipe(fds) != 0) {
        ctx.error("Failed to create output pipe: ", std::strerror(errno));
        return result;
    }
    // Keep sibling builds started from other threads off this pipe.
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);

    const pid_t pid = fork();
    if (pid < 0) {
        ctx.error("Failed to fork process: ", std::strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Own process group so a timeout also reaches the driver's children.
        setpgid(0, 0);
        close(fds[0]);
        const int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            if (devNull > STDERR_FILENO) {
                close(devNull);
            }
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        if (fds[1] > STDERR_FILENO) {
            close(fds[1]);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            writeAll(STDERR_FILENO, "chdir failed: ");
            writeAll(STDERR_FILENO, cwd.c_str());
            writeAll(STDERR_FILENO, "\n");
            _exit(127);
        }
        execvp(command.c_str(), argv.data());
        const char *reason = std::strerror(errno);
        writeAll(STDERR_FILENO, command.c_str());
        writeAll(STDERR_FILENO, ": ");
        writeAll(STDERR_FILENO, reason);
        writeAll(STDERR_FILENO, "\n");
        _exit(127);
    }

    setpgid(pid, pid);
    close(fds[1]);
    const int readFd = fds[0];
    fcntl(readFd, F_SETFL, fcntl(readFd, F_GETFL) | O_NONBLOCK);

    const auto started = Clock::now();
    Clock::time_point killAt{};
    bool terminating = false;
    bool pipeOpen = true;
    bool exited = false;
    int status = 0;

    for (;;) {
        if (pipeOpen) {
            pollfd pfd{readFd, POLLIN, 0};
            if (poll(&pfd, 1, kPollIntervalMs) > 0) {
                pipeOpen = drainPipe(readFd, result.output);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }

        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
        } else if (waited < 0 && errno != EINTR) {
            ctx.error("Failed to wait for process: ", std::strerror(errno));
            break;
        }

        if (exited) {
            if (pipeOpen) {
                drainPipe(readFd, result.output);
            }
            break;
        }

        if (!terminating) {
            if (deadlinePassed(options, started)) {
                result.timedOut = true;
            } else if (cancelRequested(options)) {
                result.cancelled = true;
            }
            if (result.timedOut || result.cancelled) {
                kill(-pid, SIGTERM);
                terminating = true;
                killAt = Clock::now() + kKillGrace;
            }
        } else if (Clock::now() >= killAt) {
            kill(-pid, SIGKILL);
        }
    }
    close(readFd);

    if (!exited) {
        result.code = -1;
        return result;
    }

    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.code = 128 + WTERMSIG(status);
        if (!terminating) {
            ctx.warn("Process terminated by signal: ", WTERMSIG(status));
        }
    } else {
        result.code = -1;
        ctx.error("Process ended abnormally");
    }
    if (terminating && result.code == 0) {
        result.code = 1;
    }
    return result;
}

#endif

} // namespace

std::string shellQuote(const std::string &value) {
#ifdef _WIN32
    if (value.empty()) {
        return "\"\"";
    }

    bool needQuotes = false;
    for (char ch : value) {
        if (ch == ' ' || ch == '\t' || ch == '"') {
            needQuotes = true;
            break;
        }
    }
    if (!needQuotes) {
        return value;
    }

    std::string out;
    out.push_back('"');
    std::size_t backslashes = 0;
    for (char ch : value) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out.push_back('"');
            backslashes = 0;
            continue;
        }
        out.append(backslashes, '\\');
        backslashes = 0;
        out.push_back(ch);
    }
    out.append(backslashes * 2, '\\');
    out.push_back('"');
    return out;
#else
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
#endif
}

std::string displayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const relpack::Context &ctx,
    const RunOptions &options
) {
    ProcessResult result;
    result.commandLine = displayCommand(command, args);

    if (!cwd.empty()) {
        ctx.log("cwd: ", cwd.string());
    }
    ctx.log(result.commandLine);

    if (options.dryRun) {
        result.code = 0;
        return result;
    }

    if (!validateWorkingDirectory(cwd, ctx)) {
        result.code = -1;
        return result;
    }

#ifdef _WIN32
    return runCommandWindows(command, args, cwd, ctx, options);
#else
    return runCommandPosix(command, args, cwd, ctx, options);
#endif
}

} // namespace relpack::io
