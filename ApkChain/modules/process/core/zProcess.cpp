#include "zProcess.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "zLog.h"

namespace apkc::process {

namespace {

using Clock = std::chrono::steady_clock;

// 子进程通过 exec 管道回报的失败信息。
struct ExecFailure {
    // 1 = chdir 失败，2 = exec 失败，3 = 重定向失败。
    int step;
    // 对应 errno。
    int err;
};

// 关闭 fd 并置为 -1。
void closeFd(int* fd) {
    if (*fd >= 0) {
        ::close(*fd);
        *fd = -1;
    }
}

// 子进程侧：回报失败并退出（不走 atexit，不刷父进程继承来的缓冲）。
[[noreturn]] void childFail(int execFd, int step) {
    ExecFailure failure{step, errno};
    ssize_t ignored = ::write(execFd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

// 读一次管道并追加到 sink；返回 false 表示 EOF 或不可恢复错误。
bool drainOnce(int fd, std::string* sink) {
    char buffer[4096];
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink->append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

// 计算 poll 等待时长：无 deadline 时无限等待。
int pollWaitMs(bool hasDeadline, Clock::time_point deadline) {
    if (!hasDeadline) {
        return -1;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (remaining <= 0) {
        return 0;
    }
    // 分片等待，超时判定粒度 100ms。
    return remaining > 100 ? 100 : static_cast<int>(remaining);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

}  // namespace

ToolResult runTool(const ToolInvocation& invocation) {
    ToolResult result;
    if (invocation.argv.empty() || invocation.argv[0].empty()) {
        result.launchError = "empty command";
        return result;
    }
    LOGD("exec: %s", formatCommandLine(invocation.argv).c_str());

    // exec 管道：成功 exec 后因 CLOEXEC 自动关闭，父进程读到 EOF。
    int execPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        result.launchError = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (invocation.captureOutput &&
        (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0)) {
        result.launchError = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(&execPipe[0]);
        closeFd(&execPipe[1]);
        closeFd(&outPipe[0]);
        closeFd(&outPipe[1]);
        closeFd(&errPipe[0]);
        closeFd(&errPipe[1]);
        return result;
    }

    // 先构造 argv 指针数组，fork 后子进程不再分配内存。
    std::vector<char*> argv;
    argv.reserve(invocation.argv.size() + 1);
    for (const std::string& arg : invocation.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // 让父进程已有日志先落地，保持输出顺序。
    std::fflush(stdout);
    std::fflush(stderr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.launchError = std::string("fork failed: ") + std::strerror(errno);
        closeFd(&execPipe[0]);
        closeFd(&execPipe[1]);
        closeFd(&outPipe[0]);
        closeFd(&outPipe[1]);
        closeFd(&errPipe[0]);
        closeFd(&errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // 子进程：重定向标准流。
        if (!invocation.inheritStdin) {
            const int devNull = ::open("/dev/null", O_RDONLY);
            if (devNull < 0 || ::dup2(devNull, STDIN_FILENO) < 0) {
                childFail(execPipe[1], 3);
            }
        }
        if (invocation.captureOutput) {
            if (::dup2(outPipe[1], STDOUT_FILENO) < 0 || ::dup2(errPipe[1], STDERR_FILENO) < 0) {
                childFail(execPipe[1], 3);
            }
        }
        if (!invocation.workingDir.empty() && ::chdir(invocation.workingDir.c_str()) != 0) {
            childFail(execPipe[1], 1);
        }
        ::execvp(argv[0], argv.data());
        childFail(execPipe[1], 2);
    }

    // 父进程：关闭写端。
    closeFd(&execPipe[1]);
    closeFd(&outPipe[1]);
    closeFd(&errPipe[1]);

    // 阻塞读 exec 管道，直到 exec 成功（EOF）或收到失败回报。
    ExecFailure failure{0, 0};
    ssize_t got = 0;
    do {
        got = ::read(execPipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    closeFd(&execPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        // 启动失败：回收子进程，不读输出。
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(&outPipe[0]);
        closeFd(&errPipe[0]);
        const char* step = failure.step == 1 ? "chdir" : (failure.step == 2 ? "exec" : "redirect");
        result.launchError = std::string(step) + " " +
                             (failure.step == 1 ? invocation.workingDir : invocation.argv[0]) +
                             ": " + std::strerror(failure.err);
        return result;
    }
    result.launched = true;

    const bool hasDeadline = invocation.timeoutMs > 0;
    const Clock::time_point deadline =
        Clock::now() + std::chrono::milliseconds(invocation.timeoutMs);

    int status = 0;
    bool reaped = false;
    int fds[2] = {outPipe[0], errPipe[0]};
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};

    for (;;) {
        const bool anyOpen = fds[0] >= 0 || fds[1] >= 0;
        if (anyOpen) {
            pollfd pfds[2];
            nfds_t count = 0;
            int index[2] = {-1, -1};
            for (int i = 0; i < 2; ++i) {
                if (fds[i] >= 0) {
                    pfds[count].fd = fds[i];
                    pfds[count].events = POLLIN;
                    pfds[count].revents = 0;
                    index[count] = i;
                    ++count;
                }
            }
            const int rc = ::poll(pfds, count, pollWaitMs(hasDeadline, deadline));
            if (rc < 0 && errno != EINTR) {
                LOGW("poll failed: %s", std::strerror(errno));
                closeFd(&fds[0]);
                closeFd(&fds[1]);
            }
            for (nfds_t k = 0; rc > 0 && k < count; ++k) {
                if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                const int i = index[k];
                if (!drainOnce(fds[i], sinks[i])) {
                    closeFd(&fds[i]);
                }
            }
        } else {
            // 输出已全部关闭（或未采集），等待进程退出。
            const pid_t w = ::waitpid(pid, &status, hasDeadline ? WNOHANG : 0);
            if (w == pid) {
                reaped = true;
                break;
            }
            if (w < 0 && errno != EINTR) {
                break;
            }
            if (hasDeadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        if (hasDeadline && Clock::now() >= deadline) {
            // 超时：强杀并停止读取（孙进程可能仍持有管道）。
            ::kill(pid, SIGKILL);
            result.timedOut = true;
            closeFd(&fds[0]);
            closeFd(&fds[1]);
            break;
        }
    }

    if (!reaped) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    closeFd(&fds[0]);
    closeFd(&fds[1]);
    result.exitCode = decodeStatus(status);
    return result;
}

std::string findOnPath(const std::string& name) {
    if (name.empty()) {
        return std::string();
    }
    // 带路径分隔符：按路径直接检查。
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::string();
    }
    const std::string pathList(pathEnv);
    size_t begin = 0;
    while (begin <= pathList.size()) {
        size_t end = pathList.find(':', begin);
        if (end == std::string::npos) {
            end = pathList.size();
        }
        // 空段按 POSIX 约定表示当前目录。
        std::string dir = pathList.substr(begin, end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + name;
        struct stat st;
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        begin = end + 1;
    }
    return std::string();
}

std::string formatCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const std::string& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            line += '"' + arg + '"';
        } else {
            line += arg;
        }
    }
    return line;
}

}  // namespace apkc::process
