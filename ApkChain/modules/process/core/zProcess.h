/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 外部工具进程执行器：fork/exec + 管道采集 + 可选超时。
 * - 链路位置：所有阶段的最底层执行单元。
 * - 输入：ToolInvocation（命令向量、工作目录、超时、输出采集开关）。
 * - 输出：ToolResult（退出码、stdout/stderr、是否启动成功、是否超时）。
 * - 约束：单次调用只执行一次，不做任何自动重试。
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace apkc::process {

// 一次外部工具调用。
struct ToolInvocation {
    // 命令向量，argv[0] 为可执行名（走 PATH）或路径。
    std::vector<std::string> argv;
    // 工作目录，空串表示继承当前目录。
    std::string workingDir;
    // 超时毫秒数，0 表示不限时。
    uint32_t timeoutMs = 0;
    // 非零退出是否视为致命（由上层阶段执行器解释）。
    bool checkExit = true;
    // 是否采集 stdout/stderr；关闭时子进程直接继承父进程输出。
    bool captureOutput = true;
    // 是否继承 stdin；默认接到 /dev/null，避免外部工具意外阻塞在交互输入。
    bool inheritStdin = false;
};

// 一次调用的结果。
struct ToolResult {
    // 是否成功启动（exec 成功）。
    bool launched = false;
    // 是否因超时被强制结束。
    bool timedOut = false;
    // 退出码；被信号杀死时为 128 + 信号值。
    int exitCode = -1;
    // 启动失败原因。
    std::string launchError;
    // 采集到的标准输出。
    std::string stdoutText;
    // 采集到的标准错误。
    std::string stderrText;

    // 启动成功、未超时且退出码为 0。
    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
};

// 执行外部工具并等待结束。
ToolResult runTool(const ToolInvocation& invocation);

// 在 PATH 中查找可执行文件；name 含 '/' 时直接检查该路径。
// 找不到返回空串。
std::string findOnPath(const std::string& name);

// 把命令向量拼成便于日志阅读的单行文本（含空格的参数加引号）。
std::string formatCommandLine(const std::vector<std::string>& argv);

}  // namespace apkc::process
