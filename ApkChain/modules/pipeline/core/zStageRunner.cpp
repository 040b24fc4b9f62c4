#include "zStageRunner.h"

#include <utility>

#include "zFile.h"
#include "zLog.h"

namespace apkc {

namespace {

// 外部工具输出可能很长，错误正文只保留尾部。
constexpr size_t kMaxToolOutputInMessage = 2000;

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

std::string tail(const std::string& text) {
    const std::string trimmed = trimTrailing(text);
    if (trimmed.size() <= kMaxToolOutputInMessage) {
        return trimmed;
    }
    return "..." + trimmed.substr(trimmed.size() - kMaxToolOutputInMessage);
}

}  // namespace

bool interpretToolResult(const process::ToolResult& result,
                         const process::ToolInvocation& invocation,
                         const std::string& stage,
                         const std::string& tool,
                         PipelineError* error) {
    const std::string command = process::formatCommandLine(invocation.argv);
    if (!result.launched) {
        return setError(error, ErrorKind::kToolExecution, ErrorReason::kLaunchFailed, stage,
                        "command not found or not launchable: " + result.launchError,
                        std::string(), tool);
    }
    if (result.timedOut) {
        return setError(error, ErrorKind::kToolExecution, ErrorReason::kTimeout, stage,
                        "command timed out after " + std::to_string(invocation.timeoutMs) +
                            "ms: " + command,
                        std::string(), tool);
    }
    if (result.exitCode != 0 && invocation.checkExit) {
        // stderr 为空时退回 stdout，部分工具把错误写在 stdout。
        const std::string detail =
            tail(result.stderrText.empty() ? result.stdoutText : result.stderrText);
        setError(error, ErrorKind::kToolExecution, ErrorReason::kNonZeroExit, stage,
                 "command failed: " + command + (detail.empty() ? "" : "\n" + detail),
                 std::string(), tool);
        if (error != nullptr) {
            error->exitCode = result.exitCode;
        }
        return false;
    }
    return true;
}

bool runStage(const StageSpec& spec, process::ToolResult* result, PipelineError* error) {
    // 1) 前置校验门：任一失败都不启动进程。
    if (!evaluateGates(spec.gates, spec.name, error)) {
        if (error != nullptr) {
            error->tool = spec.tool;
        }
        return false;
    }

    // 2) 执行外部工具。
    LOGD("[%s] %s", spec.name.c_str(), process::formatCommandLine(spec.invocation.argv).c_str());
    process::ToolResult local = process::runTool(spec.invocation);
    if (result != nullptr) {
        *result = local;
    }

    // 3) 解释退出状态。
    if (!interpretToolResult(local, spec.invocation, spec.name, spec.tool, error)) {
        if (error != nullptr) {
            error->artifact = spec.expectedArtifact;
        }
        return false;
    }

    // 4) 断言产物存在：工具报告成功但没有产物不能当作成功。
    bool present = true;
    if (spec.artifactType == ArtifactType::kFile) {
        present = base::file::fileExists(spec.expectedArtifact);
    } else if (spec.artifactType == ArtifactType::kDirectory) {
        present = base::file::directoryExists(spec.expectedArtifact);
    }
    if (!present) {
        return setError(error, ErrorKind::kToolExecution, ErrorReason::kArtifactMissing,
                        spec.name,
                        spec.tool + " reported success but output was not created",
                        spec.expectedArtifact, spec.tool);
    }
    return true;
}

process::ToolInvocation makeInvocation(std::vector<std::string> argv,
                                       const ToolchainConfig& toolchain,
                                       const std::string& workingDir) {
    process::ToolInvocation invocation;
    invocation.argv = std::move(argv);
    invocation.workingDir = workingDir;
    invocation.timeoutMs = toolchain.timeoutMs;
    return invocation;
}

void recordStage(std::vector<StageRecord>* stages,
                 const std::string& name,
                 bool succeeded,
                 const std::string& artifact,
                 const PipelineError* error) {
    if (stages == nullptr) {
        return;
    }
    StageRecord record;
    record.name = name;
    record.ran = true;
    record.succeeded = succeeded;
    record.artifact = artifact;
    if (!succeeded && error != nullptr) {
        record.message = error->describe();
    }
    stages->push_back(record);
}

}  // namespace apkc
