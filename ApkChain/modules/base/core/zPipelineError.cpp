#include "zPipelineError.h"

// 引入字符串拼接。
#include <sstream>

namespace apkc {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "NoError";
        case ErrorKind::kValidation: return "ValidationError";
        case ErrorKind::kToolExecution: return "ToolExecutionError";
        case ErrorKind::kConfig: return "ConfigError";
        case ErrorKind::kBuild: return "BuildError";
        case ErrorKind::kAlign: return "AlignError";
        case ErrorKind::kSign: return "SignError";
        case ErrorKind::kDecompile: return "DecompileError";
        case ErrorKind::kMerge: return "MergeError";
        case ErrorKind::kFrameworkMismatch: return "FrameworkMismatchError";
        case ErrorKind::kInstrument: return "InstrumentError";
        case ErrorKind::kInstall: return "InstallError";
        case ErrorKind::kDump: return "DumpError";
    }
    return "UnknownError";
}

const char* errorReasonName(ErrorReason reason) {
    switch (reason) {
        case ErrorReason::kNone: return "none";
        case ErrorReason::kPrecondition: return "precondition";
        case ErrorReason::kLaunchFailed: return "launch failed";
        case ErrorReason::kTimeout: return "timeout";
        case ErrorReason::kNonZeroExit: return "non-zero exit";
        case ErrorReason::kArtifactMissing: return "artifact missing";
        case ErrorReason::kEmptyContent: return "empty content";
        case ErrorReason::kIo: return "io";
    }
    return "unknown";
}

// 输出格式：<Kind> [stage=..., tool=..., artifact=...] (<reason>): <message>
std::string PipelineError::describe() const {
    std::ostringstream oss;
    oss << errorKindName(kind);
    // 定位字段只输出非空项。
    bool open = false;
    auto field = [&oss, &open](const char* key, const std::string& value) {
        if (value.empty()) {
            return;
        }
        oss << (open ? ", " : " [") << key << "=" << value;
        open = true;
    };
    field("stage", stage);
    field("tool", tool);
    field("artifact", artifact);
    if (open) {
        oss << "]";
    }
    if (reason != ErrorReason::kNone) {
        oss << " (" << errorReasonName(reason);
        if (reason == ErrorReason::kNonZeroExit) {
            oss << " " << exitCode;
        }
        oss << ")";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    return oss.str();
}

bool setError(PipelineError* error,
              ErrorKind kind,
              ErrorReason reason,
              const std::string& stage,
              const std::string& message,
              const std::string& artifact,
              const std::string& tool) {
    if (error != nullptr) {
        error->kind = kind;
        error->reason = reason;
        error->stage = stage;
        error->tool = tool;
        error->artifact = artifact;
        error->exitCode = 0;
        error->message = message;
    }
    return false;
}

bool retagError(PipelineError* error, ErrorKind kind, const std::string& prefix) {
    if (error != nullptr) {
        // 工具解析失败（ConfigError）与运行期失败区分开，外层阶段只加前缀不改类别。
        if (error->kind != ErrorKind::kConfig) {
            error->kind = kind;
        }
        if (!prefix.empty()) {
            error->message = error->message.empty() ? prefix : prefix + ": " + error->message;
        }
    }
    return false;
}

}  // namespace apkc
