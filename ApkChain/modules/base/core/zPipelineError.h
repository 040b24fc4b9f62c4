/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 全链路统一错误描述：类别 + 原因 + 定位信息（阶段/工具/产物）。
 * - 约定：函数返回 bool，失败时回填调用方传入的 PipelineError*（可为空）。
 * - 阶段包装层只改 kind，不改 reason，保证“产物缺失”等原因在上层仍可区分。
 */
#pragma once

#include <string>

namespace apkc {

// 错误类别。
enum class ErrorKind {
    // 无错误。
    kNone = 0,
    // 前置条件不满足，未启动任何外部进程。
    kValidation,
    // 外部进程失败、超时或无法启动。
    kToolExecution,
    // 配置错误（工具无法解析、参数组合非法）。
    kConfig,
    // 构建阶段失败。
    kBuild,
    // 对齐阶段失败。
    kAlign,
    // 签名/验签/密钥库阶段失败。
    kSign,
    // 所有请求的反编译阶段都失败。
    kDecompile,
    // split 合并失败。
    kMerge,
    // 目标框架特征不匹配。
    kFrameworkMismatch,
    // 插桩工具或插桩后重签失败。
    kInstrument,
    // 安装失败。
    kInstall,
    // 运行时 dump 失败。
    kDump,
};

// 失败原因（与类别正交）。
enum class ErrorReason {
    kNone = 0,
    // 前置校验失败。
    kPrecondition,
    // 可执行文件找不到或无法启动。
    kLaunchFailed,
    // 超时被强制结束。
    kTimeout,
    // 进程非零退出。
    kNonZeroExit,
    // 进程报告成功但声明的产物不存在。
    kArtifactMissing,
    // 读取成功但内容为空。
    kEmptyContent,
    // 本地文件系统操作失败。
    kIo,
};

// 统一错误对象。
struct PipelineError {
    // 错误类别。
    ErrorKind kind = ErrorKind::kNone;
    // 失败原因。
    ErrorReason reason = ErrorReason::kNone;
    // 失败阶段名（build/align/sign/...）。
    std::string stage;
    // 涉及的外部工具（可为空）。
    std::string tool;
    // 期望的产物或被校验的路径（可为空）。
    std::string artifact;
    // 外部进程退出码（仅 kNonZeroExit 有意义）。
    int exitCode = 0;
    // 人类可读的详细信息。
    std::string message;

    // 是否携带错误。
    bool isSet() const { return kind != ErrorKind::kNone; }
    // 单行描述：类别、阶段、工具、产物与正文。
    std::string describe() const;
};

// 类别名（BuildError 等）。
const char* errorKindName(ErrorKind kind);
// 原因名。
const char* errorReasonName(ErrorReason reason);

// 回填错误的便捷函数，返回 false 方便直接 return。
bool setError(PipelineError* error,
              ErrorKind kind,
              ErrorReason reason,
              const std::string& stage,
              const std::string& message,
              const std::string& artifact = std::string(),
              const std::string& tool = std::string());

// 把下层错误改写为阶段类别，保留原因与定位信息，并给正文加前缀。
// ConfigError 保持原类别。
bool retagError(PipelineError* error, ErrorKind kind, const std::string& prefix);

}  // namespace apkc
