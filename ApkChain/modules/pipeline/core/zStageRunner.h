/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 阶段执行器：前置校验门 → 外部工具调用 → 退出状态解释 → 产物存在性断言。
 * - 失败分类：
 *   1) 门失败：kValidation，未启动任何进程；
 *   2) 找不到/无法启动/超时/非零退出：kToolExecution；
 *   3) 工具报告成功但产物缺失：kToolExecution + kArtifactMissing。
 * - 不做重试。
 */
#pragma once

#include <string>
#include <vector>

#include "zPipelineError.h"
#include "zPipelineTypes.h"
#include "zProcess.h"
#include "zValidationGate.h"

namespace apkc {

// 阶段产物类型。
enum class ArtifactType {
    // 不检查产物。
    kNone,
    // 普通文件。
    kFile,
    // 目录。
    kDirectory,
};

// 一个阶段的完整描述。
struct StageSpec {
    // 阶段名（build/align/sign/...）。
    std::string name;
    // 工具名（日志与错误定位使用）。
    std::string tool;
    // 前置校验门。
    std::vector<ValidationGate> gates;
    // 外部调用。
    process::ToolInvocation invocation;
    // 声明的产物路径。
    std::string expectedArtifact;
    // 产物类型。
    ArtifactType artifactType = ArtifactType::kFile;
};

// 执行阶段；result 可为空。
bool runStage(const StageSpec& spec, process::ToolResult* result, PipelineError* error);

// 把一次调用结果解释为成功/失败（不检查产物）。
// invocation.checkExit 为 false 时非零退出不算失败。
bool interpretToolResult(const process::ToolResult& result,
                         const process::ToolInvocation& invocation,
                         const std::string& stage,
                         const std::string& tool,
                         PipelineError* error);

// 构造一次调用（统一套用工具链超时）。
process::ToolInvocation makeInvocation(std::vector<std::string> argv,
                                       const ToolchainConfig& toolchain,
                                       const std::string& workingDir = std::string());

// 把阶段结果追加到阶段记录表。
void recordStage(std::vector<StageRecord>* stages,
                 const std::string& name,
                 bool succeeded,
                 const std::string& artifact,
                 const PipelineError* error);

}  // namespace apkc
