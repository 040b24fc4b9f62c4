/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 反编译流水线：APK → Java 源码（jadx）和/或 smali+资源（apktool）。
 * - 两个阶段相互独立：请求了就都尝试，一个失败不会阻止另一个。
 * - 只有全部请求的阶段都失败才整体失败（DecompileError）；都不请求为 ConfigError。
 * - 输入 APK 使用严格校验（含 ZIP 头）。
 */
#pragma once

#include <string>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 单阶段结果，执行完全部请求阶段后统一汇总。
struct StageOutcome {
    bool attempted = false;
    bool succeeded = false;
    PipelineError error;
};

// 默认输出根目录：./<apk 文件名去扩展名>。
std::string defaultDecompileOutputDir(const std::string& apkPath);

bool runDecompile(const std::string& apkPath,
                  const DecompileOptions& options,
                  const ToolchainConfig& toolchain,
                  DecompileResult* result,
                  PipelineError* error);

}  // namespace apkc
