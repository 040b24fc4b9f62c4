/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - split 合并流水线：包含 base + split 的目录 → 单个 APK（APKEditor merge）。
 * - 顺序：目录校验（存在/目录/含 *.apk）→ split 分类 → 工具解析 → 删除旧输出 → merge → 产物断言。
 * - 目录校验失败为 MergeError，且发生在工具解析之前；工具无法解析为 ConfigError。
 */
#pragma once

#include <string>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 默认输出路径：<dir>.merged.apk（与目录同级）。
std::string defaultMergedOutputPath(const std::string& splitDir);

bool runSplitMerge(const std::string& splitDir,
                   const std::string& outputPath,
                   const ToolchainConfig& toolchain,
                   MergeResult* result,
                   PipelineError* error);

}  // namespace apkc
