/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - Build-Align-Sign 流水线：apktool 工程目录 → 已签名 APK。
 * - 阶段顺序固定：
 *   1) build（必选）：apktool b <dir> -o <staging>/built.apk；
 *   2) align（可选，默认开）：zipalign -P 16 4 <cur> <staging>/aligned.apk；
 *   3) sign（可选，默认开）：apksigner sign ... --out <output> <cur>；跳过时 <cur> 原样复制到 output；
 *   4) verify（可选，默认关，仅在 sign 执行后）：apksigner verify --verbose <output>。
 * - 中间产物只存在于 staging 区，任何退出路径都会被删除。
 * - 失败类别：BuildError / AlignError / SignError；工具无法解析为 ConfigError。
 */
#pragma once

#include <string>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 默认输出路径：<dir>-patched.apk（与工程目录同级）。
std::string defaultPatchedOutputPath(const std::string& sourceDir);

// 执行流水线；outputPath 为空时使用默认输出路径。
bool runBuildAlignSign(const std::string& sourceDir,
                       const std::string& outputPath,
                       const BuildOptions& options,
                       const ToolchainConfig& toolchain,
                       BuildResult* result,
                       PipelineError* error);

}  // namespace apkc
